#include <catch2/reporters/catch_reporter_event_listener.hpp>
#include <catch2/reporters/catch_reporter_registrars.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

// modules look up the shared "tapfluent" logger on construction
class TapfluentLoggerListener : public Catch::EventListenerBase
{
public:
    using Catch::EventListenerBase::EventListenerBase;

    void testRunStarting([[maybe_unused]] Catch::TestRunInfo const &runInfo) override
    {
        if (!spdlog::get("tapfluent")) {
            spdlog::stderr_color_mt("tapfluent");
        }
    }

    void testRunEnded([[maybe_unused]] Catch::TestRunStats const &runStats) override
    {
        spdlog::drop("tapfluent");
    }
};

CATCH_REGISTER_LISTENER(TapfluentLoggerListener)
