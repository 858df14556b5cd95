#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_test_tapfluent.hpp>

#include "ErrorSink.h"
#include <vector>

using namespace tapfluent;

TEST_CASE("error sink keeps reports in order", "[errors]")
{
    ErrorSink sink{4};
    CHECK(sink.capacity() == 4);
    CHECK_FALSE(sink.try_pop().has_value());

    CHECK(sink.report({OutputError::Kind::Parse, "dnstap", "short header"}));
    CHECK(sink.report({OutputError::Kind::Publish, "dnstap", "buffer full"}));
    CHECK(sink.size() == 2);

    auto first = sink.try_pop();
    REQUIRE(first.has_value());
    CHECK(first->kind == OutputError::Kind::Parse);
    CHECK(first->kind_str() == "parse");
    CHECK(first->message == "short header");

    auto second = sink.try_pop();
    REQUIRE(second.has_value());
    CHECK(second->kind_str() == "publish");
    CHECK(sink.size() == 0);
}

TEST_CASE("error sink drops when full", "[errors]")
{
    ErrorSink sink{2};
    CHECK(sink.report({OutputError::Kind::Parse, "t", "1"}));
    CHECK(sink.report({OutputError::Kind::Parse, "t", "2"}));
    CHECK_FALSE(sink.report({OutputError::Kind::Parse, "t", "3"}));
    CHECK_FALSE(sink.report({OutputError::Kind::Publish, "t", "4"}));

    CHECK(sink.size() == 2);
    CHECK(sink.reported() == 2);
    CHECK(sink.dropped() == 2);

    // room again after draining
    sink.try_pop();
    CHECK(sink.report({OutputError::Kind::Publish, "t", "5"}));

    json j;
    sink.info_json(j);
    CHECK(j["errors"]["capacity"] == 2);
    CHECK(j["errors"]["queued"] == 2);
    CHECK(j["errors"]["dropped"] == 2);
}

TEST_CASE("error sink accepts concurrent producers", "[errors]")
{
    ErrorSink sink{100};
    std::vector<std::thread> producers;
    for (int t = 0; t < 4; ++t) {
        producers.emplace_back([&sink] {
            for (int i = 0; i < 50; ++i) {
                sink.report({OutputError::Kind::Publish, "t", "x"});
            }
        });
    }
    for (auto &p : producers) {
        p.join();
    }
    CHECK(sink.size() == 100);
    CHECK(sink.reported() == 100);
    CHECK(sink.dropped() == 100);
}

TEST_CASE("error sink consumer drains the queue", "[errors]")
{
    ErrorSink sink{8};
    sink.start();
    for (int i = 0; i < 5; ++i) {
        sink.report({OutputError::Kind::Publish, "t", "x"});
    }
    sink.stop();
    CHECK(sink.size() == 0);
    CHECK(sink.reported() == 5);

    // restartable
    sink.start();
    sink.stop();
}

TEST_CASE("error sink capacity must be positive", "[errors]")
{
    CHECK_THROWS_AS(ErrorSink{0}, std::invalid_argument);
}
