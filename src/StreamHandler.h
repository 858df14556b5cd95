/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */

#pragma once

#include "AbstractModule.h"
#include "ErrorSink.h"
#include <spdlog/common.h>

namespace tapfluent {

class StreamHandlerException : public std::runtime_error
{
public:
    explicit StreamHandlerException(const std::string &msg)
        : std::runtime_error(msg)
    {
    }
};

/**
 * a stage that consumes input records and publishes derived events.
 *
 * per-record failures never stop the stream. they go to an ErrorSink, filtered by the handler
 * verbosity: parse failures are reported at debug and below, publish failures at warn and below.
 */
class StreamHandler : public AbstractModule
{
protected:
    spdlog::level::level_enum _verbosity{spdlog::level::info};

    // "verbosity" is an spdlog level name, fallback applies when it is not configured
    void _read_verbosity(spdlog::level::level_enum fallback)
    {
        _verbosity = fallback;
        if (!config_exists("verbosity")) {
            return;
        }
        auto level_name = config_get<std::string>("verbosity");
        _verbosity = spdlog::level::from_str(level_name);
        // from_str maps unknown names to off
        if (_verbosity == spdlog::level::off && level_name != "off") {
            throw ConfigException(fmt::format("invalid verbosity: {}", level_name));
        }
    }

    void _report(ErrorSink &errors, OutputError error) const
    {
        auto threshold = error.kind == OutputError::Kind::Parse ? spdlog::level::debug : spdlog::level::warn;
        if (_verbosity <= threshold) {
            errors.report(std::move(error));
        }
    }

public:
    explicit StreamHandler(const std::string &name)
        : AbstractModule(name)
    {
    }

    spdlog::level::level_enum verbosity() const
    {
        return _verbosity;
    }
};

}
