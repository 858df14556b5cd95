/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */

#pragma once

#include "Configurable.h"
#include <atomic>
#include <pthread.h>
#include <regex>
#include <string>

namespace tapfluent {

/**
 * one stage of the pipeline: the dnstap input, the fluent handler or the fluent output.
 *
 * the name prefixes log lines and thread names, schema_key() identifies the kind of stage.
 * start() and stop() must both be idempotent.
 */
class AbstractModule : public Configurable
{
protected:
    std::string _name;
    std::atomic_bool _running{false};

    void common_info_json(json &j) const
    {
        auto &module = j["module"];
        module["name"] = _name;
        module["type"] = schema_key();
        module["running"] = _running.load();
        config_json(module["config"]);
    }

    // name the calling thread after this module, e.g. "d-dnstap". thread names are limited to 15 characters
    void _name_current_thread() const
    {
        auto thread_name = schema_key().substr(0, 1) + "-" + _name;
        pthread_setname_np(pthread_self(), thread_name.substr(0, 15).c_str());
    }

public:
    explicit AbstractModule(const std::string &name)
        : _name(name)
    {
        static const std::regex valid_name("[a-zA-Z_][a-zA-Z0-9_-]*");
        if (!std::regex_match(name, valid_name)) {
            throw ConfigException(fmt::format("invalid module name: {}", name));
        }
    }

    ~AbstractModule() override = default;

    virtual std::string schema_key() const = 0;
    virtual void start() = 0;
    virtual void stop() = 0;
    virtual void info_json(json &j) const = 0;

    const std::string &name() const
    {
        return _name;
    }

    bool running() const
    {
        return _running;
    }
};

}
