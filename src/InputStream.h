/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */

#pragma once

#include "AbstractModule.h"
#include <memory>
#include <shared_mutex>
#include <vector>

namespace tapfluent {

/**
 * the point where handlers attach to an input. each proxy carries its own filter config,
 * and inputs only deliver records through proxies.
 */
class InputEventProxy : public Configurable
{
protected:
    std::string _input_name;

public:
    InputEventProxy(const std::string &input_name, const Configurable &filter)
        : _input_name(input_name)
    {
        config_merge(filter);
    }

    ~InputEventProxy() override = default;

    const std::string &name() const
    {
        return _input_name;
    }

    // number of connected handler slots
    virtual size_t consumer_count() const
    {
        return 0;
    }
};

class InputStream : public AbstractModule
{
protected:
    mutable std::shared_mutex _input_mutex;
    std::vector<std::unique_ptr<InputEventProxy>> _event_proxies;

    std::atomic<uint64_t> _records{0};
    std::atomic<uint64_t> _skipped{0};

    virtual std::unique_ptr<InputEventProxy> create_event_proxy(const Configurable &filter) = 0;

    void common_info_json(json &j) const
    {
        AbstractModule::common_info_json(j);
        auto &input = j[schema_key()];
        input["consumers"] = consumer_count();
        input["records"] = _records.load();
        input["skipped"] = _skipped.load();
    }

public:
    explicit InputStream(const std::string &name)
        : AbstractModule(name)
    {
    }

    size_t consumer_count() const
    {
        std::shared_lock lock(_input_mutex);
        size_t count = 0;
        for (const auto &proxy : _event_proxies) {
            count += proxy->consumer_count();
        }
        return count;
    }

    /**
     * create a proxy filtered by filter. the input owns it for its whole lifetime.
     * throws ConfigException for an invalid filter.
     */
    InputEventProxy *add_event_proxy(const Configurable &filter)
    {
        std::unique_ptr<InputEventProxy> proxy;
        try {
            proxy = create_event_proxy(filter);
        } catch (const ConfigException &e) {
            throw ConfigException(fmt::format("invalid input filter for {}: {}", _name, e.what()));
        }
        std::unique_lock lock(_input_mutex);
        _event_proxies.push_back(std::move(proxy));
        return _event_proxies.back().get();
    }

    uint64_t records() const
    {
        return _records;
    }

    uint64_t skipped() const
    {
        return _skipped;
    }
};

}
