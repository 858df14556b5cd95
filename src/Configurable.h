/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */

#pragma once

#include <cstdint>
#include <fmt/core.h>
#include <mutex>
#include <nlohmann/json.hpp>
#include <regex>
#include <shared_mutex>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>
#include <yaml-cpp/yaml.h>

namespace tapfluent {

using json = nlohmann::json;

class ConfigException : public std::runtime_error
{
public:
    explicit ConfigException(const std::string &msg)
        : std::runtime_error(msg)
    {
    }
};

/**
 * flat, thread safe key/value settings of one module: an input, the handler, or the output.
 * values are strings, unsigned integers, booleans or lists of strings.
 */
class Configurable
{
public:
    typedef std::vector<std::string> StringList;
    typedef std::variant<std::string, uint64_t, bool, StringList> Value;

private:
    std::unordered_map<std::string, Value> _config;
    mutable std::shared_mutex _config_mutex;

public:
    Configurable() = default;
    virtual ~Configurable() = default;

    Configurable(const Configurable &) = delete;
    Configurable &operator=(const Configurable &) = delete;

    /**
     * copy every key of other over this one, replacing keys present in both
     */
    void config_merge(const Configurable &other)
    {
        std::shared_lock rlock(other._config_mutex);
        std::unique_lock wlock(_config_mutex);
        for (const auto &[key, value] : other._config) {
            _config[key] = value;
        }
    }

    template <class T>
    T config_get(const std::string &key) const
    {
        std::shared_lock lock(_config_mutex);
        auto entry = _config.find(key);
        if (entry == _config.end()) {
            throw ConfigException(fmt::format("missing key: {}", key));
        }
        auto val = std::get_if<T>(&entry->second);
        if (!val) {
            throw ConfigException(fmt::format("wrong type for key: {}", key));
        }
        return *val;
    }

    // the configured value, or fallback when the key is absent. a value of the wrong type still throws.
    template <class T>
    T config_get_or(const std::string &key, const T &fallback) const
    {
        if (!config_exists(key)) {
            return fallback;
        }
        return config_get<T>(key);
    }

    template <class T>
    void config_set(const std::string &key, const T &val)
    {
        std::unique_lock lock(_config_mutex);
        _config[key] = val;
    }

    // a string literal is stored as std::string, not bool
    void config_set(const std::string &key, const char *val)
    {
        std::unique_lock lock(_config_mutex);
        _config[key] = std::string(val);
    }

    bool config_exists(const std::string &key) const
    {
        std::shared_lock lock(_config_mutex);
        return _config.count(key) == 1;
    }

    void config_json(json &j) const
    {
        std::shared_lock lock(_config_mutex);
        for (const auto &[key, value] : _config) {
            std::visit([&j, &key = key](auto &&arg) { j[key] = arg; }, value);
        }
    }

    /**
     * load one YAML section (a map of scalars and scalar sequences).
     * unquoted digits become integers and true/false booleans; quoted scalars always stay strings.
     */
    void config_set_yaml(const YAML::Node &section)
    {
        if (!section.IsMap()) {
            throw ConfigException("configuration section must be a map");
        }
        std::unique_lock lock(_config_mutex);
        for (YAML::const_iterator it = section.begin(); it != section.end(); ++it) {
            auto key = it->first.as<std::string>();
            YAML::Node node = it->second;

            if (node.IsSequence()) {
                StringList sl;
                for (std::size_t i = 0; i < node.size(); ++i) {
                    if (!node[i].IsScalar()) {
                        throw ConfigException(fmt::format("invalid value for sequence in key: {}", key));
                    }
                    sl.push_back(node[i].as<std::string>());
                }
                _config[key] = sl;
                continue;
            }

            if (!node.IsScalar()) {
                throw ConfigException(fmt::format("invalid value for key: {}", key));
            }

            auto value = node.as<std::string>();
            if (node.Tag() == "!") {
                _config[key] = value;
            } else if (std::regex_match(value, std::regex("[0-9]+"))) {
                _config[key] = node.as<uint64_t>();
            } else if (std::regex_match(value, std::regex("true|false", std::regex_constants::icase))) {
                _config[key] = node.as<bool>();
            } else {
                _config[key] = value;
            }
        }
    }
};

class Config : public Configurable
{
};

}
