/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */

#pragma once

#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

namespace tapfluent {

/**
 * a flat output event: field name to scalar, in insertion order
 */
using Event = nlohmann::ordered_json;

class PublishException : public std::runtime_error
{
public:
    explicit PublishException(const std::string &msg)
        : std::runtime_error(msg)
    {
    }
};

/**
 * sink for output events. implementations own the network and any retry policy,
 * and must be safe to call from several threads.
 */
class Publisher
{
public:
    virtual ~Publisher() = default;

    /**
     * hand an event over for delivery under the given tag. throws PublishException on failure.
     */
    virtual void post(const std::string &tag, const Event &event) = 0;
};

}
