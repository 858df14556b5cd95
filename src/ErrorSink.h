/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */

#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <spdlog/spdlog.h>
#include <string>
#include <thread>

namespace tapfluent {

using json = nlohmann::json;

struct OutputError {
    enum class Kind {
        Parse,
        Publish
    };

    Kind kind;
    std::string tag;
    std::string message;

    std::string kind_str() const
    {
        return kind == Kind::Parse ? "parse" : "publish";
    }
};

/**
 * bounded channel for non-fatal per-record errors.
 *
 * report() never blocks: once capacity is reached new reports are dropped and counted.
 * errors are either collected by the caller with try_pop(), or logged by the consumer thread
 * started with start().
 */
class ErrorSink
{
    std::shared_ptr<spdlog::logger> _logger;

    std::size_t _capacity;
    mutable std::mutex _mutex;
    std::condition_variable _cv;
    std::deque<OutputError> _queue;

    std::atomic<uint64_t> _reported{0};
    std::atomic<uint64_t> _dropped{0};

    std::unique_ptr<std::thread> _consumer;
    bool _stopping{false};

    void _log(const OutputError &err) const;

public:
    static constexpr std::size_t DEFAULT_CAPACITY = 1024;

    explicit ErrorSink(std::size_t capacity = DEFAULT_CAPACITY);
    ~ErrorSink();

    ErrorSink(const ErrorSink &) = delete;
    ErrorSink &operator=(const ErrorSink &) = delete;

    /**
     * enqueue an error report. returns false if it was dropped because the sink is full.
     */
    bool report(OutputError err);

    std::optional<OutputError> try_pop();

    void start();
    void stop();

    std::size_t capacity() const
    {
        return _capacity;
    }

    std::size_t size() const;

    uint64_t reported() const
    {
        return _reported;
    }

    uint64_t dropped() const
    {
        return _dropped;
    }

    void info_json(json &j) const;
};

}
