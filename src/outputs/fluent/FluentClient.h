/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */

#pragma once

#include "AbstractModule.h"
#include "Publisher.h"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <ctime>
#include <deque>
#include <mutex>
#include <spdlog/spdlog.h>
#include <thread>

namespace uvw {
class Loop;
class AsyncHandle;
class TCPHandle;
class TimerHandle;
}

namespace tapfluent::output::fluent {

/**
 * encode one event in Fluentd forward protocol Message Mode: msgpack [tag, time, record].
 * time is integer seconds, or EventTime (ext type 0) when sub_second is set.
 */
std::string encode_forward_message(const std::string &tag, const Event &record, const timespec &stamp, bool sub_second);

class FluentClient : public tapfluent::AbstractModule, public tapfluent::Publisher
{
    std::shared_ptr<spdlog::logger> _logger;

    std::string _host;
    unsigned int _port{24224};
    uint64_t _buffer_limit{8 * 1024 * 1024};
    uint64_t _retry_wait{500};
    uint64_t _max_retry_wait{60000};
    uint64_t _max_retry{13};
    bool _sub_second{false};

    // producer side, shared with the io thread
    mutable std::mutex _pending_mutex;
    std::condition_variable _flushed_cv;
    std::deque<std::string> _pending;
    uint64_t _pending_bytes{0};

    std::atomic<uint64_t> _accepted{0};
    std::atomic<uint64_t> _rejected{0};
    std::atomic<uint64_t> _discarded{0};
    std::atomic<uint64_t> _bytes_written{0};
    std::atomic<uint64_t> _reconnects{0};
    std::atomic_bool _connected{false};

    // io thread only
    std::unique_ptr<std::thread> _io_thread;
    std::shared_ptr<uvw::Loop> _io_loop;
    std::shared_ptr<uvw::AsyncHandle> _flush_h;
    std::shared_ptr<uvw::AsyncHandle> _stop_h;
    std::shared_ptr<uvw::TimerHandle> _retry_timer;
    std::shared_ptr<uvw::TCPHandle> _tcp;
    uint64_t _attempts{0};
    bool _stopping{false};

    void _read_config();
    void _connect();
    void _schedule_reconnect();
    void _flush();
    void _discard_pending(const std::string &reason);

public:
    FluentClient(const std::string &name);
    ~FluentClient();

    // tapfluent::Publisher
    void post(const std::string &tag, const Event &event) override;

    bool connected() const
    {
        return _connected;
    }

    uint64_t pending_bytes() const;

    /**
     * wait until the client is connected and every buffered event has been handed to the socket.
     * returns false if that did not happen within timeout, or the client is not running.
     */
    bool drain(std::chrono::milliseconds timeout);

    // tapfluent::AbstractModule
    std::string schema_key() const override
    {
        return "fluent";
    }
    void start() override;
    void stop() override;
    void info_json(json &j) const override;
};

}
