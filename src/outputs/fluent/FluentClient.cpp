/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */

#include "FluentClient.h"
#include <algorithm>
#include <cassert>
#include <cstring>
#include <fmt/format.h>
#include <uvw/async.h>
#include <uvw/dns.h>
#include <uvw/loop.h>
#include <uvw/stream.h>
#include <uvw/tcp.h>
#include <uvw/timer.h>

namespace tapfluent::output::fluent {

std::string encode_forward_message(const std::string &tag, const Event &record, const timespec &stamp, bool sub_second)
{
    auto message = Event::array();
    message.push_back(tag);
    if (sub_second) {
        // EventTime: ext type 0, 32 bit big endian seconds then nanoseconds
        auto sec = static_cast<uint32_t>(stamp.tv_sec);
        auto nsec = static_cast<uint32_t>(stamp.tv_nsec);
        std::vector<uint8_t> event_time{
            static_cast<uint8_t>(sec >> 24), static_cast<uint8_t>(sec >> 16), static_cast<uint8_t>(sec >> 8), static_cast<uint8_t>(sec),
            static_cast<uint8_t>(nsec >> 24), static_cast<uint8_t>(nsec >> 16), static_cast<uint8_t>(nsec >> 8), static_cast<uint8_t>(nsec)};
        message.push_back(Event::binary(std::move(event_time), 0));
    } else {
        message.push_back(static_cast<uint64_t>(stamp.tv_sec));
    }
    message.push_back(record);
    auto packed = Event::to_msgpack(message);
    return std::string(packed.begin(), packed.end());
}

FluentClient::FluentClient(const std::string &name)
    : tapfluent::AbstractModule(name)
{
    _logger = spdlog::get("tapfluent");
    assert(_logger);
}

FluentClient::~FluentClient()
{
    stop();
}

void FluentClient::_read_config()
{
    _host = config_get_or<std::string>("host", "127.0.0.1");
    if (_host.empty()) {
        throw ConfigException("fluent host must not be empty");
    }
    auto port = config_get_or<uint64_t>("port", 24224);
    if (!port || port > 65535) {
        throw ConfigException(fmt::format("invalid fluent port: {}", port));
    }
    _port = static_cast<unsigned int>(port);

    _buffer_limit = config_get_or<uint64_t>("buffer_limit", 8 * 1024 * 1024);
    if (!_buffer_limit) {
        throw ConfigException("fluent buffer_limit must be greater than zero");
    }
    _retry_wait = std::max<uint64_t>(1, config_get_or<uint64_t>("retry_wait", 500));
    _max_retry_wait = config_get_or<uint64_t>("max_retry_wait", 60000);
    if (_max_retry_wait < _retry_wait) {
        throw ConfigException(fmt::format("fluent max_retry_wait ({}) is less than retry_wait ({})", _max_retry_wait, _retry_wait));
    }
    _max_retry = config_get_or<uint64_t>("max_retry", 13);
    _sub_second = config_get_or<bool>("sub_second_precision", false);
}

void FluentClient::post(const std::string &tag, const Event &event)
{
    timespec stamp;
    std::timespec_get(&stamp, TIME_UTC);
    auto data = encode_forward_message(tag, event, stamp, _sub_second);

    std::unique_lock lock(_pending_mutex);
    if (!_running) {
        ++_rejected;
        throw PublishException(fmt::format("fluent output {} is not running", _name));
    }
    if (_pending_bytes + data.size() > _buffer_limit) {
        ++_rejected;
        throw PublishException(fmt::format("fluent output {} buffer is full ({} bytes pending)", _name, _pending_bytes));
    }
    _pending_bytes += data.size();
    _pending.push_back(std::move(data));
    ++_accepted;
    // under the lock so stop() can not close the handle between the check and the send
    _flush_h->send();
}

uint64_t FluentClient::pending_bytes() const
{
    std::unique_lock lock(_pending_mutex);
    return _pending_bytes;
}

bool FluentClient::drain(std::chrono::milliseconds timeout)
{
    std::unique_lock lock(_pending_mutex);
    _flushed_cv.wait_for(lock, timeout, [this] {
        return !_running || (_connected && _pending.empty());
    });
    return _running && _connected && _pending.empty();
}

void FluentClient::_discard_pending(const std::string &reason)
{
    std::deque<std::string> discard;
    {
        std::unique_lock lock(_pending_mutex);
        discard.swap(_pending);
        _pending_bytes = 0;
    }
    if (discard.empty()) {
        return;
    }
    _discarded += discard.size();
    _logger->error("[{}] discarding {} buffered events: {}", _name, discard.size(), reason);
}

void FluentClient::_flush()
{
    if (!_connected || !_tcp) {
        return;
    }
    std::deque<std::string> batch;
    {
        std::unique_lock lock(_pending_mutex);
        batch.swap(_pending);
        _pending_bytes = 0;
    }
    _flushed_cv.notify_all();
    for (const auto &data : batch) {
        auto buf = std::make_unique<char[]>(data.size());
        std::memcpy(buf.get(), data.data(), data.size());
        _tcp->write(std::move(buf), static_cast<unsigned int>(data.size()));
        _bytes_written += data.size();
    }
}

void FluentClient::_connect()
{
    if (_stopping) {
        return;
    }

    auto request = _io_loop->resource<uvw::GetAddrInfoReq>();
    auto resolved = request->addrInfoSync(_host, std::to_string(_port));
    if (!resolved.first || !resolved.second) {
        _logger->warn("[{}] unable to resolve fluentd host {}", _name, _host);
        _schedule_reconnect();
        return;
    }

    _tcp = _io_loop->resource<uvw::TCPHandle>();
    if (!_tcp) {
        throw PublishException("unable to initialize TCPHandle");
    }
    _tcp->on<uvw::ConnectEvent>([this](const uvw::ConnectEvent &, uvw::TCPHandle &handle) {
        _connected = true;
        _attempts = 0;
        _logger->info("[{}]: connected to fluentd {}:{}", _name, _host, _port);
        // forward protocol acks are not requested, anything read is ignored
        handle.read();
        _flush();
    });
    _tcp->on<uvw::DataEvent>([](const uvw::DataEvent &, uvw::TCPHandle &) {});
    _tcp->on<uvw::ErrorEvent>([this](const uvw::ErrorEvent &err, uvw::TCPHandle &handle) {
        _logger->warn("[{}] fluentd socket error: {}", _name, err.what());
        _connected = false;
        if (!handle.closing()) {
            handle.close();
        }
        _schedule_reconnect();
    });
    _tcp->on<uvw::EndEvent>([this](const uvw::EndEvent &, uvw::TCPHandle &handle) {
        _logger->info("[{}]: fluentd closed the connection", _name);
        _connected = false;
        handle.close();
        _schedule_reconnect();
    });
    _tcp->once<uvw::ShutdownEvent>([](const uvw::ShutdownEvent &, uvw::TCPHandle &handle) {
        handle.close();
    });

    _logger->debug("[{}]: connecting to fluentd {}:{}", _name, _host, _port);
    _tcp->connect(*resolved.second->ai_addr);
}

void FluentClient::_schedule_reconnect()
{
    if (_stopping) {
        return;
    }
    ++_attempts;
    ++_reconnects;
    if (_attempts > _max_retry) {
        _discard_pending(fmt::format("fluentd unreachable after {} attempts", _max_retry));
        _attempts = _max_retry;
    }
    uint64_t wait = _retry_wait;
    for (uint64_t i = 1; i < _attempts && wait < _max_retry_wait; ++i) {
        wait *= 2;
    }
    wait = std::min(wait, _max_retry_wait);
    _logger->debug("[{}]: reconnecting to fluentd in {}ms", _name, wait);
    _retry_timer->start(uvw::TimerHandle::Time{wait}, uvw::TimerHandle::Time{0});
}

void FluentClient::start()
{
    if (_running) {
        return;
    }

    _read_config();

    _io_loop = uvw::Loop::create();
    if (!_io_loop) {
        throw PublishException("unable to create io loop");
    }
    _stopping = false;
    _attempts = 0;

    _flush_h = _io_loop->resource<uvw::AsyncHandle>();
    if (!_flush_h) {
        throw PublishException("unable to initialize AsyncHandle");
    }
    _flush_h->on<uvw::AsyncEvent>([this](const auto &, auto &) {
        _flush();
    });

    _retry_timer = _io_loop->resource<uvw::TimerHandle>();
    if (!_retry_timer) {
        throw PublishException("unable to initialize TimerHandle");
    }
    _retry_timer->on<uvw::TimerEvent>([this](const auto &, auto &) {
        _connect();
    });

    _stop_h = _io_loop->resource<uvw::AsyncHandle>();
    if (!_stop_h) {
        throw PublishException("unable to initialize AsyncHandle");
    }
    _stop_h->once<uvw::AsyncEvent>([this](const auto &, auto &handle) {
        _stopping = true;
        _retry_timer->stop();
        _retry_timer->close();
        _flush_h->close();
        if (_connected) {
            _flush();
            // pending writes complete before the shutdown callback closes the socket
            _tcp->shutdown();
        } else {
            _discard_pending("stopped while disconnected from fluentd");
            if (_tcp && !_tcp->closing()) {
                _tcp->close();
            }
        }
        handle.close();
    });

    _connect();

    {
        std::unique_lock lock(_pending_mutex);
        _running = true;
    }

    _io_thread = std::make_unique<std::thread>([this] {
        _name_current_thread();
        _io_loop->run();
        _io_loop->close();
    });
}

void FluentClient::stop()
{
    {
        std::unique_lock lock(_pending_mutex);
        if (!_running) {
            return;
        }
        _running = false;
    }
    _flushed_cv.notify_all();

    _stop_h->send();
    if (_io_thread && _io_thread->joinable()) {
        _io_thread->join();
    }
    _io_thread.reset();
    _connected = false;
    _tcp.reset();
    _logger->info("[{}]: fluent output stopped, {} events accepted, {} bytes written", _name, _accepted.load(), _bytes_written.load());
}

void FluentClient::info_json(json &j) const
{
    common_info_json(j);
    j[schema_key()]["connected"] = _connected.load();
    j[schema_key()]["pending_bytes"] = pending_bytes();
    j[schema_key()]["accepted"] = _accepted.load();
    j[schema_key()]["rejected"] = _rejected.load();
    j[schema_key()]["discarded"] = _discarded.load();
    j[schema_key()]["bytes_written"] = _bytes_written.load();
    j[schema_key()]["reconnects"] = _reconnects.load();
}

}
