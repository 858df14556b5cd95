/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */

#include "ErrorSink.h"
#include <cassert>
#include <pthread.h>

namespace tapfluent {

ErrorSink::ErrorSink(std::size_t capacity)
    : _capacity(capacity)
{
    if (!_capacity) {
        throw std::invalid_argument("error sink capacity must be greater than zero");
    }
    _logger = spdlog::get("tapfluent");
    assert(_logger);
}

ErrorSink::~ErrorSink()
{
    stop();
}

bool ErrorSink::report(OutputError err)
{
    {
        std::unique_lock lock(_mutex);
        if (_queue.size() >= _capacity) {
            ++_dropped;
            return false;
        }
        _queue.push_back(std::move(err));
        ++_reported;
    }
    _cv.notify_one();
    return true;
}

std::optional<OutputError> ErrorSink::try_pop()
{
    std::unique_lock lock(_mutex);
    if (_queue.empty()) {
        return std::nullopt;
    }
    auto err = std::move(_queue.front());
    _queue.pop_front();
    return err;
}

std::size_t ErrorSink::size() const
{
    std::unique_lock lock(_mutex);
    return _queue.size();
}

void ErrorSink::_log(const OutputError &err) const
{
    switch (err.kind) {
    case OutputError::Kind::Parse:
        _logger->debug("[{}] dropped dnstap record: {}", err.tag, err.message);
        break;
    case OutputError::Kind::Publish:
        _logger->warn("[{}] {}", err.tag, err.message);
        break;
    }
}

void ErrorSink::start()
{
    std::unique_lock lock(_mutex);
    if (_consumer) {
        return;
    }
    _stopping = false;
    _consumer = std::make_unique<std::thread>([this] {
        pthread_setname_np(pthread_self(), "errors");
        std::unique_lock lock(_mutex);
        for (;;) {
            _cv.wait(lock, [this] { return _stopping || !_queue.empty(); });
            while (!_queue.empty()) {
                auto err = std::move(_queue.front());
                _queue.pop_front();
                lock.unlock();
                _log(err);
                lock.lock();
            }
            if (_stopping) {
                break;
            }
        }
    });
}

void ErrorSink::stop()
{
    std::unique_ptr<std::thread> consumer;
    {
        std::unique_lock lock(_mutex);
        if (!_consumer) {
            return;
        }
        _stopping = true;
        consumer = std::move(_consumer);
    }
    _cv.notify_all();
    if (consumer->joinable()) {
        consumer->join();
    }
    if (_dropped) {
        _logger->warn("error sink dropped {} reports while full", _dropped.load());
    }
}

void ErrorSink::info_json(json &j) const
{
    j["errors"]["capacity"] = _capacity;
    j["errors"]["queued"] = size();
    j["errors"]["reported"] = _reported.load();
    j["errors"]["dropped"] = _dropped.load();
}

}
