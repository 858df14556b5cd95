/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */

#pragma once

#include <arpa/inet.h>
#include <cstring>
#include <fstrm.h>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>

namespace tapfluent::input::dnstap {

// failure of the dnstap input: bad source config, socket setup or a broken Frame Streams session
class DnstapException : public std::runtime_error
{
public:
    explicit DnstapException(const std::string &msg)
        : std::runtime_error(msg)
    {
    }
};

/**
 * Frame Streams session state for one connected dnstap sender.
 *
 * C is the client handle type and only needs write(std::unique_ptr<char[]>, len), so tests can
 * substitute a mock for the uvw handle.
 */
template <typename C>
class FrameSessionData
{
public:
    using on_data_frame_cb_t = std::function<void(const void *data, std::size_t size)>;

    enum class FrameState {
        New,
        Ready,
        Running,
        Finishing
    };

private:
    struct ControlDeleter {
        void operator()(fstrm_control *c) const
        {
            fstrm_control_destroy(&c);
        }
    };
    using control_ptr = std::unique_ptr<fstrm_control, ControlDeleter>;

    std::shared_ptr<C> _client_h;
    std::string _content_type;
    using binary = std::basic_string<uint8_t>;
    binary _buffer;
    bool _is_bidir{false};

    on_data_frame_cb_t _on_data_frame_cb;

    FrameState _state{FrameState::New};

    void _decode_control_frame(const void *control_frame, size_t len_control_frame);
    void _send_control_frame(fstrm_control_type type);
    bool _try_yield_frame();

public:
    FrameSessionData(
        std::shared_ptr<C> client,
        const std::string &content_type,
        on_data_frame_cb_t on_data_frame)
        : _client_h{std::move(client)}
        , _content_type{content_type}
        , _on_data_frame_cb{std::move(on_data_frame)}
    {
    }

    void receive_socket_data(const uint8_t data[], std::size_t data_len);

    const FrameState &state() const
    {
        return _state;
    }

    bool is_bidir() const
    {
        return _is_bidir;
    }
};

template <typename C>
void FrameSessionData<C>::_send_control_frame(fstrm_control_type type)
{
    control_ptr c{fstrm_control_init()};
    if (fstrm_control_set_type(c.get(), type) != fstrm_res_success) {
        throw DnstapException("unable to build control frame: fstrm_control_set_type");
    }
    if (type == FSTRM_CONTROL_ACCEPT) {
        auto res = fstrm_control_add_field_content_type(c.get(),
            reinterpret_cast<const uint8_t *>(_content_type.data()), _content_type.size());
        if (res != fstrm_res_success) {
            throw DnstapException("unable to build control frame: fstrm_control_add_field_content_type");
        }
    }
    auto control_frame = std::make_unique<char[]>(FSTRM_CONTROL_FRAME_LENGTH_MAX);
    size_t len_control_frame = FSTRM_CONTROL_FRAME_LENGTH_MAX;
    if (fstrm_control_encode(c.get(), control_frame.get(), &len_control_frame, FSTRM_CONTROL_FLAG_WITH_HEADER) != fstrm_res_success) {
        throw DnstapException("unable to build control frame: fstrm_control_encode");
    }
    _client_h->write(std::move(control_frame), len_control_frame);
}

template <typename C>
void FrameSessionData<C>::_decode_control_frame(const void *control_frame, size_t len_control_frame)
{
    control_ptr c{fstrm_control_init()};
    if (fstrm_control_decode(c.get(), control_frame, len_control_frame, 0) != fstrm_res_success) {
        throw DnstapException("unable to parse control frame");
    }
    fstrm_control_type c_type;
    if (fstrm_control_get_type(c.get(), &c_type) != fstrm_res_success) {
        throw DnstapException("unable to parse control frame type");
    }

    size_t n_content_type{0};
    if (fstrm_control_get_num_field_content_type(c.get(), &n_content_type) != fstrm_res_success) {
        throw DnstapException("unable to parse control frame content types");
    }
    for (size_t idx = 0; idx < n_content_type; idx++) {
        const uint8_t *content_type;
        size_t len_content_type;
        if (fstrm_control_get_field_content_type(c.get(), idx, &content_type, &len_content_type) != fstrm_res_success) {
            throw DnstapException("unable to parse content type");
        }
        if (len_content_type != _content_type.size() || std::memcmp(content_type, _content_type.data(), len_content_type) != 0) {
            throw DnstapException("content type mismatch");
        }
    }

    switch (c_type) {
        // uni-directional
    case FSTRM_CONTROL_START:
        if ((!_is_bidir && _state != FrameState::New) || (_is_bidir && _state != FrameState::Ready)) {
            throw DnstapException("received START frame out of order, aborting");
        }
        _state = FrameState::Running;
        break;
        // bi-directional: got READY, send ACCEPT
    case FSTRM_CONTROL_READY:
        if (_state != FrameState::New) {
            throw DnstapException("received READY frame but already started, aborting");
        }
        _state = FrameState::Ready;
        _is_bidir = true;
        _send_control_frame(FSTRM_CONTROL_ACCEPT);
        break;
    case FSTRM_CONTROL_STOP:
        _state = FrameState::Finishing;
        if (_is_bidir) {
            _send_control_frame(FSTRM_CONTROL_FINISH);
        }
        break;
    case FSTRM_CONTROL_ACCEPT:
    case FSTRM_CONTROL_FINISH:
        break;
    }
}

template <typename C>
void FrameSessionData<C>::receive_socket_data(const uint8_t data[], std::size_t data_len)
{
    _buffer.append(data, data_len);
    while (_try_yield_frame()) { }
}

template <typename C>
bool FrameSessionData<C>::_try_yield_frame()
{
    std::uint32_t frame_len{0};

    if (_buffer.size() < sizeof(frame_len)) {
        // need more data
        return false;
    }

    std::memcpy(&frame_len, _buffer.data(), sizeof(frame_len));
    frame_len = ntohl(frame_len);

    if (frame_len != 0) {
        // this is a data frame and we have the length
        if (_state != FrameState::Running) {
            throw DnstapException("data frame without a START control frame");
        }

        // ensure we never allocate more than max
        if (frame_len > FSTRM_READER_MAX_FRAME_SIZE_DEFAULT) {
            throw DnstapException("data frame too large");
        }

        if (_buffer.size() < sizeof(frame_len) + frame_len) {
            return false;
        }
        _on_data_frame_cb(_buffer.data() + sizeof(frame_len), frame_len);
        _buffer.erase(0, sizeof(frame_len) + frame_len);
    } else {
        // escape code followed by control frame length. this happens infrequently
        std::uint32_t ctrl_len{0};

        if (_buffer.size() < sizeof(frame_len) + sizeof(ctrl_len)) {
            return false;
        }

        std::memcpy(&ctrl_len, _buffer.data() + sizeof(frame_len), sizeof(ctrl_len));
        ctrl_len = ntohl(ctrl_len);

        if (ctrl_len > FSTRM_CONTROL_FRAME_LENGTH_MAX) {
            throw DnstapException("control frame too large");
        }

        auto header_len = sizeof(frame_len) + sizeof(ctrl_len);
        if (_buffer.size() < header_len + ctrl_len) {
            return false;
        }
        _decode_control_frame(_buffer.data() + header_len, ctrl_len);
        _buffer.erase(0, header_len + ctrl_len);
    }

    // parsed ok. if we have more data, try to parse another frame
    return !_buffer.empty();
}

}
