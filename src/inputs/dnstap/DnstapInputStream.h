/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */

#pragma once

#include "FrameSession.h"
#include "InputStream.h"
#include "dnstap.pb.h"
#include "utils.h"
#include <sigslot/signal.hpp>
#include <spdlog/spdlog.h>
#include <thread>
#include <unordered_map>
#include <uv.h>

namespace uvw {
class Loop;
class AsyncHandle;
class PipeHandle;
class TCPHandle;
}

namespace tapfluent::input::dnstap {

const static std::string CONTENT_TYPE = "protobuf:dnstap.Dnstap";

/**
 * dnstap source. exactly one of these config keys selects where records come from:
 *  - socket: unix socket path, Frame Streams server
 *  - tcp: HOST:PORT, Frame Streams server
 *  - dnstap_file: Frame Streams capture file, read to the end by start()
 */
class DnstapInputStream : public tapfluent::InputStream
{
    template <typename H>
    using SessionMap = std::unordered_map<uv_os_fd_t, std::unique_ptr<FrameSessionData<H>>>;

    std::shared_ptr<spdlog::logger> _logger;

    std::unique_ptr<std::thread> _io_thread;
    std::shared_ptr<uvw::Loop> _io_loop;
    std::shared_ptr<uvw::AsyncHandle> _async_h;

    std::shared_ptr<uvw::PipeHandle> _unix_server_h;
    SessionMap<uvw::PipeHandle> _unix_sessions;

    std::shared_ptr<uvw::TCPHandle> _tcp_server_h;
    SessionMap<uvw::TCPHandle> _tcp_sessions;
    std::atomic<std::size_t> _sessions{0};

    void _read_frame_stream_file();
    void _setup_io_loop();
    void _create_frame_stream_unix_socket();
    void _create_frame_stream_tcp_socket();
    template <typename H>
    void _accept_session(H &server, SessionMap<H> &sessions);

protected:
    std::unique_ptr<InputEventProxy> create_event_proxy(const Configurable &filter) override;

public:
    explicit DnstapInputStream(const std::string &name);
    ~DnstapInputStream() override;

    /**
     * decode one Frame Streams data frame as a dnstap record and signal it to all event proxies.
     * returns false if the frame was skipped.
     */
    bool process_data_frame(const void *data, std::size_t len_data);

    // open Frame Streams connections across both socket servers
    std::size_t sessions() const
    {
        return _sessions;
    }

    // tapfluent::AbstractModule
    std::string schema_key() const override
    {
        return "dnstap";
    }
    void start() override;
    void stop() override;
    void info_json(json &j) const override;
};

/**
 * delivers records to connected handlers, optionally only those whose query or response
 * address falls in one of the only_hosts subnets
 */
class DnstapInputEventProxy : public tapfluent::InputEventProxy
{
    lib::utils::IPv4subnetList _ipv4_hosts;
    lib::utils::IPv6subnetList _ipv6_hosts;
    bool _only_hosts{false};

    bool _accept(const ::dnstap::Message &msg) const
    {
        if (msg.has_query_address() && lib::utils::match_subnet(_ipv4_hosts, _ipv6_hosts, msg.query_address())) {
            return true;
        }
        return msg.has_response_address() && lib::utils::match_subnet(_ipv4_hosts, _ipv6_hosts, msg.response_address());
    }

public:
    DnstapInputEventProxy(const std::string &input_name, const Configurable &filter)
        : InputEventProxy(input_name, filter)
    {
        if (!config_exists("only_hosts")) {
            return;
        }
        try {
            lib::utils::parse_host_specs(config_get<StringList>("only_hosts"), _ipv4_hosts, _ipv6_hosts);
        } catch (const lib::utils::UtilsException &e) {
            throw ConfigException(e.what());
        }
        _only_hosts = true;
    }

    size_t consumer_count() const override
    {
        return dnstap_signal.slot_count();
    }

    void dnstap_cb(const ::dnstap::Dnstap &dnstap, size_t size)
    {
        if (_only_hosts && !_accept(dnstap.message())) {
            return;
        }
        dnstap_signal(dnstap, size);
    }

    mutable sigslot::signal<const ::dnstap::Dnstap &, size_t> dnstap_signal;
};

}
