/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */

#include "DnstapInputStream.h"
#include <cassert>
#include <filesystem>
#include <uvw/async.h>
#include <uvw/loop.h>
#include <uvw/pipe.h>
#include <uvw/stream.h>
#include <uvw/tcp.h>

namespace tapfluent::input::dnstap {

DnstapInputStream::DnstapInputStream(const std::string &name)
    : tapfluent::InputStream(name)
{
    GOOGLE_PROTOBUF_VERIFY_VERSION;
    _logger = spdlog::get("tapfluent");
    assert(_logger);
}

DnstapInputStream::~DnstapInputStream()
{
    stop();
}

bool DnstapInputStream::process_data_frame(const void *data, std::size_t len_data)
{
    ::dnstap::Dnstap d;
    if (!d.ParseFromArray(data, static_cast<int>(len_data))) {
        _logger->warn("[{}] Dnstap::ParseFromArray fail, skipping frame of size {}", _name, len_data);
        ++_skipped;
        return false;
    }
    if (!d.has_type() || d.type() != ::dnstap::Dnstap_Type_MESSAGE || !d.has_message()) {
        _logger->warn("[{}] dnstap data is wrong type or has no message, skipping frame of size {}", _name, len_data);
        ++_skipped;
        return false;
    }
    ++_records;

    std::shared_lock lock(_input_mutex);
    for (auto &proxy : _event_proxies) {
        static_cast<DnstapInputEventProxy *>(proxy.get())->dnstap_cb(d, len_data);
    }
    return true;
}

void DnstapInputStream::_read_frame_stream_file()
{
    assert(config_exists("dnstap_file"));

    auto file_options = fstrm_file_options_init();
    fstrm_file_options_set_file_path(file_options, config_get<std::string>("dnstap_file").c_str());

    auto reader_options = fstrm_reader_options_init();
    auto res = fstrm_reader_options_add_content_type(reader_options,
        reinterpret_cast<const uint8_t *>(CONTENT_TYPE.data()), CONTENT_TYPE.size());
    if (res != fstrm_res_success) {
        fstrm_reader_options_destroy(&reader_options);
        fstrm_file_options_destroy(&file_options);
        throw DnstapException("fstrm_reader_options_add_content_type() failed");
    }

    auto reader = fstrm_file_reader_init(file_options, reader_options);
    fstrm_file_options_destroy(&file_options);
    fstrm_reader_options_destroy(&reader_options);
    if (!reader) {
        throw DnstapException(fmt::format("unable to open dnstap file: {}", config_get<std::string>("dnstap_file")));
    }
    if (fstrm_reader_open(reader) != fstrm_res_success) {
        fstrm_reader_destroy(&reader);
        throw DnstapException(fmt::format("unable to read dnstap file: {}", config_get<std::string>("dnstap_file")));
    }

    _logger->info("[{}]: reading dnstap file {}", _name, config_get<std::string>("dnstap_file"));
    uint64_t frames{0};
    for (;;) {
        const uint8_t *data;
        size_t len_data;

        res = fstrm_reader_read(reader, &data, &len_data);
        if (res == fstrm_res_success) {
            if (process_data_frame(data, len_data)) {
                ++frames;
            }
        } else if (res == fstrm_res_stop) {
            // normal end of data stream
            break;
        } else {
            _logger->warn("[{}] fstrm_reader_read() data stream ended abnormally: {}", _name, static_cast<int>(res));
            break;
        }
    }
    _logger->info("[{}]: finished dnstap file, {} records", _name, frames);

    fstrm_reader_destroy(&reader);
}

void DnstapInputStream::start()
{
    if (_running) {
        return;
    }

    auto sources = config_exists("dnstap_file") + config_exists("socket") + config_exists("tcp");
    if (sources != 1) {
        throw DnstapException("config must specify exactly one of: socket, tcp, dnstap_file");
    }

    if (config_exists("dnstap_file")) {
        // read synchronously, the caller's thread does all the work
        _running = true;
        try {
            _read_frame_stream_file();
        } catch (const DnstapException &) {
            _running = false;
            throw;
        }
        return;
    } else if (config_exists("socket")) {
        _create_frame_stream_unix_socket();
    } else {
        _create_frame_stream_tcp_socket();
    }

    _io_thread = std::make_unique<std::thread>([this] {
        _name_current_thread();
        _io_loop->run();
        _io_loop->close();
    });

    _running = true;
}

void DnstapInputStream::_setup_io_loop()
{
    // main io loop, run in its own thread
    _io_loop = uvw::Loop::create();
    if (!_io_loop) {
        throw DnstapException("unable to create io loop");
    }
    // AsyncHandle lets us stop the loop from its own thread
    _async_h = _io_loop->resource<uvw::AsyncHandle>();
    if (!_async_h) {
        throw DnstapException("unable to initialize AsyncHandle");
    }
    _async_h->once<uvw::AsyncEvent>([this](const auto &, auto &) {
        // closes the server, every client session and this handle, after which run() returns
        _io_loop->walk([](auto &&h) {
            if (!h.closing()) {
                h.close();
            }
        });
    });
    _async_h->on<uvw::ErrorEvent>([this](const auto &err, auto &handle) {
        _logger->error("[{}] AsyncEvent error: {}", _name, err.what());
        handle.close();
    });
}

template <typename H>
void DnstapInputStream::_accept_session(H &server, SessionMap<H> &sessions)
{
    auto client = _io_loop->resource<H>();
    if (!client) {
        _logger->error("[{}] unable to initialize dnstap client handle", _name);
        return;
    }

    server.accept(*client);
    // a closing handle no longer has a usable fd, so the session key is fixed here
    uv_os_fd_t fd = client->fd();

    client->template on<uvw::ErrorEvent>([this](const uvw::ErrorEvent &err, H &c_sock) {
        _logger->error("[{}]: dnstap client socket error: {}", _name, err.what());
        c_sock.stop();
        c_sock.close();
    });
    client->template on<uvw::DataEvent>([this, &sessions, fd](const uvw::DataEvent &data, H &c_sock) {
        auto session = sessions.find(fd);
        if (session == sessions.end()) {
            return;
        }
        try {
            session->second->receive_socket_data(reinterpret_cast<uint8_t *>(data.data.get()), data.length);
        } catch (const DnstapException &err) {
            // a broken handshake or oversized frame ends this session only
            _logger->error("[{}] dnstap client read error: {}", _name, err.what());
            c_sock.stop();
            c_sock.close();
        }
    });
    client->template on<uvw::CloseEvent>([this, &sessions, fd](const uvw::CloseEvent &, H &) {
        _logger->info("[{}]: dnstap client {} disconnected", _name, static_cast<int>(fd));
        if (sessions.erase(fd)) {
            --_sessions;
        }
    });
    client->template on<uvw::EndEvent>([](const uvw::EndEvent &, H &c_sock) {
        c_sock.stop();
        c_sock.close();
    });

    _logger->info("[{}]: dnstap client {} connected", _name, static_cast<int>(fd));
    sessions[fd] = std::make_unique<FrameSessionData<H>>(client, CONTENT_TYPE,
        [this](const void *data, std::size_t len_data) { process_data_frame(data, len_data); });
    ++_sessions;
    client->read();
}

void DnstapInputStream::_create_frame_stream_tcp_socket()
{
    assert(config_exists("tcp"));

    // split address and port
    auto tcp_config = config_get<std::string>("tcp");
    auto delimiter = tcp_config.rfind(':');
    if (delimiter == std::string::npos) {
        throw DnstapException("invalid tcp address specification, use HOST:PORT");
    }

    std::string host;
    unsigned long port;
    try {
        host = tcp_config.substr(0, delimiter);
        port = std::stoul(tcp_config.substr(delimiter + 1));
    } catch (const std::exception &) {
        throw DnstapException("unable to parse tcp address specification, use HOST:PORT");
    }
    if (port == 0 || port > 65535) {
        throw DnstapException(fmt::format("invalid tcp port: {}", port));
    }

    _setup_io_loop();

    _tcp_server_h = _io_loop->resource<uvw::TCPHandle>();
    if (!_tcp_server_h) {
        throw DnstapException("unable to initialize server TCPHandle");
    }
    _tcp_server_h->on<uvw::ErrorEvent>([this](const auto &err, auto &handle) {
        _logger->error("[{}] socket error: {}", _name, err.what());
        handle.close();
    });
    _tcp_server_h->on<uvw::ListenEvent>([this](const uvw::ListenEvent &, uvw::TCPHandle &server) {
        _accept_session(server, _tcp_sessions);
    });

    _logger->info("[{}]: opening dnstap server on {}", _name, tcp_config);
    _tcp_server_h->bind(host, static_cast<unsigned int>(port));
    _tcp_server_h->listen();
}

void DnstapInputStream::_create_frame_stream_unix_socket()
{
    assert(config_exists("socket"));
    auto path = config_get<std::string>("socket");

    _setup_io_loop();

    _unix_server_h = _io_loop->resource<uvw::PipeHandle>();
    if (!_unix_server_h) {
        throw DnstapException("unable to initialize server PipeHandle");
    }
    _unix_server_h->on<uvw::ErrorEvent>([this](const auto &err, auto &handle) {
        _logger->error("[{}] socket error: {}", _name, err.what());
        handle.close();
    });
    _unix_server_h->on<uvw::ListenEvent>([this](const uvw::ListenEvent &, uvw::PipeHandle &server) {
        _accept_session(server, _unix_sessions);
    });

    // a stale socket from an earlier run would make bind fail
    std::error_code ec;
    std::filesystem::remove(path, ec);

    _logger->info("[{}]: opening dnstap server on {}", _name, path);
    _unix_server_h->bind(path);
    _unix_server_h->listen();
}

void DnstapInputStream::stop()
{
    if (!_running) {
        return;
    }

    if (_async_h && _io_thread) {
        // the loop can only be stopped from its own thread
        _async_h->send();
        if (_io_thread->joinable()) {
            _io_thread->join();
        }
    }
    _io_thread.reset();
    _unix_sessions.clear();
    _tcp_sessions.clear();
    _sessions = 0;

    _running = false;
    _logger->info("[{}]: dnstap input stopped, {} records, {} skipped", _name, _records.load(), _skipped.load());
}

void DnstapInputStream::info_json(json &j) const
{
    common_info_json(j);
    j[schema_key()]["sessions"] = _sessions.load();
}

std::unique_ptr<InputEventProxy> DnstapInputStream::create_event_proxy(const Configurable &filter)
{
    return std::make_unique<DnstapInputEventProxy>(_name, filter);
}

}
