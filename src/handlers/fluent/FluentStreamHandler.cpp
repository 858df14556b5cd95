/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */

#include "FluentStreamHandler.h"
#include "DnstapInputStream.h"
#include "dns.h"
#include <cassert>
#include <fmt/format.h>
#ifdef __GNUC__
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wold-style-cast"
#pragma GCC diagnostic ignored "-Wunused-parameter"
#endif
#include <Logger.h>
#ifdef __GNUC__
#pragma GCC diagnostic pop
#endif

namespace tapfluent::handler::fluent {

namespace {

uint8_t prefix_length(const Configurable &config, const std::string &key, uint64_t def, uint64_t max)
{
    auto len = config.config_get_or<uint64_t>(key, def);
    if (len > max) {
        throw ConfigException(fmt::format("{} must be between 0 and {}, got {}", key, max, len));
    }
    return static_cast<uint8_t>(len);
}

}

RecordClass classify(::dnstap::Message_Type type)
{
    switch (type) {
    case ::dnstap::Message_Type_AUTH_QUERY:
    case ::dnstap::Message_Type_RESOLVER_QUERY:
    case ::dnstap::Message_Type_CLIENT_QUERY:
    case ::dnstap::Message_Type_FORWARDER_QUERY:
    case ::dnstap::Message_Type_STUB_QUERY:
    case ::dnstap::Message_Type_TOOL_QUERY:
        return RecordClass::Query;
    case ::dnstap::Message_Type_AUTH_RESPONSE:
    case ::dnstap::Message_Type_RESOLVER_RESPONSE:
    case ::dnstap::Message_Type_CLIENT_RESPONSE:
    case ::dnstap::Message_Type_FORWARDER_RESPONSE:
    case ::dnstap::Message_Type_STUB_RESPONSE:
    case ::dnstap::Message_Type_TOOL_RESPONSE:
        return RecordClass::Response;
    case ::dnstap::Message_Type_UPDATE_QUERY:
    case ::dnstap::Message_Type_UPDATE_RESPONSE:
        return RecordClass::Unclassified;
    }
    return RecordClass::Unclassified;
}

const std::string &select_payload(const ::dnstap::Message &msg, RecordClass record_class)
{
    switch (record_class) {
    case RecordClass::Query:
        if (!msg.query_message().empty()) {
            return msg.query_message();
        }
        break;
    case RecordClass::Response:
        if (!msg.response_message().empty()) {
            return msg.response_message();
        }
        break;
    case RecordClass::Unclassified:
        break;
    }
    return msg.query_message().empty() ? msg.response_message() : msg.query_message();
}

FluentStreamHandler::FluentStreamHandler(const std::string &name, InputEventProxy *proxy, Publisher *publisher, ErrorSink *errors, const Configurable &config)
    : tapfluent::StreamHandler(name)
    , _publisher(publisher)
    , _errors(errors)
    , _mask(prefix_length(config, "ipv4_mask", DEFAULT_IPV4_MASK, 32), prefix_length(config, "ipv6_mask", DEFAULT_IPV6_MASK, 128))
{
    assert(proxy);
    assert(publisher);
    assert(errors);

    _logger = spdlog::get("tapfluent");
    assert(_logger);

    _dnstap_proxy = dynamic_cast<DnstapInputEventProxy *>(proxy);
    if (!_dnstap_proxy) {
        throw StreamHandlerException(fmt::format("FluentStreamHandler: unsupported input event proxy {}", proxy->name()));
    }

    config_merge(config);

    _tag = config_get_or<std::string>("tag", "");
    if (_tag.empty()) {
        throw ConfigException("fluent handler requires a non-empty tag");
    }

    _read_verbosity(_logger->level());

    // PcapPlusPlus logs malformed packets on its own, errors are reported through the sink instead
    pcpp::Logger::getInstance().suppressLogs();
}

FluentStreamHandler::~FluentStreamHandler()
{
    stop();
}

void FluentStreamHandler::start()
{
    if (_running) {
        return;
    }

    _dnstap_connection = _dnstap_proxy->dnstap_signal.connect(&FluentStreamHandler::process_dnstap_cb, this);
    _logger->info("[{}]: publishing dnstap events under tag {} (ipv4 /{}, ipv6 /{})", _name, _tag, _mask.v4_cidr(), _mask.v6_cidr());

    _running = true;
}

void FluentStreamHandler::stop()
{
    if (!_running) {
        return;
    }

    _dnstap_connection.disconnect();

    _running = false;
}

void FluentStreamHandler::process_dnstap_cb(const ::dnstap::Dnstap &d, [[maybe_unused]] size_t size)
{
    handle(*_publisher, d, *_errors);
}

void FluentStreamHandler::handle(Publisher &publisher, const ::dnstap::Dnstap &record, ErrorSink &errors) const
{
    const auto &msg = record.message();
    auto record_class = classify(msg.type());

    lib::dns::DnsMessage dns;
    try {
        dns = lib::dns::parse_dns_wire(select_payload(msg, record_class));
    } catch (const lib::dns::DnsParseException &e) {
        _report(errors, {OutputError::Kind::Parse, _tag, fmt::format("{}: {}", ::dnstap::Message_Type_Name(msg.type()), e.what())});
        return;
    }

    auto event = Event::object();
    switch (record_class) {
    case RecordClass::Query:
        event["@timestamp"] = lib::utils::format_rfc3339_nano(msg.query_time_sec(), msg.query_time_nsec());
        event["identity"] = record.identity();
        event["query_address"] = _mask.mask(msg.query_address());
        event["query_port"] = msg.query_port();
        break;
    case RecordClass::Response:
        event["@timestamp"] = lib::utils::format_rfc3339_nano(msg.response_time_sec(), msg.response_time_nsec());
        event["identity"] = record.identity();
        event["response_address"] = _mask.mask(msg.response_address());
        event["response_port"] = msg.response_port();
        event["response_zone"] = msg.query_zone();
        break;
    case RecordClass::Unclassified:
        break;
    }

    event["type"] = ::dnstap::Message_Type_Name(msg.type());
    event["socket_family"] = ::dnstap::SocketFamily_Name(msg.socket_family());
    event["socket_protocol"] = ::dnstap::SocketProtocol_Name(msg.socket_protocol());
    event["version"] = record.version();
    event["extra"] = record.extra();

    event["qname"] = dns.qname;
    event["qclass"] = lib::dns::qclass_str(dns.qclass);
    event["qtype"] = lib::dns::qtype_str(dns.qtype);
    event["rcode"] = lib::dns::rcode_str(dns.rcode);
    event["aa"] = dns.aa;
    event["tc"] = dns.tc;
    event["rd"] = dns.rd;
    event["ra"] = dns.ra;
    event["ad"] = dns.ad;
    event["cd"] = dns.cd;

    for (const auto &[field, value] : lib::dns::domain_labels(dns.qname)) {
        event[field] = value;
    }

    try {
        publisher.post(_tag, event);
    } catch (const PublishException &e) {
        _report(errors, {OutputError::Kind::Publish, _tag, e.what()});
    }
}

void FluentStreamHandler::info_json(json &j) const
{
    common_info_json(j);
    j[schema_key()]["tag"] = _tag;
    j[schema_key()]["ipv4_mask"] = _mask.v4_cidr();
    j[schema_key()]["ipv6_mask"] = _mask.v6_cidr();
    j[schema_key()]["verbosity"] = spdlog::level::to_string_view(_verbosity).data();
}

}
