/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */

#pragma once

#include "InputStream.h"
#include "Publisher.h"
#include "StreamHandler.h"
#include "dnstap.pb.h"
#include "utils.h"
#include <sigslot/signal.hpp>
#include <spdlog/spdlog.h>
#include <string>

namespace tapfluent::input::dnstap {
class DnstapInputEventProxy;
}

namespace tapfluent::handler::fluent {

using namespace tapfluent::input::dnstap;

static constexpr const char *FLUENT_SCHEMA{"fluent"};

enum class RecordClass {
    Query,
    Response,
    Unclassified
};

RecordClass classify(::dnstap::Message_Type type);

/**
 * the wire payload to parse for a record of the given class: the classified side first,
 * falling back to whichever payload is non-empty
 */
const std::string &select_payload(const ::dnstap::Message &msg, RecordClass record_class);

/**
 * translates dnstap records into anonymized flat events and publishes them under one tag
 */
class FluentStreamHandler final : public tapfluent::StreamHandler
{
    std::shared_ptr<spdlog::logger> _logger;

    DnstapInputEventProxy *_dnstap_proxy{nullptr};
    Publisher *_publisher;
    ErrorSink *_errors;

    std::string _tag;
    lib::utils::AddressMask _mask;

    sigslot::connection _dnstap_connection;

    void process_dnstap_cb(const ::dnstap::Dnstap &d, size_t size);

public:
    static constexpr uint64_t DEFAULT_IPV4_MASK = 24;
    static constexpr uint64_t DEFAULT_IPV6_MASK = 48;

    FluentStreamHandler(const std::string &name, InputEventProxy *proxy, Publisher *publisher, ErrorSink *errors, const Configurable &config);
    ~FluentStreamHandler() override;

    /**
     * build the event for one record and publish it. parse and publish failures are reported
     * to the error sink when the verbosity threshold allows, never thrown.
     */
    void handle(Publisher &publisher, const ::dnstap::Dnstap &record, ErrorSink &errors) const;

    const std::string &tag() const
    {
        return _tag;
    }

    // tapfluent::AbstractModule
    std::string schema_key() const override
    {
        return FLUENT_SCHEMA;
    }
    void start() override;
    void stop() override;
    void info_json(json &j) const override;
};

}
