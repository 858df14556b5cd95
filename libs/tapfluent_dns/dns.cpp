/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */

#include "dns.h"
#include <arpa/inet.h>
#include <cstring>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <string_view>
#include <vector>
#ifdef __GNUC__
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wold-style-cast"
#pragma GCC diagnostic ignored "-Wunused-parameter"
#pragma GCC diagnostic ignored "-Wzero-as-null-pointer-constant"
#endif
#include <DnsLayer.h>
#ifdef __GNUC__
#pragma GCC diagnostic pop
#endif

namespace tapfluent::lib::dns {

const std::unordered_map<uint16_t, std::string> QTypeNames({
    {1, "A"},
    {2, "NS"},
    {5, "CNAME"},
    {6, "SOA"},
    {12, "PTR"},
    {13, "HINFO"},
    {15, "MX"},
    {16, "TXT"},
    {17, "RP"},
    {18, "AFSDB"},
    {24, "SIG"},
    {25, "KEY"},
    {28, "AAAA"},
    {29, "LOC"},
    {33, "SRV"},
    {35, "NAPTR"},
    {36, "KX"},
    {37, "CERT"},
    {39, "DNAME"},
    {41, "OPT"},
    {42, "APL"},
    {43, "DS"},
    {44, "SSHFP"},
    {45, "IPSECKEY"},
    {46, "RRSIG"},
    {47, "NSEC"},
    {48, "DNSKEY"},
    {49, "DHCID"},
    {50, "NSEC3"},
    {51, "NSEC3PARAM"},
    {52, "TLSA"},
    {53, "SMIMEA"},
    {55, "HIP"},
    {59, "CDS"},
    {60, "CDNSKEY"},
    {61, "OPENPGPKEY"},
    {62, "CSYNC"},
    {63, "ZONEMD"},
    {64, "SVCB"},
    {65, "HTTPS"},
    {99, "SPF"},
    {108, "EUI48"},
    {109, "EUI64"},
    {249, "TKEY"},
    {250, "TSIG"},
    {251, "IXFR"},
    {252, "AXFR"},
    {253, "MAILB"},
    {254, "MAILA"},
    {255, "ANY"},
    {256, "URI"},
    {257, "CAA"},
    {32768, "TA"},
    {32769, "DLV"},
});

const std::unordered_map<uint16_t, std::string> QClassNames({
    {1, "IN"},
    {2, "CS"},
    {3, "CH"},
    {4, "HS"},
    {254, "NONE"},
    {255, "ANY"},
});

const std::unordered_map<uint16_t, std::string> RCodeNames({
    {0, "NOERROR"},
    {1, "FORMERR"},
    {2, "SERVFAIL"},
    {3, "NXDOMAIN"},
    {4, "NOTIMP"},
    {5, "REFUSED"},
    {6, "YXDOMAIN"},
    {7, "YXRRSET"},
    {8, "NXRRSET"},
    {9, "NOTAUTH"},
    {10, "NOTZONE"},
});

std::string qtype_str(uint16_t qtype)
{
    if (auto it = QTypeNames.find(qtype); it != QTypeNames.end()) {
        return it->second;
    }
    return fmt::format("TYPE{}", qtype);
}

std::string qclass_str(uint16_t qclass)
{
    if (auto it = QClassNames.find(qclass); it != QClassNames.end()) {
        return it->second;
    }
    return fmt::format("CLASS{}", qclass);
}

std::string rcode_str(uint8_t rcode)
{
    if (auto it = RCodeNames.find(rcode); it != RCodeNames.end()) {
        return it->second;
    }
    return fmt::format("RCODE{}", rcode);
}

DnsMessage parse_dns_wire(const std::string &wire)
{
    if (wire.size() < sizeof(pcpp::dnshdr)) {
        throw DnsParseException(fmt::format("message too short for a DNS header: {} bytes", wire.size()));
    }

    // DnsLayer takes ownership of the buffer when it is not attached to a packet
    auto buf = new uint8_t[wire.size()];
    std::memcpy(buf, wire.data(), wire.size());
    pcpp::DnsLayer payload(buf, wire.size(), nullptr, nullptr);

    auto query = payload.getFirstQuery();
    if (!query) {
        throw DnsParseException("message has no question");
    }

    // DnsLayer stops at the first record running past the buffer and keeps the ones before it,
    // so a truncated message only shows as fewer records than the header counts
    auto header = payload.getDnsHeader();
    std::size_t questions{0};
    for (auto q = query; q; q = payload.getNextQuery(q)) {
        ++questions;
    }
    std::size_t answers{0};
    for (auto r = payload.getFirstAnswer(); r; r = payload.getNextAnswer(r)) {
        ++answers;
    }
    std::size_t authority{0};
    for (auto r = payload.getFirstAuthority(); r; r = payload.getNextAuthority(r)) {
        ++authority;
    }
    std::size_t additional{0};
    for (auto r = payload.getFirstAdditionalRecord(); r; r = payload.getNextAdditionalRecord(r)) {
        ++additional;
    }
    if (questions < ntohs(header->numberOfQuestions) || answers < ntohs(header->numberOfAnswers)
        || authority < ntohs(header->numberOfAuthority) || additional < ntohs(header->numberOfAdditional)) {
        throw DnsParseException(fmt::format("truncated message: {}/{}/{}/{} of {}/{}/{}/{} records decoded",
            questions, answers, authority, additional,
            ntohs(header->numberOfQuestions), ntohs(header->numberOfAnswers),
            ntohs(header->numberOfAuthority), ntohs(header->numberOfAdditional)));
    }

    DnsMessage msg;
    // fully qualified, the root name is "."
    msg.qname = query->getName();
    if (msg.qname.empty() || msg.qname.back() != '.') {
        msg.qname += '.';
    }
    msg.qtype = static_cast<uint16_t>(query->getDnsType());
    msg.qclass = static_cast<uint16_t>(query->getDnsClass());
    msg.rcode = header->responseCode;
    msg.aa = header->authoritativeAnswer;
    msg.tc = header->truncation;
    msg.rd = header->recursionDesired;
    msg.ra = header->recursionAvailable;
    msg.ad = header->authenticData;
    msg.cd = header->checkingDisabled;
    return msg;
}

DomainLabels domain_labels(const std::string &name)
{
    std::string_view trimmed(name);
    if (!trimmed.empty() && trimmed.back() == '.') {
        trimmed.remove_suffix(1);
    }

    std::vector<std::string_view> labels;
    if (!trimmed.empty()) {
        std::size_t start = 0;
        for (;;) {
            auto dot = trimmed.find('.', start);
            if (dot == std::string_view::npos) {
                labels.push_back(trimmed.substr(start));
                break;
            }
            labels.push_back(trimmed.substr(start, dot - start));
            start = dot + 1;
        }
    }

    DomainLabels result;
    for (std::size_t i = 0; i < LABEL_FIELDS.size(); ++i) {
        auto [depth, field] = LABEL_FIELDS[i];
        result[i].first = field;
        if (labels.size() < static_cast<std::size_t>(depth)) {
            result[i].second = name;
            continue;
        }
        result[i].second = fmt::format("{}", fmt::join(labels.end() - (depth - 1), labels.end(), "."));
    }
    return result;
}

}
