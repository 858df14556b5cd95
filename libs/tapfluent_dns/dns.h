/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */

#pragma once

#include <array>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>

namespace tapfluent::lib::dns {

class DnsParseException : public std::runtime_error
{
public:
    explicit DnsParseException(const std::string &msg)
        : std::runtime_error(msg)
    {
    }
};

/**
 * the parts of a DNS wire message that end up in an output event
 */
struct DnsMessage {
    std::string qname;
    uint16_t qclass{0};
    uint16_t qtype{0};
    uint8_t rcode{0};
    bool aa{false};
    bool tc{false};
    bool rd{false};
    bool ra{false};
    bool ad{false};
    bool cd{false};
};

/**
 * decode a raw DNS wire message. throws DnsParseException if the buffer is too short for a header,
 * carries no decodable question, or holds fewer records than its header counts.
 * qname is fully qualified, with a trailing dot.
 */
DnsMessage parse_dns_wire(const std::string &wire);

extern const std::unordered_map<uint16_t, std::string> QTypeNames;
extern const std::unordered_map<uint16_t, std::string> QClassNames;
extern const std::unordered_map<uint16_t, std::string> RCodeNames;

// mnemonics, falling back to RFC 3597 style for unassigned codes
std::string qtype_str(uint16_t qtype);
std::string qclass_str(uint16_t qclass);
std::string rcode_str(uint8_t rcode);

typedef std::pair<int, const char *> LabelField;
constexpr std::array<LabelField, 4> LABEL_FIELDS{{{2, "tld"}, {3, "2ld"}, {4, "3ld"}, {5, "4ld"}}};

typedef std::array<std::pair<const char *, std::string>, LABEL_FIELDS.size()> DomainLabels;

/**
 * hierarchical suffix labels of a name, one per entry in LABEL_FIELDS.
 * depth d yields the last d-1 labels when the name has at least d labels (root excluded),
 * otherwise the full name.
 */
DomainLabels domain_labels(const std::string &name);

}
