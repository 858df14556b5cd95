/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */

#pragma once

#include <netinet/in.h>
#include <sys/socket.h>
#include <array>
#include <cstdint>
#include <ctime>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace tapfluent::lib::utils {

class UtilsException : public std::runtime_error
{
public:
    UtilsException(const char *msg)
        : std::runtime_error(msg)
    {
    }
    UtilsException(const std::string &msg)
        : std::runtime_error(msg)
    {
    }
};

// subnets given in an only_hosts filter
struct IPv4subnet {
    in_addr addr;
    uint8_t cidr;
    std::string str;
};

struct IPv6subnet {
    in6_addr addr;
    uint8_t cidr;
    std::string str;
};
typedef std::vector<IPv4subnet> IPv4subnetList;
typedef std::vector<IPv6subnet> IPv6subnetList;

std::vector<std::string> split_str_to_vec_str(const std::string &spec, const char &delimiter);
void parse_host_specs(const std::vector<std::string> &host_list, IPv4subnetList &ipv4_list, IPv6subnetList &ipv6_list);
std::optional<IPv4subnetList::const_iterator> match_subnet(const IPv4subnetList &ipv4_list, const uint8_t *ipv4_val);
std::optional<IPv6subnetList::const_iterator> match_subnet(const IPv6subnetList &ipv6_list, const uint8_t *ipv6_val);

/**
 * match raw network order address bytes (4 or 16 bytes, as carried in dnstap) against the subnet lists
 */
bool match_subnet(const IPv4subnetList &ipv4_list, const IPv6subnetList &ipv6_list, const std::string &raw_addr);

/**
 * network prefix masks for both address families, built once from prefix lengths
 */
class AddressMask
{
    std::array<uint8_t, 4> _v4;
    std::array<uint8_t, 16> _v6;
    uint8_t _v4_cidr;
    uint8_t _v6_cidr;

public:
    AddressMask(uint8_t v4_cidr, uint8_t v6_cidr);

    uint8_t v4_cidr() const
    {
        return _v4_cidr;
    }

    uint8_t v6_cidr() const
    {
        return _v6_cidr;
    }

    /**
     * mask raw address bytes and return the canonical string form of the network prefix.
     * the family is chosen by length alone: 4 bytes IPv4, 16 bytes IPv6. anything else yields an empty string.
     */
    std::string mask(const std::string &raw_addr) const;
};

/**
 * RFC 3339 UTC timestamp with nanosecond precision, trailing fractional zeros trimmed
 */
std::string format_rfc3339_nano(uint64_t sec, uint64_t nsec);

}
