/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */

#include "utils.h"
#include <algorithm>
#include <arpa/inet.h>
#include <cctype>
#include <cstring>
#include <fmt/chrono.h>
#include <fmt/format.h>
#include <iterator>
#include <sstream>
#ifdef __GNUC__
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wold-style-cast"
#endif
#include <IpAddress.h>
#ifdef __GNUC__
#pragma GCC diagnostic pop
#endif

namespace tapfluent::lib::utils {

template <typename Out>
static void split(const std::string &s, char delim, Out result)
{
    std::stringstream ss;
    ss.str(s);
    std::string item;
    while (std::getline(ss, item, delim)) {
        *(result++) = item;
    }
}

// leading bits set for a partial byte of a prefix
static uint8_t reverse_bits(uint8_t n)
{
    static constexpr std::array<uint8_t, 9> bit_reverse_masks{0, 128, 192, 224, 240, 248, 252, 254, 255};
    return bit_reverse_masks[n];
}

template <std::size_t N>
static std::array<uint8_t, N> prefix_mask(uint8_t cidr)
{
    std::array<uint8_t, N> mask{};
    uint8_t byte_count = cidr / 8;
    uint8_t bit_count = cidr % 8;
    for (std::size_t b = 0; b < N; ++b) {
        if (b < byte_count) {
            mask[b] = 0xFF;
        } else if (b == byte_count) {
            mask[b] = reverse_bits(bit_count);
        }
    }
    return mask;
}

std::optional<IPv4subnetList::const_iterator> match_subnet(const IPv4subnetList &ipv4_list, const uint8_t *ipv4_val)
{
    if (ipv4_val && !ipv4_list.empty()) {
        in_addr ipv4{};
        std::memcpy(&ipv4, ipv4_val, sizeof(in_addr));
        for (IPv4subnetList::const_iterator it = ipv4_list.begin(); it != ipv4_list.end(); ++it) {
            uint8_t cidr = it->cidr;
            if (cidr == 0) {
                return it;
            }
            uint32_t mask = htonl((0xFFFFFFFFu) << (32 - cidr));
            if (!((ipv4.s_addr ^ it->addr.s_addr) & mask)) {
                return it;
            }
        }
    }
    return std::nullopt;
}

std::optional<IPv6subnetList::const_iterator> match_subnet(const IPv6subnetList &ipv6_list, const uint8_t *ipv6_val)
{
    if (ipv6_val && !ipv6_list.empty()) {
        in6_addr ipv6{};
        std::memcpy(&ipv6, ipv6_val, sizeof(in6_addr));
        for (IPv6subnetList::const_iterator it = ipv6_list.begin(); it != ipv6_list.end(); ++it) {
            uint8_t prefixLength = it->cidr;
            auto network = it->addr;
            uint8_t compareByteCount = prefixLength / 8;
            uint8_t compareBitCount = prefixLength % 8;
            bool result = prefixLength == 0;
            if (compareByteCount > 0) {
                result = std::memcmp(&network.s6_addr, &ipv6.s6_addr, compareByteCount) == 0;
            }
            if ((result || prefixLength < 8) && compareBitCount > 0) {
                uint8_t subSubnetByte = network.s6_addr[compareByteCount] >> (8 - compareBitCount);
                uint8_t subThisByte = ipv6.s6_addr[compareByteCount] >> (8 - compareBitCount);
                result = subSubnetByte == subThisByte;
            }
            if (result) {
                return it;
            }
        }
    }
    return std::nullopt;
}

bool match_subnet(const IPv4subnetList &ipv4_list, const IPv6subnetList &ipv6_list, const std::string &raw_addr)
{
    auto bytes = reinterpret_cast<const uint8_t *>(raw_addr.data());
    if (raw_addr.size() == sizeof(in_addr)) {
        return match_subnet(ipv4_list, bytes).has_value();
    } else if (raw_addr.size() == sizeof(in6_addr)) {
        return match_subnet(ipv6_list, bytes).has_value();
    }
    return false;
}

void parse_host_specs(const std::vector<std::string> &host_list, IPv4subnetList &ipv4_list, IPv6subnetList &ipv6_list)
{
    for (const auto &host : host_list) {
        auto delimiter = host.find('/');
        if (delimiter == std::string::npos) {
            throw UtilsException(fmt::format("invalid CIDR: {}", host));
        }
        auto ip = host.substr(0, delimiter);
        auto cidr = host.substr(++delimiter);
        auto not_number = std::count_if(cidr.begin(), cidr.end(),
            [](unsigned char c) { return !std::isdigit(c); });
        if (not_number || cidr.empty() || cidr.size() > 3) {
            throw UtilsException(fmt::format("invalid CIDR: {}", host));
        }

        auto cidr_number = std::stoi(cidr);
        if (ip.find(':') != std::string::npos) {
            if (cidr_number < 0 || cidr_number > 128) {
                throw UtilsException(fmt::format("invalid CIDR: {}", host));
            }
            in6_addr ipv6{};
            if (inet_pton(AF_INET6, ip.c_str(), &ipv6) != 1) {
                throw UtilsException(fmt::format("invalid IPv6 address: {}", ip));
            }
            ipv6_list.push_back({ipv6, static_cast<uint8_t>(cidr_number), host});
        } else {
            if (cidr_number < 0 || cidr_number > 32) {
                throw UtilsException(fmt::format("invalid CIDR: {}", host));
            }
            in_addr ipv4{};
            if (inet_pton(AF_INET, ip.c_str(), &ipv4) != 1) {
                throw UtilsException(fmt::format("invalid IPv4 address: {}", ip));
            }
            ipv4_list.push_back({ipv4, static_cast<uint8_t>(cidr_number), host});
        }
    }
}

std::vector<std::string> split_str_to_vec_str(const std::string &spec, const char &delimiter)
{
    std::vector<std::string> elems;
    split(spec, delimiter, std::back_inserter(elems));
    return elems;
}

AddressMask::AddressMask(uint8_t v4_cidr, uint8_t v6_cidr)
    : _v4_cidr(v4_cidr)
    , _v6_cidr(v6_cidr)
{
    if (v4_cidr > 32) {
        throw UtilsException(fmt::format("invalid IPv4 mask length: {}", v4_cidr));
    }
    if (v6_cidr > 128) {
        throw UtilsException(fmt::format("invalid IPv6 mask length: {}", v6_cidr));
    }
    _v4 = prefix_mask<4>(v4_cidr);
    _v6 = prefix_mask<16>(v6_cidr);
}

std::string AddressMask::mask(const std::string &raw_addr) const
{
    if (raw_addr.size() == _v4.size()) {
        std::array<uint8_t, 4> masked{};
        for (std::size_t i = 0; i < masked.size(); ++i) {
            masked[i] = static_cast<uint8_t>(raw_addr[i]) & _v4[i];
        }
        return pcpp::IPv4Address(masked.data()).toString();
    } else if (raw_addr.size() == _v6.size()) {
        std::array<uint8_t, 16> masked{};
        for (std::size_t i = 0; i < masked.size(); ++i) {
            masked[i] = static_cast<uint8_t>(raw_addr[i]) & _v6[i];
        }
        // ::ffff:0:0/96 prints in dotted IPv4 form
        static constexpr std::array<uint8_t, 12> v4_mapped_prefix{0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0xFF, 0xFF};
        if (std::equal(v4_mapped_prefix.begin(), v4_mapped_prefix.end(), masked.begin())) {
            return pcpp::IPv4Address(masked.data() + v4_mapped_prefix.size()).toString();
        }
        return pcpp::IPv6Address(masked.data()).toString();
    }
    return std::string();
}

std::string format_rfc3339_nano(uint64_t sec, uint64_t nsec)
{
    static constexpr uint64_t NSEC_PER_SEC = 1000000000;
    sec += nsec / NSEC_PER_SEC;
    nsec %= NSEC_PER_SEC;

    time_t t = static_cast<time_t>(sec);
    std::tm bt{};
    gmtime_r(&t, &bt);
    auto stamp = fmt::format("{:%Y-%m-%dT%H:%M:%S}", bt);
    if (nsec) {
        auto frac = fmt::format("{:09d}", nsec);
        frac.erase(frac.find_last_not_of('0') + 1);
        stamp += "." + frac;
    }
    stamp += "Z";
    return stamp;
}

}
