#include <catch2/catch_test_macros.hpp>

#include "dns.h"

using namespace tapfluent::lib::dns;

// www.example.com A IN, rd set
static const uint8_t query_www_example_com[] = {
    0x12, 0x34, 0x01, 0x00, 0x00, 0x01, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
    0x03, 0x77, 0x77, 0x77, 0x07, 0x65, 0x78, 0x61, 0x6d, 0x70, 0x6c, 0x65,
    0x03, 0x63, 0x6f, 0x6d, 0x00, 0x00, 0x01, 0x00, 0x01};

// example.org AAAA IN response: qr aa rd ra, NXDOMAIN
static const uint8_t response_example_org_nx[] = {
    0xab, 0xcd, 0x85, 0x83, 0x00, 0x01, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
    0x07, 0x65, 0x78, 0x61, 0x6d, 0x70, 0x6c, 0x65, 0x03, 0x6f, 0x72, 0x67,
    0x00, 0x00, 0x1c, 0x00, 0x01};

// version.bind TXT CH, ad and cd set
static const uint8_t query_version_bind[] = {
    0x00, 0x01, 0x00, 0x30, 0x00, 0x01, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
    0x07, 0x76, 0x65, 0x72, 0x73, 0x69, 0x6f, 0x6e, 0x04, 0x62, 0x69, 0x6e,
    0x64, 0x00, 0x00, 0x10, 0x00, 0x03};

// www.example.com A IN response with one answer, 93.184.216.34 ttl 300
static const uint8_t response_www_example_com_a[] = {
    0x12, 0x34, 0x81, 0x80, 0x00, 0x01, 0x00, 0x01, 0x00, 0x00, 0x00, 0x00,
    0x03, 0x77, 0x77, 0x77, 0x07, 0x65, 0x78, 0x61, 0x6d, 0x70, 0x6c, 0x65,
    0x03, 0x63, 0x6f, 0x6d, 0x00, 0x00, 0x01, 0x00, 0x01,
    0xc0, 0x0c, 0x00, 0x01, 0x00, 0x01, 0x00, 0x00, 0x01, 0x2c, 0x00, 0x04,
    0x5d, 0xb8, 0xd8, 0x22};

template <std::size_t N>
static std::string wire(const uint8_t (&data)[N])
{
    return std::string(reinterpret_cast<const char *>(data), N);
}

TEST_CASE("parse_dns_wire", "[dns][parse]")
{
    SECTION("query")
    {
        auto msg = parse_dns_wire(wire(query_www_example_com));
        CHECK(msg.qname == "www.example.com.");
        CHECK(qtype_str(msg.qtype) == "A");
        CHECK(qclass_str(msg.qclass) == "IN");
        CHECK(rcode_str(msg.rcode) == "NOERROR");
        CHECK(msg.rd);
        CHECK_FALSE(msg.aa);
        CHECK_FALSE(msg.tc);
        CHECK_FALSE(msg.ra);
        CHECK_FALSE(msg.ad);
        CHECK_FALSE(msg.cd);
    }

    SECTION("response flags and rcode")
    {
        auto msg = parse_dns_wire(wire(response_example_org_nx));
        CHECK(msg.qname == "example.org.");
        CHECK(qtype_str(msg.qtype) == "AAAA");
        CHECK(rcode_str(msg.rcode) == "NXDOMAIN");
        CHECK(msg.aa);
        CHECK(msg.rd);
        CHECK(msg.ra);
        CHECK_FALSE(msg.tc);
    }

    SECTION("chaos class, ad and cd")
    {
        auto msg = parse_dns_wire(wire(query_version_bind));
        CHECK(msg.qname == "version.bind.");
        CHECK(qtype_str(msg.qtype) == "TXT");
        CHECK(qclass_str(msg.qclass) == "CH");
        CHECK(msg.ad);
        CHECK(msg.cd);
        CHECK_FALSE(msg.rd);
    }

    SECTION("too short for a header")
    {
        CHECK_THROWS_AS(parse_dns_wire(std::string()), DnsParseException);
        CHECK_THROWS_AS(parse_dns_wire(wire(query_www_example_com).substr(0, 11)), DnsParseException);
    }

    SECTION("answer section")
    {
        auto msg = parse_dns_wire(wire(response_www_example_com_a));
        CHECK(msg.qname == "www.example.com.");
        CHECK(msg.ra);
    }

    SECTION("root name")
    {
        // . NS IN
        static const uint8_t query_root_ns[] = {
            0x00, 0x02, 0x00, 0x00, 0x00, 0x01, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
            0x00, 0x00, 0x02, 0x00, 0x01};
        auto msg = parse_dns_wire(wire(query_root_ns));
        CHECK(msg.qname == ".");
        CHECK(qtype_str(msg.qtype) == "NS");
    }

    SECTION("header counts records that are missing")
    {
        auto data = wire(query_www_example_com);
        // ANCOUNT 1, no answer bytes
        data[7] = 0x01;
        CHECK_THROWS_AS(parse_dns_wire(data), DnsParseException);

        data = wire(query_www_example_com);
        // NSCOUNT 1
        data[9] = 0x01;
        CHECK_THROWS_AS(parse_dns_wire(data), DnsParseException);

        data = wire(query_www_example_com);
        // ARCOUNT 2
        data[11] = 0x02;
        CHECK_THROWS_AS(parse_dns_wire(data), DnsParseException);
    }

    SECTION("answer cut short")
    {
        auto data = wire(response_www_example_com_a);
        CHECK_THROWS_AS(parse_dns_wire(data.substr(0, data.size() - 2)), DnsParseException);
        CHECK_THROWS_AS(parse_dns_wire(data.substr(0, 35)), DnsParseException);
    }

    SECTION("header without question")
    {
        auto data = wire(query_www_example_com).substr(0, 12);
        data[5] = 0x00;
        CHECK_THROWS_AS(parse_dns_wire(data), DnsParseException);
    }
}

TEST_CASE("DNS code names", "[dns]")
{
    CHECK(qtype_str(65) == "HTTPS");
    CHECK(qtype_str(65280) == "TYPE65280");
    CHECK(qclass_str(255) == "ANY");
    CHECK(qclass_str(42) == "CLASS42");
    CHECK(rcode_str(2) == "SERVFAIL");
    CHECK(rcode_str(15) == "RCODE15");
}

TEST_CASE("domain_labels", "[dns][labels]")
{
    SECTION("three labels")
    {
        auto labels = domain_labels("www.example.com");
        CHECK(std::string(labels[0].first) == "tld");
        CHECK(labels[0].second == "com");
        CHECK(std::string(labels[1].first) == "2ld");
        CHECK(labels[1].second == "example.com");
        CHECK(std::string(labels[2].first) == "3ld");
        CHECK(labels[2].second == "www.example.com");
        CHECK(std::string(labels[3].first) == "4ld");
        CHECK(labels[3].second == "www.example.com");
    }

    SECTION("root label is not counted")
    {
        auto labels = domain_labels("www.example.com.");
        CHECK(labels[0].second == "com");
        CHECK(labels[1].second == "example.com");
        CHECK(labels[2].second == "www.example.com.");
        CHECK(labels[3].second == "www.example.com.");
    }

    SECTION("deep name")
    {
        auto labels = domain_labels("a.b.c.d.e.example.net");
        CHECK(labels[0].second == "net");
        CHECK(labels[1].second == "example.net");
        CHECK(labels[2].second == "e.example.net");
        CHECK(labels[3].second == "d.e.example.net");
    }

    SECTION("short names fall back to the full name")
    {
        auto labels = domain_labels("localhost");
        for (const auto &label : labels) {
            CHECK(label.second == "localhost");
        }
        labels = domain_labels("");
        for (const auto &label : labels) {
            CHECK(label.second == "");
        }
        labels = domain_labels("example.com");
        CHECK(labels[0].second == "com");
        CHECK(labels[1].second == "example.com");
        CHECK(labels[2].second == "example.com");
    }
}
