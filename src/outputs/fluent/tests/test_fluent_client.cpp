#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_test_tapfluent.hpp>

#include "FluentClient.h"
#include <arpa/inet.h>
#include <chrono>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

using namespace tapfluent;
using namespace tapfluent::output::fluent;

static Event sample_record()
{
    auto record = Event::object();
    record["@timestamp"] = "2023-11-14T22:13:20.123456789Z";
    record["query_address"] = "192.0.2.0";
    record["query_port"] = 53;
    record["type"] = "CLIENT_QUERY";
    record["rd"] = true;
    record["tld"] = "com";
    return record;
}

// one-shot TCP listener on loopback collecting everything a single peer sends until EOF.
// until listen() is called the port is bound but refuses connections.
class CollectingServer
{
    int _fd{-1};
    uint16_t _port{0};
    std::string _received;
    std::thread _thread;

public:
    explicit CollectingServer(bool listening = true)
    {
        _fd = ::socket(AF_INET, SOCK_STREAM, 0);
        REQUIRE(_fd >= 0);
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        REQUIRE(::bind(_fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) == 0);
        socklen_t len = sizeof(addr);
        REQUIRE(::getsockname(_fd, reinterpret_cast<sockaddr *>(&addr), &len) == 0);
        _port = ntohs(addr.sin_port);
        if (listening) {
            listen();
        }
    }

    void listen()
    {
        REQUIRE(::listen(_fd, 1) == 0);
        _thread = std::thread([this] {
            int peer = ::accept(_fd, nullptr, nullptr);
            if (peer < 0) {
                return;
            }
            char buf[4096];
            ssize_t n;
            while ((n = ::recv(peer, buf, sizeof(buf), 0)) > 0) {
                _received.append(buf, static_cast<size_t>(n));
            }
            ::close(peer);
        });
    }

    ~CollectingServer()
    {
        if (_thread.joinable()) {
            ::shutdown(_fd, SHUT_RDWR);
            _thread.join();
        }
        ::close(_fd);
    }

    uint16_t port() const
    {
        return _port;
    }

    const std::string &wait_received()
    {
        _thread.join();
        return _received;
    }
};

// forward messages sent back to back on one connection
static int count_messages(const std::string &received)
{
    std::size_t consumed{0};
    int messages{0};
    while (consumed < received.size()) {
        auto message = Event::from_msgpack(received.substr(consumed), false);
        REQUIRE(message.is_array());
        CHECK(message[0] == "dnstap.test");
        CHECK(message[2]["type"] == "CLIENT_QUERY");
        consumed += Event::to_msgpack(message).size();
        ++messages;
    }
    return messages;
}

static bool wait_connected(const FluentClient &client)
{
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (!client.connected()) {
        if (std::chrono::steady_clock::now() > deadline) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return true;
}

TEST_CASE("forward message mode encoding", "[fluent][output][msgpack]")
{
    timespec stamp{1700000000, 123456789};

    SECTION("integer time")
    {
        auto packed = encode_forward_message("dnstap.test", sample_record(), stamp, false);
        auto message = Event::from_msgpack(packed);

        REQUIRE(message.is_array());
        REQUIRE(message.size() == 3);
        CHECK(message[0] == "dnstap.test");
        CHECK(message[1] == 1700000000);

        const auto &record = message[2];
        std::vector<std::string> keys;
        for (const auto &item : record.items()) {
            keys.push_back(item.key());
        }
        std::vector<std::string> expected{"@timestamp", "query_address", "query_port", "type", "rd", "tld"};
        CHECK(keys == expected);
        CHECK(record["query_address"] == "192.0.2.0");
        CHECK(record["query_port"] == 53);
        CHECK(record["rd"] == true);
    }

    SECTION("EventTime")
    {
        auto packed = encode_forward_message("dnstap.test", sample_record(), stamp, true);
        auto message = Event::from_msgpack(packed);

        REQUIRE(message.size() == 3);
        REQUIRE(message[1].is_binary());
        const auto &event_time = message[1].get_binary();
        CHECK(event_time.has_subtype());
        CHECK(event_time.subtype() == 0);
        std::vector<uint8_t> expected{0x65, 0x53, 0xf1, 0x00, 0x07, 0x5b, 0xcd, 0x15};
        CHECK(std::vector<uint8_t>(event_time.begin(), event_time.end()) == expected);

        // fixext 8, type 0
        CHECK(static_cast<uint8_t>(packed[13]) == 0xd7);
        CHECK(packed[14] == 0x00);
    }
}

TEST_CASE("fluent client lifecycle", "[fluent][output]")
{
    FluentClient client{"fluent-out"};

    SECTION("post before start is rejected")
    {
        CHECK_THROWS_AS(client.post("dnstap.test", sample_record()), PublishException);
    }

    SECTION("events are buffered while disconnected")
    {
        // nothing listens on the discard port of loopback
        client.config_set("host", "127.0.0.1");
        client.config_set<uint64_t>("port", 9);
        client.config_set<uint64_t>("retry_wait", 10000);
        client.config_set<uint64_t>("max_retry_wait", 10000);
        client.start();
        CHECK(client.running());

        client.post("dnstap.test", sample_record());
        CHECK(client.pending_bytes() > 0);
        CHECK_FALSE(client.connected());

        client.stop();
        CHECK_FALSE(client.running());

        json j;
        client.info_json(j);
        CHECK(j["fluent"]["accepted"] == 1);
        CHECK(j["fluent"]["discarded"] == 1);
        CHECK(j["fluent"]["pending_bytes"] == 0);
    }

    SECTION("buffer limit")
    {
        client.config_set<uint64_t>("port", 9);
        client.config_set<uint64_t>("buffer_limit", 64);
        client.config_set<uint64_t>("retry_wait", 10000);
        client.config_set<uint64_t>("max_retry_wait", 10000);
        client.start();

        auto big = sample_record();
        big["extra"] = std::string(128, 'x');
        CHECK_THROWS_AS(client.post("dnstap.test", big), PublishException);
        CHECK(client.pending_bytes() == 0);
        client.stop();

        json j;
        client.info_json(j);
        CHECK(j["fluent"]["rejected"] == 1);
    }
}

TEST_CASE("fluent client configuration", "[fluent][output][config]")
{
    FluentClient client{"fluent-out"};

    SECTION("port range")
    {
        client.config_set<uint64_t>("port", 70000);
        CHECK_THROWS_AS(client.start(), ConfigException);
        CHECK_FALSE(client.running());
    }

    SECTION("retry waits")
    {
        client.config_set<uint64_t>("retry_wait", 1000);
        client.config_set<uint64_t>("max_retry_wait", 10);
        CHECK_THROWS_AS(client.start(), ConfigException);
    }

    SECTION("empty host")
    {
        client.config_set("host", "");
        CHECK_THROWS_AS(client.start(), ConfigException);
    }
}

TEST_CASE("fluent client delivers to a forward endpoint", "[fluent][output][network]")
{
    CollectingServer server;
    FluentClient client{"fluent-out"};
    client.config_set("host", "127.0.0.1");
    client.config_set<uint64_t>("port", server.port());
    client.start();
    REQUIRE(wait_connected(client));

    client.post("dnstap.test", sample_record());
    client.post("dnstap.test", sample_record());
    client.stop();

    const auto &received = server.wait_received();
    auto single = encode_forward_message("dnstap.test", sample_record(), {0, 0}, false);
    REQUIRE(received.size() > single.size());
    CHECK(count_messages(received) == 2);
}

TEST_CASE("fluent client drains events posted before the collector accepts", "[fluent][output][network]")
{
    CollectingServer server{false};
    FluentClient client{"fluent-out"};
    client.config_set("host", "127.0.0.1");
    client.config_set<uint64_t>("port", server.port());
    client.config_set<uint64_t>("retry_wait", 20);
    client.config_set<uint64_t>("max_retry_wait", 50);
    client.start();

    client.post("dnstap.test", sample_record());
    client.post("dnstap.test", sample_record());
    client.post("dnstap.test", sample_record());
    CHECK_FALSE(client.drain(std::chrono::milliseconds(100)));
    CHECK_FALSE(client.connected());
    CHECK(client.pending_bytes() > 0);

    server.listen();
    REQUIRE(client.drain(std::chrono::seconds(5)));
    CHECK(client.pending_bytes() == 0);
    client.stop();

    CHECK(count_messages(server.wait_received()) == 3);

    json j;
    client.info_json(j);
    CHECK(j["fluent"]["accepted"] == 3);
    CHECK(j["fluent"]["discarded"] == 0);
}

TEST_CASE("fluent client drain on a stopped client", "[fluent][output]")
{
    FluentClient client{"fluent-out"};
    CHECK_FALSE(client.drain(std::chrono::milliseconds(10)));
}
