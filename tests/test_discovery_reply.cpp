#include <doctest/doctest.h>
#include <cstring>
#include "akka/discovery_reply.hpp"

using namespace akka;
using namespace akka::discovery;

static bool echo(const std::string& s) {
    return is_echo(reinterpret_cast<const uint8_t*>(s.data()), s.size());
}

TEST_CASE("Magic string constants") {
    CHECK(std::strlen(MAGIC) == MAGIC_LEN);
    CHECK(std::string(MAGIC) == "DISCOVER_AKKA_SERVER");
    CHECK(DEFAULT_PORT == 37020);
}

TEST_CASE("Only the exact magic string is an echo") {
    CHECK(echo("DISCOVER_AKKA_SERVER"));
    CHECK_FALSE(echo("DISCOVER_AKKA_SERVER_REPLY"));
    CHECK_FALSE(echo("DISCOVER_AKKA_SERVE"));
    CHECK_FALSE(echo(""));
    CHECK_FALSE(is_echo(nullptr, MAGIC_LEN));
}

TEST_CASE("JSON-style reply with double quotes") {
    auto ip = parse_server_reply("DISCOVER_AKKA_SERVER_REPLY {\"ip\":\"192.168.1.50\"}");
    REQUIRE(ip);
    CHECK(*ip == AddressStr("192.168.1.50"));
}

TEST_CASE("Single-quoted reply") {
    auto ip = parse_server_reply("{'ip': '10.0.0.7'}");
    REQUIRE(ip);
    CHECK(*ip == AddressStr("10.0.0.7"));
}

TEST_CASE("Unrelated fields are ignored") {
    auto ip = parse_server_reply("{\"name\":\"akka\",\"ip\":\"172.16.3.4\",\"port\":8000,\"ver\":\"1.2\"}");
    REQUIRE(ip);
    CHECK(*ip == AddressStr("172.16.3.4"));
}

TEST_CASE("The first dotted token decides") {
    // "v1.0" has a dot but is not IPv4; the address after it is not tried
    CHECK_FALSE(parse_server_reply("{\"ip_note\":\"v1.0\",\"addr\":\"192.168.0.9\"}"));

    auto ip = parse_server_reply("{\"ip\":\"192.168.0.9\",\"ver\":\"1.2\"}");
    REQUIRE(ip);
    CHECK(*ip == AddressStr("192.168.0.9"));
}

TEST_CASE("Malformed replies yield nothing") {
    CHECK_FALSE(parse_server_reply("{\"ip\":\"not-an-address\"}"));
    CHECK_FALSE(parse_server_reply("{\"ip\":\"999.1.1.1\"}"));
    CHECK_FALSE(parse_server_reply("ip"));
    CHECK_FALSE(parse_server_reply("hello world"));
    CHECK_FALSE(parse_server_reply(""));
}

TEST_CASE("Marker detection") {
    CHECK(looks_like_reply("{\"ip\":\"1.2.3.4\"}"));
    CHECK_FALSE(looks_like_reply("DISCOVER_AKKA_SERVER"));
}
