#include <doctest/doctest.h>
#include <vector>
#include "akka/discovery_engine.hpp"
#include "fakes.hpp"

using namespace akka;
using namespace akka::test;

static DiscoveryConfig seeded() {
    DiscoveryConfig cfg;
    cfg.seed = 42;
    return cfg;
}

static std::vector<DiscoveryEvent> drain(DiscoveryEngine& e) {
    std::vector<DiscoveryEvent> out;
    DiscoveryEvent ev;
    while (e.get_event(ev)) out.push_back(ev);
    return out;
}

// Fire the pending attempt (whatever its delay) and return the new time.
static uint64_t fire_next(DiscoveryEngine& e, uint64_t now) {
    REQUIRE(e.next_attempt_ms());
    now = *e.next_attempt_ms();
    e.tick(now);
    return now;
}

TEST_CASE("start opens an ephemeral broadcast socket and sends on the next tick") {
    FakeTransport udp;
    DiscoveryEngine e(udp, one_target, seeded());

    REQUIRE(e.start());
    CHECK(udp.begin_calls == 1);
    CHECK(udp.last_config.local_port == 0);
    CHECK(udp.last_config.broadcast);
    CHECK(e.state().phase == DiscoveryPhase::Broadcasting);
    CHECK(e.state().cycle_index == 0);
    CHECK(e.state().attempt_index == 0);
    REQUIRE(e.next_attempt_ms());
    CHECK(*e.next_attempt_ms() == 0);

    e.tick(5);
    REQUIRE(udp.sent.size() == 1);
    CHECK(udp.sent[0].ipv4 == 0xC0A801FFu);     // 192.168.1.255
    CHECK(udp.sent[0].port == 37020);
    CHECK(udp.sent[0].payload == "DISCOVER_AKKA_SERVER");
    CHECK(e.state().attempt_index == 1);
}

TEST_CASE("Retry interval stays within 1..3 s") {
    FakeTransport udp;
    DiscoveryEngine e(udp, one_target, seeded());
    REQUIRE(e.start());

    uint64_t now = 0;
    e.tick(now);
    for (int i = 0; i < 4; ++i) {
        REQUIRE(e.next_attempt_ms());
        const uint64_t gap = *e.next_attempt_ms() - now;
        CHECK(gap >= 1000);
        CHECK(gap <= 3000);
        // not due yet: nothing happens one ms early
        const size_t before = udp.sent.size();
        e.tick(*e.next_attempt_ms() - 1);
        CHECK(udp.sent.size() == before);
        now = fire_next(e, now);
        drain(e);
    }
}

TEST_CASE("Six unanswered attempts complete a cycle and arm a 30 s cooldown") {
    FakeTransport udp;
    DiscoveryEngine e(udp, one_target, seeded());
    REQUIRE(e.start());

    uint64_t now = 0;
    e.tick(now);
    for (int i = 1; i < 6; ++i) now = fire_next(e, now);

    CHECK(e.attempts_made() == 6);
    CHECK(e.state().cycle_index == 1);
    CHECK(e.state().attempt_index == 0);
    CHECK(e.state().phase == DiscoveryPhase::Broadcasting);
    REQUIRE(e.next_attempt_ms());
    CHECK(*e.next_attempt_ms() == now + 30000);
}

TEST_CASE("Ten cycles without a reply exhaust discovery and stop all I/O") {
    FakeTransport udp;
    DiscoveryEngine e(udp, one_target, seeded());
    REQUIRE(e.start());

    uint64_t now = 0;
    e.tick(now);
    bool exhausted = false;
    while (e.next_attempt_ms()) {
        now = fire_next(e, now);
        for (const auto& ev : drain(e)) {
            if (ev.kind == DiscoveryEvent::Kind::Exhausted) exhausted = true;
        }
    }

    CHECK(exhausted);
    CHECK(e.attempts_made() == 60);
    CHECK(udp.sent.size() == 60);
    CHECK(e.state().phase == DiscoveryPhase::Exhausted);
    CHECK(e.last_error() == ErrorKind::DiscoveryExhausted);
    CHECK_FALSE(udp.is_open());

    const size_t sent = udp.sent.size();
    udp.push("{\"ip\":\"192.168.1.50\"}");
    e.tick(now + 120000);
    CHECK(udp.sent.size() == sent);
    CHECK_FALSE(e.state().server_address);
    CHECK(drain(e).empty());
}

TEST_CASE("Attempt and cycle indexes never go backwards and stay in range") {
    FakeTransport udp;
    DiscoveryEngine e(udp, one_target, seeded());
    REQUIRE(e.start());

    uint64_t now = 0;
    e.tick(now);
    unsigned last_linear = 0;
    while (e.next_attempt_ms()) {
        const auto& s = e.state();
        CHECK(s.attempt_index < 6);
        CHECK(s.cycle_index <= 10);
        const unsigned linear = s.cycle_index * 6u + s.attempt_index;
        CHECK(linear >= last_linear);
        last_linear = linear;
        now = fire_next(e, now);
        drain(e);
    }
}

TEST_CASE("A reply connects, cancels the pending attempt and closes the socket") {
    FakeTransport udp;
    DiscoveryEngine e(udp, one_target, seeded());
    REQUIRE(e.start());
    e.tick(0);
    drain(e);

    udp.push("DISCOVER_AKKA_SERVER_REPLY {\"ip\":\"192.168.1.50\"}");
    e.tick(10);

    CHECK(e.state().phase == DiscoveryPhase::Connected);
    REQUIRE(e.state().server_address);
    CHECK(*e.state().server_address == AddressStr("192.168.1.50"));
    CHECK_FALSE(e.next_attempt_ms());
    CHECK_FALSE(udp.is_open());

    auto events = drain(e);
    REQUIRE(events.size() == 2);
    CHECK(events[0].kind == DiscoveryEvent::Kind::ServerFound);
    CHECK(events[1].kind == DiscoveryEvent::Kind::StatusChanged);
    CHECK(events[1].state.phase == DiscoveryPhase::Connected);
}

TEST_CASE("A reply beats a retry that is due in the same tick") {
    FakeTransport udp;
    DiscoveryEngine e(udp, one_target, seeded());
    REQUIRE(e.start());
    e.tick(0);
    REQUIRE(e.next_attempt_ms());
    const uint64_t due = *e.next_attempt_ms();

    udp.push("{\"ip\":\"10.0.0.2\"}");
    e.tick(due + 500);

    CHECK(udp.sent.size() == 1);
    CHECK(e.state().phase == DiscoveryPhase::Connected);
}

TEST_CASE("Echoes of our own broadcast are discarded") {
    FakeTransport udp;
    DiscoveryEngine e(udp, one_target, seeded());
    REQUIRE(e.start());
    e.tick(0);

    udp.push("DISCOVER_AKKA_SERVER");
    udp.push("some unrelated chatter");
    e.tick(1);
    CHECK(e.state().phase == DiscoveryPhase::Broadcasting);
    CHECK_FALSE(e.state().server_address);
}

TEST_CASE("Malformed replies are ignored and broadcasting continues") {
    FakeTransport udp;
    DiscoveryEngine e(udp, one_target, seeded());
    REQUIRE(e.start());
    e.tick(0);

    udp.push("{\"ip\":\"nowhere\"}");
    e.tick(1);
    CHECK(e.state().phase == DiscoveryPhase::Broadcasting);
    CHECK(e.next_attempt_ms());
}

TEST_CASE("No broadcast targets still counts as an attempt") {
    FakeTransport udp;
    DiscoveryEngine e(udp, no_targets, seeded());
    REQUIRE(e.start());
    e.tick(0);

    CHECK(udp.sent.empty());
    CHECK(e.attempts_made() == 1);
    CHECK(e.state().attempt_index == 1);
    CHECK(e.last_error() == ErrorKind::NetworkUnavailable);
    CHECK(e.next_attempt_ms());
}

TEST_CASE("Send failures are logged and the schedule continues") {
    FakeTransport udp;
    udp.send_result = transport::TxResult::Error;
    DiscoveryEngine e(udp, one_target, seeded());
    REQUIRE(e.start());
    e.tick(0);

    CHECK(e.last_error() == ErrorKind::SocketError);
    CHECK(e.datagrams_sent() == 0);
    CHECK(e.attempts_made() == 1);
    CHECK(e.next_attempt_ms());
    CHECK(e.state().phase == DiscoveryPhase::Broadcasting);
}

TEST_CASE("Socket open failure makes start fail synchronously") {
    FakeTransport udp;
    udp.fail_begin = true;
    DiscoveryEngine e(udp, one_target, seeded());

    CHECK_FALSE(e.start());
    CHECK(e.last_error() == ErrorKind::SocketError);
    CHECK(e.state().phase == DiscoveryPhase::Idle);
    e.tick(100000);
    CHECK(udp.sent.empty());
}

TEST_CASE("stop is idempotent and silences the engine") {
    FakeTransport udp;
    DiscoveryEngine e(udp, one_target, seeded());
    REQUIRE(e.start());
    e.tick(0);
    drain(e);

    e.stop();
    CHECK(e.state().phase == DiscoveryPhase::Idle);
    CHECK_FALSE(e.next_attempt_ms());
    CHECK_FALSE(udp.is_open());
    CHECK(drain(e).size() == 1);

    e.stop();
    e.stop();
    CHECK(drain(e).empty());

    e.tick(50000);
    CHECK(udp.sent.size() == 1);
}

TEST_CASE("start while running resets counters and the address") {
    FakeTransport udp;
    DiscoveryEngine e(udp, one_target, seeded());
    REQUIRE(e.start());
    uint64_t now = 0;
    e.tick(now);
    now = fire_next(e, now);
    CHECK(e.attempts_made() == 2);

    udp.push("{\"ip\":\"192.168.1.50\"}");
    e.tick(now + 1);
    REQUIRE(e.state().phase == DiscoveryPhase::Connected);

    REQUIRE(e.start());
    CHECK(e.state().phase == DiscoveryPhase::Broadcasting);
    CHECK(e.attempts_made() == 0);
    CHECK(e.state().cycle_index == 0);
    CHECK(e.state().attempt_index == 0);
    CHECK_FALSE(e.state().server_address);
    CHECK(udp.is_open());
}

TEST_CASE("A reply longer than a kilobyte still connects") {
    FakeTransport udp;
    DiscoveryEngine e(udp, one_target, seeded());
    REQUIRE(e.start());
    e.tick(0);

    const std::string pad(1500, 'x');
    udp.push("{\"pad\":\"" + pad + "\",\"ip\":\"192.168.1.50\"}");
    e.tick(10);

    CHECK(e.state().phase == DiscoveryPhase::Connected);
    REQUIRE(e.state().server_address);
    CHECK(*e.state().server_address == AddressStr("192.168.1.50"));
}
