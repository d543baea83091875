#include <doctest/doctest.h>
#include <vector>
#include "akka/audio_arbiter.hpp"
#include "akka/conversation.hpp"
#include "akka/discovery_engine.hpp"
#include "akka/orchestrator.hpp"
#include "akka/voice_session.hpp"
#include "fakes.hpp"

using namespace akka;
using namespace akka::test;

static DiscoveryConfig disco_cfg(uint8_t attempts = 6, uint8_t cycles = 10) {
    DiscoveryConfig cfg;
    cfg.seed = 99;
    cfg.attempts_per_cycle = attempts;
    cfg.max_cycles = cycles;
    return cfg;
}

static VoiceSessionConfig session_cfg() {
    VoiceSessionConfig cfg;
    cfg.seed = 5;
    return cfg;
}

struct App {
    FakeTransport   udp;
    DiscoveryEngine discovery;
    FakeAudioDevice dev;
    AudioArbiter    arbiter{dev};
    FakeRecognizer  stt;
    FakeSynthesizer tts;
    FakeRulesApi    api;
    Conversation    conversation{11};
    VoiceSession    session;
    Orchestrator    orch;

    explicit App(const DiscoveryConfig& dc = disco_cfg())
    : discovery(udp, one_target, dc),
      session(arbiter, stt, tts, api, conversation, session_cfg()),
      orch(discovery, session, api, conversation, 8000) {}

    std::vector<OrchestratorEvent> drain() {
        std::vector<OrchestratorEvent> out;
        OrchestratorEvent ev;
        while (orch.get_event(ev)) out.push_back(ev);
        return out;
    }

    // start, receive a reply, load two games
    void connect_with_games() {
        REQUIRE(orch.start());
        orch.tick(0);
        udp.push("DISCOVER_AKKA_SERVER_REPLY {\"ip\":\"192.168.1.50\"}");
        orch.tick(10);
        REQUIRE(orch.connected());
        api.games({make_game("catan", "Catan", true), make_game("chess", "Chess")});
        orch.tick(20);
        REQUIRE(orch.games().size() == 2);
    }
};

static const OrchestratorEvent* find(const std::vector<OrchestratorEvent>& evs, OrchestratorEvent::Kind k) {
    for (const auto& e : evs) if (e.kind == k) return &e;
    return nullptr;
}

TEST_CASE("Discovered server is handed to the API client and games are fetched") {
    App a;
    REQUIRE(a.orch.start());
    CHECK(a.orch.status() == "searching for server");
    CHECK_FALSE(a.orch.connected());

    a.orch.tick(0);
    a.udp.push("DISCOVER_AKKA_SERVER_REPLY {\"ip\":\"192.168.1.50\"}");
    a.orch.tick(10);

    CHECK(a.orch.connected());
    CHECK_FALSE(a.orch.manual_server());
    CHECK(*a.orch.server() == "192.168.1.50");
    CHECK(a.api.address == "192.168.1.50");
    CHECK(a.api.port == 8000);
    CHECK(a.api.games_calls == 1);

    a.api.games({make_game("catan", "Catan", true)});
    a.orch.tick(20);
    auto evs = a.drain();
    const auto* found = find(evs, OrchestratorEvent::Kind::ServerFound);
    REQUIRE(found);
    CHECK(found->text == "192.168.1.50");
    CHECK(find(evs, OrchestratorEvent::Kind::GamesLoaded));
    CHECK(a.orch.status() == "connected; select a game");
}

TEST_CASE("Button is gated on a server and a selected game") {
    App a;
    REQUIRE(a.orch.start());
    CHECK_FALSE(a.orch.press_button(0));
    CHECK(a.orch.status() == "not connected yet");
    CHECK(a.session.phase() == SessionPhase::Idle);

    a.orch.tick(0);
    a.udp.push("{\"ip\":\"192.168.1.50\"}");
    a.orch.tick(10);
    a.api.games({make_game("chess", "Chess")});
    a.orch.tick(20);

    CHECK_FALSE(a.orch.press_button(30));
    CHECK(a.orch.status() == "select a game first");
    CHECK(a.session.phase() == SessionPhase::Idle);

    REQUIRE(a.orch.select_game("chess"));
    CHECK(a.orch.press_button(40));
    CHECK(a.session.phase() == SessionPhase::Recording);
    CHECK(a.orch.status() == "listening");
}

TEST_CASE("Selecting a keyword game starts a new session and loads prompt hints") {
    App a;
    a.connect_with_games();
    const Uuid before = a.conversation.session_id();

    REQUIRE(a.orch.select_game("catan"));
    CHECK(a.conversation.game_name() == "catan");
    CHECK(a.conversation.session_id() != before);
    CHECK(a.conversation.history().empty());
    CHECK(a.api.keywords_calls == 1);
    CHECK(a.api.keyword_requests.back() == "catan");
    CHECK(a.orch.status() == "ready: Catan");

    a.api.keywords("catan", {"羊毛", "磚塊"});
    a.orch.tick(30);
    REQUIRE(a.session.prompt_hints().size() == 2);
    CHECK(a.session.prompt_hints()[0] == "羊毛");

    auto evs = a.drain();
    const auto* kw = find(evs, OrchestratorEvent::Kind::KeywordsLoaded);
    REQUIRE(kw);
    CHECK(kw->text == "繁體中文桌遊對話。關鍵詞：羊毛, 磚塊");
}

TEST_CASE("Games without keyword injection skip the keyword fetch") {
    App a;
    a.connect_with_games();
    REQUIRE(a.orch.select_game("chess"));
    CHECK(a.api.keywords_calls == 0);
    CHECK(a.session.prompt_hints().empty());
}

TEST_CASE("Keywords that arrive after switching games are dropped") {
    App a;
    a.connect_with_games();
    REQUIRE(a.orch.select_game("catan"));
    REQUIRE(a.orch.select_game("chess"));

    a.api.keywords("catan", {"羊毛"});
    a.orch.tick(40);
    CHECK(a.session.prompt_hints().empty());
    CHECK_FALSE(find(a.drain(), OrchestratorEvent::Kind::KeywordsLoaded));
}

TEST_CASE("Unknown game ids are refused") {
    App a;
    a.connect_with_games();
    a.drain();

    CHECK_FALSE(a.orch.select_game("monopoly"));
    CHECK_FALSE(a.orch.selected_game());
    auto evs = a.drain();
    const auto* err = find(evs, OrchestratorEvent::Kind::Error);
    REQUIRE(err);
    CHECK(err->error == ErrorKind::ConfigError);
}

TEST_CASE("exit_game clears the game, history and session") {
    App a;
    a.connect_with_games();
    REQUIRE(a.orch.select_game("chess"));
    const Uuid during = a.conversation.session_id();

    a.orch.exit_game();
    CHECK_FALSE(a.orch.selected_game());
    CHECK_FALSE(a.conversation.has_game());
    CHECK(a.conversation.session_id() != during);
    CHECK(a.orch.status() == "select a game");
    CHECK_FALSE(a.orch.press_button(100));
}

TEST_CASE("Switching games mid-turn aborts the turn") {
    App a;
    a.connect_with_games();
    REQUIRE(a.orch.select_game("chess"));
    REQUIRE(a.orch.press_button(100));
    REQUIRE(a.session.phase() == SessionPhase::Recording);

    REQUIRE(a.orch.select_game("catan"));
    CHECK(a.session.phase() == SessionPhase::Idle);
    CHECK(a.arbiter.is_free());
}

TEST_CASE("Exhausted discovery asks for a manual address") {
    App a(disco_cfg(1, 1));
    REQUIRE(a.orch.start());
    a.orch.tick(0);

    CHECK(a.discovery.state().phase == DiscoveryPhase::Exhausted);
    CHECK(a.orch.status() == "server not found; enter address manually");
    const auto evs = a.drain();
    const auto* err = find(evs, OrchestratorEvent::Kind::Error);
    REQUIRE(err);
    CHECK(err->error == ErrorKind::DiscoveryExhausted);

    CHECK_FALSE(a.orch.press_button(10));
    CHECK(a.orch.status() == "no server; enter address manually");

    CHECK_FALSE(a.orch.set_manual_server("not.an.ip"));
    CHECK_FALSE(a.orch.connected());

    REQUIRE(a.orch.set_manual_server(" 10.0.0.5 "));
    CHECK(a.orch.connected());
    CHECK(a.orch.manual_server());
    CHECK(*a.orch.server() == "10.0.0.5");
    CHECK(a.api.address == "10.0.0.5");
    CHECK(a.api.games_calls == 1);
}

TEST_CASE("Manual server stops a running discovery") {
    App a;
    REQUIRE(a.orch.start());
    a.orch.tick(0);
    REQUIRE(a.orch.set_manual_server("192.168.9.9"));

    CHECK(a.discovery.state().phase == DiscoveryPhase::Idle);
    CHECK_FALSE(a.udp.is_open());
    const size_t sent = a.udp.sent.size();
    a.orch.tick(100000);
    CHECK(a.udp.sent.size() == sent);
}

TEST_CASE("Unreachable chat server restarts discovery") {
    App a;
    a.connect_with_games();
    REQUIRE(a.orch.select_game("chess"));

    REQUIRE(a.orch.press_button(100));
    a.orch.press_button(200);
    a.stt.transcribe("who moves first");
    a.orch.tick(300);
    REQUIRE(a.session.phase() == SessionPhase::Thinking);

    a.api.chat_fail("Couldn't connect to server", /*unreachable*/true);
    a.orch.tick(400);

    CHECK(a.session.phase() == SessionPhase::Idle);
    CHECK_FALSE(a.orch.connected());
    CHECK(a.discovery.state().phase == DiscoveryPhase::Broadcasting);
    CHECK(a.udp.begin_calls == 2);
    CHECK(a.orch.status() == "connection lost; searching for server");

    // the selected game survives; the button waits for the new server
    CHECK(a.orch.selected_game());
    CHECK_FALSE(a.orch.press_button(500));
}

TEST_CASE("A plain server error does not drop the connection") {
    App a;
    a.connect_with_games();
    REQUIRE(a.orch.select_game("chess"));
    REQUIRE(a.orch.press_button(100));
    a.orch.press_button(200);
    a.stt.transcribe("who moves first");
    a.orch.tick(300);
    a.api.chat_fail("internal: boom");
    a.orch.tick(400);

    CHECK(a.orch.connected());
    CHECK(a.orch.status() == "server error: internal: boom");
    CHECK(a.udp.begin_calls == 1);
}

TEST_CASE("Unreachable game list restarts discovery") {
    App a;
    REQUIRE(a.orch.start());
    a.orch.tick(0);
    a.udp.push("{\"ip\":\"192.168.1.50\"}");
    a.orch.tick(10);

    a.api.games_fail("Timeout was reached", /*unreachable*/true);
    a.orch.tick(20);
    CHECK_FALSE(a.orch.connected());
    CHECK(a.discovery.state().phase == DiscoveryPhase::Broadcasting);
}

TEST_CASE("Table id is trimmed and must not be empty") {
    App a;
    CHECK(a.orch.set_table_id("  T07 "));
    CHECK(a.conversation.table_id() == "T07");
    CHECK_FALSE(a.orch.set_table_id("   "));
    CHECK(a.conversation.table_id() == "T07");
}

TEST_CASE("Socket failure at start is reported") {
    App a;
    a.udp.fail_begin = true;
    CHECK_FALSE(a.orch.start());
    auto evs = a.drain();
    const auto* err = find(evs, OrchestratorEvent::Kind::Error);
    REQUIRE(err);
    CHECK(err->error == ErrorKind::SocketError);
    CHECK(a.orch.set_manual_server("192.168.1.50"));
}

TEST_CASE("shutdown stops discovery and the live turn") {
    App a;
    a.connect_with_games();
    REQUIRE(a.orch.select_game("chess"));
    REQUIRE(a.orch.press_button(100));

    a.orch.shutdown();
    CHECK(a.session.phase() == SessionPhase::Idle);
    CHECK(a.arbiter.is_free());
    CHECK(a.discovery.state().phase != DiscoveryPhase::Broadcasting);
}
