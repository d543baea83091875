/**
 * @file main.cpp
 * @brief akka-probe: one-shot checks against an Akka rules server.
 *
 * Modes (exactly one):
 *   --discover                       broadcast until a server answers
 *   --games                          list the game catalogue
 *   --keywords <game-id>             list recognizer keywords for a game
 *   --chat <text> --game <game-id>   one text chat turn, no audio
 *
 * Without --server the HTTP modes discover first.
 *
 * Output is one `key=value` line per record on stdout; failures print
 * `status=error reason=...` on stderr.
 *
 * Exit codes:
 *   0 ok, 2 usage, 3 discovery failed, 4 server error, 5 server unreachable,
 *   6 timed out
 */

#include <poll.h>

#include <chrono>
#include <cstdint>
#include <future>
#include <iostream>
#include <string>
#include <vector>

#include "CLI/CLI11.hpp"

#include "akka/conversation.hpp"
#include "akka/discovery_engine.hpp"
#include "akka/log.hpp"
#include "akka/transport/transport_linux_udp.hpp"
#include "http_rules_api.hpp"
#include "net_interfaces.hpp"

using namespace akka;

static uint64_t now_ms_steady() {
  using namespace std::chrono;
  return static_cast<uint64_t>(duration_cast<milliseconds>(steady_clock::now().time_since_epoch()).count());
}

static std::string quoted(const std::string& s) {
  std::string out = "\"";
  for (char c : s) {
    if (c == '"' || c == '\\') out.push_back('\\');
    if (c == '\n') { out += "\\n"; continue; }
    out.push_back(c);
  }
  out.push_back('"');
  return out;
}

// Run discovery until found, exhausted or `timeout_ms` elapsed.
// Returns 0 and fills `server`, or the exit code to use.
static int run_discovery(uint16_t port, int cycles, int timeout_ms, std::string& server) {
  transport::LinuxUdp udp;
  DiscoveryConfig cfg;
  cfg.port = port;
  cfg.max_cycles = static_cast<uint8_t>(cycles);
  DiscoveryEngine engine(udp, list_broadcast_targets, cfg);

  if (!engine.start()) {
    std::cerr << "status=error reason=socket_error\n";
    return 3;
  }

  const uint64_t deadline = now_ms_steady() + static_cast<uint64_t>(timeout_ms);
  for (;;) {
    const uint64_t now = now_ms_steady();
    engine.tick(now);

    DiscoveryEvent ev;
    while (engine.get_event(ev)) {
      if (ev.kind == DiscoveryEvent::Kind::ServerFound && ev.state.server_address) {
        server = ev.state.server_address->c_str();
        return 0;
      }
      if (ev.kind == DiscoveryEvent::Kind::Exhausted) {
        std::cerr << "status=error reason=discovery_exhausted attempts=" << engine.attempts_made() << "\n";
        return 3;
      }
    }
    if (now >= deadline) {
      engine.stop();
      std::cerr << "status=error reason=timeout attempts=" << engine.attempts_made() << "\n";
      return 6;
    }

    int wait = 50;
    if (auto next = engine.next_attempt_ms()) {
      if (*next <= now)          wait = 0;
      else if (*next - now < 50) wait = static_cast<int>(*next - now);
    }
    pollfd pfd{engine.poll_handle(), POLLIN, 0};
    if (pfd.fd >= 0) ::poll(&pfd, 1, wait);
    else             ::poll(nullptr, 0, wait);
  }
}

// Block on a RulesApi future with an outer timeout.
template <class T>
static int await_result(std::future<Result<T>>& fut, int timeout_ms, Result<T>& out) {
  if (fut.wait_for(std::chrono::milliseconds(timeout_ms)) != std::future_status::ready) {
    std::cerr << "status=error reason=timeout\n";
    return 6;
  }
  out = fut.get();
  if (!out.ok) {
    std::cerr << "status=error reason=" << (out.unreachable ? "unreachable" : error_name(out.error))
              << " detail=" << quoted(out.message) << "\n";
    return out.unreachable ? 5 : 4;
  }
  return 0;
}

int main(int argc, char** argv) {
  CLI::App app{"Akka probe"};

  bool do_discover = false, do_games = false, verbose = false;
  std::string keywords_for, chat_text, game_id, server;
  int      server_port = 8000;
  int      discovery_port = 37020;
  int      timeout_ms = 20000;
  int      cycles = 1;

  app.add_flag("--discover", do_discover, "Broadcast for a server and print its address");
  app.add_flag("--games", do_games, "List games (GET /api/games)");
  app.add_option("--keywords", keywords_for, "List keywords for a game (GET /api/keywords/<id>)");
  app.add_option("--chat", chat_text, "Send one chat turn (POST /api/chat); needs --game");
  app.add_option("--game", game_id, "Game id for --chat");

  app.add_option("--server", server, "Server IPv4 address (skip discovery)");
  app.add_option("--port", server_port, "HTTP port")->check(CLI::Range(1, 65535));
  app.add_option("--discovery-port", discovery_port, "UDP discovery port")->check(CLI::Range(1, 65535));
  app.add_option("--cycles", cycles, "Discovery cycles of 6 attempts")->check(CLI::Range(1, 255));
  app.add_option("--timeout", timeout_ms, "Overall timeout (ms)")->check(CLI::PositiveNumber);
  app.add_flag("-v,--verbose", verbose, "Debug log lines on stderr");

  CLI11_PARSE(app, argc, argv);

  log::set_level(verbose ? log::Level::Debug : log::Level::Warn);

  int cmds = 0;
  cmds += do_discover ? 1 : 0;
  cmds += do_games ? 1 : 0;
  cmds += keywords_for.empty() ? 0 : 1;
  cmds += chat_text.empty() ? 0 : 1;
  if (cmds != 1) {
    std::cerr << "status=error reason=need_exactly_one_command\n";
    return 2;
  }
  if (!chat_text.empty() && game_id.empty()) {
    std::cerr << "status=error reason=chat_needs_game\n";
    return 2;
  }
  if (!server.empty() && !parse_ipv4(server)) {
    std::cerr << "status=error reason=bad_server_address\n";
    return 2;
  }

  if (server.empty()) {
    int rc = run_discovery(static_cast<uint16_t>(discovery_port), cycles, timeout_ms, server);
    if (rc != 0) return rc;
  }

  if (do_discover) {
    std::cout << "status=ok server=" << server << "\n";
    return 0;
  }

  HttpRulesApi api(timeout_ms);
  api.set_server(server, static_cast<uint16_t>(server_port));
  const int outer = timeout_ms + 1000;

  if (do_games) {
    auto fut = api.fetch_games();
    Result<std::vector<GameInfo>> r;
    if (int rc = await_result(fut, outer, r)) return rc;
    for (const auto& g : r.value) {
      std::cout << "id=" << g.id << " name=" << quoted(g.name)
                << " stt_injection=" << (g.enable_stt_injection ? 1 : 0) << "\n";
    }
    std::cout << "status=ok server=" << server << " games=" << r.value.size() << "\n";
    return 0;
  }

  if (!keywords_for.empty()) {
    auto fut = api.fetch_keywords(keywords_for);
    Result<KeywordSet> r;
    if (int rc = await_result(fut, outer, r)) return rc;
    for (const auto& k : r.value.keywords) std::cout << "keyword=" << quoted(k) << "\n";
    std::cout << "status=ok game=" << r.value.game_id
              << " correction=" << (r.value.correction_enabled ? 1 : 0)
              << " keywords=" << r.value.keywords.size() << "\n";
    return 0;
  }

  Conversation conversation;
  conversation.reset(game_id);
  auto fut = api.send_chat(conversation.build_request(chat_text));
  Result<ChatReply> r;
  if (int rc = await_result(fut, outer, r)) return rc;
  std::cout << "status=ok intent=" << r.value.intent
            << " source=" << r.value.source;
  if (r.value.latency_ms) std::cout << " latency_ms=" << *r.value.latency_ms;
  std::cout << " response=" << quoted(r.value.response) << "\n";
  return 0;
}
