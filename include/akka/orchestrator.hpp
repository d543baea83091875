/**
 * @file orchestrator.hpp
 * @brief Wires discovery, the chat API client and the voice session into one client.
 *
 * @details
 * ## Field Brief
 * The two state machines do not know about each other. The orchestrator is
 * the glue a front end talks to:
 *
 * ```
 *   DiscoveryEngine ──ServerFound──► RulesApi::set_server ──► fetch_games
 *        ▲                                                       │
 *        │ restart on link loss                                  ▼
 *   VoiceSession ◄── press_button (gated: connected + game) ◄── select_game
 *        │                                                  (keywords → prompt hints)
 *        └── SessionEvents ──► OrchestratorEvent outbox ──► UI
 * ```
 *
 * @par Gating
 * The button does nothing until a server address is known (discovered or
 * entered by hand) and a game is selected. Refusals come back as `false`
 * plus a Status event explaining why.
 *
 * @par Connectivity
 * A chat or catalogue failure flagged unreachable aborts the live turn,
 * forgets the server and restarts discovery from cycle 0. Exhaustion leaves
 * the client waiting for `set_manual_server()`.
 *
 * @par Minimal Usage Example
 * @code
 * akka::Orchestrator app(disco, session, api, conversation, 8000);
 * app.start();
 * for (;;) {
 *   app.tick(now_ms());
 *   akka::OrchestratorEvent ev;
 *   while (app.get_event(ev)) { show(ev); }
 * }
 * @endcode
 */
#ifndef AKKA_ORCHESTRATOR_HPP
#define AKKA_ORCHESTRATOR_HPP

#include <cstdint>
#include <future>
#include <optional>
#include <string>
#include <vector>
#include "etl/deque.h"
#include "akka/conversation.hpp"
#include "akka/discovery_engine.hpp"
#include "akka/rules_api.hpp"
#include "akka/voice_session.hpp"

namespace akka {

struct OrchestratorEvent {
  enum class Kind : uint8_t {
    Status = 0,      ///< status line changed; text = new status
    ServerFound,     ///< text = address
    GamesLoaded,     ///< games() now current
    GameSelected,    ///< text = game id (empty after exit_game)
    KeywordsLoaded,  ///< prompt hints now current
    Session,         ///< session field carries a VoiceSession event
    Error            ///< error + text set
  };
  Kind         kind{Kind::Status};
  std::string  text;
  ErrorKind    error{ErrorKind::None};
  SessionEvent session;
};

class Orchestrator {
public:
  static constexpr size_t OUTBOX_CAP = 64;

  Orchestrator(DiscoveryEngine& discovery,
               VoiceSession& session,
               RulesApi& api,
               Conversation& conversation,
               uint16_t server_port = 8000);

  Orchestrator(const Orchestrator&) = delete;
  Orchestrator& operator=(const Orchestrator&) = delete;

  /// Begin discovery. false when the discovery socket could not be opened.
  bool start();

  /// Stop discovery and abort any live turn.
  void shutdown();

  void tick(uint64_t now_ms);

  /// Use `address` as the server without discovery. false = not a dotted IPv4.
  bool set_manual_server(const std::string& address);

  /// Re-request the game list from the current server.
  bool refresh_games();

  /// false when the id is not in games().
  bool select_game(const std::string& game_id);

  /// Back to the lobby: no game, empty history, new session id.
  void exit_game();

  /// false when the id is empty after trimming.
  bool set_table_id(const std::string& table_id);

  /// Forwarded to the voice session when connected and a game is selected.
  bool press_button(uint64_t now_ms);

  /// Server went away: abort the turn, forget the address, rediscover.
  void connectivity_lost();

  bool get_event(OrchestratorEvent& out);

  bool connected() const { return server_.has_value(); }
  const std::optional<std::string>& server() const { return server_; }
  bool manual_server() const { return manual_; }
  const std::vector<GameInfo>& games() const { return games_; }
  const std::optional<GameInfo>& selected_game() const { return selected_; }
  const std::string& status() const { return status_; }

private:
  void on_discovery_event(const DiscoveryEvent& ev);
  void on_session_event(const SessionEvent& ev);
  void on_server(const std::string& address, bool manual);
  void poll_games();
  void poll_keywords();

  void set_status(const std::string& s);
  void emit(OrchestratorEvent ev);
  void emit_error(ErrorKind kind, const std::string& text);

  DiscoveryEngine& discovery_;
  VoiceSession&    session_;
  RulesApi&        api_;
  Conversation&    conversation_;
  uint16_t         server_port_;

  std::optional<std::string> server_;
  bool                       manual_{false};
  std::vector<GameInfo>      games_;
  std::optional<GameInfo>    selected_;
  std::string                keywords_for_;     ///< game id the pending keyword fetch belongs to
  std::string                status_{"starting"};

  std::future<Result<std::vector<GameInfo>>> games_future_;
  std::future<Result<KeywordSet>>            keywords_future_;

  etl::deque<OrchestratorEvent, OUTBOX_CAP> outbox_;
};

} // namespace akka

#endif // AKKA_ORCHESTRATOR_HPP
