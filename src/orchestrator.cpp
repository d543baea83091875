// -----------------------------------------------------------------------------
// orchestrator.cpp - Implementation of the client orchestrator
//
// API: see include/akka/orchestrator.hpp
// Tests: tests/test_orchestrator.cpp
// -----------------------------------------------------------------------------
#include "akka/orchestrator.hpp"
#include "akka/log.hpp"

#include <chrono>

namespace akka {

namespace {

template <class T>
bool ready(const std::future<T>& f) {
  return f.valid() && f.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
}

} // namespace

Orchestrator::Orchestrator(DiscoveryEngine& discovery,
                           VoiceSession& session,
                           RulesApi& api,
                           Conversation& conversation,
                           uint16_t server_port)
: discovery_(discovery), session_(session), api_(api),
  conversation_(conversation), server_port_(server_port) {}

// ---------- public ----------

bool Orchestrator::start() {
  if (!discovery_.start()) {
    emit_error(ErrorKind::SocketError, "cannot open discovery socket");
    set_status("network error; enter server address manually");
    return false;
  }
  set_status("searching for server");
  return true;
}

void Orchestrator::shutdown() {
  session_.abort_turn("shutting down");
  discovery_.stop();
}

void Orchestrator::tick(uint64_t now_ms) {
  discovery_.tick(now_ms);
  DiscoveryEvent dev;
  while (discovery_.get_event(dev)) on_discovery_event(dev);

  session_.tick(now_ms);
  SessionEvent sev;
  while (session_.get_event(sev)) on_session_event(sev);

  poll_games();
  poll_keywords();
}

bool Orchestrator::set_manual_server(const std::string& address) {
  const std::string a = trim_copy(address);
  auto ip = parse_ipv4(a);
  if (!ip) {
    emit_error(ErrorKind::ConfigError, "not an IPv4 address: " + a);
    return false;
  }
  discovery_.stop();
  on_server(format_ipv4(*ip).c_str(), /*manual*/true);
  return true;
}

bool Orchestrator::refresh_games() {
  if (!server_) return false;
  games_future_ = api_.fetch_games();
  return true;
}

// select_game()
// PRE:    id present in games_
// POLICY: a game switch always ends the live turn and starts a new session;
//         keywords are fetched only for games that opt in
// OUT:    selected_, conversation reset, prompt hints cleared or pending
bool Orchestrator::select_game(const std::string& game_id) {
  const GameInfo* found = nullptr;
  for (const auto& g : games_) {
    if (g.id == game_id) { found = &g; break; }
  }
  if (!found) {
    emit_error(ErrorKind::ConfigError, "unknown game: " + game_id);
    return false;
  }

  session_.abort_turn("game changed");
  selected_ = *found;
  conversation_.reset(found->id);       // server keys its rules by id
  session_.set_prompt_hints({});
  keywords_future_ = {};
  keywords_for_.clear();

  if (found->enable_stt_injection && server_) {
    keywords_for_ = found->id;
    keywords_future_ = api_.fetch_keywords(found->id);
  }

  log::info("orchestrator", "game_selected", "id=" + found->id +
            " session=" + conversation_.session_id().to_string().c_str());
  OrchestratorEvent ev;
  ev.kind = OrchestratorEvent::Kind::GameSelected;
  ev.text = found->id;
  emit(ev);
  set_status("ready: " + found->name);
  return true;
}

void Orchestrator::exit_game() {
  session_.abort_turn("left game");
  selected_.reset();
  conversation_.clear();
  session_.set_prompt_hints({});
  keywords_future_ = {};
  keywords_for_.clear();

  OrchestratorEvent ev;
  ev.kind = OrchestratorEvent::Kind::GameSelected;
  emit(ev);
  set_status("select a game");
}

bool Orchestrator::set_table_id(const std::string& table_id) {
  if (!conversation_.set_table_id(table_id)) {
    emit_error(ErrorKind::ConfigError, "table id must not be empty");
    return false;
  }
  return true;
}

bool Orchestrator::press_button(uint64_t now_ms) {
  if (!server_) {
    set_status(discovery_.state().phase == DiscoveryPhase::Exhausted
                 ? "no server; enter address manually"
                 : "not connected yet");
    return false;
  }
  if (!selected_) {
    set_status("select a game first");
    return false;
  }
  session_.press_button(now_ms);
  SessionEvent sev;
  while (session_.get_event(sev)) on_session_event(sev);
  return true;
}

void Orchestrator::connectivity_lost() {
  log::warn("orchestrator", "connectivity_lost", server_ ? "server=" + *server_ : std::string{});
  session_.abort_turn("connection lost");
  server_.reset();
  manual_ = false;
  games_future_ = {};
  keywords_future_ = {};
  keywords_for_.clear();

  if (discovery_.start()) {
    set_status("connection lost; searching for server");
  } else {
    emit_error(ErrorKind::SocketError, "cannot open discovery socket");
    set_status("connection lost; enter server address manually");
  }
}

bool Orchestrator::get_event(OrchestratorEvent& out) {
  if (outbox_.empty()) return false;
  out = outbox_.front();
  outbox_.pop_front();
  return true;
}

// ---------- private ----------

void Orchestrator::on_discovery_event(const DiscoveryEvent& ev) {
  switch (ev.kind) {
    case DiscoveryEvent::Kind::ServerFound:
      if (ev.state.server_address) on_server(ev.state.server_address->c_str(), /*manual*/false);
      break;

    case DiscoveryEvent::Kind::Exhausted:
      emit_error(ErrorKind::DiscoveryExhausted, "server not found");
      set_status("server not found; enter address manually");
      break;

    case DiscoveryEvent::Kind::StatusChanged:
      if (ev.state.phase == DiscoveryPhase::Broadcasting && !server_) {
        set_status("searching for server (cycle " + std::to_string(ev.state.cycle_index + 1) + "/" +
                   std::to_string(discovery_.config().max_cycles) + ")");
      }
      break;
  }
}

void Orchestrator::on_session_event(const SessionEvent& ev) {
  OrchestratorEvent out;
  out.kind = OrchestratorEvent::Kind::Session;
  out.session = ev;
  out.error = ev.error;
  out.text = ev.text;
  emit(out);

  if (ev.kind == SessionEvent::Kind::PhaseChanged || ev.kind == SessionEvent::Kind::TurnFailed) {
    set_status(session_.status());
  }
  if (ev.kind == SessionEvent::Kind::TurnFailed && ev.link_lost) connectivity_lost();
}

void Orchestrator::on_server(const std::string& address, bool manual) {
  server_ = address;
  manual_ = manual;
  api_.set_server(address, server_port_);
  log::info("orchestrator", "server", "address=" + address + (manual ? " manual=1" : ""));

  OrchestratorEvent ev;
  ev.kind = OrchestratorEvent::Kind::ServerFound;
  ev.text = address;
  emit(ev);
  set_status(selected_ ? "connected" : "connected; select a game");
  refresh_games();
}

void Orchestrator::poll_games() {
  if (!ready(games_future_)) return;

  Result<std::vector<GameInfo>> r;
  try {
    r = games_future_.get();
  } catch (const std::future_error& e) {
    r = Result<std::vector<GameInfo>>::failure(ErrorKind::RemoteError, e.what());
  }

  if (!r.ok) {
    emit_error(ErrorKind::RemoteError, "game list: " + r.message);
    if (r.unreachable) connectivity_lost();
    return;
  }

  games_ = std::move(r.value);
  log::info("orchestrator", "games_loaded", "count=" + std::to_string(games_.size()));
  OrchestratorEvent ev;
  ev.kind = OrchestratorEvent::Kind::GamesLoaded;
  ev.text = std::to_string(games_.size());
  emit(ev);
}

void Orchestrator::poll_keywords() {
  if (!ready(keywords_future_)) return;

  Result<KeywordSet> r;
  try {
    r = keywords_future_.get();
  } catch (const std::future_error& e) {
    r = Result<KeywordSet>::failure(ErrorKind::RemoteError, e.what());
  }

  const std::string for_game = keywords_for_;
  keywords_for_.clear();
  if (!selected_ || selected_->id != for_game) return;   // user moved on

  if (!r.ok) {
    emit_error(ErrorKind::RemoteError, "keywords: " + r.message);  // recognition still works without hints
    if (r.unreachable) connectivity_lost();
    return;
  }

  session_.set_prompt_hints(r.value.keywords);
  log::info("orchestrator", "keywords_loaded", "game=" + for_game +
            " count=" + std::to_string(r.value.keywords.size()));
  OrchestratorEvent ev;
  ev.kind = OrchestratorEvent::Kind::KeywordsLoaded;
  ev.text = stt_prompt(r.value.keywords);
  emit(ev);
}

void Orchestrator::set_status(const std::string& s) {
  if (s == status_) return;
  status_ = s;
  OrchestratorEvent ev;
  ev.kind = OrchestratorEvent::Kind::Status;
  ev.text = s;
  emit(ev);
}

void Orchestrator::emit(OrchestratorEvent ev) {
  if (outbox_.full()) outbox_.pop_front();
  outbox_.push_back(std::move(ev));
}

void Orchestrator::emit_error(ErrorKind kind, const std::string& text) {
  OrchestratorEvent ev;
  ev.kind = OrchestratorEvent::Kind::Error;
  ev.error = kind;
  ev.text = text;
  emit(ev);
}

} // namespace akka
