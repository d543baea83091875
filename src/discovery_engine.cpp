// -----------------------------------------------------------------------------
// discovery_engine.cpp - Implementation of the UDP discovery state machine
//
// API & field descriptions:
//   see include/akka/discovery_engine.hpp
//
// Tests:
//   see tests/test_discovery_engine.cpp, tests/test-discover/ (live network)
// -----------------------------------------------------------------------------
#include "akka/discovery_engine.hpp"
#include "akka/discovery_reply.hpp"
#include "akka/log.hpp"

#include <string>
#include <utility>

namespace akka {

const char* phase_name(DiscoveryPhase p) {
  switch (p) {
    case DiscoveryPhase::Idle:         return "idle";
    case DiscoveryPhase::Broadcasting: return "broadcasting";
    case DiscoveryPhase::Connected:    return "connected";
    case DiscoveryPhase::Exhausted:    return "exhausted";
  }
  return "idle";
}

DiscoveryEngine::DiscoveryEngine(transport::IDatagramTransport& transport,
                                 TargetProvider targets,
                                 const DiscoveryConfig& cfg)
: transport_(transport), targets_(std::move(targets)), cfg_(cfg) {
  if (cfg_.attempts_per_cycle == 0) cfg_.attempts_per_cycle = 1;   // keep attempt < per_cycle meaningful
  if (cfg_.max_cycles == 0)         cfg_.max_cycles = 1;
  if (cfg_.retry_max_ms < cfg_.retry_min_ms) cfg_.retry_max_ms = cfg_.retry_min_ms;

  if (cfg_.seed != 0) {
    rng_.seed(static_cast<std::mt19937::result_type>(cfg_.seed));
  } else {
    std::random_device rd;
    rng_.seed(rd());
  }
}

// ---------- public ----------

bool DiscoveryEngine::start() {
  if (state_.phase != DiscoveryPhase::Idle) {
    transport_.end();                 // full reset before a restart
    next_attempt_ms_.reset();
  }
  reset_counters();
  state_.phase = DiscoveryPhase::Idle;

  transport::Config tc;
  tc.local_port = 0;                  // ephemeral; replies come back to it
  tc.broadcast  = true;
  if (!transport_.begin(tc)) {
    last_error_ = ErrorKind::SocketError;
    log::error("discovery", "socket_open_failed", std::string("transport=") + transport_.name());
    return false;
  }

  last_error_ = ErrorKind::None;
  state_.phase = DiscoveryPhase::Broadcasting;
  next_attempt_ms_ = 0;               // first attempt on next tick
  log::info("discovery", "started", "port=" + std::to_string(cfg_.port));
  emit(DiscoveryEvent::Kind::StatusChanged);
  return true;
}

void DiscoveryEngine::stop() {
  if (state_.phase == DiscoveryPhase::Idle && !transport_.is_open()) return;

  const bool changed = state_.phase != DiscoveryPhase::Idle;
  next_attempt_ms_.reset();
  transport_.end();
  state_.phase = DiscoveryPhase::Idle;
  if (changed) {
    log::info("discovery", "stopped");
    emit(DiscoveryEvent::Kind::StatusChanged);
  }
}

void DiscoveryEngine::tick(uint64_t now_ms) {
  if (state_.phase != DiscoveryPhase::Broadcasting) return;

  drain_inbound();                                      // success beats a due retry
  if (state_.phase != DiscoveryPhase::Broadcasting) return;

  if (next_attempt_ms_ && now_ms >= *next_attempt_ms_) {
    next_attempt_ms_.reset();
    run_attempt(now_ms);
  }
}

bool DiscoveryEngine::get_event(DiscoveryEvent& out) {
  if (outbox_.empty()) return false;
  out = outbox_.front();
  outbox_.pop_front();
  return true;
}

// ---------- private ----------

void DiscoveryEngine::reset_counters() {
  state_.cycle_index = 0;
  state_.attempt_index = 0;
  state_.server_address.reset();
  datagrams_sent_ = 0;
  attempts_made_ = 0;
}

void DiscoveryEngine::drain_inbound() {
  uint8_t buf[transport::MAX_DATAGRAM];
  for (size_t i = 0; i < RX_PER_TICK; ++i) {
    size_t len = 0;
    uint32_t from = 0;
    auto r = transport_.recv(buf, sizeof(buf), len, &from);
    if (r == transport::RxResult::None) return;
    if (r == transport::RxResult::Error) {
      log::warn("discovery", "recv_failed", std::string("transport=") + transport_.name());
      return;
    }
    if (len >= sizeof(buf)) {
      log::warn("discovery", "datagram_truncated", "bytes=" + std::to_string(len));
    }
    handle_datagram(buf, len);
    if (state_.phase != DiscoveryPhase::Broadcasting) return;   // connected; socket is gone
  }
}

void DiscoveryEngine::handle_datagram(const uint8_t* data, size_t len) {
  if (discovery::is_echo(data, len)) return;            // our own broadcast looped back

  const std::string text(reinterpret_cast<const char*>(data), len);
  if (!discovery::looks_like_reply(text)) {
    log::debug("discovery", "ignored_datagram", "bytes=" + std::to_string(len));
    return;
  }

  auto address = discovery::parse_server_reply(text);
  if (!address) {
    log::warn("discovery", "malformed_reply", "bytes=" + std::to_string(len));
    return;
  }
  connect_to(*address);
}

// run_attempt()
// PRE:    Broadcasting, deadline due (already cleared by tick)
// POLICY: send to every target; per-target failures are logged, not fatal
// OUT:    attempt_index advanced, next deadline armed or Exhausted
void DiscoveryEngine::run_attempt(uint64_t now_ms) {
  std::vector<BroadcastTarget> targets;
  if (targets_) targets = targets_();

  if (targets.empty()) {
    last_error_ = ErrorKind::NetworkUnavailable;
    log::warn("discovery", error_name(ErrorKind::NetworkUnavailable),
              "cycle=" + std::to_string(state_.cycle_index) +
              " attempt=" + std::to_string(state_.attempt_index));
  }

  const auto* magic = reinterpret_cast<const uint8_t*>(discovery::MAGIC);
  for (const auto& t : targets) {
    auto ip = parse_ipv4(t.broadcast_address.c_str());
    if (!ip) {
      log::warn("discovery", "bad_target", "iface=" + t.interface_name);
      continue;
    }
    auto r = transport_.send_to(*ip, cfg_.port, magic, discovery::MAGIC_LEN);
    if (r == transport::TxResult::Ok) {
      ++datagrams_sent_;
      log::debug("discovery", "sent", std::string("target=") + t.broadcast_address.c_str() +
                                      " iface=" + t.interface_name);
    } else {
      last_error_ = ErrorKind::SocketError;
      log::warn("discovery", "send_failed", std::string("target=") + t.broadcast_address.c_str() +
                                            " iface=" + t.interface_name);
    }
  }

  ++attempts_made_;
  ++state_.attempt_index;

  if (state_.attempt_index >= cfg_.attempts_per_cycle) {
    state_.attempt_index = 0;
    ++state_.cycle_index;
    if (state_.cycle_index >= cfg_.max_cycles) {
      exhaust();
      return;
    }
    next_attempt_ms_ = now_ms + cfg_.cooldown_ms;
    log::info("discovery", "cycle_complete", "cycle=" + std::to_string(state_.cycle_index) +
                                             " cooldown_ms=" + std::to_string(cfg_.cooldown_ms));
  } else {
    next_attempt_ms_ = now_ms + next_interval_ms();
  }
  emit(DiscoveryEvent::Kind::StatusChanged);
}

void DiscoveryEngine::connect_to(const AddressStr& address) {
  next_attempt_ms_.reset();
  transport_.end();
  state_.phase = DiscoveryPhase::Connected;
  state_.server_address = address;
  last_error_ = ErrorKind::None;
  log::info("discovery", "server_found", std::string("address=") + address.c_str());
  emit(DiscoveryEvent::Kind::ServerFound);
  emit(DiscoveryEvent::Kind::StatusChanged);
}

void DiscoveryEngine::exhaust() {
  next_attempt_ms_.reset();
  transport_.end();
  state_.phase = DiscoveryPhase::Exhausted;
  last_error_ = ErrorKind::DiscoveryExhausted;
  log::warn("discovery", error_name(ErrorKind::DiscoveryExhausted),
            "attempts=" + std::to_string(attempts_made_));
  emit(DiscoveryEvent::Kind::StatusChanged);
  emit(DiscoveryEvent::Kind::Exhausted);
}

void DiscoveryEngine::emit(DiscoveryEvent::Kind kind) {
  if (outbox_.full()) outbox_.pop_front();               // drop oldest
  DiscoveryEvent ev;
  ev.kind = kind;
  ev.state = state_;
  outbox_.push_back(ev);
}

uint32_t DiscoveryEngine::next_interval_ms() {
  std::uniform_int_distribution<uint32_t> dist(cfg_.retry_min_ms, cfg_.retry_max_ms);
  return dist(rng_);
}

} // namespace akka
