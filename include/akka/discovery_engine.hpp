/**
 * @file discovery_engine.hpp
 * @brief Akka discovery: find the rules server on an unknown subnet by UDP broadcast.
 *
 * @details
 * ## Field Brief
 * The appliance boots onto whatever wifi the venue has. Nobody types an IP.
 * The client shouts `DISCOVER_AKKA_SERVER` at every directed broadcast
 * address it can compute, and the server answers with its address. The
 * engine owns that shouting: when to send, how often, when to give up, and
 * how to recognise the answer.
 *
 * @par Operational Model
 * ```
 *   start() ──► Broadcasting(cycle 0, attempt 0), first attempt due now
 *
 *   tick(now_ms):
 *     1. drain socket ── echo? drop ── reply? parse ── ok ──► Connected (socket closed)
 *     2. deadline due? ── send magic to every target ── attempt++
 *          attempt < 6   ──► next attempt in U[1.0 s, 3.0 s]
 *          attempt == 6  ──► cycle++, attempt = 0
 *              cycle < 10 ──► next attempt after 30 s cooldown
 *              cycle == 10 ──► Exhausted (socket closed, terminal)
 *
 *   get_event(out): StatusChanged / ServerFound / Exhausted, oldest first
 * ```
 *
 * Inbound traffic is drained before the deadline is checked, so a reply that
 * arrived while a retry was due wins: the retry never goes out.
 *
 * @par Invariants
 * - `attempt_index < attempts_per_cycle` in every observable state.
 * - `cycle_index < max_cycles` while Broadcasting.
 * - At most one pending attempt deadline. Connected, Exhausted and Idle hold none.
 * - The socket is open only while Broadcasting.
 *
 * @par Failure Model
 * - Socket open fails: `start()` returns false, `last_error() == SocketError`,
 *   phase stays Idle.
 * - A send fails: logged, swallowed, schedule continues.
 * - No targets: logged as NetworkUnavailable, attempt still counts.
 * - Malformed reply: logged, ignored, broadcasting continues.
 *
 * @par Minimal Usage Example
 * @code
 * akka::transport::LinuxUdp udp;
 * akka::DiscoveryEngine disco(udp, akka::list_broadcast_targets);
 * disco.start();
 * while (running) {
 *   disco.tick(now_ms());
 *   akka::DiscoveryEvent ev;
 *   while (disco.get_event(ev)) { ... }
 * }
 * @endcode
 */
#ifndef AKKA_DISCOVERY_ENGINE_HPP
#define AKKA_DISCOVERY_ENGINE_HPP

#include <cstdint>
#include <functional>
#include <optional>
#include <random>
#include <vector>
#include "etl/deque.h"
#include "akka/broadcast_target.hpp"
#include "akka/errors.hpp"
#include "akka/transport/transport_base.hpp"

namespace akka {

enum class DiscoveryPhase : uint8_t { Idle = 0, Broadcasting, Connected, Exhausted };

const char* phase_name(DiscoveryPhase p);

struct DiscoveryState {
  DiscoveryPhase            phase{DiscoveryPhase::Idle};
  uint8_t                   cycle_index{0};
  uint8_t                   attempt_index{0};
  std::optional<AddressStr> server_address;
};

struct DiscoveryEvent {
  enum class Kind : uint8_t { StatusChanged = 0, ServerFound, Exhausted };
  Kind           kind{Kind::StatusChanged};
  DiscoveryState state;     ///< snapshot at emission
};

struct DiscoveryConfig {
  uint16_t port{37020};
  uint8_t  attempts_per_cycle{6};
  uint8_t  max_cycles{10};
  uint32_t retry_min_ms{1000};
  uint32_t retry_max_ms{3000};
  uint32_t cooldown_ms{30000};
  uint64_t seed{0};          ///< 0 = seed from std::random_device
};

class DiscoveryEngine {
public:
  /// Called once per attempt; must not cache across calls.
  using TargetProvider = std::function<std::vector<BroadcastTarget>()>;

  static constexpr size_t OUTBOX_CAP   = 16;   ///< oldest event dropped when full
  static constexpr size_t RX_PER_TICK  = 32;   ///< bound on datagrams drained per tick

  DiscoveryEngine(transport::IDatagramTransport& transport,
                  TargetProvider targets,
                  const DiscoveryConfig& cfg = DiscoveryConfig{});

  /**
   * @brief Begin (or restart) broadcasting.
   *
   * Not Idle: full reset first (pending attempt cancelled, socket closed,
   * counters zeroed, address cleared). Then the socket is opened on an
   * ephemeral port with broadcast enabled and the first attempt is armed to
   * fire on the next tick.
   *
   * @return false when the socket could not be opened (SocketError).
   */
  bool start();

  /// Cancel the pending attempt, close the socket, go Idle. Idempotent.
  void stop();

  /// Drain inbound, then fire the attempt if due. No-op unless Broadcasting.
  void tick(uint64_t now_ms);

  bool get_event(DiscoveryEvent& out);

  const DiscoveryState& state() const { return state_; }
  ErrorKind last_error() const { return last_error_; }

  /// Absolute time of the pending attempt; 0 means "on next tick".
  std::optional<uint64_t> next_attempt_ms() const { return next_attempt_ms_; }

  /// Datagrams handed to the transport successfully since the last start().
  uint32_t datagrams_sent() const { return datagrams_sent_; }

  /// Attempts run since the last start(), across cycles.
  uint32_t attempts_made() const { return attempts_made_; }

  const DiscoveryConfig& config() const { return cfg_; }

  /// fd to include in the caller's poll(2) set, -1 when no socket.
  int poll_handle() const { return transport_.is_open() ? transport_.native_handle() : -1; }

private:
  void reset_counters();
  void drain_inbound();
  void handle_datagram(const uint8_t* data, size_t len);
  void run_attempt(uint64_t now_ms);
  void connect_to(const AddressStr& address);
  void exhaust();
  void emit(DiscoveryEvent::Kind kind);
  uint32_t next_interval_ms();

  transport::IDatagramTransport& transport_;
  TargetProvider                 targets_;
  DiscoveryConfig                cfg_;

  DiscoveryState          state_{};
  ErrorKind               last_error_{ErrorKind::None};
  std::optional<uint64_t> next_attempt_ms_;
  uint32_t                datagrams_sent_{0};
  uint32_t                attempts_made_{0};

  std::mt19937 rng_;
  etl::deque<DiscoveryEvent, OUTBOX_CAP> outbox_;
};

} // namespace akka

#endif // AKKA_DISCOVERY_ENGINE_HPP
