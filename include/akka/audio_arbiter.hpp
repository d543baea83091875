/**
 * @file audio_arbiter.hpp
 * @brief Single-owner access to the shared audio device (capture XOR playback).
 *
 * @details
 * ## Field Brief
 * The tablet has one audio session. Recording and speaking cannot overlap:
 * opening the output while the input tap is live either fails or produces
 * feedback. Instead of "tear everything down and rebuild on error", every
 * user of the device holds an explicit ownership token, and there is at most
 * one token in the world.
 *
 * @par Rules
 * - `acquire(role)` fails fast while any token is outstanding. No waiting,
 *   no queue. The caller decides what that means (the voice session ends
 *   the turn).
 * - `release(token)` tears the role down best-effort. Device errors are
 *   logged and swallowed; the arbiter is free afterwards no matter what.
 *   A stale token (already released, or forced) is a no-op.
 * - `force_release()` is the interrupt path (button pressed while speaking).
 *   Safe from any state, idempotent, never waits on the device.
 * - `read_capture(token, ...)` is the only way to get samples, and only for
 *   the current Capture token.
 *
 * All calls serialize on one mutex, so a release coming in from a TTS
 * completion thread cannot interleave with an acquire from the event loop.
 *
 * @par Minimal Usage Example
 * @code
 * akka::AudioArbiter arb(device);
 * auto tok = arb.acquire(akka::AudioRole::Capture);
 * if (!tok) { // CaptureUnavailable  }
 * int16_t buf[1600];
 * long n = arb.read_capture(*tok, buf, 1600);
 * arb.release(*tok);
 * @endcode
 */
#ifndef AKKA_AUDIO_ARBITER_HPP
#define AKKA_AUDIO_ARBITER_HPP

#include <cstdint>
#include <mutex>
#include <optional>
#include "akka/audio_device.hpp"
#include "akka/errors.hpp"

namespace akka {

/// Opaque handle. Copyable; only the most recently issued serial is live.
struct OwnershipToken {
  uint32_t  serial{0};
  AudioRole role{AudioRole::Capture};
  bool valid() const { return serial != 0; }
};

struct ArbiterStats {
  uint32_t acquires{0};
  uint32_t releases{0};
  uint32_t forced{0};        ///< force_release() calls that actually freed a token
  uint32_t force_calls{0};
  uint32_t refused{0};       ///< acquire() refused: busy or device said no
};

class AudioArbiter {
public:
  explicit AudioArbiter(AudioDevice& device);

  AudioArbiter(const AudioArbiter&) = delete;
  AudioArbiter& operator=(const AudioArbiter&) = delete;

  std::optional<OwnershipToken> acquire(AudioRole role);

  /// @return true when `token` was the live token and is now released.
  bool release(const OwnershipToken& token);

  /// @return true when a token was outstanding.
  bool force_release() noexcept;

  /// Samples for the live Capture token; -1 for any other token or device error.
  long read_capture(const OwnershipToken& token, int16_t* out, std::size_t max_samples);

  bool is_free() const;
  std::optional<AudioRole> current_role() const;

  /// Error from the last refused acquire (CaptureUnavailable / PlaybackError).
  ErrorKind last_error() const;

  ArbiterStats stats() const;

  unsigned sample_rate() const { return device_.sample_rate(); }

private:
  void teardown_locked() noexcept;

  AudioDevice&               device_;
  mutable std::mutex         mu_;
  std::optional<OwnershipToken> held_;
  uint32_t                   next_serial_{1};
  ErrorKind                  last_error_{ErrorKind::None};
  ArbiterStats               stats_{};
};

} // namespace akka

#endif // AKKA_AUDIO_ARBITER_HPP
