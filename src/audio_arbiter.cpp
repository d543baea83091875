// -----------------------------------------------------------------------------
// audio_arbiter.cpp - Implementation of the audio ownership arbiter
//
// API: see include/akka/audio_arbiter.hpp
// Tests: tests/test_audio_arbiter.cpp
// -----------------------------------------------------------------------------
#include "akka/audio_arbiter.hpp"
#include "akka/log.hpp"

#include <string>

namespace akka {

AudioArbiter::AudioArbiter(AudioDevice& device)
: device_(device) {}

std::optional<OwnershipToken> AudioArbiter::acquire(AudioRole role) {
  std::lock_guard<std::mutex> lock(mu_);

  const ErrorKind refusal = (role == AudioRole::Capture) ? ErrorKind::CaptureUnavailable
                                                         : ErrorKind::PlaybackError;
  if (held_) {                                        // fail fast, no waiting
    ++stats_.refused;
    last_error_ = refusal;
    log::warn("arbiter", "busy", std::string("want=") + role_name(role) +
                                 " held=" + role_name(held_->role));
    return std::nullopt;
  }

  if (!device_.configure(role)) {
    ++stats_.refused;
    last_error_ = refusal;
    log::warn("arbiter", "configure_failed", std::string("role=") + role_name(role) +
                                             " device=" + device_.name());
    device_.teardown(role);                           // leave the device clean for the next try
    return std::nullopt;
  }

  OwnershipToken tok;
  tok.serial = next_serial_++;
  if (next_serial_ == 0) next_serial_ = 1;            // 0 is the invalid token
  tok.role = role;
  held_ = tok;
  ++stats_.acquires;
  last_error_ = ErrorKind::None;
  log::debug("arbiter", "acquired", std::string("role=") + role_name(role) +
                                    " serial=" + std::to_string(tok.serial));
  return tok;
}

bool AudioArbiter::release(const OwnershipToken& token) {
  std::lock_guard<std::mutex> lock(mu_);
  if (!held_ || !token.valid() || held_->serial != token.serial) {
    log::debug("arbiter", "stale_release", "serial=" + std::to_string(token.serial));
    return false;
  }
  teardown_locked();
  ++stats_.releases;
  return true;
}

bool AudioArbiter::force_release() noexcept {
  std::lock_guard<std::mutex> lock(mu_);
  ++stats_.force_calls;
  if (!held_) return false;
  teardown_locked();
  ++stats_.forced;
  return true;
}

long AudioArbiter::read_capture(const OwnershipToken& token, int16_t* out, std::size_t max_samples) {
  std::lock_guard<std::mutex> lock(mu_);
  if (!held_ || held_->serial != token.serial || held_->role != AudioRole::Capture) return -1;
  if (!out || max_samples == 0) return 0;
  return device_.read_capture(out, max_samples);
}

bool AudioArbiter::is_free() const {
  std::lock_guard<std::mutex> lock(mu_);
  return !held_.has_value();
}

std::optional<AudioRole> AudioArbiter::current_role() const {
  std::lock_guard<std::mutex> lock(mu_);
  if (!held_) return std::nullopt;
  return held_->role;
}

ErrorKind AudioArbiter::last_error() const {
  std::lock_guard<std::mutex> lock(mu_);
  return last_error_;
}

ArbiterStats AudioArbiter::stats() const {
  std::lock_guard<std::mutex> lock(mu_);
  return stats_;
}

// teardown_locked()
// PRE:  mu_ held, held_ set
// OUT:  held_ cleared regardless of what the device does
void AudioArbiter::teardown_locked() noexcept {
  const AudioRole role = held_->role;
  held_.reset();
  device_.teardown(role);
}

} // namespace akka
