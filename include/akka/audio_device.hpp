#pragma once
/**
 * @file audio_device.hpp
 * @brief The one physical audio device, seen from the arbiter.
 *
 * Only AudioArbiter calls these. Everything else reaches the device through
 * an ownership token.
 *
 * Contract:
 *  - configure(role) puts the device into the role: Capture opens the input
 *    stream; Playback makes sure the input is closed and the output path is
 *    free. false = the device refused.
 *  - teardown(role) undoes configure(role). Best-effort, must not throw, must
 *    not block on a wedged device.
 *  - read_capture(buf, n) copies up to n mono S16 samples that are already
 *    buffered. Returns the count, 0 when nothing is ready, -1 on a hard error.
 *  - sample_rate() is the capture rate in Hz.
 */

#include <cstddef>
#include <cstdint>

namespace akka {

enum class AudioRole : uint8_t { Capture = 0, Playback = 1 };

inline const char* role_name(AudioRole r) {
  return r == AudioRole::Capture ? "capture" : "playback";
}

class AudioDevice {
public:
  virtual ~AudioDevice() = default;
  virtual bool        configure(AudioRole role) = 0;
  virtual void        teardown(AudioRole role) noexcept = 0;
  virtual long        read_capture(int16_t* out, std::size_t max_samples) = 0;
  virtual unsigned    sample_rate() const = 0;
  virtual const char* name() const = 0;
};

} // namespace akka
