// ============================================================================
// alsa_audio.cpp - implementation for alsa_audio.hpp
// For API/overview see the matching .hpp.
// ============================================================================

/**
 * @file alsa_audio.cpp
 */

#include "alsa_audio.hpp"
#include "akka/log.hpp"

#include <cerrno>
#include <utility>

namespace akka {

AlsaAudioDevice::AlsaAudioDevice(std::string capture_pcm, std::string playback_pcm)
: capture_pcm_(std::move(capture_pcm)), playback_pcm_(std::move(playback_pcm)) {}

AlsaAudioDevice::~AlsaAudioDevice() {
  close_capture();
}

bool AlsaAudioDevice::configure(AudioRole role) {
  if (role == AudioRole::Capture) return open_capture();
  close_capture();                                   // input must be off before output
  return probe_playback();
}

void AlsaAudioDevice::teardown(AudioRole role) noexcept {
  if (role == AudioRole::Capture) close_capture();
  // Playback: the synthesizer owns its stream; nothing held here.
}

// ---------------------------------------------------------------------------
// read_capture()
// --------------
// Non-blocking snd_pcm_readi(). One frame = one sample (mono).
//
// Returns: samples read, 0 when nothing is buffered or after a recovered
// xrun, -1 when the stream is gone.
// ---------------------------------------------------------------------------
long AlsaAudioDevice::read_capture(int16_t* out, std::size_t max_samples) {
  if (!capture_) return -1;

  snd_pcm_sframes_t n = snd_pcm_readi(capture_, out, static_cast<snd_pcm_uframes_t>(max_samples));
  if (n >= 0) return static_cast<long>(n);
  if (n == -EAGAIN) return 0;

  int rc = snd_pcm_recover(capture_, static_cast<int>(n), /*silent*/1);
  if (rc == 0) {
    log::debug("alsa", "xrun_recovered", std::string("err=") + snd_strerror(static_cast<int>(n)));
    return 0;
  }
  log::error("alsa", "read_failed", std::string("err=") + snd_strerror(rc));
  return -1;
}

// ---------- private ----------

bool AlsaAudioDevice::open_capture() {
  if (capture_) return true;

  int rc = snd_pcm_open(&capture_, capture_pcm_.c_str(), SND_PCM_STREAM_CAPTURE, SND_PCM_NONBLOCK);
  if (rc < 0) {
    capture_ = nullptr;
    log::error("alsa", "capture_open_failed", "pcm=" + capture_pcm_ + " err=" + snd_strerror(rc));
    return false;
  }

  rc = snd_pcm_set_params(capture_,
                          SND_PCM_FORMAT_S16_LE,
                          SND_PCM_ACCESS_RW_INTERLEAVED,
                          /*channels*/1,
                          SAMPLE_RATE,
                          /*soft_resample*/1,
                          LATENCY_US);
  if (rc < 0) {
    log::error("alsa", "capture_params_failed", "pcm=" + capture_pcm_ + " err=" + snd_strerror(rc));
    close_capture();
    return false;
  }

  rc = snd_pcm_start(capture_);
  if (rc < 0) {
    log::error("alsa", "capture_start_failed", "pcm=" + capture_pcm_ + " err=" + snd_strerror(rc));
    close_capture();
    return false;
  }
  return true;
}

bool AlsaAudioDevice::probe_playback() {
  snd_pcm_t* pb = nullptr;
  int rc = snd_pcm_open(&pb, playback_pcm_.c_str(), SND_PCM_STREAM_PLAYBACK, SND_PCM_NONBLOCK);
  if (rc < 0) {
    log::error("alsa", "playback_busy", "pcm=" + playback_pcm_ + " err=" + snd_strerror(rc));
    return false;
  }
  snd_pcm_close(pb);                                // released for the synthesizer
  return true;
}

void AlsaAudioDevice::close_capture() noexcept {
  if (!capture_) return;
  snd_pcm_drop(capture_);
  snd_pcm_close(capture_);
  capture_ = nullptr;
}

} // namespace akka
