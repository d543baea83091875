/**
 * @file alsa_audio.hpp
 * @brief ALSA backend for akka::AudioDevice (16 kHz mono S16 capture).
 *
 * @details
 * PURPOSE
 * -------
 * The physical side of the audio arbiter on Linux. Capture opens the PCM
 * non-blocking so the event loop can drain whatever has arrived each tick
 * without ever sleeping in snd_pcm_readi().
 *
 * Playback itself is done by the synthesizer process (espeak-ng, piper, ...)
 * which opens its own PCM. For the Playback role this backend only makes
 * sure our capture stream is closed and probes that the output device can
 * be opened, so a busy speaker shows up as PlaybackError before the
 * synthesizer is started.
 *
 * OPERATIONAL NOTES
 * -----------------
 * - Device names are ALSA PCM names: "default", "plughw:1,0", "pulse".
 * - Overruns (-EPIPE) and suspends (-ESTRPIPE) go through snd_pcm_recover();
 *   only unrecoverable errors surface as -1.
 * - teardown() uses snd_pcm_drop(), never snd_pcm_drain(), so it cannot block.
 */
#ifndef AKKA_ALSA_AUDIO_HPP
#define AKKA_ALSA_AUDIO_HPP

#include <string>
#include <alsa/asoundlib.h>
#include "akka/audio_device.hpp"

namespace akka {

class AlsaAudioDevice : public AudioDevice {
public:
  static constexpr unsigned SAMPLE_RATE = 16000;
  static constexpr unsigned LATENCY_US  = 500000;

  AlsaAudioDevice(std::string capture_pcm = "default", std::string playback_pcm = "default");
  ~AlsaAudioDevice() override;

  AlsaAudioDevice(const AlsaAudioDevice&) = delete;
  AlsaAudioDevice& operator=(const AlsaAudioDevice&) = delete;

  bool        configure(AudioRole role) override;
  void        teardown(AudioRole role) noexcept override;
  long        read_capture(int16_t* out, std::size_t max_samples) override;
  unsigned    sample_rate() const override { return SAMPLE_RATE; }
  const char* name() const override { return "alsa"; }

private:
  bool open_capture();
  bool probe_playback();
  void close_capture() noexcept;

  std::string capture_pcm_;
  std::string playback_pcm_;
  snd_pcm_t*  capture_{nullptr};
};

} // namespace akka

#endif // AKKA_ALSA_AUDIO_HPP
