#pragma once
/**
 * @file speech.hpp
 * @brief Speech collaborator seams: recognizer (STT) and synthesizer (TTS).
 *
 * The voice session drives these and polls their futures from tick(); no
 * callback ever re-enters the state machine. Implementations must complete
 * every future they hand out, even after abort()/cancel(), so a poll never
 * waits forever on a dropped engine.
 */

#include <cstddef>
#include <cstdint>
#include <future>
#include <string>
#include <vector>
#include "akka/errors.hpp"

namespace akka {

/// Recognizer prompt: domain framing plus the game's keywords.
inline std::string stt_prompt(const std::vector<std::string>& hints) {
  std::string p = "繁體中文桌遊對話。關鍵詞：";
  for (std::size_t i = 0; i < hints.size(); ++i) {
    if (i) p += ", ";
    p += hints[i];
  }
  return p;
}

struct Transcript {
  std::string text;
  bool        low_confidence{false};   ///< engine flagged the result as a guess
};

class SpeechRecognizer {
public:
  virtual ~SpeechRecognizer() = default;

  /// Begin a new utterance; drops any buffered audio. false = CaptureUnavailable.
  virtual bool start_capture() = 0;

  /// Feed mono S16 samples at the capture rate.
  virtual void append_audio(const int16_t* samples, std::size_t count) = 0;

  /**
   * @brief Close the utterance and transcribe it.
   * @param hints domain keywords biasing recognition (may be empty)
   */
  virtual std::future<Result<Transcript>> finalize(const std::vector<std::string>& hints) = 0;

  /// Drop the utterance. A pending finalize() future still completes.
  virtual void abort() = 0;
};

enum class SpeechOutcome : uint8_t { Finished = 0, Cancelled, Failed };

inline const char* outcome_name(SpeechOutcome o) {
  switch (o) {
    case SpeechOutcome::Finished:  return "finished";
    case SpeechOutcome::Cancelled: return "cancelled";
    case SpeechOutcome::Failed:    return "failed";
  }
  return "failed";
}

class SpeechSynthesizer {
public:
  virtual ~SpeechSynthesizer() = default;

  /// @param rate 0.0..1.0, 0.5 is the platform's normal speaking rate.
  virtual std::future<SpeechOutcome> speak(const std::string& text,
                                           const std::string& voice,
                                           float rate) = 0;

  /**
   * @brief Stop any utterance in progress; its future completes with Cancelled.
   *
   * The engine may still hold the speaker when this returns. Callers treat
   * the device as busy until the utterance's future is ready.
   */
  virtual void cancel() = 0;
};

} // namespace akka
