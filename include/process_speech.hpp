/**
 * @file process_speech.hpp
 * @brief Speech engines run as child processes (whisper.cpp, vosk, espeak-ng, piper, ...).
 *
 * @details
 * PURPOSE
 * -------
 * Akka does not link a speech model. Recognition and synthesis are delegated
 * to whatever command-line engine the device has, described by a command
 * template in the settings file:
 *
 * ```
 *   stt_command = "whisper-cli -m /opt/models/ggml-small.bin -l zh -nt -np -f {wav} --prompt {prompt}"
 *   tts_command = "espeak-ng -v {voice} -s {wpm} {text}"
 * ```
 *
 * The template is split on whitespace first, then placeholders are replaced
 * inside each word, so a `{text}` full of spaces is still one argument. No
 * shell is involved.
 *
 * | Placeholder | Value                                                      |
 * |-------------|------------------------------------------------------------|
 * | {wav}       | temp file: the utterance as 16-bit mono PCM WAV            |
 * | {prompt}    | recognizer prompt (domain framing + game keywords)         |
 * | {text}      | text to speak                                              |
 * | {voice}     | voice id (e.g. zh-TW)                                      |
 * | {rate}      | speech rate 0.0..1.0 (0.5 = normal)                        |
 * | {wpm}       | rate mapped to words per minute, 0.5 -> 175                |
 *
 * CONTRACT
 * --------
 * - ProcessRecognizer: stdout of the command, trimmed, is the transcript.
 *   Non-zero exit is a failure. abort() kills the child; its future then
 *   completes with a failure.
 * - ProcessSynthesizer: exit 0 = Finished, cancel() = Cancelled, anything
 *   else = Failed. cancel() sends SIGTERM and waits up to `stop_grace_ms`
 *   for the child to exit, then SIGKILL and the same wait again. When it
 *   returns the child no longer holds the sound device.
 * - Futures are completed from a detached reaper thread that owns everything
 *   it touches, so dropping the engine or the future never blocks.
 */
#ifndef AKKA_PROCESS_SPEECH_HPP
#define AKKA_PROCESS_SPEECH_HPP

#include <sys/types.h>

#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>
#include "akka/speech.hpp"

namespace akka {

using CommandVars = std::vector<std::pair<std::string, std::string>>;

/// Split `tmpl` on whitespace, then substitute every placeholder in each word.
std::vector<std::string> expand_command(const std::string& tmpl, const CommandVars& vars);

/// 0.0..1.0 rate to espeak-style words per minute, clamped to 80..450.
int rate_to_wpm(float rate);

/// Child bookkeeping shared with the reaper thread.
struct ChildState {
  std::mutex              mu;
  std::condition_variable exited;    ///< notified when pid drops to -1
  pid_t                   pid{-1};
  bool                    stopped{false};   ///< abort()/cancel() was called for this child
};

struct ProcessRecognizerConfig {
  std::string command{"whisper-cli -l zh -nt -np -f {wav} --prompt {prompt}"};
  unsigned    sample_rate{16000};
  std::string tmp_dir{"/tmp"};
  std::size_t max_seconds{65};       ///< hard cap on buffered audio
};

class ProcessRecognizer : public SpeechRecognizer {
public:
  explicit ProcessRecognizer(ProcessRecognizerConfig cfg = ProcessRecognizerConfig{});
  ~ProcessRecognizer() override;

  bool start_capture() override;
  void append_audio(const int16_t* samples, std::size_t count) override;
  std::future<Result<Transcript>> finalize(const std::vector<std::string>& hints) override;
  void abort() override;

  std::size_t buffered_samples() const { return samples_.size(); }

private:
  bool write_wav(std::string& path_out);

  ProcessRecognizerConfig     cfg_;
  std::vector<int16_t>        samples_;
  bool                        capturing_{false};
  std::shared_ptr<ChildState> running_;
};

struct ProcessSynthesizerConfig {
  std::string command{"espeak-ng -v {voice} -s {wpm} {text}"};
  unsigned    stop_grace_ms{300};   ///< per signal in cancel(): SIGTERM, then SIGKILL
};

class ProcessSynthesizer : public SpeechSynthesizer {
public:
  explicit ProcessSynthesizer(ProcessSynthesizerConfig cfg = ProcessSynthesizerConfig{});
  ~ProcessSynthesizer() override;

  std::future<SpeechOutcome> speak(const std::string& text, const std::string& voice, float rate) override;
  void cancel() override;

private:
  ProcessSynthesizerConfig    cfg_;
  std::shared_ptr<ChildState> running_;
};

} // namespace akka

#endif // AKKA_PROCESS_SPEECH_HPP
