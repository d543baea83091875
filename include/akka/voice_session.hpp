/**
 * @file voice_session.hpp
 * @brief Akka voice session: the half-duplex record → transcribe → ask → speak loop.
 *
 * @details
 * ## Field Brief
 * One button, one audio device, one question at a time. The player presses
 * to talk, presses again to send, and the table speaker answers. Pressing
 * while the answer is being spoken cuts it off and starts a new question.
 * Everything in between (the recognizer, the server round trip, the
 * synthesizer) is slow, may fail, and completes on someone else's thread.
 *
 * This class is the state machine that keeps that honest. It runs on one
 * thread, driven by `press_button(now_ms)` and `tick(now_ms)`, and consumes
 * collaborator results by polling their futures. No callback ever re-enters it.
 *
 * @par Operational Model
 * ```
 *            press                      press / 60 s limit
 *   Idle ───────────► Recording ─────────────────────────► Transcribing
 *    ▲                   ▲                                     │ usable text
 *    │ done              │ press (cut off)                     ▼
 *    └──────────── Speaking ◄──────────── reply ────────── Thinking
 *                                                   +2.5 s StillWorking
 *                                                   +7.0 s Elaborating
 *
 *   any failure ──► release audio, cancel timer, drop futures ──► Idle
 * ```
 *
 * A cut-off is not instant: the synthesizer is told to stop, and the
 * Playback token is held until its future settles. Only then is it
 * force-released and Capture acquired. The same wait applies when a turn
 * fails or is aborted mid-answer; presses in Idle report Busy until the
 * speaker is back.
 *
 * @par Invariants
 * - Exactly one live turn outside Idle; none in Idle.
 * - At most one pending deadline, tagged with its turn id. A deadline whose
 *   turn or phase no longer matches is discarded when it comes due.
 * - Audio is touched only through an AudioArbiter token: Capture during
 *   Recording, Playback during Speaking (and while a cancelled utterance
 *   drains), nothing otherwise.
 * - History is appended only when a reply arrives, user line first.
 *
 * @par Failure Model
 * - Capture refused / failed: CaptureUnavailable, turn ends.
 * - Recognizer silent past `transcribe_limit_ms`: aborted, TranscriptionEmpty.
 * - Synthesizer not stopping within `playback_stop_ms` of a cut-off:
 *   PlaybackError, no new recording.
 * - Empty, low-confidence or placeholder transcript: TranscriptionEmpty,
 *   status "didn't catch that", turn ends.
 * - Chat API failure: RemoteError, turn ends; `link_lost` on the event when
 *   the server was unreachable so the orchestrator can restart discovery.
 * - Playback refused / synthesizer failed: PlaybackError, turn ends.
 * Partial results are discarded; nothing is retried automatically.
 *
 * @par Minimal Usage Example
 * @code
 * akka::VoiceSession vs(arbiter, stt, tts, api, conversation);
 * vs.press_button(now());          // start talking
 * vs.press_button(now());          // send
 * while (...) {
 *   vs.tick(now());
 *   akka::SessionEvent ev;
 *   while (vs.get_event(ev)) { render(ev); }
 * }
 * @endcode
 */
#ifndef AKKA_VOICE_SESSION_HPP
#define AKKA_VOICE_SESSION_HPP

#include <cstdint>
#include <future>
#include <optional>
#include <random>
#include <string>
#include <vector>
#include "etl/deque.h"
#include "akka/audio_arbiter.hpp"
#include "akka/chat_types.hpp"
#include "akka/conversation.hpp"
#include "akka/errors.hpp"
#include "akka/rules_api.hpp"
#include "akka/speech.hpp"
#include "akka/uuid.hpp"

namespace akka {

enum class SessionPhase : uint8_t { Idle = 0, Recording, Transcribing, Thinking, Speaking };

const char* phase_name(SessionPhase p);

enum class SessionAlert : uint8_t { None = 0, RecordingTimeout, StillWorking, Elaborating };

const char* alert_name(SessionAlert a);

struct SessionEvent {
  enum class Kind : uint8_t {
    PhaseChanged = 0,  ///< phase field is the new phase
    Alert,             ///< alert field set; UI plays a cue / haptic
    Transcript,        ///< text = what the player said
    Reply,             ///< text = what the server answered
    TurnCompleted,     ///< playback finished normally
    TurnFailed,        ///< error + text (status line) set
    Interrupted,       ///< playback cut off by the button
    Busy               ///< button ignored while transcribing / thinking
  };
  Kind         kind{Kind::PhaseChanged};
  SessionPhase phase{SessionPhase::Idle};
  SessionAlert alert{SessionAlert::None};
  ErrorKind    error{ErrorKind::None};
  std::string  text;
  bool         link_lost{false};
  Uuid         turn_id;
};

struct VoiceSessionConfig {
  uint32_t    recording_limit_ms{60000};
  uint32_t    still_working_ms{2500};      ///< from entering Thinking
  uint32_t    elaborating_ms{7000};        ///< from entering Thinking
  uint32_t    transcribe_limit_ms{45000};  ///< recognizer gets this long per utterance
  uint32_t    playback_stop_ms{1000};      ///< cancelled speech must settle within this
  std::string voice_id{"zh-TW"};
  float       speech_rate{0.5f};
  std::size_t capture_chunk_samples{1600}; ///< 100 ms at 16 kHz
  std::size_t max_chunks_per_tick{8};
  /// Transcripts the recognizer emits for silence or noise.
  std::vector<std::string> placeholders{
    "嗯", "謝謝", "謝謝觀看", "字幕", "Thank you.", "Thank you", "you", "[BLANK_AUDIO]", "(silence)"
  };
  uint64_t    seed{0};                     ///< turn ids; 0 = std::random_device
};

class VoiceSession {
public:
  static constexpr size_t OUTBOX_CAP = 32;

  enum class DeadlineKind : uint8_t { RecordingLimit = 0, TranscribeLimit, StillWorking, Elaborating, PlaybackStop };

  struct Deadline {
    DeadlineKind kind{DeadlineKind::RecordingLimit};
    Uuid         turn_id;
    uint64_t     due_ms{0};
  };

  struct Turn {
    Uuid                       id;
    std::size_t                captured_samples{0};
    std::optional<std::string> transcript;
    std::optional<ChatReply>   reply;
  };

  VoiceSession(AudioArbiter& arbiter,
               SpeechRecognizer& recognizer,
               SpeechSynthesizer& synthesizer,
               RulesApi& api,
               Conversation& conversation,
               const VoiceSessionConfig& cfg = VoiceSessionConfig{});

  VoiceSession(const VoiceSession&) = delete;
  VoiceSession& operator=(const VoiceSession&) = delete;

  /**
   * @brief The one user input.
   *
   * Idle → start recording. Recording → stop and transcribe. Speaking → cut
   * playback off and start recording a new turn, once the synthesizer has
   * let go of the speaker. Transcribing / Thinking, or a cut-off still
   * waiting on the synthesizer → ignored, a Busy event is emitted.
   */
  void press_button(uint64_t now_ms);

  /// Pump capture, collect finished futures, fire due deadlines.
  void tick(uint64_t now_ms);

  /// End the live turn without an error (game switch, link loss). No-op in Idle.
  void abort_turn(const std::string& reason);

  /// Keywords passed to the recognizer on every finalize().
  void set_prompt_hints(std::vector<std::string> hints) { hints_ = std::move(hints); }
  const std::vector<std::string>& prompt_hints() const { return hints_; }

  void set_voice(const std::string& voice_id, float rate);

  bool get_event(SessionEvent& out);

  SessionPhase phase() const { return phase_; }
  const std::optional<Turn>& turn() const { return turn_; }
  const std::optional<Deadline>& pending_deadline() const { return deadline_; }
  const std::string& status() const { return status_; }
  ErrorKind last_error() const { return last_error_; }
  const VoiceSessionConfig& config() const { return cfg_; }

  /// A cut-off is waiting for the synthesizer before recording starts.
  bool interrupt_pending() const { return interrupt_pending_; }
  /// A cancelled utterance from an ended turn still holds the speaker.
  bool speaker_draining() const { return draining_token_.has_value(); }

  /// True when the text is empty, whitespace, or a known silence placeholder.
  bool is_unusable_transcript(const std::string& text) const;

private:
  void start_recording(uint64_t now_ms);
  void stop_recording(uint64_t now_ms, bool timed_out);
  void complete_interrupt(uint64_t now_ms);
  void stop_playback();
  bool poll_draining(uint64_t now_ms);
  void enter_thinking(uint64_t now_ms, const std::string& text);
  void start_speaking(const ChatReply& reply);
  void finish_turn();
  void fail_turn(ErrorKind kind, const std::string& status, bool link_lost = false);
  void release_audio();
  void clear_turn();

  bool pump_capture();
  void poll_transcription(uint64_t now_ms);
  void poll_chat();
  void poll_speech(uint64_t now_ms);
  void fire_deadline(uint64_t now_ms);

  void set_phase(SessionPhase p);
  void set_status(const std::string& s) { status_ = s; }
  void emit(SessionEvent ev);
  void emit_simple(SessionEvent::Kind kind, const std::string& text = {});

  AudioArbiter&      arbiter_;
  SpeechRecognizer&  recognizer_;
  SpeechSynthesizer& synth_;
  RulesApi&          api_;
  Conversation&      conversation_;
  VoiceSessionConfig cfg_;

  SessionPhase                  phase_{SessionPhase::Idle};
  std::optional<Turn>           turn_;
  std::optional<Deadline>       deadline_;
  std::optional<OwnershipToken> capture_token_;
  std::optional<OwnershipToken> playback_token_;
  uint64_t                      thinking_since_ms_{0};
  bool                          interrupt_pending_{false};

  // cancelled utterance of an ended turn; Playback stays held until it settles
  std::future<SpeechOutcome>    draining_;
  std::optional<OwnershipToken> draining_token_;
  std::optional<uint64_t>       draining_due_ms_;

  std::future<Result<Transcript>> transcribe_future_;
  std::future<Result<ChatReply>>  chat_future_;
  std::future<SpeechOutcome>      speak_future_;

  std::vector<std::string> hints_;
  std::vector<int16_t>     chunk_;
  std::string              status_{"ready"};
  ErrorKind                last_error_{ErrorKind::None};
  std::mt19937_64          rng_;

  etl::deque<SessionEvent, OUTBOX_CAP> outbox_;
};

} // namespace akka

#endif // AKKA_VOICE_SESSION_HPP
