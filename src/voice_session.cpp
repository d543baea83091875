// -----------------------------------------------------------------------------
// voice_session.cpp - Implementation of the Akka voice session state machine
//
// API & field descriptions:
//   see include/akka/voice_session.hpp
//
// Tests:
//   see tests/test_voice_session.cpp
//
// NOTE: every transition runs on the caller's thread (press_button / tick).
// Collaborators complete futures from their own threads; we only ever look
// at those futures with a zero wait.
// -----------------------------------------------------------------------------
#include "akka/voice_session.hpp"
#include "akka/log.hpp"

#include <chrono>

namespace akka {

namespace {

template <class T>
bool ready(const std::future<T>& f) {
  return f.valid() && f.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
}

// Trailing punctuation the recognizer tacks onto filler words.
std::string strip_trailing_punct(std::string s) {
  static const char* ascii = ".!?,~ ";
  static const char* wide[] = {"。", "！", "？", "，", "…"};
  bool changed = true;
  while (changed && !s.empty()) {
    changed = false;
    if (std::string(ascii).find(s.back()) != std::string::npos) {
      s.pop_back();
      changed = true;
      continue;
    }
    for (const char* w : wide) {
      const std::string ws(w);
      if (s.size() >= ws.size() && s.compare(s.size() - ws.size(), ws.size(), ws) == 0) {
        s.erase(s.size() - ws.size());
        changed = true;
        break;
      }
    }
  }
  return s;
}

std::string lower_ascii(std::string s) {
  for (char& c : s) if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
  return s;
}

} // namespace

const char* phase_name(SessionPhase p) {
  switch (p) {
    case SessionPhase::Idle:         return "idle";
    case SessionPhase::Recording:    return "recording";
    case SessionPhase::Transcribing: return "transcribing";
    case SessionPhase::Thinking:     return "thinking";
    case SessionPhase::Speaking:     return "speaking";
  }
  return "idle";
}

const char* alert_name(SessionAlert a) {
  switch (a) {
    case SessionAlert::None:             return "none";
    case SessionAlert::RecordingTimeout: return "recording_timeout";
    case SessionAlert::StillWorking:     return "still_working";
    case SessionAlert::Elaborating:      return "elaborating";
  }
  return "none";
}

VoiceSession::VoiceSession(AudioArbiter& arbiter,
                           SpeechRecognizer& recognizer,
                           SpeechSynthesizer& synthesizer,
                           RulesApi& api,
                           Conversation& conversation,
                           const VoiceSessionConfig& cfg)
: arbiter_(arbiter), recognizer_(recognizer), synth_(synthesizer),
  api_(api), conversation_(conversation), cfg_(cfg) {
  if (cfg_.capture_chunk_samples == 0) cfg_.capture_chunk_samples = 1600;
  if (cfg_.max_chunks_per_tick == 0)   cfg_.max_chunks_per_tick = 1;
  chunk_.resize(cfg_.capture_chunk_samples);

  if (cfg_.seed != 0) rng_.seed(cfg_.seed);
  else                rng_.seed(std::random_device{}());
}

// ---------- public ----------

void VoiceSession::press_button(uint64_t now_ms) {
  switch (phase_) {
    case SessionPhase::Idle:
      if (!poll_draining(now_ms)) {
        log::debug("session", "busy", "reason=speaker_draining");
        emit_simple(SessionEvent::Kind::Busy, "speaker still stopping");
        break;
      }
      start_recording(now_ms);
      break;

    case SessionPhase::Recording:
      stop_recording(now_ms, /*timed_out*/false);
      break;

    case SessionPhase::Speaking:
      if (interrupt_pending_) {
        emit_simple(SessionEvent::Kind::Busy, "speaker still stopping");
        break;
      }
      synth_.cancel();
      if (ready(speak_future_)) {
        complete_interrupt(now_ms);
        break;
      }
      // the speaker is not ours to reuse until the synthesizer says so
      interrupt_pending_ = true;
      deadline_ = Deadline{DeadlineKind::PlaybackStop, turn_->id, now_ms + cfg_.playback_stop_ms};
      set_status("stopping playback");
      log::info("session", "interrupt_waiting");
      break;

    case SessionPhase::Transcribing:
    case SessionPhase::Thinking:
      log::debug("session", "busy", std::string("phase=") + phase_name(phase_));
      emit_simple(SessionEvent::Kind::Busy, "busy");
      break;
  }
}

void VoiceSession::tick(uint64_t now_ms) {
  poll_draining(now_ms);

  switch (phase_) {
    case SessionPhase::Recording:
      if (!pump_capture()) return;          // capture failed; turn is over
      break;
    case SessionPhase::Transcribing:
      poll_transcription(now_ms);
      break;
    case SessionPhase::Thinking:
      poll_chat();
      break;
    case SessionPhase::Speaking:
      poll_speech(now_ms);
      break;
    case SessionPhase::Idle:
      break;
  }

  while (deadline_ && now_ms >= deadline_->due_ms) fire_deadline(now_ms);
}

void VoiceSession::abort_turn(const std::string& reason) {
  if (phase_ == SessionPhase::Idle) return;

  log::info("session", "turn_aborted", "reason=" + reason);
  if (phase_ == SessionPhase::Recording || phase_ == SessionPhase::Transcribing) recognizer_.abort();
  if (phase_ == SessionPhase::Speaking) stop_playback();
  release_audio();
  clear_turn();
  set_status(reason);
  set_phase(SessionPhase::Idle);
}

void VoiceSession::set_voice(const std::string& voice_id, float rate) {
  cfg_.voice_id = voice_id;
  cfg_.speech_rate = rate;
}

bool VoiceSession::get_event(SessionEvent& out) {
  if (outbox_.empty()) return false;
  out = outbox_.front();
  outbox_.pop_front();
  return true;
}

bool VoiceSession::is_unusable_transcript(const std::string& text) const {
  const std::string t = lower_ascii(strip_trailing_punct(trim_copy(text)));
  if (t.empty()) return true;
  for (const auto& p : cfg_.placeholders) {
    if (t == lower_ascii(strip_trailing_punct(p))) return true;
  }
  return false;
}

// ---------- transitions ----------

// start_recording()
// PRE:    Idle, or Speaking right after an interrupt; no token held by us
// POLICY: capture token first, then recognizer; undo the token if the
//         recognizer refuses
// OUT:    Recording with a 60 s limit armed, or Idle with CaptureUnavailable
void VoiceSession::start_recording(uint64_t now_ms) {
  Turn t;
  t.id = Uuid::generate(rng_);
  turn_ = t;

  auto tok = arbiter_.acquire(AudioRole::Capture);
  if (!tok) {
    fail_turn(ErrorKind::CaptureUnavailable, "microphone unavailable");
    return;
  }
  capture_token_ = tok;

  if (!recognizer_.start_capture()) {
    fail_turn(ErrorKind::CaptureUnavailable, "recognizer could not start");
    return;
  }

  deadline_ = Deadline{DeadlineKind::RecordingLimit, turn_->id, now_ms + cfg_.recording_limit_ms};
  last_error_ = ErrorKind::None;
  set_status("listening");
  log::info("session", "recording", std::string("turn=") + turn_->id.to_string().c_str());
  set_phase(SessionPhase::Recording);
}

void VoiceSession::stop_recording(uint64_t now_ms, bool timed_out) {
  deadline_.reset();
  if (!pump_capture()) return;              // last samples; may fail the turn

  if (capture_token_) {
    arbiter_.release(*capture_token_);
    capture_token_.reset();
  }

  if (timed_out) {
    SessionEvent ev;
    ev.kind = SessionEvent::Kind::Alert;
    ev.alert = SessionAlert::RecordingTimeout;
    ev.turn_id = turn_->id;
    emit(ev);
    log::info("session", alert_name(SessionAlert::RecordingTimeout),
              "samples=" + std::to_string(turn_->captured_samples));
  }

  transcribe_future_ = recognizer_.finalize(hints_);
  deadline_ = Deadline{DeadlineKind::TranscribeLimit, turn_->id, now_ms + cfg_.transcribe_limit_ms};
  set_status("transcribing");
  set_phase(SessionPhase::Transcribing);
}

void VoiceSession::enter_thinking(uint64_t now_ms, const std::string& text) {
  turn_->transcript = text;

  SessionEvent ev;
  ev.kind = SessionEvent::Kind::Transcript;
  ev.text = text;
  ev.turn_id = turn_->id;
  emit(ev);

  chat_future_ = api_.send_chat(conversation_.build_request(text));
  thinking_since_ms_ = now_ms;
  deadline_ = Deadline{DeadlineKind::StillWorking, turn_->id, now_ms + cfg_.still_working_ms};
  set_status("thinking");
  set_phase(SessionPhase::Thinking);
}

void VoiceSession::start_speaking(const ChatReply& reply) {
  auto tok = arbiter_.acquire(AudioRole::Playback);
  if (!tok) {
    fail_turn(ErrorKind::PlaybackError, "speaker unavailable");
    return;
  }
  playback_token_ = tok;
  speak_future_ = synth_.speak(reply.response, cfg_.voice_id, cfg_.speech_rate);
  set_status("speaking");
  set_phase(SessionPhase::Speaking);
}

// complete_interrupt()
// PRE:    Speaking; the synthesizer's future has settled
// POLICY: force_release, not release: the cut-off path owns the device
//         whatever state the playback side left it in
// OUT:    Recording on a fresh turn (no Idle in between), or Idle with
//         CaptureUnavailable
void VoiceSession::complete_interrupt(uint64_t now_ms) {
  interrupt_pending_ = false;
  arbiter_.force_release();
  playback_token_.reset();
  speak_future_ = {};

  const Uuid old = turn_ ? turn_->id : Uuid{};
  clear_turn();
  SessionEvent ev;
  ev.kind = SessionEvent::Kind::Interrupted;
  ev.turn_id = old;
  emit(ev);
  log::info("session", "interrupted");
  start_recording(now_ms);
}

// stop_playback()
// PRE:    Speaking, turn ending
// OUT:    Playback token released when the utterance is already over;
//         otherwise moved to draining_token_ with the utterance's future
void VoiceSession::stop_playback() {
  interrupt_pending_ = false;
  if (!speak_future_.valid()) return;       // outcome already consumed

  synth_.cancel();
  if (ready(speak_future_) || !playback_token_) {
    speak_future_ = {};
    return;                                 // release_audio() gives the token back
  }
  draining_ = std::move(speak_future_);
  draining_token_ = playback_token_;
  draining_due_ms_.reset();
  playback_token_.reset();
  log::debug("session", "speaker_draining");
}

void VoiceSession::finish_turn() {
  release_audio();
  SessionEvent ev;
  ev.kind = SessionEvent::Kind::TurnCompleted;
  ev.turn_id = turn_ ? turn_->id : Uuid{};
  emit(ev);
  clear_turn();
  set_status("ready");
  set_phase(SessionPhase::Idle);
}

// fail_turn()
// PRE:    any phase
// POLICY: stop whatever collaborator is running, give the device back,
//         drop the timer and futures; never retry
// OUT:    Idle, status + last_error set, TurnFailed emitted
void VoiceSession::fail_turn(ErrorKind kind, const std::string& status, bool link_lost) {
  if (phase_ == SessionPhase::Recording || phase_ == SessionPhase::Transcribing) recognizer_.abort();
  if (phase_ == SessionPhase::Speaking) stop_playback();

  const Uuid id = turn_ ? turn_->id : Uuid{};
  release_audio();
  clear_turn();

  last_error_ = kind;
  set_status(status);
  log::warn("session", error_name(kind), "status=\"" + status + "\"" + (link_lost ? " link_lost=1" : ""));

  set_phase(SessionPhase::Idle);
  SessionEvent ev;
  ev.kind = SessionEvent::Kind::TurnFailed;
  ev.error = kind;
  ev.text = status;
  ev.link_lost = link_lost;
  ev.turn_id = id;
  emit(ev);
}

void VoiceSession::release_audio() {
  if (capture_token_)  { arbiter_.release(*capture_token_);  capture_token_.reset(); }
  if (playback_token_) { arbiter_.release(*playback_token_); playback_token_.reset(); }
}

void VoiceSession::clear_turn() {
  interrupt_pending_ = false;
  deadline_.reset();
  transcribe_future_ = {};
  chat_future_ = {};
  speak_future_ = {};
  turn_.reset();
}

// ---------- polling ----------

// pump_capture()
// OUT: false when the device failed and the turn was ended
bool VoiceSession::pump_capture() {
  if (phase_ != SessionPhase::Recording || !capture_token_) return true;

  for (std::size_t i = 0; i < cfg_.max_chunks_per_tick; ++i) {
    long n = arbiter_.read_capture(*capture_token_, chunk_.data(), chunk_.size());
    if (n < 0) {
      fail_turn(ErrorKind::CaptureUnavailable, "microphone failed");
      return false;
    }
    if (n == 0) break;
    recognizer_.append_audio(chunk_.data(), static_cast<std::size_t>(n));
    turn_->captured_samples += static_cast<std::size_t>(n);
  }
  return true;
}

void VoiceSession::poll_transcription(uint64_t now_ms) {
  if (!ready(transcribe_future_)) return;

  Result<Transcript> r;
  try {
    r = transcribe_future_.get();
  } catch (const std::future_error& e) {
    r = Result<Transcript>::failure(ErrorKind::TranscriptionEmpty, e.what());
  }

  if (!r.ok) {
    const ErrorKind k = r.error == ErrorKind::None ? ErrorKind::TranscriptionEmpty : r.error;
    fail_turn(k, k == ErrorKind::TranscriptionEmpty ? "didn't catch that" : "recognizer failed");
    return;
  }
  if (r.value.low_confidence || is_unusable_transcript(r.value.text)) {
    log::debug("session", "unusable_transcript", "text=\"" + r.value.text + "\"");
    fail_turn(ErrorKind::TranscriptionEmpty, "didn't catch that");
    return;
  }
  enter_thinking(now_ms, trim_copy(r.value.text));
}

void VoiceSession::poll_chat() {
  if (!ready(chat_future_)) return;

  Result<ChatReply> r;
  try {
    r = chat_future_.get();
  } catch (const std::future_error& e) {
    r = Result<ChatReply>::failure(ErrorKind::RemoteError, e.what());
  }
  deadline_.reset();                        // masking cues end with the reply

  if (!r.ok) {
    fail_turn(ErrorKind::RemoteError, r.message.empty() ? "server error" : "server error: " + r.message,
              r.unreachable);
    return;
  }

  conversation_.commit_turn(*turn_->transcript, r.value);
  turn_->reply = r.value;

  SessionEvent ev;
  ev.kind = SessionEvent::Kind::Reply;
  ev.text = r.value.response;
  ev.turn_id = turn_->id;
  emit(ev);
  log::info("session", "reply", "intent=" + r.value.intent + " source=" + r.value.source);

  start_speaking(r.value);
}

void VoiceSession::poll_speech(uint64_t now_ms) {
  if (!ready(speak_future_)) return;
  if (interrupt_pending_) {
    complete_interrupt(now_ms);
    return;
  }

  SpeechOutcome o = SpeechOutcome::Failed;
  try {
    o = speak_future_.get();
  } catch (const std::future_error& e) {
    log::warn("session", "speech_future_broken", std::string("what=\"") + e.what() + "\"");
  }
  log::debug("session", "speech_done", std::string("outcome=") + outcome_name(o));

  if (o == SpeechOutcome::Failed) {
    fail_turn(ErrorKind::PlaybackError, "could not speak the answer");
    return;
  }
  finish_turn();                            // Finished, or Cancelled from outside
}

// poll_draining()
// OUT: true when no cancelled utterance holds the speaker any more
bool VoiceSession::poll_draining(uint64_t now_ms) {
  if (!draining_token_) return true;
  if (!draining_due_ms_) draining_due_ms_ = now_ms + cfg_.playback_stop_ms;

  if (ready(draining_)) {
    arbiter_.release(*draining_token_);
  } else if (now_ms >= *draining_due_ms_) {
    log::error("session", "speaker_stuck", "waited_ms=" + std::to_string(cfg_.playback_stop_ms));
    arbiter_.force_release();
  } else {
    return false;
  }
  draining_ = {};
  draining_token_.reset();
  draining_due_ms_.reset();
  return true;
}

// fire_deadline()
// PRE:  deadline_ due
// POLICY: a deadline that does not belong to the live turn and phase is stale
void VoiceSession::fire_deadline(uint64_t now_ms) {
  const Deadline d = *deadline_;
  deadline_.reset();

  if (!turn_ || turn_->id != d.turn_id) return;

  switch (d.kind) {
    case DeadlineKind::RecordingLimit:
      if (phase_ == SessionPhase::Recording) stop_recording(now_ms, /*timed_out*/true);
      break;

    case DeadlineKind::TranscribeLimit:
      if (phase_ != SessionPhase::Transcribing) return;
      log::warn("session", "recognizer_timeout", "limit_ms=" + std::to_string(cfg_.transcribe_limit_ms));
      fail_turn(ErrorKind::TranscriptionEmpty, "recognizer timed out");
      break;

    case DeadlineKind::PlaybackStop:
      if (phase_ != SessionPhase::Speaking || !interrupt_pending_) return;
      fail_turn(ErrorKind::PlaybackError, "speaker did not stop");
      break;

    case DeadlineKind::StillWorking:
    case DeadlineKind::Elaborating: {
      if (phase_ != SessionPhase::Thinking) return;
      SessionEvent ev;
      ev.kind = SessionEvent::Kind::Alert;
      ev.alert = d.kind == DeadlineKind::StillWorking ? SessionAlert::StillWorking
                                                      : SessionAlert::Elaborating;
      ev.turn_id = d.turn_id;
      emit(ev);
      log::debug("session", alert_name(ev.alert), "elapsed_ms=" + std::to_string(now_ms - thinking_since_ms_));
      if (d.kind == DeadlineKind::StillWorking) {
        set_status("still thinking");
        deadline_ = Deadline{DeadlineKind::Elaborating, d.turn_id, thinking_since_ms_ + cfg_.elaborating_ms};
      } else {
        set_status("looking it up");
      }
      break;
    }
  }
}

// ---------- events ----------

void VoiceSession::set_phase(SessionPhase p) {
  if (p == phase_) return;
  phase_ = p;
  SessionEvent ev;
  ev.kind = SessionEvent::Kind::PhaseChanged;
  ev.phase = p;
  ev.text = status_;
  if (turn_) ev.turn_id = turn_->id;
  emit(ev);
}

void VoiceSession::emit(SessionEvent ev) {
  ev.phase = (ev.kind == SessionEvent::Kind::PhaseChanged) ? ev.phase : phase_;
  if (outbox_.full()) outbox_.pop_front();  // drop oldest
  outbox_.push_back(std::move(ev));
}

void VoiceSession::emit_simple(SessionEvent::Kind kind, const std::string& text) {
  SessionEvent ev;
  ev.kind = kind;
  ev.text = text;
  if (turn_) ev.turn_id = turn_->id;
  emit(ev);
}

} // namespace akka
