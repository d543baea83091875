// ============================================================================
// process_speech.cpp - implementation for process_speech.hpp
// For API/overview see the matching .hpp.
// ============================================================================

/**
 * @file process_speech.cpp
 */

#include "process_speech.hpp"
#include "akka/conversation.hpp"   // trim_copy
#include "akka/log.hpp"
#include "akka/wav.hpp"

#include <fcntl.h>         // O_* flags
#include <signal.h>        // kill, SIGTERM
#include <spawn.h>         // posix_spawnp
#include <sys/wait.h>      // waitid, waitpid
#include <unistd.h>        // pipe2, read, write, close, unlink
#include <cerrno>
#include <cstdio>          // snprintf
#include <cstring>         // strerror
#include <chrono>
#include <exception>
#include <system_error>
#include <thread>

extern char** environ;

namespace akka {

namespace {

// ---------------------------------------------------------------------------
// spawn_child()
// -------------
// posix_spawnp the argv. stdout goes to a fresh pipe when `stdout_fd` is
// non-null, otherwise to /dev/null. stderr always goes to /dev/null; the
// engines are chatty there.
//
// Returns: pid, or -1 with errno set.
// ---------------------------------------------------------------------------
pid_t spawn_child(const std::vector<std::string>& argv, int* stdout_fd) {
  if (argv.empty()) { errno = EINVAL; return -1; }

  int pipefd[2] = {-1, -1};
  if (stdout_fd && ::pipe2(pipefd, O_CLOEXEC) != 0) return -1;

  posix_spawn_file_actions_t fa;
  posix_spawn_file_actions_init(&fa);
  if (stdout_fd) posix_spawn_file_actions_adddup2(&fa, pipefd[1], STDOUT_FILENO);
  else           posix_spawn_file_actions_addopen(&fa, STDOUT_FILENO, "/dev/null", O_WRONLY, 0);
  posix_spawn_file_actions_addopen(&fa, STDERR_FILENO, "/dev/null", O_WRONLY, 0);

  std::vector<char*> args;
  args.reserve(argv.size() + 1);
  for (const auto& a : argv) args.push_back(const_cast<char*>(a.c_str()));
  args.push_back(nullptr);

  pid_t pid = -1;
  int rc = ::posix_spawnp(&pid, args[0], &fa, nullptr, args.data(), environ);
  posix_spawn_file_actions_destroy(&fa);

  if (stdout_fd) ::close(pipefd[1]);                 // parent keeps the read end only
  if (rc != 0) {
    if (stdout_fd) ::close(pipefd[0]);
    errno = rc;
    return -1;
  }
  if (stdout_fd) *stdout_fd = pipefd[0];
  return pid;
}

// ---------------------------------------------------------------------------
// reap_child()
// ------------
// Wait for exit without reaping (WNOWAIT), clear the shared pid under the
// lock, then reap. kill() from abort()/cancel() can therefore never hit a
// recycled pid.
//
// Returns: exit status, or -1 when killed by a signal or on wait error.
// ---------------------------------------------------------------------------
int reap_child(ChildState& st, pid_t pid) {
  siginfo_t info{};
  while (::waitid(P_PID, static_cast<id_t>(pid), &info, WEXITED | WNOWAIT) != 0 && errno == EINTR) {}

  {
    std::lock_guard<std::mutex> lock(st.mu);
    st.pid = -1;
  }
  st.exited.notify_all();

  int status = 0;
  while (::waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR) return -1;
  }
  return WIFEXITED(status) ? WEXITSTATUS(status) : -1;
}

void stop_child(const std::shared_ptr<ChildState>& st) {
  if (!st) return;
  std::lock_guard<std::mutex> lock(st->mu);
  st->stopped = true;
  if (st->pid > 0) ::kill(st->pid, SIGTERM);
}

// ---------------------------------------------------------------------------
// stop_child_and_wait()
// ---------------------
// SIGTERM, wait up to `grace` for the reaper to see the exit, then SIGKILL
// and wait once more. Bounded: at most two grace periods. A child that
// outlives both is logged and left to its reaper thread.
// ---------------------------------------------------------------------------
void stop_child_and_wait(const std::shared_ptr<ChildState>& st, std::chrono::milliseconds grace) {
  if (!st) return;
  std::unique_lock<std::mutex> lock(st->mu);
  st->stopped = true;
  if (st->pid <= 0) return;

  const auto gone = [&st] { return st->pid <= 0; };
  ::kill(st->pid, SIGTERM);
  if (st->exited.wait_for(lock, grace, gone)) return;

  log::warn("tts", "engine_ignored_sigterm", "pid=" + std::to_string(st->pid));
  ::kill(st->pid, SIGKILL);
  if (st->exited.wait_for(lock, grace, gone)) return;

  log::error("tts", "engine_not_reaped", "pid=" + std::to_string(st->pid));
}

// Child whose reaper thread never started: kill and reap it here.
void kill_and_reap(ChildState& st, pid_t pid) {
  {
    std::lock_guard<std::mutex> lock(st.mu);
    st.stopped = true;
    st.pid = -1;
  }
  ::kill(pid, SIGKILL);
  int status = 0;
  while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
}

std::string read_all(int fd) {
  std::string out;
  char buf[4096];
  for (;;) {
    ssize_t n = ::read(fd, buf, sizeof(buf));
    if (n > 0) { out.append(buf, static_cast<size_t>(n)); continue; }
    if (n < 0 && errno == EINTR) continue;
    break;                                           // EOF or error
  }
  return out;
}

template <class T>
std::future<T> ready_future(T value) {
  std::promise<T> p;
  p.set_value(std::move(value));
  return p.get_future();
}

} // namespace

std::vector<std::string> expand_command(const std::string& tmpl, const CommandVars& vars) {
  std::vector<std::string> out;
  size_t i = 0;
  while (i < tmpl.size()) {
    while (i < tmpl.size() && (tmpl[i] == ' ' || tmpl[i] == '\t')) ++i;
    if (i >= tmpl.size()) break;
    size_t j = i;
    while (j < tmpl.size() && tmpl[j] != ' ' && tmpl[j] != '\t') ++j;

    std::string word = tmpl.substr(i, j - i);
    for (const auto& kv : vars) {
      size_t at = 0;
      while ((at = word.find(kv.first, at)) != std::string::npos) {
        word.replace(at, kv.first.size(), kv.second);
        at += kv.second.size();                      // never rescan substituted text
      }
    }
    out.push_back(std::move(word));
    i = j;
  }
  return out;
}

int rate_to_wpm(float rate) {
  int wpm = static_cast<int>(rate * 350.0f + 0.5f);
  if (wpm < 80)  wpm = 80;
  if (wpm > 450) wpm = 450;
  return wpm;
}

// ============================ ProcessRecognizer =============================

ProcessRecognizer::ProcessRecognizer(ProcessRecognizerConfig cfg)
: cfg_(std::move(cfg)) {}

ProcessRecognizer::~ProcessRecognizer() {
  stop_child(running_);
}

bool ProcessRecognizer::start_capture() {
  samples_.clear();
  capturing_ = true;
  return true;
}

void ProcessRecognizer::append_audio(const int16_t* samples, std::size_t count) {
  if (!capturing_ || !samples) return;
  const std::size_t cap = cfg_.max_seconds * cfg_.sample_rate;
  if (samples_.size() + count > cap) count = cap > samples_.size() ? cap - samples_.size() : 0;
  samples_.insert(samples_.end(), samples, samples + count);
}

// finalize()
// PRE:    start_capture() called; samples buffered
// POLICY: utterance goes to a temp WAV; the reaper thread owns the file and
//         deletes it when the child exits
// OUT:    future completing with the trimmed stdout, or a failure
std::future<Result<Transcript>> ProcessRecognizer::finalize(const std::vector<std::string>& hints) {
  capturing_ = false;
  if (samples_.empty()) {
    return ready_future(Result<Transcript>::failure(ErrorKind::TranscriptionEmpty, "no audio"));
  }

  std::string wav;
  if (!write_wav(wav)) {
    samples_.clear();
    return ready_future(Result<Transcript>::failure(ErrorKind::CaptureUnavailable, "cannot write utterance"));
  }
  samples_.clear();

  char rate[16];
  std::snprintf(rate, sizeof(rate), "%u", cfg_.sample_rate);
  auto argv = expand_command(cfg_.command, {{"{wav}", wav}, {"{prompt}", stt_prompt(hints)}, {"{rate}", rate}});

  int out_fd = -1;
  pid_t pid = spawn_child(argv, &out_fd);
  if (pid < 0) {
    log::error("stt", "spawn_failed", "cmd=" + (argv.empty() ? std::string{} : argv[0]) +
               " err=" + std::strerror(errno));
    ::unlink(wav.c_str());
    return ready_future(Result<Transcript>::failure(ErrorKind::CaptureUnavailable, "recognizer not runnable"));
  }

  auto st = std::make_shared<ChildState>();
  st->pid = pid;
  running_ = st;

  auto promise = std::make_shared<std::promise<Result<Transcript>>>();
  auto fut = promise->get_future();
  try {
    std::thread([st, promise, pid, out_fd, wav]() {
      std::string text = read_all(out_fd);
      ::close(out_fd);
      int code = reap_child(*st, pid);
      ::unlink(wav.c_str());

      bool stopped;
      {
        std::lock_guard<std::mutex> lock(st->mu);
        stopped = st->stopped;
      }
      if (stopped) {
        promise->set_value(Result<Transcript>::failure(ErrorKind::TranscriptionEmpty, "aborted"));
      } else if (code != 0) {
        log::warn("stt", "engine_failed", "exit=" + std::to_string(code));
        promise->set_value(Result<Transcript>::failure(ErrorKind::TranscriptionEmpty,
                                                       "recognizer exit " + std::to_string(code)));
      } else {
        Transcript t;
        t.text = trim_copy(text);
        promise->set_value(Result<Transcript>::success(std::move(t)));
      }
    }).detach();
  } catch (const std::system_error& e) {
    log::error("stt", "thread_spawn_failed", std::string("what=\"") + e.what() + "\"");
    ::close(out_fd);
    kill_and_reap(*st, pid);
    ::unlink(wav.c_str());
    promise->set_value(Result<Transcript>::failure(ErrorKind::CaptureUnavailable, "cannot wait for recognizer"));
  }
  return fut;
}

void ProcessRecognizer::abort() {
  capturing_ = false;
  samples_.clear();
  stop_child(running_);
  running_.reset();
}

bool ProcessRecognizer::write_wav(std::string& path_out) {
  std::string tmpl = cfg_.tmp_dir + "/akka-utt-XXXXXX.wav";
  std::vector<char> path(tmpl.begin(), tmpl.end());
  path.push_back('\0');

  int fd = ::mkstemps(path.data(), 4);
  if (fd < 0) {
    log::error("stt", "tmpfile_failed", "dir=" + cfg_.tmp_dir + " err=" + std::strerror(errno));
    return false;
  }

  const auto bytes = encode_wav(samples_.data(), samples_.size(), cfg_.sample_rate);
  size_t off = 0;
  while (off < bytes.size()) {
    ssize_t n = ::write(fd, bytes.data() + off, bytes.size() - off);
    if (n < 0 && errno == EINTR) continue;
    if (n <= 0) {
      log::error("stt", "tmpfile_write_failed", std::string("err=") + std::strerror(errno));
      ::close(fd);
      ::unlink(path.data());
      return false;
    }
    off += static_cast<size_t>(n);
  }
  if (::close(fd) != 0) {
    ::unlink(path.data());
    return false;
  }
  path_out = path.data();
  return true;
}

// ============================ ProcessSynthesizer ============================

ProcessSynthesizer::ProcessSynthesizer(ProcessSynthesizerConfig cfg)
: cfg_(std::move(cfg)) {}

ProcessSynthesizer::~ProcessSynthesizer() {
  stop_child(running_);
}

std::future<SpeechOutcome> ProcessSynthesizer::speak(const std::string& text, const std::string& voice, float rate) {
  stop_child_and_wait(running_, std::chrono::milliseconds(cfg_.stop_grace_ms));   // one voice at a time
  running_.reset();

  char rate_s[16];
  std::snprintf(rate_s, sizeof(rate_s), "%.2f", static_cast<double>(rate));
  auto argv = expand_command(cfg_.command, {{"{text}", text},
                                            {"{voice}", voice},
                                            {"{rate}", rate_s},
                                            {"{wpm}", std::to_string(rate_to_wpm(rate))}});

  pid_t pid = spawn_child(argv, nullptr);
  if (pid < 0) {
    log::error("tts", "spawn_failed", "cmd=" + (argv.empty() ? std::string{} : argv[0]) +
               " err=" + std::strerror(errno));
    return ready_future(SpeechOutcome::Failed);
  }

  auto st = std::make_shared<ChildState>();
  st->pid = pid;
  running_ = st;

  auto promise = std::make_shared<std::promise<SpeechOutcome>>();
  auto fut = promise->get_future();
  try {
    std::thread([st, promise, pid]() {
      int code = reap_child(*st, pid);
      bool stopped;
      {
        std::lock_guard<std::mutex> lock(st->mu);
        stopped = st->stopped;
      }
      if (stopped)        promise->set_value(SpeechOutcome::Cancelled);
      else if (code == 0) promise->set_value(SpeechOutcome::Finished);
      else {
        log::warn("tts", "engine_failed", "exit=" + std::to_string(code));
        promise->set_value(SpeechOutcome::Failed);
      }
    }).detach();
  } catch (const std::system_error& e) {
    log::error("tts", "thread_spawn_failed", std::string("what=\"") + e.what() + "\"");
    kill_and_reap(*st, pid);
    promise->set_value(SpeechOutcome::Failed);
  }
  return fut;
}

void ProcessSynthesizer::cancel() {
  stop_child_and_wait(running_, std::chrono::milliseconds(cfg_.stop_grace_ms));
}

} // namespace akka
