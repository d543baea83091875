/**
 * @file main.cpp
 * @brief akka-client: interactive table-side voice client.
 *
 * Responsibilities:
 *  - Load settings from $XDG_CONFIG_HOME/akka/client.json; CLI11 options
 *    override them for this run, --save writes them back.
 *  - Build the Linux stack (UDP discovery, ALSA, child-process speech, HTTP)
 *    and hand it to akka::Orchestrator.
 *  - Event loop: poll(2) on stdin and the discovery socket, tick the
 *    orchestrator with steady-clock milliseconds, print every event.
 *
 * Console commands (one per line):
 *   <Enter>        the button: talk / stop talking / interrupt the answer
 *   games          list games (re-fetches from the server)
 *   game <id>      pick a game; starts a new session
 *   exit           leave the current game
 *   server <ip>    use this server instead of discovery
 *   table <id>     change and persist the table id
 *   status         one-line summary
 *   quit           leave
 */

#include <poll.h>
#include <signal.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

#include "CLI/CLI11.hpp"

#include "akka/audio_arbiter.hpp"
#include "akka/conversation.hpp"
#include "akka/discovery_engine.hpp"
#include "akka/log.hpp"
#include "akka/orchestrator.hpp"
#include "akka/transport/transport_linux_udp.hpp"
#include "akka/voice_session.hpp"
#include "alsa_audio.hpp"
#include "http_rules_api.hpp"
#include "net_interfaces.hpp"
#include "process_speech.hpp"
#include "settings_store.hpp"

namespace fs = std::filesystem;
using namespace akka;

// ---------- small utilities ----------

static volatile std::sig_atomic_t g_stop = 0;

static void on_signal(int) { g_stop = 1; }

static bool is_tty_stdout() { return ::isatty(fileno(stdout)); }

struct Ansi {
  bool enabled{true};
  std::string bold(const std::string& s) const { return enabled ? "\033[1m"+s+"\033[0m" : s; }
  std::string dim (const std::string& s) const { return enabled ? "\033[2m"+s+"\033[0m" : s; }
  std::string red (const std::string& s) const { return enabled ? "\033[31m"+s+"\033[0m" : s; }
};

static uint64_t now_ms_steady() {
  using namespace std::chrono;
  return static_cast<uint64_t>(duration_cast<milliseconds>(steady_clock::now().time_since_epoch()).count());
}

// Split "cmd rest of line" at the first space; rest is trimmed.
static void split_command(const std::string& line, std::string& cmd, std::string& arg) {
  std::string t = trim_copy(line);
  size_t sp = t.find(' ');
  cmd = t.substr(0, sp);
  arg = sp == std::string::npos ? std::string{} : trim_copy(t.substr(sp + 1));
}

// ---------- event printing ----------

static void print_games(const Orchestrator& orch, const Ansi& ansi) {
  if (orch.games().empty()) { std::cout << ansi.dim("  (no games)\n"); return; }
  for (const auto& g : orch.games()) {
    std::cout << "  " << ansi.bold(g.id) << "  " << g.name;
    if (g.enable_stt_injection) std::cout << ansi.dim("  [keywords]");
    std::cout << "\n";
  }
}

static void print_session_event(const SessionEvent& ev, const Ansi& ansi) {
  switch (ev.kind) {
    case SessionEvent::Kind::PhaseChanged:
      std::cout << ansi.dim(std::string("[") + phase_name(ev.phase) + "]") << "\n";
      break;
    case SessionEvent::Kind::Alert:
      std::cout << ansi.dim(std::string("(") + alert_name(ev.alert) + ")") << "\n";
      break;
    case SessionEvent::Kind::Transcript:
      std::cout << ansi.bold("you: ") << ev.text << "\n";
      break;
    case SessionEvent::Kind::Reply:
      std::cout << ansi.bold("akka: ") << ev.text << "\n";
      break;
    case SessionEvent::Kind::TurnCompleted:
      break;
    case SessionEvent::Kind::TurnFailed:
      std::cout << ansi.red(ev.text) << ansi.dim(std::string(" reason=") + error_name(ev.error)) << "\n";
      break;
    case SessionEvent::Kind::Interrupted:
      std::cout << ansi.dim("(interrupted)") << "\n";
      break;
    case SessionEvent::Kind::Busy:
      std::cout << ansi.dim("(busy, wait for the answer)") << "\n";
      break;
  }
}

static void print_event(const OrchestratorEvent& ev, const Orchestrator& orch, const Ansi& ansi) {
  switch (ev.kind) {
    case OrchestratorEvent::Kind::Status:
      std::cout << ansi.dim("status: ") << ev.text << "\n";
      break;
    case OrchestratorEvent::Kind::ServerFound:
      std::cout << "server=" << ansi.bold(ev.text) << "\n";
      break;
    case OrchestratorEvent::Kind::GamesLoaded:
      std::cout << "games:\n";
      print_games(orch, ansi);
      break;
    case OrchestratorEvent::Kind::GameSelected:
      if (ev.text.empty()) std::cout << "left the game\n";
      else                 std::cout << "game=" << ansi.bold(ev.text) << "\n";
      break;
    case OrchestratorEvent::Kind::KeywordsLoaded:
      std::cout << ansi.dim("keywords loaded") << "\n";
      break;
    case OrchestratorEvent::Kind::Session:
      print_session_event(ev.session, ansi);
      break;
    case OrchestratorEvent::Kind::Error:
      std::cout << ansi.red("error: " + ev.text) << ansi.dim(std::string(" reason=") + error_name(ev.error)) << "\n";
      break;
  }
}

// ---------- console ----------

// Returns false on "quit".
static bool handle_line(const std::string& line, Orchestrator& orch, Settings& settings,
                        const fs::path& config_path, const Ansi& ansi) {
  std::string cmd, arg;
  split_command(line, cmd, arg);

  if (cmd.empty()) {
    orch.press_button(now_ms_steady());
  } else if (cmd == "quit" || cmd == "q") {
    return false;
  } else if (cmd == "games") {
    if (!orch.refresh_games()) std::cout << ansi.red("not connected") << "\n";
  } else if (cmd == "game") {
    orch.select_game(arg);                            // unknown ids come back as an Error event
  } else if (cmd == "exit") {
    orch.exit_game();
  } else if (cmd == "server") {
    orch.set_manual_server(arg);
  } else if (cmd == "table") {
    if (orch.set_table_id(arg)) {
      settings.table_id = trim_copy(arg);
      auto saved = save_settings(config_path, settings);
      if (!saved.ok) std::cout << ansi.red("not saved: " + saved.message) << "\n";
      else           std::cout << "table=" << settings.table_id << "\n";
    }
  } else if (cmd == "status") {
    std::cout << "status=" << orch.status()
              << " server=" << (orch.server() ? *orch.server() : std::string("-"))
              << (orch.manual_server() ? " (manual)" : "")
              << " game=" << (orch.selected_game() ? orch.selected_game()->id : std::string("-"))
              << " table=" << settings.table_id << "\n";
  } else if (cmd == "help" || cmd == "?") {
    std::cout << "<Enter> talk | games | game <id> | exit | server <ip> | table <id> | status | quit\n";
  } else {
    std::cout << ansi.red("unknown command: " + cmd) << ansi.dim("  (help)") << "\n";
  }
  return true;
}

int main(int argc, char** argv) {
  CLI::App app{"Akka table client"};

  std::string config_file;
  std::string table_id, voice_id, server, capture_dev, playback_dev, stt_cmd, tts_cmd;
  float speech_rate = 0.0f;
  int   server_port = 0, discovery_port = 0;
  bool  save = false, verbose = false, no_color = false;

  app.add_option("--config", config_file, "Settings file (default $XDG_CONFIG_HOME/akka/client.json)");
  app.add_option("--table", table_id, "Table id sent with every chat request");
  app.add_option("--voice", voice_id, "Voice id for the synthesizer (e.g. zh-TW)");
  app.add_option("--rate", speech_rate, "Speech rate 0..1 (0.5 = normal)")->check(CLI::Range(0.05f, 1.0f));
  app.add_option("--server", server, "Server IPv4 address (skip discovery)");
  app.add_option("--port", server_port, "Server HTTP port")->check(CLI::Range(1, 65535));
  app.add_option("--discovery-port", discovery_port, "UDP discovery port")->check(CLI::Range(1, 65535));
  app.add_option("--capture", capture_dev, "ALSA capture PCM");
  app.add_option("--playback", playback_dev, "ALSA playback PCM");
  app.add_option("--stt-cmd", stt_cmd, "Recognizer command template ({wav} {prompt})");
  app.add_option("--tts-cmd", tts_cmd, "Synthesizer command template ({text} {voice} {rate} {wpm})");
  app.add_flag("--save", save, "Persist the given options to the settings file");
  app.add_flag("-v,--verbose", verbose, "Debug log lines on stderr");
  app.add_flag("--no-color", no_color, "Disable ANSI color");

  CLI11_PARSE(app, argc, argv);

  log::set_level(verbose ? log::Level::Debug : log::Level::Info);
  Ansi ansi;
  ansi.enabled = is_tty_stdout() && !no_color;

  // ---- settings ----
  const fs::path config_path = config_file.empty() ? default_config_path() : fs::path(config_file);
  auto loaded = load_settings(config_path);
  if (!loaded.ok) {
    std::cerr << "status=error reason=config_error detail=\"" << loaded.message << "\"\n";
    return 2;
  }
  Settings settings = loaded.value;

  if (!table_id.empty())     settings.table_id = table_id;
  if (!voice_id.empty())     settings.voice_id = voice_id;
  if (speech_rate > 0.0f)    settings.speech_rate = speech_rate;
  if (!server.empty())       settings.manual_server = server;
  if (server_port > 0)       settings.server_port = static_cast<uint16_t>(server_port);
  if (discovery_port > 0)    settings.discovery_port = static_cast<uint16_t>(discovery_port);
  if (!capture_dev.empty())  settings.capture_device = capture_dev;
  if (!playback_dev.empty()) settings.playback_device = playback_dev;
  if (!stt_cmd.empty())      settings.stt_command = stt_cmd;
  if (!tts_cmd.empty())      settings.tts_command = tts_cmd;

  std::string invalid = validate_settings(settings);
  if (!invalid.empty()) {
    std::cerr << "status=error reason=config_error detail=\"" << invalid << "\"\n";
    return 2;
  }
  if (save) {
    auto saved = save_settings(config_path, settings);
    if (!saved.ok) {
      std::cerr << "status=error reason=config_error detail=\"" << saved.message << "\"\n";
      return 2;
    }
  }

  // ---- stack ----
  AlsaAudioDevice audio(settings.capture_device, settings.playback_device);
  AudioArbiter    arbiter(audio);

  ProcessRecognizerConfig stt_cfg;
  stt_cfg.command = settings.stt_command;
  stt_cfg.sample_rate = arbiter.sample_rate();
  ProcessRecognizer recognizer(stt_cfg);

  ProcessSynthesizerConfig tts_cfg;
  tts_cfg.command = settings.tts_command;
  ProcessSynthesizer synthesizer(tts_cfg);

  HttpRulesApi api(settings.http_timeout_ms);

  Conversation conversation;
  conversation.set_table_id(settings.table_id);

  transport::LinuxUdp udp;
  DiscoveryConfig disco_cfg;
  disco_cfg.port = settings.discovery_port;
  DiscoveryEngine discovery(udp, list_broadcast_targets, disco_cfg);

  VoiceSessionConfig session_cfg;
  session_cfg.voice_id = settings.voice_id;
  session_cfg.speech_rate = settings.speech_rate;
  VoiceSession session(arbiter, recognizer, synthesizer, api, conversation, session_cfg);

  Orchestrator orch(discovery, session, api, conversation, settings.server_port);

  struct sigaction sa;
  std::memset(&sa, 0, sizeof(sa));
  sa.sa_handler = on_signal;
  ::sigaction(SIGINT, &sa, nullptr);
  ::sigaction(SIGTERM, &sa, nullptr);

  if (!orch.start()) std::cerr << "status=error reason=socket_error detail=\"discovery socket\"\n";
  if (!settings.manual_server.empty()) orch.set_manual_server(settings.manual_server);

  std::cout << ansi.bold("akka") << " table=" << settings.table_id
            << ansi.dim("  (help for commands, Enter to talk)") << "\n";

  // ---- loop ----
  std::string pending;
  bool running = true;
  while (running && !g_stop) {
    pollfd fds[2];
    nfds_t n = 0;
    fds[n++] = pollfd{STDIN_FILENO, POLLIN, 0};
    if (discovery.poll_handle() >= 0) fds[n++] = pollfd{discovery.poll_handle(), POLLIN, 0};

    int rc = ::poll(fds, n, 20);
    if (rc < 0 && errno != EINTR) {
      std::cerr << "status=error reason=poll_failed detail=\"" << std::strerror(errno) << "\"\n";
      break;
    }

    if (rc > 0 && (fds[0].revents & (POLLIN | POLLHUP))) {
      char buf[512];
      ssize_t got = ::read(STDIN_FILENO, buf, sizeof(buf));
      if (got <= 0) {
        if (got < 0 && errno == EINTR) continue;
        running = false;                              // EOF on stdin
      } else {
        pending.append(buf, static_cast<size_t>(got));
        size_t nl;
        while (running && (nl = pending.find('\n')) != std::string::npos) {
          std::string line = pending.substr(0, nl);
          pending.erase(0, nl + 1);
          running = handle_line(line, orch, settings, config_path, ansi);
        }
      }
    }

    orch.tick(now_ms_steady());

    OrchestratorEvent ev;
    while (orch.get_event(ev)) print_event(ev, orch, ansi);
    std::cout.flush();
  }

  orch.shutdown();
  OrchestratorEvent ev;
  while (orch.get_event(ev)) print_event(ev, orch, ansi);
  std::cout << "bye\n";
  return 0;
}
