// ============================================================================
// settings_store.cpp - implementation for settings_store.hpp
// For API/overview see the matching .hpp.
// ============================================================================

#include "settings_store.hpp"
#include "akka/broadcast_target.hpp"   // parse_ipv4
#include "akka/conversation.hpp"       // trim_copy
#include "akka/log.hpp"

#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <system_error>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace akka {

namespace {

// Assign `out` from j[key] when present. Throws json::type_error on mismatch.
template <class T>
void take(const json& j, const char* key, T& out) {
  auto it = j.find(key);
  if (it != j.end() && !it->is_null()) out = it->get<T>();
}

// Ports are read wide and range-checked; get<uint16_t> would wrap 70000.
// Returns: error text, empty when `out` was set or the key is absent.
std::string take_port(const json& j, const char* key, uint16_t& out) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) return {};
  if (!it->is_number_integer()) return std::string(key) + " must be an integer";
  const auto v = it->get<int64_t>();
  if (v < 1 || v > 65535) return std::string(key) + " must be in 1..65535";
  out = static_cast<uint16_t>(v);
  return {};
}

} // namespace

fs::path default_config_path() {
  const char* xdg  = std::getenv("XDG_CONFIG_HOME");
  const char* home = std::getenv("HOME");
  fs::path base;
  if (xdg && *xdg)        base = fs::path(xdg);
  else if (home && *home) base = fs::path(home) / ".config";
  else                    base = fs::current_path();
  return base / "akka" / "client.json";
}

std::string validate_settings(Settings& s) {
  s.table_id      = trim_copy(s.table_id);
  s.voice_id      = trim_copy(s.voice_id);
  s.manual_server = trim_copy(s.manual_server);

  if (s.table_id.empty())                            return "table_id must not be empty";
  if (s.voice_id.empty())                            return "voice_id must not be empty";
  if (!(s.speech_rate > 0.0f && s.speech_rate <= 1.0f)) return "speech_rate must be in (0, 1]";
  if (s.server_port == 0)                            return "server_port must not be 0";
  if (s.discovery_port == 0)                         return "discovery_port must not be 0";
  if (s.http_timeout_ms <= 0)                        return "http_timeout_ms must be positive";
  if (s.stt_command.find("{wav}") == std::string::npos) return "stt_command needs {wav}";
  if (s.tts_command.find("{text}") == std::string::npos) return "tts_command needs {text}";
  if (!s.manual_server.empty() && !parse_ipv4(s.manual_server)) return "manual_server is not an IPv4 address";
  return {};
}

json settings_to_json(const Settings& s) {
  return json{
    {"table_id",        s.table_id},
    {"voice_id",        s.voice_id},
    {"speech_rate",     s.speech_rate},
    {"server_port",     s.server_port},
    {"discovery_port",  s.discovery_port},
    {"http_timeout_ms", s.http_timeout_ms},
    {"capture_device",  s.capture_device},
    {"playback_device", s.playback_device},
    {"stt_command",     s.stt_command},
    {"tts_command",     s.tts_command},
    {"manual_server",   s.manual_server}
  };
}

Result<Settings> settings_from_json(const json& j) {
  if (!j.is_object()) return Result<Settings>::failure(ErrorKind::ConfigError, "settings must be a JSON object");

  Settings s;
  std::string port_err = take_port(j, "server_port", s.server_port);
  if (port_err.empty()) port_err = take_port(j, "discovery_port", s.discovery_port);
  if (!port_err.empty()) return Result<Settings>::failure(ErrorKind::ConfigError, port_err);

  try {
    take(j, "table_id",        s.table_id);
    take(j, "voice_id",        s.voice_id);
    take(j, "speech_rate",     s.speech_rate);
    take(j, "http_timeout_ms", s.http_timeout_ms);
    take(j, "capture_device",  s.capture_device);
    take(j, "playback_device", s.playback_device);
    take(j, "stt_command",     s.stt_command);
    take(j, "tts_command",     s.tts_command);
    take(j, "manual_server",   s.manual_server);
  } catch (const json::exception& e) {
    return Result<Settings>::failure(ErrorKind::ConfigError, e.what());
  }

  std::string err = validate_settings(s);
  if (!err.empty()) return Result<Settings>::failure(ErrorKind::ConfigError, err);
  return Result<Settings>::success(std::move(s));
}

Result<Settings> load_settings(const fs::path& path) {
  std::error_code ec;
  if (!fs::exists(path, ec)) {
    if (ec) log::warn("config", "stat_failed", "path=" + path.string() + " err=\"" + ec.message() + "\"");
    return Result<Settings>::success(Settings{});
  }

  std::ifstream in(path);
  if (!in) return Result<Settings>::failure(ErrorKind::ConfigError, "cannot open " + path.string());

  json j;
  try {
    in >> j;
  } catch (const json::parse_error& e) {
    return Result<Settings>::failure(ErrorKind::ConfigError, path.string() + ": " + e.what());
  }
  return settings_from_json(j);
}

// save_settings()
// POLICY: write <path>.tmp in full, flush, rename over <path>
// OUT:    ok, or ConfigError with the filesystem reason
Result<bool> save_settings(const fs::path& path, const Settings& s) {
  Settings checked = s;
  std::string err = validate_settings(checked);
  if (!err.empty()) return Result<bool>::failure(ErrorKind::ConfigError, err);

  std::error_code ec;
  if (path.has_parent_path()) {
    fs::create_directories(path.parent_path(), ec);
    if (ec) return Result<bool>::failure(ErrorKind::ConfigError, "mkdir " + path.parent_path().string() + ": " + ec.message());
  }

  fs::path tmp = path;
  tmp += ".tmp";
  {
    std::ofstream out(tmp, std::ios::trunc);
    if (!out) return Result<bool>::failure(ErrorKind::ConfigError, "cannot write " + tmp.string());
    out << settings_to_json(checked).dump(2) << '\n';
    out.flush();
    if (!out) {
      fs::remove(tmp, ec);
      return Result<bool>::failure(ErrorKind::ConfigError, "short write " + tmp.string());
    }
  }

  fs::rename(tmp, path, ec);
  if (ec) {
    std::error_code ignored;
    fs::remove(tmp, ignored);
    return Result<bool>::failure(ErrorKind::ConfigError, "rename " + path.string() + ": " + ec.message());
  }
  log::info("config", "saved", "path=" + path.string());
  return Result<bool>::success(true);
}

} // namespace akka
