/**
 * @file settings_store.hpp
 * @brief Persisted client settings: `$XDG_CONFIG_HOME/akka/client.json`.
 *
 * @details
 * One flat JSON object. Unknown keys are ignored, missing keys keep their
 * defaults, so an old file keeps working after new settings appear.
 *
 * ```json
 * {
 *   "table_id": "T01",
 *   "voice_id": "zh-TW",
 *   "speech_rate": 0.5,
 *   "server_port": 8000,
 *   "discovery_port": 37020,
 *   "http_timeout_ms": 15000,
 *   "capture_device": "default",
 *   "playback_device": "default",
 *   "stt_command": "whisper-cli -l zh -nt -np -f {wav} --prompt {prompt}",
 *   "tts_command": "espeak-ng -v {voice} -s {wpm} {text}",
 *   "manual_server": ""
 * }
 * ```
 *
 * Writes are atomic: `client.json.tmp` is written in full, then renamed.
 */
#ifndef AKKA_SETTINGS_STORE_HPP
#define AKKA_SETTINGS_STORE_HPP

#include <cstdint>
#include <filesystem>
#include <string>

#include "nlohmann/json.hpp"
#include "akka/errors.hpp"

namespace akka {

struct Settings {
  std::string table_id{"T01"};
  std::string voice_id{"zh-TW"};
  float       speech_rate{0.5f};
  uint16_t    server_port{8000};
  uint16_t    discovery_port{37020};
  long        http_timeout_ms{15000};
  std::string capture_device{"default"};
  std::string playback_device{"default"};
  std::string stt_command{"whisper-cli -l zh -nt -np -f {wav} --prompt {prompt}"};
  std::string tts_command{"espeak-ng -v {voice} -s {wpm} {text}"};
  std::string manual_server;   ///< empty = discover
};

/// `$XDG_CONFIG_HOME/akka/client.json`, else `$HOME/.config/akka/client.json`.
std::filesystem::path default_config_path();

/// Trims string fields and checks ranges. Empty string = valid.
std::string validate_settings(Settings& s);

nlohmann::json settings_to_json(const Settings& s);

/// Overlay `j` onto defaults. Fails (ConfigError) on wrong value types.
Result<Settings> settings_from_json(const nlohmann::json& j);

/// Missing file is not an error: returns defaults.
Result<Settings> load_settings(const std::filesystem::path& path);

/// Validates, then writes atomically.
Result<bool> save_settings(const std::filesystem::path& path, const Settings& s);

} // namespace akka

#endif // AKKA_SETTINGS_STORE_HPP
