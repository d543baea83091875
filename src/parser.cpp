/**
 * @file parser.cpp
 * @brief JSON codec for the rules server API.
 * @details
 *   Every conversion between wire text and the chat types goes through here,
 *   so the HTTP client and the probe tool share one definition of the API.
 *
 *   ## Robustness
 *   - Parse functions catch nlohmann::json exceptions at this boundary and
 *     return std::nullopt with a reason token in `err`. Nothing throws out.
 *   - Unknown fields are ignored. Optional fields (`latency_ms`, `confidence`,
 *     keyword `id`/`correction_enabled`) are read only when present and of
 *     the right type.
 *   - Required fields of the wrong type count as malformed.
 */

#include "akka/parser.hpp"
#include "nlohmann/json.hpp"

using nlohmann::json;

namespace akka {
namespace parser {

namespace {

// Read an optional string field; wrong type = malformed.
bool opt_string(const json& j, const char* key, std::string& out) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) return true;
  if (!it->is_string()) return false;
  out = it->get<std::string>();
  return true;
}

std::optional<double> opt_number(const json& j, const char* key) {
  auto it = j.find(key);
  if (it == j.end() || !it->is_number()) return std::nullopt;
  return it->get<double>();
}

} // namespace

std::string to_json(const ChatRequest& req) {
  json history = json::array();
  for (const auto& h : req.history) {
    history.push_back({
      {"role",    role_wire(h.role)},
      {"content", h.content},
      {"intent",  h.intent.value_or("")}
    });
  }

  json j = {
    {"table_id",     req.table_id},
    {"session_id",   req.session_id},
    {"game_context", {{"game_name", req.game_name}}},
    {"user_input",   req.user_input},
    {"history",      history}
  };
  // replace invalid UTF-8 rather than throwing on a bad transcript
  return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

std::optional<ChatReply> chat_reply_from_json(const std::string& body, std::string& err) {
  try {
    json j = json::parse(body);
    if (!j.is_object()) { err = "not_object"; return std::nullopt; }

    auto it = j.find("response");
    if (it == j.end() || !it->is_string()) { err = "missing_response"; return std::nullopt; }

    ChatReply r;
    r.response = it->get<std::string>();
    if (!opt_string(j, "intent", r.intent) || !opt_string(j, "source", r.source)) {
      err = "bad_field_type";
      return std::nullopt;
    }
    r.latency_ms = opt_number(j, "latency_ms");
    r.confidence = opt_number(j, "confidence");
    return r;
  } catch (const json::exception&) {
    err = "bad_json";
    return std::nullopt;
  }
}

std::optional<std::vector<GameInfo>> games_from_json(const std::string& body, std::string& err) {
  try {
    json j = json::parse(body);
    auto it = j.is_object() ? j.find("games") : j.end();
    if (it == j.end() || !it->is_array()) { err = "missing_games"; return std::nullopt; }

    std::vector<GameInfo> out;
    out.reserve(it->size());
    for (const auto& g : *it) {
      if (!g.is_object()) { err = "bad_game_entry"; return std::nullopt; }
      GameInfo info;
      info.id = g.at("id").get<std::string>();                   // required
      info.name = g.at("name").get<std::string>();
      info.description = g.value("description", std::string{});
      info.enable_stt_injection = g.value("enable_stt_injection", false);
      out.push_back(std::move(info));
    }
    return out;
  } catch (const json::exception&) {
    err = "bad_json";
    return std::nullopt;
  }
}

std::optional<KeywordSet> keywords_from_json(const std::string& body,
                                             const std::string& game_id,
                                             std::string& err) {
  try {
    json j = json::parse(body);
    if (!j.is_object()) { err = "not_object"; return std::nullopt; }

    auto it = j.find("keywords");
    if (it == j.end() || !it->is_array()) { err = "missing_keywords"; return std::nullopt; }

    KeywordSet k;
    k.game_id = game_id;
    if (!opt_string(j, "id", k.game_id)) { err = "bad_field_type"; return std::nullopt; }
    if (k.game_id.empty()) k.game_id = game_id;
    auto ce = j.find("correction_enabled");
    if (ce != j.end() && ce->is_boolean()) k.correction_enabled = ce->get<bool>();

    for (const auto& w : *it) {
      if (w.is_string()) k.keywords.push_back(w.get<std::string>());   // skip non-strings
    }
    return k;
  } catch (const json::exception&) {
    err = "bad_json";
    return std::nullopt;
  }
}

std::string error_message_from_json(const std::string& body) {
  json j = json::parse(body, nullptr, /*allow_exceptions*/false);
  if (!j.is_object()) return {};

  std::string code, msg;
  if (!opt_string(j, "error_code", code) || !opt_string(j, "message", msg)) return {};
  if (!code.empty() && !msg.empty()) return code + ": " + msg;
  return code.empty() ? msg : code;
}

} // namespace parser
} // namespace akka
