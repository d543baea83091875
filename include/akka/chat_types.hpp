#pragma once
/**
 * @file chat_types.hpp
 * @brief Value types exchanged with the rules server's HTTP API.
 *
 * Field names match the JSON keys on the wire; see parser.hpp for the codec.
 */

#include <optional>
#include <string>
#include <vector>

namespace akka {

enum class ChatRole : unsigned char { User = 0, Assistant = 1 };

inline const char* role_wire(ChatRole r) { return r == ChatRole::User ? "user" : "assistant"; }

struct ChatHistoryEntry {
  ChatRole                   role{ChatRole::User};
  std::string                content;
  std::optional<std::string> intent;    ///< assistant turns only, as reported by the server
};

/// Body of POST /api/chat.
struct ChatRequest {
  std::string                   table_id;
  std::string                   session_id;
  std::string                   game_name;      ///< sent as game_context.game_name
  std::string                   user_input;
  std::vector<ChatHistoryEntry> history;
};

/// Reply of POST /api/chat.
struct ChatReply {
  std::string           response;
  std::string           intent;
  std::string           source;
  std::optional<double> latency_ms;
  std::optional<double> confidence;
};

/// One entry of GET /api/games.
struct GameInfo {
  std::string id;
  std::string name;
  std::string description;
  bool        enable_stt_injection{false};
};

/// Reply of GET /api/keywords/{game_id}.
struct KeywordSet {
  std::string              game_id;
  bool                     correction_enabled{false};
  std::vector<std::string> keywords;
};

} // namespace akka
