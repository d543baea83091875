#pragma once

#include <optional>
#include <string>
#include <vector>
#include "akka/chat_types.hpp"

namespace akka {
namespace parser {

/**
 * @brief Serialize a chat request to the POST /api/chat body.
 * @return JSON text `{table_id, session_id, game_context:{game_name}, user_input, history:[...]}`.
 *         History items always carry `intent` (empty string when unknown).
 */
std::string to_json(const ChatRequest& req);

/**
 * @brief Parse a POST /api/chat reply.
 * @param body  response text
 * @param err   set to a short reason token on failure
 * @return the reply, or std::nullopt when the body is not JSON or `response` is missing.
 */
std::optional<ChatReply> chat_reply_from_json(const std::string& body, std::string& err);

/**
 * @brief Parse GET /api/games.
 * @return the list (possibly empty), or std::nullopt on a malformed body.
 */
std::optional<std::vector<GameInfo>> games_from_json(const std::string& body, std::string& err);

/**
 * @brief Parse GET /api/keywords/{id}. `id` and `correction_enabled` are optional;
 *        a missing `id` falls back to `game_id`.
 */
std::optional<KeywordSet> keywords_from_json(const std::string& body,
                                             const std::string& game_id,
                                             std::string& err);

/**
 * @brief Extract `message` (and `error_code`) from a server error body.
 * @return "error_code: message", just one of them, or an empty string.
 */
std::string error_message_from_json(const std::string& body);

} // namespace parser
} // namespace akka
