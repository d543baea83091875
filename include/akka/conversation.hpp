/**
 * @file conversation.hpp
 * @brief Chat context for one table: session id, game, and the history log.
 *
 * @details
 * The server is stateless per request; continuity comes from what the client
 * sends. A Conversation holds:
 * - `table_id`: which physical table this device sits on ("T01" by default).
 * - `session_id`: a fresh UUID v4 on every `reset()`, i.e. every game pick.
 * - `game_name`: sent as `game_context.game_name`.
 * - the history: append-only, user and assistant turns interleaved.
 *
 * `build_request()` sends the last `HISTORY_WINDOW` entries plus the new user
 * line. History is committed only when a reply arrives (`commit_turn()`), so
 * a failed turn leaves no half-exchange behind.
 */
#ifndef AKKA_CONVERSATION_HPP
#define AKKA_CONVERSATION_HPP

#include <cstddef>
#include <random>
#include <string>
#include <vector>
#include "akka/chat_types.hpp"
#include "akka/uuid.hpp"

namespace akka {

class Conversation {
public:
  static constexpr std::size_t HISTORY_WINDOW = 10;
  static constexpr const char* DEFAULT_TABLE_ID = "T01";

  Conversation();
  explicit Conversation(uint64_t seed);

  /// Trimmed; empty input is refused and the old id kept.
  bool set_table_id(const std::string& table_id);
  const std::string& table_id() const { return table_id_; }

  /// New session id, empty history, given game.
  void reset(const std::string& game_name);

  /// Forget the game entirely (back to the lobby).
  void clear();

  const std::string& game_name() const { return game_name_; }
  const Uuid& session_id() const { return session_id_; }
  bool has_game() const { return !game_name_.empty(); }

  ChatRequest build_request(const std::string& user_input) const;

  /// Append the user line and the assistant reply, in that order.
  void commit_turn(const std::string& user_input, const ChatReply& reply);

  const std::vector<ChatHistoryEntry>& history() const { return history_; }

private:
  std::mt19937_64               rng_;
  std::string                   table_id_{DEFAULT_TABLE_ID};
  std::string                   game_name_;
  Uuid                          session_id_;
  std::vector<ChatHistoryEntry> history_;
};

/// Strip ASCII whitespace at both ends.
std::string trim_copy(const std::string& s);

} // namespace akka

#endif // AKKA_CONVERSATION_HPP
