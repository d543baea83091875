// -----------------------------------------------------------------------------
// conversation.cpp - Implementation of akka::Conversation
//
// API: see include/akka/conversation.hpp
// Tests: tests/test_conversation.cpp
// -----------------------------------------------------------------------------
#include "akka/conversation.hpp"

namespace akka {

std::string trim_copy(const std::string& s) {
  const char* ws = " \t\r\n\v\f";
  const auto b = s.find_first_not_of(ws);
  if (b == std::string::npos) return {};
  const auto e = s.find_last_not_of(ws);
  return s.substr(b, e - b + 1);
}

Conversation::Conversation()
: rng_(std::random_device{}()) {
  session_id_ = Uuid::generate(rng_);
}

Conversation::Conversation(uint64_t seed)
: rng_(seed) {
  session_id_ = Uuid::generate(rng_);
}

bool Conversation::set_table_id(const std::string& table_id) {
  std::string t = trim_copy(table_id);
  if (t.empty()) return false;
  table_id_ = std::move(t);
  return true;
}

void Conversation::reset(const std::string& game_name) {
  game_name_  = game_name;
  session_id_ = Uuid::generate(rng_);
  history_.clear();
}

void Conversation::clear() {
  reset(std::string{});
}

ChatRequest Conversation::build_request(const std::string& user_input) const {
  ChatRequest req;
  req.table_id   = table_id_;
  req.session_id = session_id_.to_string().c_str();
  req.game_name  = game_name_;
  req.user_input = user_input;

  const std::size_t first = history_.size() > HISTORY_WINDOW ? history_.size() - HISTORY_WINDOW : 0;
  req.history.assign(history_.begin() + static_cast<std::ptrdiff_t>(first), history_.end());

  ChatHistoryEntry mine;                            // the line being asked now
  mine.role = ChatRole::User;
  mine.content = user_input;
  req.history.push_back(std::move(mine));
  return req;
}

void Conversation::commit_turn(const std::string& user_input, const ChatReply& reply) {
  ChatHistoryEntry u;
  u.role = ChatRole::User;
  u.content = user_input;
  history_.push_back(std::move(u));

  ChatHistoryEntry a;
  a.role = ChatRole::Assistant;
  a.content = reply.response;
  if (!reply.intent.empty()) a.intent = reply.intent;
  history_.push_back(std::move(a));
}

} // namespace akka
