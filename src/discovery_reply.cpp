// -----------------------------------------------------------------------------
// discovery_reply.cpp - Implementation of discovery reply parsing
//
// API: see include/akka/discovery_reply.hpp
// Tests: tests/test_discovery_reply.cpp
// -----------------------------------------------------------------------------
#include "akka/discovery_reply.hpp"

#include <cstring>

namespace akka::discovery {

namespace {

// First piece of `tail` split on `quote` (empty pieces skipped) that
// contains a '.'.
std::optional<std::string> first_dotted_piece(const std::string& tail, char quote) {
  size_t start = 0;
  while (start <= tail.size()) {
    size_t end = tail.find(quote, start);
    if (end == std::string::npos) end = tail.size();

    if (end > start) {
      std::string piece = tail.substr(start, end - start);
      if (piece.find('.') != std::string::npos) return piece;
    }
    start = end + 1;
  }
  return std::nullopt;
}

} // namespace

bool is_echo(const uint8_t* data, std::size_t len) {
  return data && len == MAGIC_LEN && std::memcmp(data, MAGIC, MAGIC_LEN) == 0;
}

bool looks_like_reply(const std::string& text) {
  return text.find(REPLY_MARKER) != std::string::npos;
}

std::optional<AddressStr> parse_server_reply(const std::string& text) {
  const size_t at = text.find(REPLY_MARKER);
  if (at == std::string::npos) return std::nullopt;

  const std::string tail = text.substr(at + std::strlen(REPLY_MARKER));
  const char quote = tail.find('"') != std::string::npos ? '"' : '\'';
  auto piece = first_dotted_piece(tail, quote);
  if (!piece) return std::nullopt;

  auto ip = parse_ipv4(*piece);
  if (!ip) return std::nullopt;             // first dotted piece decides
  return format_ipv4(*ip);
}

} // namespace akka::discovery
