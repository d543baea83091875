/**
 * @file uuid.hpp
 * @brief Session identifiers: random RFC 4122 version-4 UUIDs.
 *
 * @details
 * A session id is created every time a game is selected or the conversation
 * is reset, and travels as `session_id` in every chat request so the server
 * can keep its own per-session context.
 *
 * The canonical text form is 36 characters, lower-case hex, hyphens at
 * 8-4-4-4-12. It lives in a fixed-capacity ETL string so request building
 * never touches the heap for it.
 *
 * @code
 * std::mt19937_64 rng{seed};
 * akka::Uuid id = akka::Uuid::generate(rng);
 * auto text = id.to_string();              // "3f2b...-4...-a..."
 * @endcode
 */
#ifndef AKKA_UUID_HPP
#define AKKA_UUID_HPP

#include <array>
#include <cstdint>
#include <random>
#include "etl/string.h"

namespace akka {

class Uuid {
public:
  using TextStr = etl::string<36>;

  Uuid() = default;

  /// Draws 128 random bits, then stamps version 4 and the RFC 4122 variant.
  static Uuid generate(std::mt19937_64& rng);

  TextStr to_string() const;

  bool is_nil() const;
  uint8_t version() const { return static_cast<uint8_t>(bytes_[6] >> 4); }

  const std::array<uint8_t, 16>& bytes() const { return bytes_; }

  bool operator==(const Uuid& o) const { return bytes_ == o.bytes_; }
  bool operator!=(const Uuid& o) const { return !(*this == o); }

private:
  std::array<uint8_t, 16> bytes_{};
};

} // namespace akka

#endif // AKKA_UUID_HPP
