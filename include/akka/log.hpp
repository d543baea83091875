/**
 * @file log.hpp
 * @brief Akka log lines: one key=value record per event, written to stderr.
 *
 * @details
 * ## Field Brief
 * Everything Akka reports about itself uses the same shape the executables
 * already print on failure:
 *
 * ```
 * [akka] level=warn comp=discovery reason=send_failed target=192.168.1.255
 * ```
 *
 * One line, no timestamps (journald and shells add their own), grep-friendly.
 * The state machines call these functions from inside `tick()` so the output
 * order matches the order decisions were made.
 *
 * @par Knobs
 * - `set_level()` is the global threshold. Default is `Level::Info`.
 * - `set_sink()` replaces the writer. Tests point it at a capture buffer or
 *   at a no-op so doctest output stays readable.
 *
 * @par Minimal Usage Example
 * @code
 * akka::log::warn("discovery", "send_failed", "target=" + addr);
 * @endcode
 */
#ifndef AKKA_LOG_HPP
#define AKKA_LOG_HPP

#include <string>

namespace akka::log {

enum class Level : unsigned char { Debug = 0, Info = 1, Warn = 2, Error = 3 };

/// Receives one fully formatted line (no trailing newline).
using Sink = void (*)(Level level, const std::string& line);

void  set_level(Level level);
Level level();

/// nullptr restores the stderr writer.
void set_sink(Sink sink);

const char* level_name(Level level);

/**
 * @brief Emit one record.
 * @param comp    component tag (discovery, arbiter, session, ...)
 * @param reason  short machine-readable token, snake_case
 * @param detail  extra `key=value` pairs, already formatted; may be empty
 */
void write(Level level, const char* comp, const char* reason, const std::string& detail = {});

inline void debug(const char* comp, const char* reason, const std::string& detail = {}) { write(Level::Debug, comp, reason, detail); }
inline void info (const char* comp, const char* reason, const std::string& detail = {}) { write(Level::Info,  comp, reason, detail); }
inline void warn (const char* comp, const char* reason, const std::string& detail = {}) { write(Level::Warn,  comp, reason, detail); }
inline void error(const char* comp, const char* reason, const std::string& detail = {}) { write(Level::Error, comp, reason, detail); }

} // namespace akka::log

#endif // AKKA_LOG_HPP
