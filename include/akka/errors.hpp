/**
 * @file errors.hpp
 * @brief Error taxonomy shared by discovery, the voice session and the adapters.
 *
 * @details
 * Akka does not throw across module boundaries. Synchronous calls report with
 * `bool` or `std::optional` plus a `last_error()` accessor on the owning
 * object. Asynchronous collaborators (speech, chat API) complete a
 * `std::future<Result<T>>` that the state machines poll from `tick()`.
 *
 * | Kind                | Raised by                    | Effect                                  |
 * |---------------------|------------------------------|-----------------------------------------|
 * | NetworkUnavailable  | discovery, no targets        | attempt counted, schedule continues     |
 * | SocketError         | discovery socket open/send   | open: start() fails. send: logged       |
 * | DiscoveryExhausted  | discovery, last cycle        | terminal until restart                  |
 * | CaptureUnavailable  | arbiter / recognizer         | current turn ends                       |
 * | TranscriptionEmpty  | recognizer / placeholder     | current turn ends ("didn't catch that") |
 * | RemoteError         | chat API                     | current turn ends                       |
 * | PlaybackError       | arbiter / synthesizer        | current turn ends                       |
 * | ConfigError         | settings store               | CLI reports, defaults stay in effect    |
 */
#ifndef AKKA_ERRORS_HPP
#define AKKA_ERRORS_HPP

#include <cstdint>
#include <string>
#include <utility>

namespace akka {

enum class ErrorKind : uint8_t {
  None = 0,
  NetworkUnavailable,
  SocketError,
  DiscoveryExhausted,
  CaptureUnavailable,
  TranscriptionEmpty,
  RemoteError,
  PlaybackError,
  ConfigError
};

/// snake_case token used in log lines and `reason=` output.
inline const char* error_name(ErrorKind k) {
  switch (k) {
    case ErrorKind::None:               return "none";
    case ErrorKind::NetworkUnavailable: return "network_unavailable";
    case ErrorKind::SocketError:        return "socket_error";
    case ErrorKind::DiscoveryExhausted: return "discovery_exhausted";
    case ErrorKind::CaptureUnavailable: return "capture_unavailable";
    case ErrorKind::TranscriptionEmpty: return "transcription_empty";
    case ErrorKind::RemoteError:        return "remote_error";
    case ErrorKind::PlaybackError:      return "playback_error";
    case ErrorKind::ConfigError:        return "config_error";
  }
  return "unknown";
}

/**
 * @brief Completion value for asynchronous collaborators.
 *
 * `unreachable` is set by the chat client when the server could not be
 * reached at all (connect refused, host unreachable, timeout). The
 * orchestrator treats that as connectivity loss and restarts discovery.
 */
template <class T>
struct Result {
  bool        ok{false};
  T           value{};
  ErrorKind   error{ErrorKind::None};
  std::string message;
  bool        unreachable{false};

  static Result success(T v) {
    Result r;
    r.ok = true;
    r.value = std::move(v);
    return r;
  }

  static Result failure(ErrorKind e, std::string msg, bool unreachable_ = false) {
    Result r;
    r.error = e;
    r.message = std::move(msg);
    r.unreachable = unreachable_;
    return r;
  }
};

} // namespace akka

#endif // AKKA_ERRORS_HPP
