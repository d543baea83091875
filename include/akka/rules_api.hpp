#pragma once
/**
 * @file rules_api.hpp
 * @brief Rules server client seam.
 *
 * Contract:
 *  - set_server(address, port) retargets subsequent requests. Requests
 *    already in flight keep their old target.
 *  - Each call returns immediately with a future; the future always
 *    completes (success, server error, or client-side timeout).
 *  - Failures carry ErrorKind::RemoteError. `unreachable` marks transport
 *    level failures (refused, no route, timed out) as opposed to an HTTP
 *    error status or an unparsable body.
 */

#include <cstdint>
#include <future>
#include <string>
#include <vector>
#include "akka/chat_types.hpp"
#include "akka/errors.hpp"

namespace akka {

class RulesApi {
public:
  virtual ~RulesApi() = default;

  virtual void        set_server(const std::string& address, uint16_t port) = 0;
  virtual std::string server() const = 0;

  virtual std::future<Result<std::vector<GameInfo>>> fetch_games() = 0;
  virtual std::future<Result<KeywordSet>>            fetch_keywords(const std::string& game_id) = 0;
  virtual std::future<Result<ChatReply>>             send_chat(const ChatRequest& request) = 0;
};

} // namespace akka
