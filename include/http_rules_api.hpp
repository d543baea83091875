/**
 * @file http_rules_api.hpp
 * @brief libcurl implementation of akka::RulesApi.
 *
 * @details
 * PURPOSE
 * -------
 * Talks plain HTTP/JSON to the rules server at `http://<address>:<port>`:
 *
 * | Call             | Request                         |
 * |------------------|---------------------------------|
 * | fetch_games()    | GET  /api/games                 |
 * | fetch_keywords() | GET  /api/keywords/{game_id}    |
 * | send_chat()      | POST /api/chat (JSON body)      |
 *
 * THREADING
 * ---------
 * Each call runs one blocking curl_easy_perform() on its own detached thread
 * and hands the result back through a std::promise. The worker captures
 * only values (URL, body, timeout), never `this`, so the client object may
 * be destroyed or retargeted while requests are in flight, and a caller that
 * drops the future never blocks on it.
 *
 * ERRORS
 * ------
 * - Transport failure (refused, unresolvable, timed out, reset): RemoteError
 *   with `unreachable = true`.
 * - HTTP status >= 400: RemoteError; message from the server's
 *   `{error_code, message}` body when it sent one.
 * - 2xx with a body that does not parse: RemoteError "bad_reply:<reason>".
 *
 * Every request has a 15 s client-side timeout (CURLOPT_TIMEOUT_MS).
 */
#ifndef AKKA_HTTP_RULES_API_HPP
#define AKKA_HTTP_RULES_API_HPP

#include <cstdint>
#include <mutex>
#include <string>
#include "akka/rules_api.hpp"

namespace akka {

class HttpRulesApi : public RulesApi {
public:
  static constexpr long DEFAULT_TIMEOUT_MS = 15000;

  explicit HttpRulesApi(long timeout_ms = DEFAULT_TIMEOUT_MS);

  void        set_server(const std::string& address, uint16_t port) override;
  std::string server() const override;

  /// "http://address:port", empty until set_server().
  std::string base_url() const;

  std::future<Result<std::vector<GameInfo>>> fetch_games() override;
  std::future<Result<KeywordSet>>            fetch_keywords(const std::string& game_id) override;
  std::future<Result<ChatReply>>             send_chat(const ChatRequest& request) override;

  /// Raw response of one request. Exposed for akka-probe diagnostics.
  struct HttpResponse {
    bool        transport_ok{false};
    bool        unreachable{false};
    long        status{0};
    std::string body;
    std::string error;
  };

  /// Blocking request; `post_body` null = GET.
  static HttpResponse perform(const std::string& url, const std::string* post_body, long timeout_ms);

private:
  mutable std::mutex mu_;
  std::string        address_;
  uint16_t           port_{8000};
  long               timeout_ms_;
};

} // namespace akka

#endif // AKKA_HTTP_RULES_API_HPP
