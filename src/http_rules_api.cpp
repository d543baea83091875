// ============================================================================
// http_rules_api.cpp - implementation for http_rules_api.hpp
// For API/overview see the matching .hpp.
// ============================================================================

/**
 * @file http_rules_api.cpp
 */

#include "http_rules_api.hpp"
#include "akka/log.hpp"
#include "akka/parser.hpp"

#include <curl/curl.h>

#include <exception>
#include <functional>
#include <memory>
#include <system_error>
#include <thread>

namespace akka {

namespace {

std::once_flag g_curl_once;

void ensure_curl_global() {
  std::call_once(g_curl_once, [] {
    CURLcode rc = curl_global_init(CURL_GLOBAL_DEFAULT);
    if (rc != CURLE_OK) log::error("http", "curl_global_init_failed", std::string("err=") + curl_easy_strerror(rc));
  });
}

size_t write_body(char* ptr, size_t size, size_t nmemb, void* userdata) {
  auto* out = static_cast<std::string*>(userdata);
  out->append(ptr, size * nmemb);
  return size * nmemb;
}

bool is_unreachable(CURLcode rc) {
  switch (rc) {
    case CURLE_COULDNT_RESOLVE_HOST:
    case CURLE_COULDNT_CONNECT:
    case CURLE_OPERATION_TIMEDOUT:
    case CURLE_SEND_ERROR:
    case CURLE_RECV_ERROR:
    case CURLE_GOT_NOTHING:
      return true;
    default:
      return false;
  }
}

// Run `fn` on a detached worker and return the future of its result.
// The promise is shared so the worker owns it even if the caller is gone.
template <class T>
std::future<Result<T>> run_detached(std::function<Result<T>()> fn) {
  auto promise = std::make_shared<std::promise<Result<T>>>();
  auto fut = promise->get_future();
  try {
    std::thread([promise, fn = std::move(fn)]() {
      try {
        promise->set_value(fn());
      } catch (const std::exception& e) {
        promise->set_value(Result<T>::failure(ErrorKind::RemoteError, e.what()));
      }
    }).detach();
  } catch (const std::system_error& e) {
    log::error("http", "thread_spawn_failed", std::string("what=\"") + e.what() + "\"");
    promise->set_value(Result<T>::failure(ErrorKind::RemoteError, "cannot start request"));
  }
  return fut;
}

// Map a raw response to a Result, running `decode` on 2xx bodies.
template <class T>
Result<T> to_result(const HttpRulesApi::HttpResponse& resp,
                    const char* what,
                    const std::function<std::optional<T>(const std::string&, std::string&)>& decode) {
  if (!resp.transport_ok) {
    log::warn("http", "request_failed", std::string("call=") + what + " err=\"" + resp.error + "\"");
    return Result<T>::failure(ErrorKind::RemoteError, resp.error, resp.unreachable);
  }
  if (resp.status >= 400) {
    std::string msg = parser::error_message_from_json(resp.body);
    if (msg.empty()) msg = "http " + std::to_string(resp.status);
    log::warn("http", "server_error", std::string("call=") + what + " status=" + std::to_string(resp.status));
    return Result<T>::failure(ErrorKind::RemoteError, msg);
  }

  std::string err;
  auto v = decode(resp.body, err);
  if (!v) {
    log::warn("http", "bad_reply", std::string("call=") + what + " reason=" + err);
    return Result<T>::failure(ErrorKind::RemoteError, "bad_reply:" + err);
  }
  return Result<T>::success(std::move(*v));
}

std::string url_escape(const std::string& s) {
  CURL* c = curl_easy_init();
  if (!c) return s;
  std::string out = s;
  if (char* e = curl_easy_escape(c, s.c_str(), static_cast<int>(s.size()))) {
    out = e;
    curl_free(e);
  }
  curl_easy_cleanup(c);
  return out;
}

} // namespace

HttpRulesApi::HttpRulesApi(long timeout_ms)
: timeout_ms_(timeout_ms > 0 ? timeout_ms : DEFAULT_TIMEOUT_MS) {
  ensure_curl_global();
}

void HttpRulesApi::set_server(const std::string& address, uint16_t port) {
  std::lock_guard<std::mutex> lock(mu_);
  address_ = address;
  port_ = port;
}

std::string HttpRulesApi::server() const {
  std::lock_guard<std::mutex> lock(mu_);
  return address_;
}

std::string HttpRulesApi::base_url() const {
  std::lock_guard<std::mutex> lock(mu_);
  if (address_.empty()) return {};
  return "http://" + address_ + ":" + std::to_string(port_);
}

std::future<Result<std::vector<GameInfo>>> HttpRulesApi::fetch_games() {
  const std::string base = base_url();
  const long timeout = timeout_ms_;
  return run_detached<std::vector<GameInfo>>([base, timeout]() {
    if (base.empty()) return Result<std::vector<GameInfo>>::failure(ErrorKind::RemoteError, "no server", true);
    auto resp = perform(base + "/api/games", nullptr, timeout);
    return to_result<std::vector<GameInfo>>(resp, "games", parser::games_from_json);
  });
}

std::future<Result<KeywordSet>> HttpRulesApi::fetch_keywords(const std::string& game_id) {
  const std::string base = base_url();
  const long timeout = timeout_ms_;
  return run_detached<KeywordSet>([base, timeout, game_id]() {
    if (base.empty()) return Result<KeywordSet>::failure(ErrorKind::RemoteError, "no server", true);
    auto resp = perform(base + "/api/keywords/" + url_escape(game_id), nullptr, timeout);
    return to_result<KeywordSet>(resp, "keywords",
      [&game_id](const std::string& body, std::string& err) {
        return parser::keywords_from_json(body, game_id, err);
      });
  });
}

std::future<Result<ChatReply>> HttpRulesApi::send_chat(const ChatRequest& request) {
  const std::string base = base_url();
  const long timeout = timeout_ms_;
  const std::string body = parser::to_json(request);
  return run_detached<ChatReply>([base, timeout, body]() {
    if (base.empty()) return Result<ChatReply>::failure(ErrorKind::RemoteError, "no server", true);
    auto resp = perform(base + "/api/chat", &body, timeout);
    return to_result<ChatReply>(resp, "chat", parser::chat_reply_from_json);
  });
}

// ---------------------------------------------------------------------------
// perform()
// ---------
// One blocking request with a fresh easy handle. No connection reuse: the
// client sends a handful of requests a minute and the server may move.
// ---------------------------------------------------------------------------
HttpRulesApi::HttpResponse HttpRulesApi::perform(const std::string& url,
                                                 const std::string* post_body,
                                                 long timeout_ms) {
  ensure_curl_global();
  HttpResponse out;

  CURL* curl = curl_easy_init();
  if (!curl) {
    out.error = "curl_easy_init failed";
    return out;
  }

  curl_slist* headers = nullptr;
  headers = curl_slist_append(headers, "Accept: application/json");
  if (post_body) headers = curl_slist_append(headers, "Content-Type: application/json");

  curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
  curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, timeout_ms);
  curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, timeout_ms);
  curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);              // required with worker threads
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_body);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &out.body);
  if (post_body) {
    curl_easy_setopt(curl, CURLOPT_POST, 1L);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, post_body->c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(post_body->size()));
  }

  CURLcode rc = curl_easy_perform(curl);
  if (rc == CURLE_OK) {
    out.transport_ok = true;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &out.status);
  } else {
    out.error = curl_easy_strerror(rc);
    out.unreachable = is_unreachable(rc);
  }

  curl_slist_free_all(headers);
  curl_easy_cleanup(curl);
  return out;
}

} // namespace akka
