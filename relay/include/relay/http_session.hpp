/*
 * 설명: HTTP 연결을 처리하고 토큰 조회/헬스/메트릭 엔드포인트를 제공한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: relay/tests/unit/http_parsing_test.cpp, relay/tests/e2e/token_flow_test.cpp
 */
#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include "relay/observability.hpp"
#include "relay/token_resolver.hpp"

namespace relay {

std::string UrlDecode(std::string_view value);
std::unordered_map<std::string, std::string> ParseQueryParams(const std::string& query);
// "a=1; session_id=abc" 형태. 같은 이름이 여러 번 오면 첫 값을 쓴다.
std::unordered_map<std::string, std::string> ParseCookies(std::string_view header);

class HttpSession : public std::enable_shared_from_this<HttpSession> {
 public:
  HttpSession(boost::asio::ip::tcp::socket socket, std::shared_ptr<TokenResolver> resolver,
              std::shared_ptr<SessionCache> cache, std::shared_ptr<Observability> observability);
  void Run();

 private:
  using Response = boost::beast::http::response<boost::beast::http::string_body>;

  void DoRead();
  void OnRead(boost::beast::error_code ec, std::size_t bytes_transferred);
  void HandleRequest();
  std::shared_ptr<Response> MakeResponse() const;
  void Route(const std::string& path, const std::string& query, Response& res);
  void HandleGetToken(const std::string& query, Response& res);
  void SendResponse(std::shared_ptr<Response> res);
  std::optional<std::string> ExtractSessionId() const;

  boost::beast::tcp_stream stream_;
  boost::beast::flat_buffer buffer_;
  boost::beast::http::request<boost::beast::http::string_body> req_;
  std::shared_ptr<TokenResolver> resolver_;
  std::shared_ptr<SessionCache> cache_;
  std::shared_ptr<Observability> observability_;
  std::chrono::steady_clock::time_point request_start_;
  std::string trace_id_;
  std::optional<std::string> session_hash_;
  std::optional<std::string> blocked_reason_;
};

}  // namespace relay
