/*
 * 설명: 인증 서버로의 동기 HTTP(S) 호출을 추상화하고 Boost.Beast 구현을 제공한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: relay/tests/unit/auth_transport_test.cpp, relay/tests/unit/auth_server_client_test.cpp
 */
#pragma once

#include <chrono>
#include <stdexcept>
#include <string>

#include <boost/asio/ssl/context.hpp>

namespace relay {

class TransportError : public std::runtime_error {
 public:
  explicit TransportError(const std::string& message) : std::runtime_error(message) {}
};

struct HttpReply {
  unsigned int status{0};
  std::string body;
};

class AuthTransport {
 public:
  virtual ~AuthTransport() = default;
  // 연결/송수신 실패는 TransportError. HTTP 상태 코드는 그대로 돌려준다.
  virtual HttpReply Post(const std::string& body, const std::string& content_type) = 0;
};

struct AuthEndpoint {
  bool tls{false};
  std::string host;
  std::string port;
  std::string target;

  // http://host[:port]/path 또는 https://host[:port]/path
  static AuthEndpoint Parse(const std::string& url);
};

class BeastAuthTransport : public AuthTransport {
 public:
  BeastAuthTransport(AuthEndpoint endpoint, std::chrono::seconds timeout);

  HttpReply Post(const std::string& body, const std::string& content_type) override;

 private:
  HttpReply PostPlain(const std::string& body, const std::string& content_type);
  HttpReply PostTls(const std::string& body, const std::string& content_type);

  AuthEndpoint endpoint_;
  std::chrono::seconds timeout_;
  boost::asio::ssl::context ssl_ctx_;
};

}  // namespace relay
