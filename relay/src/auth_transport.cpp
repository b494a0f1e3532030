/*
 * 설명: Boost.Beast로 인증 서버에 POST 요청을 보내고 응답을 받는다. 교환 전체에 하나의 기한을 건다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: relay/tests/unit/auth_transport_test.cpp
 */
#include "relay/auth_transport.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <utility>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>

namespace relay {

namespace {
namespace http = boost::beast::http;
using tcp = boost::asio::ip::tcp;

http::request<http::string_body> BuildRequest(const AuthEndpoint& endpoint, const std::string& body,
                                              const std::string& content_type) {
  http::request<http::string_body> req{http::verb::post, endpoint.target, 11};
  req.set(http::field::host, endpoint.host);
  req.set(http::field::user_agent, BOOST_BEAST_VERSION_STRING);
  req.set(http::field::content_type, content_type);
  req.body() = body;
  req.prepare_payload();
  return req;
}

// 비동기 단계 하나를 끝까지 돌린다. tcp_stream 기한이 지나면 ec가 timeout으로 채워진다.
void RunStep(boost::asio::io_context& ioc, const boost::beast::error_code& ec, const char* step) {
  ioc.run();
  ioc.restart();
  if (ec) {
    throw TransportError(std::string(step) + ": " + ec.message());
  }
}

tcp::resolver::results_type Resolve(boost::asio::io_context& ioc, const AuthEndpoint& endpoint) {
  tcp::resolver resolver{ioc};
  boost::beast::error_code ec;
  tcp::resolver::results_type results;
  resolver.async_resolve(endpoint.host, endpoint.port,
                         [&](boost::beast::error_code e, tcp::resolver::results_type r) {
                           ec = e;
                           results = std::move(r);
                         });
  RunStep(ioc, ec, "인증 서버 주소 해석 실패");
  return results;
}

bool IsDigits(const std::string& value) {
  return !value.empty() && std::all_of(value.begin(), value.end(), [](unsigned char c) { return std::isdigit(c); });
}
}  // namespace

AuthEndpoint AuthEndpoint::Parse(const std::string& url) {
  const std::string http_prefix = "http://";
  const std::string https_prefix = "https://";
  AuthEndpoint endpoint;
  std::string rest;
  if (url.compare(0, https_prefix.size(), https_prefix) == 0) {
    endpoint.tls = true;
    rest = url.substr(https_prefix.size());
  } else if (url.compare(0, http_prefix.size(), http_prefix) == 0) {
    rest = url.substr(http_prefix.size());
  } else {
    throw std::invalid_argument("지원하지 않는 인증 서버 URL입니다: " + url);
  }

  auto slash = rest.find('/');
  std::string authority = rest.substr(0, slash);
  endpoint.target = slash == std::string::npos ? "/" : rest.substr(slash);
  auto colon = authority.rfind(':');
  if (colon != std::string::npos) {
    endpoint.host = authority.substr(0, colon);
    endpoint.port = authority.substr(colon + 1);
    if (!IsDigits(endpoint.port)) {
      throw std::invalid_argument("인증 서버 포트가 올바르지 않습니다: " + url);
    }
  } else {
    endpoint.host = authority;
    endpoint.port = endpoint.tls ? "443" : "80";
  }
  if (endpoint.host.empty()) {
    throw std::invalid_argument("인증 서버 호스트가 비어 있습니다: " + url);
  }
  return endpoint;
}

BeastAuthTransport::BeastAuthTransport(AuthEndpoint endpoint, std::chrono::seconds timeout)
    : endpoint_(std::move(endpoint)), timeout_(timeout), ssl_ctx_(boost::asio::ssl::context::tls_client) {
  if (endpoint_.tls) {
    ssl_ctx_.set_default_verify_paths();
    ssl_ctx_.set_verify_mode(boost::asio::ssl::verify_peer);
  }
}

HttpReply BeastAuthTransport::Post(const std::string& body, const std::string& content_type) {
  return endpoint_.tls ? PostTls(body, content_type) : PostPlain(body, content_type);
}

HttpReply BeastAuthTransport::PostPlain(const std::string& body, const std::string& content_type) {
  boost::asio::io_context ioc;
  auto results = Resolve(ioc, endpoint_);
  boost::beast::tcp_stream stream{ioc};
  boost::beast::error_code ec;

  stream.expires_after(timeout_);
  stream.async_connect(results, [&](boost::beast::error_code e, const tcp::endpoint&) { ec = e; });
  RunStep(ioc, ec, "인증 서버 연결 실패");

  auto req = BuildRequest(endpoint_, body, content_type);
  http::async_write(stream, req, [&](boost::beast::error_code e, std::size_t) { ec = e; });
  RunStep(ioc, ec, "인증 서버 요청 전송 실패");

  boost::beast::flat_buffer buffer;
  http::response<http::string_body> res;
  http::async_read(stream, buffer, res, [&](boost::beast::error_code e, std::size_t) { ec = e; });
  RunStep(ioc, ec, "인증 서버 응답 수신 실패");

  boost::beast::error_code ignored;
  stream.socket().shutdown(tcp::socket::shutdown_both, ignored);
  return HttpReply{res.result_int(), std::move(res.body())};
}

HttpReply BeastAuthTransport::PostTls(const std::string& body, const std::string& content_type) {
  boost::asio::io_context ioc;
  auto results = Resolve(ioc, endpoint_);
  boost::beast::ssl_stream<boost::beast::tcp_stream> stream{ioc, ssl_ctx_};
  boost::beast::error_code ec;

  if (!SSL_set_tlsext_host_name(stream.native_handle(), endpoint_.host.c_str())) {
    throw TransportError("TLS SNI 설정 실패: " + endpoint_.host);
  }
  stream.set_verify_callback(boost::asio::ssl::host_name_verification(endpoint_.host));

  boost::beast::get_lowest_layer(stream).expires_after(timeout_);
  boost::beast::get_lowest_layer(stream).async_connect(
      results, [&](boost::beast::error_code e, const tcp::endpoint&) { ec = e; });
  RunStep(ioc, ec, "인증 서버 연결 실패");

  stream.async_handshake(boost::asio::ssl::stream_base::client, [&](boost::beast::error_code e) { ec = e; });
  RunStep(ioc, ec, "인증 서버 TLS 핸드셰이크 실패");

  auto req = BuildRequest(endpoint_, body, content_type);
  http::async_write(stream, req, [&](boost::beast::error_code e, std::size_t) { ec = e; });
  RunStep(ioc, ec, "인증 서버 요청 전송 실패");

  boost::beast::flat_buffer buffer;
  http::response<http::string_body> res;
  http::async_read(stream, buffer, res, [&](boost::beast::error_code e, std::size_t) { ec = e; });
  RunStep(ioc, ec, "인증 서버 응답 수신 실패");

  boost::beast::get_lowest_layer(stream).close();
  return HttpReply{res.result_int(), std::move(res.body())};
}

}  // namespace relay
