/*
 * 설명: HTTP 요청을 받아 토큰 조회, 헬스, 메트릭으로 분기한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: relay/tests/unit/http_parsing_test.cpp, relay/tests/e2e/token_flow_test.cpp
 */
#include "relay/http_session.hpp"

#include <cctype>
#include <exception>
#include <utility>

#include <nlohmann/json.hpp>

#include "relay/token_outcome.hpp"

namespace relay {

namespace {
int HexValue(char c) {
  if (c >= '0' && c <= '9') {
    return c - '0';
  }
  if (c >= 'a' && c <= 'f') {
    return c - 'a' + 10;
  }
  if (c >= 'A' && c <= 'F') {
    return c - 'A' + 10;
  }
  return -1;
}

std::string_view Trim(std::string_view value) {
  while (!value.empty() && std::isspace(static_cast<unsigned char>(value.front()))) {
    value.remove_prefix(1);
  }
  while (!value.empty() && std::isspace(static_cast<unsigned char>(value.back()))) {
    value.remove_suffix(1);
  }
  return value;
}
}  // namespace

std::string UrlDecode(std::string_view value) {
  std::string out;
  out.reserve(value.size());
  for (std::size_t i = 0; i < value.size(); ++i) {
    char c = value[i];
    if (c == '+') {
      out.push_back(' ');
    } else if (c == '%' && i + 2 < value.size() && HexValue(value[i + 1]) >= 0 && HexValue(value[i + 2]) >= 0) {
      out.push_back(static_cast<char>(HexValue(value[i + 1]) * 16 + HexValue(value[i + 2])));
      i += 2;
    } else {
      // 잘못된 % 시퀀스는 그대로 둔다.
      out.push_back(c);
    }
  }
  return out;
}

std::unordered_map<std::string, std::string> ParseQueryParams(const std::string& query) {
  std::unordered_map<std::string, std::string> params;
  std::size_t pos = 0;
  while (pos < query.size()) {
    auto amp = query.find('&', pos);
    std::string pair = query.substr(pos, amp == std::string::npos ? std::string::npos : amp - pos);
    auto eq = pair.find('=');
    if (eq != std::string::npos) {
      params.emplace(UrlDecode(pair.substr(0, eq)), UrlDecode(pair.substr(eq + 1)));
    }
    if (amp == std::string::npos) {
      break;
    }
    pos = amp + 1;
  }
  return params;
}

std::unordered_map<std::string, std::string> ParseCookies(std::string_view header) {
  std::unordered_map<std::string, std::string> cookies;
  std::size_t pos = 0;
  while (pos <= header.size()) {
    auto semi = header.find(';', pos);
    std::string_view part =
        Trim(header.substr(pos, semi == std::string_view::npos ? std::string_view::npos : semi - pos));
    auto eq = part.find('=');
    if (eq != std::string_view::npos && eq > 0) {
      std::string_view name = Trim(part.substr(0, eq));
      std::string_view val = Trim(part.substr(eq + 1));
      if (val.size() >= 2 && val.front() == '"' && val.back() == '"') {
        val = val.substr(1, val.size() - 2);
      }
      cookies.emplace(std::string(name), std::string(val));
    }
    if (semi == std::string_view::npos) {
      break;
    }
    pos = semi + 1;
  }
  return cookies;
}

HttpSession::HttpSession(boost::asio::ip::tcp::socket socket, std::shared_ptr<TokenResolver> resolver,
                         std::shared_ptr<SessionCache> cache, std::shared_ptr<Observability> observability)
    : stream_(std::move(socket)), resolver_(std::move(resolver)), cache_(std::move(cache)),
      observability_(std::move(observability)) {}

void HttpSession::Run() { DoRead(); }

void HttpSession::DoRead() {
  auto self = shared_from_this();
  req_ = {};
  stream_.expires_after(std::chrono::seconds(30));
  boost::beast::http::async_read(
      stream_, buffer_, req_,
      [self](boost::beast::error_code ec, std::size_t bytes_transferred) {
        self->OnRead(ec, bytes_transferred);
      });
}

void HttpSession::OnRead(boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
  if (ec == boost::beast::http::error::end_of_stream) {
    boost::beast::error_code ignored;
    stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ignored);
    return;
  }
  if (ec) {
    return;
  }
  HandleRequest();
}

void HttpSession::HandleRequest() {
  request_start_ = std::chrono::steady_clock::now();
  trace_id_ = observability_ ? observability_->NextTraceId() : std::string{};
  session_hash_.reset();
  blocked_reason_.reset();
  if (observability_) {
    observability_->IncrementRequest();
  }

  std::string target_str = std::string(req_.target());
  std::string path = target_str;
  std::string query;
  auto qpos = target_str.find('?');
  if (qpos != std::string::npos) {
    path = target_str.substr(0, qpos);
    query = target_str.substr(qpos + 1);
  }

  auto res = MakeResponse();
  try {
    Route(path, query, *res);
  } catch (const std::exception& ex) {
    // 처리 중 예외는 연결 하나의 500 응답으로 끝내고 워커 스레드로 전파하지 않는다.
    if (observability_) {
      LogContext ctx;
      ctx.trace_id = trace_id_;
      ctx.name = "http.handler_error";
      ctx.level = LogLevel::kError;
      ctx.session_hash = session_hash_;
      ctx.detail = ex.what();
      observability_->Log(ctx);
    }
    TokenOutcome failure = TokenOutcome::Rejection(500, reason::kUnknown);
    blocked_reason_ = failure.reason;
    res = MakeResponse();
    res->result(boost::beast::http::status::internal_server_error);
    res->set(boost::beast::http::field::content_type, failure.ContentType());
    res->body() = failure.Body();
    res->prepare_payload();
  }
  SendResponse(res);
}

std::shared_ptr<HttpSession::Response> HttpSession::MakeResponse() const {
  auto res = std::make_shared<Response>();
  res->version(req_.version());
  res->set(boost::beast::http::field::server, "token-relay");
  res->set(boost::beast::http::field::content_type, "application/json; charset=utf-8");
  return res;
}

void HttpSession::Route(const std::string& path, const std::string& query, Response& res) {
  using namespace boost::beast;
  if (req_.method() == http::verb::get && path == "/get_token") {
    HandleGetToken(query, res);
    return;
  }

  if (req_.method() == http::verb::get && path == "/api/health") {
    nlohmann::json payload{{"status", "ok"}, {"version", "v1.0.0"}};
    res.result(http::status::ok);
    res.body() = payload.dump();
    res.prepare_payload();
    return;
  }

  if (req_.method() == http::verb::get && path == "/metrics") {
    nlohmann::json data = nlohmann::json::object();
    if (observability_) {
      auto snapshot = observability_->Snapshot();
      data["requests"] = {{"total", snapshot.request_total},
                          {"blocked", snapshot.request_blocked},
                          {"errors", snapshot.request_errors}};
      data["authServer"] = {{"calls", snapshot.auth_server_calls}, {"failures", snapshot.auth_server_failures}};
    }
    if (cache_) {
      auto stats = cache_->Stats();
      data["cache"] = {{"size", cache_->Size()},
                       {"capacity", cache_->Capacity()},
                       {"hits", stats.hits},
                       {"misses", stats.misses},
                       {"joined", stats.joined},
                       {"evictions", stats.evictions}};
    }
    res.result(http::status::ok);
    res.body() = data.dump();
    res.prepare_payload();
    return;
  }

  TokenOutcome not_found = TokenOutcome::Rejection(404, reason::kNotFound);
  blocked_reason_ = not_found.reason;
  res.result(http::status::not_found);
  res.body() = not_found.Body();
  res.prepare_payload();
}

void HttpSession::HandleGetToken(const std::string& query, Response& res) {
  TokenRequest request;
  request.session_id = ExtractSessionId();
  if (request.session_id) {
    session_hash_ = HashSessionId(*request.session_id);
  }
  auto params = ParseQueryParams(query);
  auto type_it = params.find("token_type");
  if (type_it != params.end()) {
    request.token_type = type_it->second;
  }

  TokenOutcome outcome = resolver_->Resolve(request);
  if (!outcome.success) {
    blocked_reason_ = outcome.reason;
  }
  res.result(outcome.http_status);
  res.set(boost::beast::http::field::content_type, outcome.ContentType());
  res.body() = outcome.Body();
  res.prepare_payload();
}

std::optional<std::string> HttpSession::ExtractSessionId() const {
  auto range = req_.equal_range(boost::beast::http::field::cookie);
  for (auto it_field = range.first; it_field != range.second; ++it_field) {
    auto value = it_field->value();
    auto cookies = ParseCookies(std::string_view(value.data(), value.size()));
    auto it = cookies.find("session_id");
    if (it != cookies.end()) {
      return it->second;
    }
  }
  return std::nullopt;
}

void HttpSession::SendResponse(std::shared_ptr<Response> res) {
  auto self = shared_from_this();
  if (observability_) {
    const auto status = static_cast<unsigned int>(res->result_int());
    observability_->RecordOutcome(status, !blocked_reason_.has_value());
    LogContext ctx;
    ctx.trace_id = trace_id_;
    ctx.name = "http.request";
    ctx.level = status >= 500 ? LogLevel::kWarn : LogLevel::kInfo;
    ctx.session_hash = session_hash_;
    ctx.status = status;
    ctx.reason = blocked_reason_;
    ctx.detail = std::string(req_.target());
    ctx.latency_ms = static_cast<long>(
        std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - request_start_)
            .count());
    observability_->Log(ctx);
  }
  boost::beast::http::async_write(
      stream_, *res,
      [self, res](boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
        if (ec) {
          return;
        }
        self->stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ec);
      });
}

}  // namespace relay
