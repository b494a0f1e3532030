/*
 * 설명: 토큰 조회 상태 기계를 구현한다. 앞선 규칙이 일치하면 뒤 규칙은 보지 않는다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: relay/tests/unit/token_resolver_test.cpp
 */
#include "relay/token_resolver.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <utility>

namespace relay {

namespace {
bool IsSessionIdChar(unsigned char c) {
  if (std::isalnum(c)) {
    return true;
  }
  switch (c) {
    case '-':
    case '_':
    case '.':
    case '~':
    case '+':
    case '/':
    case '=':
      return true;
    default:
      return false;
  }
}

bool MentionsExpiry(std::string message) {
  std::transform(message.begin(), message.end(), message.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return message.find("expired") != std::string::npos;
}
}  // namespace

TokenResolver::TokenResolver(std::shared_ptr<SessionCache> cache, std::shared_ptr<const ClaimsVerifier> verifier,
                             std::shared_ptr<Observability> observability)
    : cache_(std::move(cache)), verifier_(std::move(verifier)), observability_(std::move(observability)) {}

bool TokenResolver::IsValidSessionId(const std::string& session_id) {
  if (session_id.empty() || session_id.size() > kMaxSessionIdLength) {
    return false;
  }
  return std::all_of(session_id.begin(), session_id.end(),
                     [](unsigned char c) { return IsSessionIdChar(c); });
}

std::string TokenResolver::UnsupportedTokenTypeReason(const std::string& token_type) {
  std::ostringstream oss;
  oss << "Requested token_type \"" << token_type << "\" not one of [";
  for (std::size_t i = 0; i < kSupportedTokenTypes.size(); ++i) {
    if (i > 0) {
      oss << ",";
    }
    oss << "\"" << kSupportedTokenTypes[i] << "\"";
  }
  oss << "]";
  return oss.str();
}

TokenOutcome TokenResolver::Resolve(const TokenRequest& request) const {
  if (!request.session_id || !IsValidSessionId(*request.session_id)) {
    return TokenOutcome::Rejection(200, reason::kBadSessionId);
  }
  const std::string& session_id = *request.session_id;

  AuthFetchResult fetched;
  try {
    fetched = cache_->Get(session_id);
  } catch (const std::exception& ex) {
    return Unknown(session_id, "token.fetch_failed", ex.what());
  }
  if (fetched.response) {
    return *fetched.response;
  }
  if (!fetched.auth_data) {
    return Unknown(session_id, "token.empty_auth_data", "캐시 항목에 인증 데이터가 없습니다");
  }
  const AuthData& auth_data = *fetched.auth_data;

  auto id_token = auth_data.find("id_token");
  if (id_token == auth_data.end() || !id_token->is_string()) {
    return Unknown(session_id, "token.missing_id_token", "id_token이 없습니다");
  }

  nlohmann::json claims;
  try {
    claims = verifier_->Verify(id_token->get<std::string>());
  } catch (const std::exception& ex) {
    if (MentionsExpiry(ex.what())) {
      return TokenOutcome::Rejection(200, reason::kTokenExpired);
    }
    return Unknown(session_id, "token.verify_failed", ex.what());
  }
  auto email_verified = claims.find("email_verified");
  if (email_verified == claims.end() || !email_verified->is_boolean() || !email_verified->get<bool>()) {
    return TokenOutcome::Rejection(500, reason::kBadEmail);
  }

  const std::string token_type = request.token_type.value_or(kDefaultTokenType);
  bool supported = std::any_of(kSupportedTokenTypes.begin(), kSupportedTokenTypes.end(),
                               [&](const char* type) { return token_type == type; });
  if (!supported) {
    return TokenOutcome::Rejection(500, UnsupportedTokenTypeReason(token_type));
  }

  auto field = auth_data.find(token_type);
  if (field == auth_data.end() || !field->is_string()) {
    return Unknown(session_id, "token.missing_field", token_type + " 필드가 없습니다");
  }
  return TokenOutcome::Success(token_type, field->get<std::string>());
}

TokenOutcome TokenResolver::Unknown(const std::string& session_id, const std::string& event,
                                    const std::string& detail) const {
  if (observability_) {
    LogContext ctx;
    ctx.name = event;
    ctx.level = LogLevel::kWarn;
    ctx.session_hash = HashSessionId(session_id);
    ctx.reason = std::string(reason::kUnknown);
    ctx.detail = detail;
    observability_->Log(ctx);
  }
  return TokenOutcome::Rejection(500, reason::kUnknown);
}

}  // namespace relay
