/*
 * 설명: 토큰 조회 결과(성공 값 또는 차단 사유)와 차단 응답 본문을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: relay/tests/unit/token_outcome_test.cpp, relay/tests/unit/token_resolver_test.cpp
 */
#pragma once

#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace relay {

namespace reason {
inline constexpr std::string_view kBadSessionId = "BAD_SESSION_ID";
inline constexpr std::string_view kRejectedRequest = "REJECTED_REQUEST";
inline constexpr std::string_view kTokenExpired = "TOKEN_EXPIRED";
inline constexpr std::string_view kBadEmail = "BAD_EMAIL";
inline constexpr std::string_view kUnknown = "UNKNOWN";
inline constexpr std::string_view kNotFound = "NOT_FOUND";
}  // namespace reason

struct TokenOutcome {
  bool success{false};
  unsigned int http_status{200};
  std::string field;
  std::string value;
  std::string reason;

  static TokenOutcome Success(std::string field, std::string value);
  static TokenOutcome Rejection(unsigned int http_status, std::string_view reason);

  // 성공이면 값 그대로, 차단이면 {"status":"BLOCKED","reason":...}.
  std::string Body() const;
  std::string ContentType() const;
};

nlohmann::ordered_json MakeBlockedBody(std::string_view reason);

}  // namespace relay
