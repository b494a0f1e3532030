/*
 * 설명: 토큰 조회 결과를 HTTP 응답 본문으로 직렬화한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: relay/tests/unit/token_outcome_test.cpp
 */
#include "relay/token_outcome.hpp"

#include <utility>

namespace relay {

TokenOutcome TokenOutcome::Success(std::string field, std::string value) {
  TokenOutcome outcome;
  outcome.success = true;
  outcome.http_status = 200;
  outcome.field = std::move(field);
  outcome.value = std::move(value);
  return outcome;
}

TokenOutcome TokenOutcome::Rejection(unsigned int http_status, std::string_view reason) {
  TokenOutcome outcome;
  outcome.success = false;
  outcome.http_status = http_status;
  outcome.reason = std::string(reason);
  return outcome;
}

std::string TokenOutcome::Body() const {
  if (success) {
    return value;
  }
  return MakeBlockedBody(reason).dump(-1, ' ', false, nlohmann::ordered_json::error_handler_t::replace);
}

std::string TokenOutcome::ContentType() const {
  return success ? "text/plain; charset=utf-8" : "application/json; charset=utf-8";
}

nlohmann::ordered_json MakeBlockedBody(std::string_view reason) {
  nlohmann::ordered_json body;
  body["status"] = "BLOCKED";
  body["reason"] = std::string(reason);
  return body;
}

}  // namespace relay
