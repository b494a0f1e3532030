/*
 * 설명: 구조화 로그와 간단한 메트릭 카운터를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: relay/tests/unit/observability_test.cpp
 */
#include "relay/observability.hpp"

#include <chrono>
#include <iomanip>
#include <iostream>
#include <sstream>

#include <openssl/evp.h>

namespace relay {

LogLevel ParseLogLevel(const std::string& value) {
  if (value == "debug") {
    return LogLevel::kDebug;
  }
  if (value == "warn" || value == "warning") {
    return LogLevel::kWarn;
  }
  if (value == "error") {
    return LogLevel::kError;
  }
  return LogLevel::kInfo;
}

const char* LogLevelName(LogLevel level) {
  switch (level) {
    case LogLevel::kDebug:
      return "debug";
    case LogLevel::kInfo:
      return "info";
    case LogLevel::kWarn:
      return "warn";
    case LogLevel::kError:
      return "error";
  }
  return "info";
}

std::string HashSessionId(const std::string& session_id) {
  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int digest_len = 0;
  if (EVP_Digest(session_id.data(), session_id.size(), digest, &digest_len, EVP_sha256(), nullptr) != 1) {
    return "unhashable";
  }
  std::ostringstream oss;
  for (unsigned int i = 0; i < digest_len && i < 6; ++i) {
    oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(digest[i]);
  }
  return oss.str();
}

Observability::Observability(LogLevel min_level) : min_level_(min_level) {}

std::string Observability::NextTraceId() {
  auto now = std::chrono::steady_clock::now().time_since_epoch().count();
  std::ostringstream oss;
  oss << std::hex << now << "-" << trace_counter_.fetch_add(1);
  return oss.str();
}

void Observability::IncrementRequest() { request_total_.fetch_add(1); }

void Observability::RecordOutcome(unsigned int status, bool success) {
  if (!success) {
    request_blocked_.fetch_add(1);
  }
  if (status >= 500) {
    request_errors_.fetch_add(1);
  }
}

void Observability::IncrementAuthCall() { auth_server_calls_.fetch_add(1); }

void Observability::IncrementAuthFailure() { auth_server_failures_.fetch_add(1); }

MetricsSnapshot Observability::Snapshot() const {
  MetricsSnapshot snapshot;
  snapshot.request_total = request_total_.load();
  snapshot.request_blocked = request_blocked_.load();
  snapshot.request_errors = request_errors_.load();
  snapshot.auth_server_calls = auth_server_calls_.load();
  snapshot.auth_server_failures = auth_server_failures_.load();
  return snapshot;
}

nlohmann::json Observability::ToLogJson(const LogContext& ctx) {
  nlohmann::json log_json;
  log_json["level"] = LogLevelName(ctx.level);
  log_json["traceId"] = ctx.trace_id;
  log_json["eventName"] = ctx.name;
  log_json["latencyMs"] = ctx.latency_ms;
  if (ctx.session_hash) {
    log_json["sessionHash"] = *ctx.session_hash;
  }
  if (ctx.status) {
    log_json["status"] = *ctx.status;
  }
  if (ctx.reason) {
    log_json["reason"] = *ctx.reason;
  }
  if (ctx.detail) {
    log_json["detail"] = *ctx.detail;
  }
  return log_json;
}

void Observability::Log(const LogContext& ctx) const {
  if (!Enabled(ctx.level)) {
    return;
  }
  // 요청 경로 등 외부 입력이 섞이므로 잘못된 UTF-8은 대체 문자로 바꿔 기록한다.
  std::cout << ToLogJson(ctx).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;
}

}  // namespace relay
