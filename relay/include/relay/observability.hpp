/*
 * 설명: 구조화 로그와 간단한 메트릭 카운터를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: relay/tests/unit/observability_test.cpp
 */
#pragma once

#include <atomic>
#include <cstdint>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace relay {

enum class LogLevel { kDebug = 0, kInfo = 1, kWarn = 2, kError = 3 };

LogLevel ParseLogLevel(const std::string& value);
const char* LogLevelName(LogLevel level);

// 세션 식별자는 원문 대신 SHA-256 앞 12자리로만 기록한다.
std::string HashSessionId(const std::string& session_id);

struct LogContext {
  std::string trace_id;
  std::string name;
  LogLevel level{LogLevel::kInfo};
  std::optional<std::string> session_hash;
  std::optional<unsigned int> status;
  std::optional<std::string> reason;
  std::optional<std::string> detail;
  long latency_ms{0};
};

struct MetricsSnapshot {
  std::uint64_t request_total{0};
  std::uint64_t request_blocked{0};
  std::uint64_t request_errors{0};
  std::uint64_t auth_server_calls{0};
  std::uint64_t auth_server_failures{0};
};

class Observability {
 public:
  explicit Observability(LogLevel min_level = LogLevel::kInfo);

  std::string NextTraceId();
  void IncrementRequest();
  void RecordOutcome(unsigned int status, bool success);
  void IncrementAuthCall();
  void IncrementAuthFailure();
  MetricsSnapshot Snapshot() const;
  bool Enabled(LogLevel level) const { return level >= min_level_; }
  void Log(const LogContext& ctx) const;

  static nlohmann::json ToLogJson(const LogContext& ctx);

 private:
  LogLevel min_level_;
  std::atomic<std::uint64_t> request_total_{0};
  std::atomic<std::uint64_t> request_blocked_{0};
  std::atomic<std::uint64_t> request_errors_{0};
  std::atomic<std::uint64_t> auth_server_calls_{0};
  std::atomic<std::uint64_t> auth_server_failures_{0};
  std::atomic<std::uint64_t> trace_counter_{0};
};

}  // namespace relay
