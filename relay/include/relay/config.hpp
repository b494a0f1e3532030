/*
 * 설명: 릴레이 환경설정 로딩과 기본값을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: relay/tests/unit/config_test.cpp
 */
#pragma once

#include <cstddef>
#include <string>

namespace relay {

struct AppConfig {
  unsigned short port;
  std::size_t threads;
  std::string auth_server_url;
  std::size_t auth_server_timeout_seconds;
  std::string private_key_path;
  std::string auth_server_public_key_path;
  std::string id_token_certs_path;
  std::string id_token_audience;
  std::size_t id_token_clock_skew_seconds;
  std::size_t session_cache_size;
  unsigned int rejected_request_status;
  std::string log_level;
};

// 숫자 값이 올바르지 않으면 std::invalid_argument 또는 std::out_of_range를 던진다.
AppConfig LoadConfigFromEnv();

}  // namespace relay
