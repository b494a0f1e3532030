/*
 * 설명: 환경변수에서 릴레이 설정을 읽는다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: relay/tests/unit/config_test.cpp
 */
#include "relay/config.hpp"

#include <cstdlib>
#include <stdexcept>

namespace relay {

AppConfig LoadConfigFromEnv() {
  auto get_env = [](const char* key, const char* def) -> std::string {
    const char* val = std::getenv(key);
    return val ? std::string{val} : std::string{def};
  };

  AppConfig cfg;
  cfg.port = static_cast<unsigned short>(std::stoi(get_env("SERVER_PORT", "8080")));
  cfg.threads = static_cast<std::size_t>(std::stoul(get_env("SERVER_THREADS", "0")));
  cfg.auth_server_url = get_env("AUTH_SERVER_URL", "http://auth:8081/auth");
  cfg.auth_server_timeout_seconds =
      static_cast<std::size_t>(std::stoul(get_env("AUTH_SERVER_TIMEOUT_SECONDS", "10")));
  cfg.private_key_path = get_env("PRIVATE_KEY_PATH", "/secrets/private_key.pem");
  cfg.auth_server_public_key_path =
      get_env("AUTH_SERVER_PUBLIC_KEY_PATH", "/secrets/auth_server_public_key.pem");
  cfg.id_token_certs_path = get_env("ID_TOKEN_CERTS_PATH", "/secrets/google_certs.json");
  cfg.id_token_audience = get_env("ID_TOKEN_AUDIENCE", "");
  cfg.id_token_clock_skew_seconds =
      static_cast<std::size_t>(std::stoul(get_env("ID_TOKEN_CLOCK_SKEW_SECONDS", "0")));
  cfg.session_cache_size = static_cast<std::size_t>(std::stoul(get_env("SESSION_CACHE_SIZE", "128")));
  cfg.rejected_request_status = static_cast<unsigned int>(std::stoul(get_env("REJECTED_REQUEST_STATUS", "200")));
  cfg.log_level = get_env("LOG_LEVEL", "info");

  if (cfg.session_cache_size == 0) {
    throw std::invalid_argument("SESSION_CACHE_SIZE는 1 이상이어야 합니다");
  }
  if (cfg.auth_server_timeout_seconds == 0) {
    throw std::invalid_argument("AUTH_SERVER_TIMEOUT_SECONDS는 1 이상이어야 합니다");
  }
  if (cfg.rejected_request_status < 100 || cfg.rejected_request_status > 599) {
    throw std::invalid_argument("REJECTED_REQUEST_STATUS는 100~599 범위여야 합니다");
  }
  return cfg;
}

}  // namespace relay
