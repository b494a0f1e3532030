#include <cstdlib>
#include <stdexcept>

#include <gtest/gtest.h>

#include "relay/config.hpp"

namespace {

const char* const kVariables[] = {"SERVER_PORT",
                                  "SERVER_THREADS",
                                  "AUTH_SERVER_URL",
                                  "AUTH_SERVER_TIMEOUT_SECONDS",
                                  "PRIVATE_KEY_PATH",
                                  "AUTH_SERVER_PUBLIC_KEY_PATH",
                                  "ID_TOKEN_CERTS_PATH",
                                  "ID_TOKEN_AUDIENCE",
                                  "ID_TOKEN_CLOCK_SKEW_SECONDS",
                                  "SESSION_CACHE_SIZE",
                                  "REJECTED_REQUEST_STATUS",
                                  "LOG_LEVEL"};

class ConfigTest : public ::testing::Test {
 protected:
  void SetUp() override { ClearAll(); }
  void TearDown() override { ClearAll(); }

  static void ClearAll() {
    for (const char* name : kVariables) {
      unsetenv(name);
    }
  }
};

}  // namespace

TEST_F(ConfigTest, Defaults) {
  auto cfg = relay::LoadConfigFromEnv();
  EXPECT_EQ(cfg.port, 8080);
  EXPECT_EQ(cfg.threads, 0u);
  EXPECT_EQ(cfg.auth_server_url, "http://auth:8081/auth");
  EXPECT_EQ(cfg.auth_server_timeout_seconds, 10u);
  EXPECT_EQ(cfg.private_key_path, "/secrets/private_key.pem");
  EXPECT_EQ(cfg.auth_server_public_key_path, "/secrets/auth_server_public_key.pem");
  EXPECT_EQ(cfg.id_token_certs_path, "/secrets/google_certs.json");
  EXPECT_TRUE(cfg.id_token_audience.empty());
  EXPECT_EQ(cfg.id_token_clock_skew_seconds, 0u);
  EXPECT_EQ(cfg.session_cache_size, 128u);
  EXPECT_EQ(cfg.rejected_request_status, 200u);
  EXPECT_EQ(cfg.log_level, "info");
}

TEST_F(ConfigTest, ReadsOverrides) {
  setenv("SERVER_PORT", "9090", 1);
  setenv("SESSION_CACHE_SIZE", "4", 1);
  setenv("REJECTED_REQUEST_STATUS", "403", 1);
  setenv("AUTH_SERVER_URL", "https://auth.internal/v1/session", 1);
  setenv("ID_TOKEN_AUDIENCE", "client-123", 1);
  auto cfg = relay::LoadConfigFromEnv();
  EXPECT_EQ(cfg.port, 9090);
  EXPECT_EQ(cfg.session_cache_size, 4u);
  EXPECT_EQ(cfg.rejected_request_status, 403u);
  EXPECT_EQ(cfg.auth_server_url, "https://auth.internal/v1/session");
  EXPECT_EQ(cfg.id_token_audience, "client-123");
}

TEST_F(ConfigTest, RejectsInvalidNumbers) {
  setenv("SESSION_CACHE_SIZE", "lots", 1);
  EXPECT_THROW(relay::LoadConfigFromEnv(), std::invalid_argument);
  setenv("SESSION_CACHE_SIZE", "0", 1);
  EXPECT_THROW(relay::LoadConfigFromEnv(), std::invalid_argument);
  unsetenv("SESSION_CACHE_SIZE");
  setenv("AUTH_SERVER_TIMEOUT_SECONDS", "0", 1);
  EXPECT_THROW(relay::LoadConfigFromEnv(), std::invalid_argument);
}

TEST_F(ConfigTest, RejectsOutOfRangeRejectionStatus) {
  setenv("REJECTED_REQUEST_STATUS", "1000", 1);
  EXPECT_THROW(relay::LoadConfigFromEnv(), std::invalid_argument);
  setenv("REJECTED_REQUEST_STATUS", "99", 1);
  EXPECT_THROW(relay::LoadConfigFromEnv(), std::invalid_argument);
  setenv("REJECTED_REQUEST_STATUS", "599", 1);
  EXPECT_EQ(relay::LoadConfigFromEnv().rejected_request_status, 599u);
}
