/*
 * 설명: ID 토큰 검증 인터페이스와 RS256 JWT 검증기를 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: relay/tests/unit/jwt_claims_verifier_test.cpp
 */
#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

#include "relay/hybrid_cipher.hpp"

namespace relay {

class ClaimsError : public std::runtime_error {
 public:
  explicit ClaimsError(const std::string& message) : std::runtime_error(message) {}
};

class ClaimsVerifier {
 public:
  virtual ~ClaimsVerifier() = default;
  // 검증된 클레임(JSON 객체)을 돌려주고, 실패하면 ClaimsError를 던진다.
  virtual nlohmann::json Verify(const std::string& token) const = 0;
};

std::string Base64UrlEncode(std::string_view data);
std::string Base64UrlDecode(std::string_view data);

struct JwtVerifierConfig {
  std::vector<std::string> issuers{"accounts.google.com", "https://accounts.google.com"};
  std::string audience;
  std::chrono::seconds clock_skew{0};
};

class JwtClaimsVerifier : public ClaimsVerifier {
 public:
  using Clock = std::function<std::chrono::system_clock::time_point()>;

  JwtClaimsVerifier(std::unordered_map<std::string, EvpPkeyPtr> keys, JwtVerifierConfig config,
                    Clock clock = [] { return std::chrono::system_clock::now(); });

  // {"<kid>": "<PEM 인증서 또는 공개키>", ...}
  static std::unique_ptr<JwtClaimsVerifier> FromCertsJson(const std::string& certs_json, JwtVerifierConfig config);

  nlohmann::json Verify(const std::string& token) const override;

 private:
  bool VerifySignature(const std::string& signing_input, const std::string& signature, EVP_PKEY* key) const;
  void ValidateClaims(const nlohmann::json& claims) const;

  std::unordered_map<std::string, EvpPkeyPtr> keys_;
  JwtVerifierConfig config_;
  Clock clock_;
};

}  // namespace relay
