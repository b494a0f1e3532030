/*
 * 설명: RS256 서명과 exp/iat/iss/aud 클레임을 검사하는 JWT 검증기를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: relay/tests/unit/jwt_claims_verifier_test.cpp
 */
#include "relay/claims_verifier.hpp"

#include <algorithm>
#include <cstdint>
#include <utility>

#include <openssl/err.h>
#include <openssl/evp.h>

#include "relay/key_material.hpp"

namespace relay {

namespace {
struct MdCtxDeleter {
  void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};
using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, MdCtxDeleter>;

nlohmann::json ParseSegment(std::string_view segment, const char* what) {
  nlohmann::json parsed;
  try {
    parsed = nlohmann::json::parse(Base64UrlDecode(segment));
  } catch (const nlohmann::json::exception& ex) {
    throw ClaimsError(std::string("Token ") + what + " is not valid JSON: " + ex.what());
  }
  if (!parsed.is_object()) {
    throw ClaimsError(std::string("Token ") + what + " is not a JSON object");
  }
  return parsed;
}

std::int64_t RequireNumericClaim(const nlohmann::json& claims, const char* name) {
  auto it = claims.find(name);
  if (it == claims.end() || !it->is_number()) {
    throw ClaimsError(std::string("Token does not contain required claim ") + name);
  }
  return it->get<std::int64_t>();
}
}  // namespace

std::string Base64UrlEncode(std::string_view data) {
  std::string out(4 * ((data.size() + 2) / 3) + 1, '\0');
  int len = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()),
                            reinterpret_cast<const unsigned char*>(data.data()), static_cast<int>(data.size()));
  out.resize(static_cast<std::size_t>(len));
  for (auto& c : out) {
    if (c == '+') {
      c = '-';
    } else if (c == '/') {
      c = '_';
    }
  }
  while (!out.empty() && out.back() == '=') {
    out.pop_back();
  }
  return out;
}

std::string Base64UrlDecode(std::string_view data) {
  std::string input(data);
  for (auto& c : input) {
    if (c == '-') {
      c = '+';
    } else if (c == '_') {
      c = '/';
    }
  }
  if (input.size() % 4 == 1) {
    throw ClaimsError("Invalid base64url segment length");
  }
  std::size_t padding = (4 - input.size() % 4) % 4;
  input.append(padding, '=');
  if (input.empty()) {
    return {};
  }

  std::string out(input.size() / 4 * 3, '\0');
  int len = EVP_DecodeBlock(reinterpret_cast<unsigned char*>(out.data()),
                            reinterpret_cast<const unsigned char*>(input.data()), static_cast<int>(input.size()));
  if (len < 0) {
    throw ClaimsError("Invalid base64url segment");
  }
  out.resize(static_cast<std::size_t>(len) - padding);
  return out;
}

JwtClaimsVerifier::JwtClaimsVerifier(std::unordered_map<std::string, EvpPkeyPtr> keys, JwtVerifierConfig config,
                                     Clock clock)
    : keys_(std::move(keys)), config_(std::move(config)), clock_(std::move(clock)) {}

std::unique_ptr<JwtClaimsVerifier> JwtClaimsVerifier::FromCertsJson(const std::string& certs_json,
                                                                    JwtVerifierConfig config) {
  nlohmann::json certs;
  try {
    certs = nlohmann::json::parse(certs_json);
  } catch (const nlohmann::json::exception& ex) {
    throw KeyLoadError(std::string("인증서 JSON 파싱 실패: ") + ex.what());
  }
  if (!certs.is_object() || certs.empty()) {
    throw KeyLoadError("인증서 JSON은 비어 있지 않은 객체여야 합니다");
  }
  std::unordered_map<std::string, EvpPkeyPtr> keys;
  for (auto it = certs.begin(); it != certs.end(); ++it) {
    if (!it.value().is_string()) {
      throw KeyLoadError("인증서 값이 문자열이 아닙니다: " + it.key());
    }
    keys.emplace(it.key(), ParsePublicKeyPem(it.value().get<std::string>()));
  }
  return std::make_unique<JwtClaimsVerifier>(std::move(keys), std::move(config));
}

nlohmann::json JwtClaimsVerifier::Verify(const std::string& token) const {
  auto first = token.find('.');
  auto second = first == std::string::npos ? std::string::npos : token.find('.', first + 1);
  if (second == std::string::npos || token.find('.', second + 1) != std::string::npos) {
    throw ClaimsError("Wrong number of segments in token");
  }

  auto header = ParseSegment(std::string_view(token).substr(0, first), "header");
  auto claims = ParseSegment(std::string_view(token).substr(first + 1, second - first - 1), "payload");
  auto alg = header.find("alg");
  if (alg == header.end() || !alg->is_string() || alg->get<std::string>() != "RS256") {
    throw ClaimsError("Unsupported token algorithm, expected RS256");
  }

  const std::string signing_input = token.substr(0, second);
  const std::string signature = Base64UrlDecode(std::string_view(token).substr(second + 1));
  bool verified = false;
  auto kid = header.find("kid");
  if (kid != header.end() && kid->is_string()) {
    auto key = keys_.find(kid->get<std::string>());
    if (key == keys_.end()) {
      throw ClaimsError("Certificate for key id " + kid->get<std::string>() + " not found.");
    }
    verified = VerifySignature(signing_input, signature, key->second.get());
  } else {
    verified = std::any_of(keys_.begin(), keys_.end(), [&](const auto& entry) {
      return VerifySignature(signing_input, signature, entry.second.get());
    });
  }
  if (!verified) {
    throw ClaimsError("Could not verify token signature.");
  }

  ValidateClaims(claims);
  return claims;
}

bool JwtClaimsVerifier::VerifySignature(const std::string& signing_input, const std::string& signature,
                                        EVP_PKEY* key) const {
  MdCtxPtr ctx(EVP_MD_CTX_new());
  if (!ctx) {
    throw ClaimsError(DescribeOpenSslError("Failed to create verification context"));
  }
  if (EVP_DigestVerifyInit(ctx.get(), nullptr, EVP_sha256(), nullptr, key) != 1 ||
      EVP_DigestVerifyUpdate(ctx.get(), signing_input.data(), signing_input.size()) != 1) {
    throw ClaimsError(DescribeOpenSslError("Failed to initialize signature verification"));
  }
  int result = EVP_DigestVerifyFinal(ctx.get(), reinterpret_cast<const unsigned char*>(signature.data()),
                                     signature.size());
  ERR_clear_error();
  return result == 1;
}

void JwtClaimsVerifier::ValidateClaims(const nlohmann::json& claims) const {
  const std::int64_t now =
      std::chrono::duration_cast<std::chrono::seconds>(clock_().time_since_epoch()).count();
  const std::int64_t skew = config_.clock_skew.count();

  const std::int64_t exp = RequireNumericClaim(claims, "exp");
  if (now - skew > exp) {
    throw ClaimsError("Token expired, " + std::to_string(exp) + " < " + std::to_string(now));
  }
  auto iat = claims.find("iat");
  if (iat != claims.end() && iat->is_number() && now + skew < iat->get<std::int64_t>()) {
    throw ClaimsError("Token used too early, " + std::to_string(now) + " < " +
                      std::to_string(iat->get<std::int64_t>()));
  }

  if (!config_.issuers.empty()) {
    auto iss = claims.find("iss");
    if (iss == claims.end() || !iss->is_string() ||
        std::find(config_.issuers.begin(), config_.issuers.end(), iss->get<std::string>()) ==
            config_.issuers.end()) {
      throw ClaimsError("Wrong issuer");
    }
  }

  if (!config_.audience.empty()) {
    auto aud = claims.find("aud");
    bool matched = false;
    if (aud != claims.end() && aud->is_string()) {
      matched = aud->get<std::string>() == config_.audience;
    } else if (aud != claims.end() && aud->is_array()) {
      matched = std::any_of(aud->begin(), aud->end(), [&](const nlohmann::json& value) {
        return value.is_string() && value.get<std::string>() == config_.audience;
      });
    }
    if (!matched) {
      throw ClaimsError("Token has wrong audience");
    }
  }
}

}  // namespace relay
