/*
 * 설명: 세션 식별자 검사, 캐시 조회, 클레임 검증, 필드 선택을 순서대로 수행해 단일 결과를 만든다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: relay/tests/unit/token_resolver_test.cpp
 */
#pragma once

#include <array>
#include <memory>
#include <optional>
#include <string>

#include "relay/auth_server_client.hpp"
#include "relay/claims_verifier.hpp"
#include "relay/lru_cache.hpp"
#include "relay/observability.hpp"
#include "relay/token_outcome.hpp"

namespace relay {

using SessionCache = LruCache<std::string, AuthFetchResult>;

inline constexpr std::array<const char*, 3> kSupportedTokenTypes{"access_token", "id_token", "email"};
inline constexpr char kDefaultTokenType[] = "id_token";
inline constexpr std::size_t kMaxSessionIdLength = 512;

struct TokenRequest {
  std::optional<std::string> session_id;
  std::optional<std::string> token_type;
};

class TokenResolver {
 public:
  TokenResolver(std::shared_ptr<SessionCache> cache, std::shared_ptr<const ClaimsVerifier> verifier,
                std::shared_ptr<Observability> observability = nullptr);

  TokenOutcome Resolve(const TokenRequest& request) const;

  static bool IsValidSessionId(const std::string& session_id);
  static std::string UnsupportedTokenTypeReason(const std::string& token_type);

 private:
  TokenOutcome Unknown(const std::string& session_id, const std::string& event, const std::string& detail) const;

  std::shared_ptr<SessionCache> cache_;
  std::shared_ptr<const ClaimsVerifier> verifier_;
  std::shared_ptr<Observability> observability_;
};

}  // namespace relay
