/*
 * 설명: 세션 식별자로 인증 서버와 한 번의 암호화 교환을 수행해 인증 데이터를 얻는다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: relay/tests/unit/auth_server_client_test.cpp
 */
#pragma once

#include <memory>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "relay/auth_transport.hpp"
#include "relay/hybrid_cipher.hpp"
#include "relay/key_material.hpp"
#include "relay/observability.hpp"
#include "relay/token_outcome.hpp"

namespace relay {

// id_token, access_token, email 등을 담은 JSON 객체.
using AuthData = nlohmann::json;

// auth_data 또는 response 중 정확히 하나가 채워진다.
struct AuthFetchResult {
  std::optional<AuthData> auth_data;
  std::optional<TokenOutcome> response;

  static AuthFetchResult FromAuthData(AuthData data);
  static AuthFetchResult FromResponse(TokenOutcome outcome);
};

class AuthServerClient {
 public:
  AuthServerClient(std::shared_ptr<const KeyMaterial> keys, std::shared_ptr<AuthTransport> transport,
                   unsigned int rejected_status = 200, std::shared_ptr<Observability> observability = nullptr);

  // 인증 서버가 세션을 거부하면 REJECTED_REQUEST 응답을 담아 돌려준다.
  // 전송/아카이브/복호화/디코딩 실패는 예외로 전파된다.
  AuthFetchResult Fetch(const std::string& session_id) const;

  std::string BuildRequestBody(const std::string& session_id) const;
  AuthData DecodeResponseBody(const std::string& body) const;

 private:
  std::shared_ptr<const KeyMaterial> keys_;
  std::shared_ptr<AuthTransport> transport_;
  HybridCipher cipher_;
  unsigned int rejected_status_;
  std::shared_ptr<Observability> observability_;
};

}  // namespace relay
