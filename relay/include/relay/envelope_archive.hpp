/*
 * 설명: 암호화 봉투를 key/session_data 두 멤버의 ZIP 아카이브로 직렬화한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: relay/tests/unit/envelope_archive_test.cpp, relay/tests/unit/auth_server_client_test.cpp
 */
#pragma once

#include <stdexcept>
#include <string>

#include "relay/hybrid_cipher.hpp"

namespace relay {

inline constexpr char kKeyMember[] = "key";
inline constexpr char kSessionDataMember[] = "session_data";

class EnvelopeError : public std::runtime_error {
 public:
  explicit EnvelopeError(const std::string& message) : std::runtime_error(message) {}
};

std::string PackEnvelope(const EncryptedEnvelope& envelope);

// 두 멤버 중 하나라도 없으면 EnvelopeError. 그 밖의 멤버는 무시한다.
EncryptedEnvelope UnpackEnvelope(const std::string& archive_bytes);

}  // namespace relay
