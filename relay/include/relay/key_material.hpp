/*
 * 설명: 로컬 개인키와 인증 서버 공개키를 시작 시 한 번 읽어 불변 객체로 보관한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: relay/tests/unit/auth_server_client_test.cpp
 */
#pragma once

#include <memory>
#include <stdexcept>
#include <string>

#include "relay/hybrid_cipher.hpp"

namespace relay {

class KeyLoadError : public std::runtime_error {
 public:
  explicit KeyLoadError(const std::string& message) : std::runtime_error(message) {}
};

std::string ReadSecretFile(const std::string& path);

EvpPkeyPtr ParsePrivateKeyPem(const std::string& pem);
// SubjectPublicKeyInfo 공개키와 X.509 인증서 PEM을 모두 받는다.
EvpPkeyPtr ParsePublicKeyPem(const std::string& pem);

class KeyMaterial {
 public:
  KeyMaterial(EvpPkeyPtr private_key, EvpPkeyPtr server_public_key);

  KeyMaterial(const KeyMaterial&) = delete;
  KeyMaterial& operator=(const KeyMaterial&) = delete;

  static std::shared_ptr<const KeyMaterial> LoadFromFiles(const std::string& private_key_path,
                                                          const std::string& server_public_key_path);

  EVP_PKEY* PrivateKey() const { return private_key_.get(); }
  EVP_PKEY* ServerPublicKey() const { return server_public_key_.get(); }

 private:
  EvpPkeyPtr private_key_;
  EvpPkeyPtr server_public_key_;
};

}  // namespace relay
