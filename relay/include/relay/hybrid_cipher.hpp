/*
 * 설명: 인증 서버와의 교환에 쓰는 대칭(AES-CBC) 코덱과 비대칭(RSA-OAEP) 전송 래퍼를 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: relay/tests/unit/hybrid_cipher_test.cpp
 */
#pragma once

#include <cstddef>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <openssl/evp.h>

namespace relay {

using Bytes = std::vector<unsigned char>;

class CryptoError : public std::runtime_error {
 public:
  explicit CryptoError(const std::string& message) : std::runtime_error(message) {}
};

struct EvpPkeyDeleter {
  void operator()(EVP_PKEY* key) const { EVP_PKEY_free(key); }
};
using EvpPkeyPtr = std::unique_ptr<EVP_PKEY, EvpPkeyDeleter>;

// OpenSSL 오류 큐의 첫 항목을 context 뒤에 붙이고 큐를 비운다.
std::string DescribeOpenSslError(const std::string& context);

Bytes ToBytes(const std::string& text);
std::string ToString(const Bytes& bytes);

class SymmetricCodec {
 public:
  virtual ~SymmetricCodec() = default;
  virtual Bytes Encrypt(const Bytes& plaintext) const = 0;
  virtual Bytes Decrypt(const Bytes& ciphertext) const = 0;
};

// AES-256-CBC, PKCS#7 패딩. 암호문 앞 16바이트는 메시지마다 새로 뽑은 IV이다.
class AesCbcCodec : public SymmetricCodec {
 public:
  static constexpr std::size_t kKeySize = 32;
  static constexpr std::size_t kBlockSize = 16;

  AesCbcCodec();
  explicit AesCbcCodec(Bytes key);

  Bytes Encrypt(const Bytes& plaintext) const override;
  Bytes Decrypt(const Bytes& ciphertext) const override;

  const Bytes& Key() const { return key_; }

 private:
  Bytes key_;
};

class AsymmetricTransport {
 public:
  virtual ~AsymmetricTransport() = default;
  virtual Bytes Encrypt(const Bytes& data, EVP_PKEY* public_key) const = 0;
  virtual Bytes Decrypt(const Bytes& data, EVP_PKEY* private_key) const = 0;
};

// RSA OAEP(SHA-1, MGF1-SHA-1). 인증 서버 쪽 PKCS1_OAEP 기본값과 같다.
class RsaOaepTransport : public AsymmetricTransport {
 public:
  Bytes Encrypt(const Bytes& data, EVP_PKEY* public_key) const override;
  Bytes Decrypt(const Bytes& data, EVP_PKEY* private_key) const override;
};

struct EncryptedEnvelope {
  Bytes key;
  Bytes session_data;
};

class HybridCipher {
 public:
  explicit HybridCipher(std::shared_ptr<const AsymmetricTransport> transport);

  // 새 AES 키로 plaintext를 암호화하고, 그 키를 peer_public으로 감싼다.
  EncryptedEnvelope Seal(const Bytes& plaintext, EVP_PKEY* peer_public) const;
  Bytes Open(const EncryptedEnvelope& envelope, EVP_PKEY* own_private) const;

 private:
  std::shared_ptr<const AsymmetricTransport> transport_;
};

}  // namespace relay
