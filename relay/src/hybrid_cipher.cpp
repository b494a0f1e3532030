/*
 * 설명: OpenSSL EVP로 AES-CBC 코덱, RSA-OAEP 전송 래퍼, 하이브리드 봉인/개봉을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: relay/tests/unit/hybrid_cipher_test.cpp
 */
#include "relay/hybrid_cipher.hpp"

#include <utility>

#include <openssl/err.h>
#include <openssl/rand.h>
#include <openssl/rsa.h>

namespace relay {

namespace {
struct CipherCtxDeleter {
  void operator()(EVP_CIPHER_CTX* ctx) const { EVP_CIPHER_CTX_free(ctx); }
};
using CipherCtxPtr = std::unique_ptr<EVP_CIPHER_CTX, CipherCtxDeleter>;

struct PkeyCtxDeleter {
  void operator()(EVP_PKEY_CTX* ctx) const { EVP_PKEY_CTX_free(ctx); }
};
using PkeyCtxPtr = std::unique_ptr<EVP_PKEY_CTX, PkeyCtxDeleter>;

PkeyCtxPtr NewOaepContext(EVP_PKEY* key, bool encrypt) {
  PkeyCtxPtr ctx(EVP_PKEY_CTX_new(key, nullptr));
  if (!ctx) {
    throw CryptoError(DescribeOpenSslError("RSA 컨텍스트 생성 실패"));
  }
  int init = encrypt ? EVP_PKEY_encrypt_init(ctx.get()) : EVP_PKEY_decrypt_init(ctx.get());
  if (init != 1) {
    throw CryptoError(DescribeOpenSslError("RSA 컨텍스트 초기화 실패"));
  }
  if (EVP_PKEY_CTX_set_rsa_padding(ctx.get(), RSA_PKCS1_OAEP_PADDING) <= 0) {
    throw CryptoError(DescribeOpenSslError("OAEP 패딩 설정 실패"));
  }
  return ctx;
}
}  // namespace

std::string DescribeOpenSslError(const std::string& context) {
  unsigned long code = ERR_get_error();
  ERR_clear_error();
  if (code == 0) {
    return context;
  }
  char buffer[256];
  ERR_error_string_n(code, buffer, sizeof(buffer));
  return context + ": " + buffer;
}

Bytes ToBytes(const std::string& text) { return Bytes(text.begin(), text.end()); }

std::string ToString(const Bytes& bytes) { return std::string(bytes.begin(), bytes.end()); }

AesCbcCodec::AesCbcCodec() : key_(kKeySize) {
  if (RAND_bytes(key_.data(), static_cast<int>(key_.size())) != 1) {
    throw CryptoError(DescribeOpenSslError("AES 키 생성 실패"));
  }
}

AesCbcCodec::AesCbcCodec(Bytes key) : key_(std::move(key)) {
  if (key_.size() != kKeySize) {
    throw CryptoError("AES 키 길이가 올바르지 않습니다: " + std::to_string(key_.size()));
  }
}

Bytes AesCbcCodec::Encrypt(const Bytes& plaintext) const {
  Bytes out(kBlockSize + plaintext.size() + kBlockSize);
  if (RAND_bytes(out.data(), static_cast<int>(kBlockSize)) != 1) {
    throw CryptoError(DescribeOpenSslError("IV 생성 실패"));
  }
  CipherCtxPtr ctx(EVP_CIPHER_CTX_new());
  if (!ctx) {
    throw CryptoError(DescribeOpenSslError("암호 컨텍스트 생성 실패"));
  }
  if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_cbc(), nullptr, key_.data(), out.data()) != 1) {
    throw CryptoError(DescribeOpenSslError("AES 암호화 초기화 실패"));
  }
  int len = 0;
  if (EVP_EncryptUpdate(ctx.get(), out.data() + kBlockSize, &len, plaintext.data(),
                        static_cast<int>(plaintext.size())) != 1) {
    throw CryptoError(DescribeOpenSslError("AES 암호화 실패"));
  }
  int total = len;
  if (EVP_EncryptFinal_ex(ctx.get(), out.data() + kBlockSize + total, &len) != 1) {
    throw CryptoError(DescribeOpenSslError("AES 암호화 마무리 실패"));
  }
  total += len;
  out.resize(kBlockSize + static_cast<std::size_t>(total));
  return out;
}

Bytes AesCbcCodec::Decrypt(const Bytes& ciphertext) const {
  if (ciphertext.size() < 2 * kBlockSize || ciphertext.size() % kBlockSize != 0) {
    throw CryptoError("AES 암호문 길이가 올바르지 않습니다: " + std::to_string(ciphertext.size()));
  }
  CipherCtxPtr ctx(EVP_CIPHER_CTX_new());
  if (!ctx) {
    throw CryptoError(DescribeOpenSslError("암호 컨텍스트 생성 실패"));
  }
  if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_cbc(), nullptr, key_.data(), ciphertext.data()) != 1) {
    throw CryptoError(DescribeOpenSslError("AES 복호화 초기화 실패"));
  }
  Bytes out(ciphertext.size());
  int len = 0;
  if (EVP_DecryptUpdate(ctx.get(), out.data(), &len, ciphertext.data() + kBlockSize,
                        static_cast<int>(ciphertext.size() - kBlockSize)) != 1) {
    throw CryptoError(DescribeOpenSslError("AES 복호화 실패"));
  }
  int total = len;
  if (EVP_DecryptFinal_ex(ctx.get(), out.data() + total, &len) != 1) {
    throw CryptoError(DescribeOpenSslError("AES 패딩이 올바르지 않습니다"));
  }
  total += len;
  out.resize(static_cast<std::size_t>(total));
  return out;
}

Bytes RsaOaepTransport::Encrypt(const Bytes& data, EVP_PKEY* public_key) const {
  if (!public_key) {
    throw CryptoError("RSA 공개키가 없습니다");
  }
  auto ctx = NewOaepContext(public_key, true);
  std::size_t out_len = 0;
  if (EVP_PKEY_encrypt(ctx.get(), nullptr, &out_len, data.data(), data.size()) != 1) {
    throw CryptoError(DescribeOpenSslError("OAEP 출력 길이 계산 실패"));
  }
  Bytes out(out_len);
  if (EVP_PKEY_encrypt(ctx.get(), out.data(), &out_len, data.data(), data.size()) != 1) {
    throw CryptoError(DescribeOpenSslError("OAEP 암호화 실패"));
  }
  out.resize(out_len);
  return out;
}

Bytes RsaOaepTransport::Decrypt(const Bytes& data, EVP_PKEY* private_key) const {
  if (!private_key) {
    throw CryptoError("RSA 개인키가 없습니다");
  }
  auto ctx = NewOaepContext(private_key, false);
  std::size_t out_len = 0;
  if (EVP_PKEY_decrypt(ctx.get(), nullptr, &out_len, data.data(), data.size()) != 1) {
    throw CryptoError(DescribeOpenSslError("OAEP 출력 길이 계산 실패"));
  }
  Bytes out(out_len);
  if (EVP_PKEY_decrypt(ctx.get(), out.data(), &out_len, data.data(), data.size()) != 1) {
    throw CryptoError(DescribeOpenSslError("OAEP 복호화 실패"));
  }
  out.resize(out_len);
  return out;
}

HybridCipher::HybridCipher(std::shared_ptr<const AsymmetricTransport> transport)
    : transport_(std::move(transport)) {}

EncryptedEnvelope HybridCipher::Seal(const Bytes& plaintext, EVP_PKEY* peer_public) const {
  AesCbcCodec codec;
  EncryptedEnvelope envelope;
  envelope.key = transport_->Encrypt(codec.Key(), peer_public);
  envelope.session_data = codec.Encrypt(plaintext);
  return envelope;
}

Bytes HybridCipher::Open(const EncryptedEnvelope& envelope, EVP_PKEY* own_private) const {
  AesCbcCodec codec(transport_->Decrypt(envelope.key, own_private));
  return codec.Decrypt(envelope.session_data);
}

}  // namespace relay
