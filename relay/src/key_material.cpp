/*
 * 설명: PEM 키 파일을 읽어 EVP_PKEY로 변환한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: relay/tests/unit/auth_server_client_test.cpp
 */
#include "relay/key_material.hpp"

#include <fstream>
#include <sstream>
#include <utility>

#include <openssl/bio.h>
#include <openssl/err.h>
#include <openssl/pem.h>
#include <openssl/x509.h>

namespace relay {

namespace {
struct BioDeleter {
  void operator()(BIO* bio) const { BIO_free(bio); }
};
using BioPtr = std::unique_ptr<BIO, BioDeleter>;

struct X509Deleter {
  void operator()(X509* cert) const { X509_free(cert); }
};

BioPtr NewMemoryBio(const std::string& pem) {
  BioPtr bio(BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())));
  if (!bio) {
    throw KeyLoadError(DescribeOpenSslError("BIO 생성 실패"));
  }
  return bio;
}
}  // namespace

std::string ReadSecretFile(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw KeyLoadError("파일을 열 수 없습니다: " + path);
  }
  std::ostringstream oss;
  oss << in.rdbuf();
  return oss.str();
}

EvpPkeyPtr ParsePrivateKeyPem(const std::string& pem) {
  auto bio = NewMemoryBio(pem);
  EvpPkeyPtr key(PEM_read_bio_PrivateKey(bio.get(), nullptr, nullptr, nullptr));
  if (!key) {
    throw KeyLoadError(DescribeOpenSslError("개인키 PEM 파싱 실패"));
  }
  return key;
}

EvpPkeyPtr ParsePublicKeyPem(const std::string& pem) {
  {
    auto bio = NewMemoryBio(pem);
    EvpPkeyPtr key(PEM_read_bio_PUBKEY(bio.get(), nullptr, nullptr, nullptr));
    if (key) {
      return key;
    }
  }
  ERR_clear_error();
  {
    auto bio = NewMemoryBio(pem);
    std::unique_ptr<X509, X509Deleter> cert(PEM_read_bio_X509(bio.get(), nullptr, nullptr, nullptr));
    if (cert) {
      EvpPkeyPtr key(X509_get_pubkey(cert.get()));
      if (key) {
        return key;
      }
    }
  }
  throw KeyLoadError(DescribeOpenSslError("공개키 PEM 파싱 실패"));
}

KeyMaterial::KeyMaterial(EvpPkeyPtr private_key, EvpPkeyPtr server_public_key)
    : private_key_(std::move(private_key)), server_public_key_(std::move(server_public_key)) {
  if (!private_key_ || !server_public_key_) {
    throw KeyLoadError("키 자료가 비어 있습니다");
  }
}

std::shared_ptr<const KeyMaterial> KeyMaterial::LoadFromFiles(const std::string& private_key_path,
                                                              const std::string& server_public_key_path) {
  auto private_key = ParsePrivateKeyPem(ReadSecretFile(private_key_path));
  auto server_public_key = ParsePublicKeyPem(ReadSecretFile(server_public_key_path));
  return std::make_shared<const KeyMaterial>(std::move(private_key), std::move(server_public_key));
}

}  // namespace relay
