#pragma once

#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <archive.h>
#include <archive_entry.h>
#include <nlohmann/json.hpp>
#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/rsa.h>

#include "relay/claims_verifier.hpp"
#include "relay/hybrid_cipher.hpp"
#include "relay/key_material.hpp"

namespace relay::testing {

inline EvpPkeyPtr GenerateRsaKey(unsigned int bits = 2048) {
  EvpPkeyPtr key(EVP_RSA_gen(bits));
  if (!key) {
    throw std::runtime_error("RSA 키 생성 실패");
  }
  return key;
}

inline std::string DrainBio(BIO* bio) {
  char* data = nullptr;
  long len = BIO_get_mem_data(bio, &data);
  std::string out(data, static_cast<std::size_t>(len));
  BIO_free(bio);
  return out;
}

inline std::string PrivateKeyPem(EVP_PKEY* key) {
  BIO* bio = BIO_new(BIO_s_mem());
  if (PEM_write_bio_PrivateKey(bio, key, nullptr, nullptr, 0, nullptr, nullptr) != 1) {
    BIO_free(bio);
    throw std::runtime_error("개인키 PEM 출력 실패");
  }
  return DrainBio(bio);
}

inline std::string PublicKeyPem(EVP_PKEY* key) {
  BIO* bio = BIO_new(BIO_s_mem());
  if (PEM_write_bio_PUBKEY(bio, key) != 1) {
    BIO_free(bio);
    throw std::runtime_error("공개키 PEM 출력 실패");
  }
  return DrainBio(bio);
}

// 공개키 부분만 따로 떼어낸 키를 돌려준다.
inline EvpPkeyPtr PublicOnly(EVP_PKEY* key) { return ParsePublicKeyPem(PublicKeyPem(key)); }

inline std::string SignJwt(const nlohmann::json& header, const nlohmann::json& payload, EVP_PKEY* key) {
  const std::string signing_input = Base64UrlEncode(header.dump()) + "." + Base64UrlEncode(payload.dump());
  EVP_MD_CTX* ctx = EVP_MD_CTX_new();
  std::size_t sig_len = 0;
  if (EVP_DigestSignInit(ctx, nullptr, EVP_sha256(), nullptr, key) != 1 ||
      EVP_DigestSignUpdate(ctx, signing_input.data(), signing_input.size()) != 1 ||
      EVP_DigestSignFinal(ctx, nullptr, &sig_len) != 1) {
    EVP_MD_CTX_free(ctx);
    throw std::runtime_error("JWT 서명 준비 실패");
  }
  std::string signature(sig_len, '\0');
  if (EVP_DigestSignFinal(ctx, reinterpret_cast<unsigned char*>(&signature[0]), &sig_len) != 1) {
    EVP_MD_CTX_free(ctx);
    throw std::runtime_error("JWT 서명 실패");
  }
  EVP_MD_CTX_free(ctx);
  signature.resize(sig_len);
  return signing_input + "." + Base64UrlEncode(signature);
}

// 임의 멤버로 store 방식 zip을 만든다.
inline std::string BuildZip(const std::vector<std::pair<std::string, std::string>>& members) {
  std::string out;
  struct archive* a = archive_write_new();
  archive_write_set_format_zip(a);
  archive_write_set_options(a, "zip:compression=store");
  archive_write_set_bytes_per_block(a, 0);
  auto writer = [](struct archive*, void* client, const void* buffer, size_t length) -> la_ssize_t {
    static_cast<std::string*>(client)->append(static_cast<const char*>(buffer), length);
    return static_cast<la_ssize_t>(length);
  };
  if (archive_write_open(a, &out, nullptr, writer, nullptr) != ARCHIVE_OK) {
    archive_write_free(a);
    throw std::runtime_error("zip 열기 실패");
  }
  for (const auto& member : members) {
    struct archive_entry* entry = archive_entry_new();
    archive_entry_set_pathname(entry, member.first.c_str());
    archive_entry_set_filetype(entry, AE_IFREG);
    archive_entry_set_perm(entry, 0644);
    archive_entry_set_size(entry, static_cast<la_int64_t>(member.second.size()));
    archive_write_header(a, entry);
    archive_write_data(a, member.second.data(), member.second.size());
    archive_entry_free(entry);
  }
  archive_write_close(a);
  archive_write_free(a);
  return out;
}

}  // namespace relay::testing
