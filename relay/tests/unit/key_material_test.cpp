#include <cstdio>
#include <fstream>
#include <string>

#include <gtest/gtest.h>

#include "relay/key_material.hpp"
#include "test_support.hpp"

namespace {

std::string WriteTempFile(const std::string& name, const std::string& contents) {
  std::string path = ::testing::TempDir() + name;
  std::ofstream out(path, std::ios::binary);
  out << contents;
  return path;
}

}  // namespace

TEST(KeyMaterialTest, LoadsPemFiles) {
  auto relay_key = relay::testing::GenerateRsaKey();
  auto server_key = relay::testing::GenerateRsaKey();
  auto private_path = WriteTempFile("relay_private.pem", relay::testing::PrivateKeyPem(relay_key.get()));
  auto public_path = WriteTempFile("server_public.pem", relay::testing::PublicKeyPem(server_key.get()));

  auto keys = relay::KeyMaterial::LoadFromFiles(private_path, public_path);
  ASSERT_NE(keys, nullptr);
  EXPECT_EQ(EVP_PKEY_eq(keys->PrivateKey(), relay_key.get()), 1);
  EXPECT_EQ(EVP_PKEY_eq(keys->ServerPublicKey(), server_key.get()), 1);
  std::remove(private_path.c_str());
  std::remove(public_path.c_str());
}

TEST(KeyMaterialTest, MissingFileRejected) {
  EXPECT_THROW(relay::ReadSecretFile("/nonexistent/relay/key.pem"), relay::KeyLoadError);
  EXPECT_THROW(relay::KeyMaterial::LoadFromFiles("/nonexistent/a.pem", "/nonexistent/b.pem"), relay::KeyLoadError);
}

TEST(KeyMaterialTest, GarbagePemRejected) {
  EXPECT_THROW(relay::ParsePrivateKeyPem("not a key"), relay::KeyLoadError);
  EXPECT_THROW(relay::ParsePublicKeyPem("-----BEGIN PUBLIC KEY-----\nAAAA\n-----END PUBLIC KEY-----\n"),
               relay::KeyLoadError);
}

TEST(KeyMaterialTest, NullKeysRejected) {
  EXPECT_THROW(relay::KeyMaterial(relay::EvpPkeyPtr{}, relay::EvpPkeyPtr{}), relay::KeyLoadError);
}
