#include <gtest/gtest.h>

#include "relay/envelope_archive.hpp"
#include "test_support.hpp"

using relay::Bytes;
using relay::EncryptedEnvelope;
using relay::EnvelopeError;

TEST(EnvelopeArchiveTest, PackThenUnpackKeepsMembers) {
  EncryptedEnvelope envelope{Bytes{0x00, 0x01, 0xFF, 0x10}, Bytes(48, 0x7A)};
  std::string archive = relay::PackEnvelope(envelope);
  ASSERT_GE(archive.size(), 4u);
  EXPECT_EQ(archive.substr(0, 2), "PK");

  auto unpacked = relay::UnpackEnvelope(archive);
  EXPECT_EQ(unpacked.key, envelope.key);
  EXPECT_EQ(unpacked.session_data, envelope.session_data);
}

TEST(EnvelopeArchiveTest, ReadsForeignArchiveAndIgnoresExtraMembers) {
  std::string archive = relay::testing::BuildZip(
      {{"readme.txt", "hello"}, {"session_data", "DATA"}, {"key", "KEY"}});
  auto unpacked = relay::UnpackEnvelope(archive);
  EXPECT_EQ(relay::ToString(unpacked.key), "KEY");
  EXPECT_EQ(relay::ToString(unpacked.session_data), "DATA");
}

TEST(EnvelopeArchiveTest, MissingMemberRejected) {
  std::string only_key = relay::testing::BuildZip({{"key", "KEY"}});
  EXPECT_THROW(relay::UnpackEnvelope(only_key), EnvelopeError);
  std::string only_data = relay::testing::BuildZip({{"session_data", "DATA"}});
  EXPECT_THROW(relay::UnpackEnvelope(only_data), EnvelopeError);
}

TEST(EnvelopeArchiveTest, GarbageRejected) {
  EXPECT_THROW(relay::UnpackEnvelope(""), EnvelopeError);
  EXPECT_THROW(relay::UnpackEnvelope("definitely not a zip archive"), EnvelopeError);
}
