#include <memory>
#include <optional>
#include <string>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "relay/auth_server_client.hpp"
#include "relay/envelope_archive.hpp"
#include "test_support.hpp"

namespace {

// 실제 인증 서버처럼 요청을 풀고, 정해진 응답을 relay 공개키로 봉인해 돌려준다.
class FakeAuthServer : public relay::AuthTransport {
 public:
  FakeAuthServer(EVP_PKEY* server_private, EVP_PKEY* relay_public)
      : server_private_(server_private), relay_public_(relay_public),
        cipher_(std::make_shared<relay::RsaOaepTransport>()) {}

  relay::HttpReply Post(const std::string& body, const std::string& content_type) override {
    ++calls;
    last_content_type = content_type;
    if (fail_with_transport_error) {
      throw relay::TransportError("connection refused");
    }
    auto request = nlohmann::json::parse(relay::ToString(cipher_.Open(relay::UnpackEnvelope(body), server_private_)));
    last_session_id = request.at("session_id").get<std::string>();
    if (status != 200) {
      return relay::HttpReply{status, "denied"};
    }
    if (raw_body) {
      return relay::HttpReply{200, *raw_body};
    }
    auto envelope = cipher_.Seal(relay::ToBytes(auth_data.dump()), relay_public_);
    return relay::HttpReply{200, relay::PackEnvelope(envelope)};
  }

  unsigned int status{200};
  nlohmann::json auth_data{{"id_token", "header.payload.sig"}, {"access_token", "ya29.token"}};
  std::optional<std::string> raw_body;
  bool fail_with_transport_error{false};
  int calls{0};
  std::string last_session_id;
  std::string last_content_type;

 private:
  EVP_PKEY* server_private_;
  EVP_PKEY* relay_public_;
  relay::HybridCipher cipher_;
};

class AuthServerClientTest : public ::testing::Test {
 protected:
  void SetUp() override {
    relay_key_ = relay::testing::GenerateRsaKey();
    server_key_ = relay::testing::GenerateRsaKey();
    keys_ = std::make_shared<relay::KeyMaterial>(
        relay::ParsePrivateKeyPem(relay::testing::PrivateKeyPem(relay_key_.get())),
        relay::testing::PublicOnly(server_key_.get()));
    server_ = std::make_shared<FakeAuthServer>(server_key_.get(), relay_key_.get());
    observability_ = std::make_shared<relay::Observability>(relay::LogLevel::kError);
  }

  relay::EvpPkeyPtr relay_key_;
  relay::EvpPkeyPtr server_key_;
  std::shared_ptr<const relay::KeyMaterial> keys_;
  std::shared_ptr<FakeAuthServer> server_;
  std::shared_ptr<relay::Observability> observability_;
};

}  // namespace

TEST_F(AuthServerClientTest, DecodesAuthData) {
  relay::AuthServerClient client(keys_, server_, 200, observability_);
  auto result = client.Fetch("session-abc");
  ASSERT_TRUE(result.auth_data.has_value());
  EXPECT_FALSE(result.response.has_value());
  EXPECT_EQ((*result.auth_data)["access_token"], "ya29.token");
  EXPECT_EQ(server_->last_session_id, "session-abc");
  EXPECT_EQ(server_->last_content_type, "application/zip");
  EXPECT_EQ(observability_->Snapshot().auth_server_calls, 1u);
  EXPECT_EQ(observability_->Snapshot().auth_server_failures, 0u);
}

TEST_F(AuthServerClientTest, RequestOnlyReadableWithServerKey) {
  relay::AuthServerClient client(keys_, server_);
  std::string body = client.BuildRequestBody("sid-1");
  auto envelope = relay::UnpackEnvelope(body);
  relay::HybridCipher cipher(std::make_shared<relay::RsaOaepTransport>());
  auto plain = nlohmann::json::parse(relay::ToString(cipher.Open(envelope, server_key_.get())));
  EXPECT_EQ(plain, (nlohmann::json{{"session_id", "sid-1"}}));
  EXPECT_THROW(cipher.Open(envelope, relay_key_.get()), relay::CryptoError);
}

TEST_F(AuthServerClientTest, NonOkStatusBecomesRejectedRequest) {
  server_->status = 403;
  relay::AuthServerClient client(keys_, server_);
  auto result = client.Fetch("session-abc");
  ASSERT_TRUE(result.response.has_value());
  EXPECT_FALSE(result.auth_data.has_value());
  EXPECT_EQ(result.response->http_status, 200u);
  EXPECT_EQ(result.response->Body(), R"({"status":"BLOCKED","reason":"REJECTED_REQUEST"})");
}

TEST_F(AuthServerClientTest, RejectedStatusIsConfigurable) {
  server_->status = 500;
  relay::AuthServerClient client(keys_, server_, 500);
  auto result = client.Fetch("session-abc");
  ASSERT_TRUE(result.response.has_value());
  EXPECT_EQ(result.response->http_status, 500u);
  EXPECT_EQ(result.response->reason, "REJECTED_REQUEST");
}

TEST_F(AuthServerClientTest, MissingMemberThrows) {
  server_->raw_body = relay::testing::BuildZip({{"key", "only-a-key"}});
  relay::AuthServerClient client(keys_, server_, 200, observability_);
  EXPECT_THROW(client.Fetch("session-abc"), relay::EnvelopeError);
  EXPECT_EQ(observability_->Snapshot().auth_server_failures, 1u);
}

TEST_F(AuthServerClientTest, NonObjectPayloadThrows) {
  relay::HybridCipher cipher(std::make_shared<relay::RsaOaepTransport>());
  server_->raw_body = relay::PackEnvelope(cipher.Seal(relay::ToBytes("[1,2,3]"), relay_key_.get()));
  relay::AuthServerClient client(keys_, server_);
  EXPECT_THROW(client.Fetch("session-abc"), relay::EnvelopeError);
}

TEST_F(AuthServerClientTest, TransportErrorPropagates) {
  server_->fail_with_transport_error = true;
  relay::AuthServerClient client(keys_, server_, 200, observability_);
  EXPECT_THROW(client.Fetch("session-abc"), relay::TransportError);
  EXPECT_EQ(observability_->Snapshot().auth_server_calls, 1u);
  EXPECT_EQ(observability_->Snapshot().auth_server_failures, 1u);
}
