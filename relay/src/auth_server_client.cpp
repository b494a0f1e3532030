/*
 * 설명: 요청 봉투를 만들어 인증 서버에 보내고, 응답 아카이브를 풀어 인증 데이터를 복원한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: relay/tests/unit/auth_server_client_test.cpp
 */
#include "relay/auth_server_client.hpp"

#include <chrono>
#include <utility>

#include "relay/envelope_archive.hpp"

namespace relay {

namespace {
constexpr char kArchiveContentType[] = "application/zip";
}  // namespace

AuthFetchResult AuthFetchResult::FromAuthData(AuthData data) {
  AuthFetchResult result;
  result.auth_data = std::move(data);
  return result;
}

AuthFetchResult AuthFetchResult::FromResponse(TokenOutcome outcome) {
  AuthFetchResult result;
  result.response = std::move(outcome);
  return result;
}

AuthServerClient::AuthServerClient(std::shared_ptr<const KeyMaterial> keys, std::shared_ptr<AuthTransport> transport,
                                   unsigned int rejected_status, std::shared_ptr<Observability> observability)
    : keys_(std::move(keys)), transport_(std::move(transport)),
      cipher_(std::make_shared<RsaOaepTransport>()), rejected_status_(rejected_status),
      observability_(std::move(observability)) {}

std::string AuthServerClient::BuildRequestBody(const std::string& session_id) const {
  nlohmann::json payload{{"session_id", session_id}};
  auto envelope = cipher_.Seal(ToBytes(payload.dump()), keys_->ServerPublicKey());
  return PackEnvelope(envelope);
}

AuthData AuthServerClient::DecodeResponseBody(const std::string& body) const {
  auto envelope = UnpackEnvelope(body);
  auto plaintext = cipher_.Open(envelope, keys_->PrivateKey());
  auto data = nlohmann::json::parse(ToString(plaintext));
  if (!data.is_object()) {
    throw EnvelopeError("session_data가 JSON 객체가 아닙니다");
  }
  return data;
}

AuthFetchResult AuthServerClient::Fetch(const std::string& session_id) const {
  auto start = std::chrono::steady_clock::now();
  if (observability_) {
    observability_->IncrementAuthCall();
  }
  try {
    auto reply = transport_->Post(BuildRequestBody(session_id), kArchiveContentType);
    if (observability_) {
      LogContext ctx;
      ctx.name = "auth_server.reply";
      ctx.level = LogLevel::kDebug;
      ctx.session_hash = HashSessionId(session_id);
      ctx.status = reply.status;
      ctx.latency_ms = static_cast<long>(
          std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start).count());
      observability_->Log(ctx);
    }
    if (reply.status != 200) {
      return AuthFetchResult::FromResponse(TokenOutcome::Rejection(rejected_status_, reason::kRejectedRequest));
    }
    return AuthFetchResult::FromAuthData(DecodeResponseBody(reply.body));
  } catch (const std::exception& ex) {
    if (observability_) {
      observability_->IncrementAuthFailure();
      LogContext ctx;
      ctx.name = "auth_server.exchange_failed";
      ctx.level = LogLevel::kWarn;
      ctx.session_hash = HashSessionId(session_id);
      ctx.detail = ex.what();
      observability_->Log(ctx);
    }
    throw;
  }
}

}  // namespace relay
