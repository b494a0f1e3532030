/*
 * 설명: 구성요소를 조립하고 리스닝 스레드와 종료 신호를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: relay/tests/e2e/token_flow_test.cpp
 */
#include "relay/app.hpp"

#include <algorithm>
#include <chrono>
#include <csignal>
#include <iostream>

#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>

#include "relay/auth_transport.hpp"
#include "relay/claims_verifier.hpp"
#include "relay/http_session.hpp"
#include "relay/key_material.hpp"

namespace relay {

class Listener : public std::enable_shared_from_this<Listener> {
 public:
  Listener(boost::asio::io_context& ioc, const boost::asio::ip::tcp::endpoint& endpoint,
           std::shared_ptr<TokenResolver> resolver, std::shared_ptr<SessionCache> cache,
           std::shared_ptr<Observability> observability)
      : ioc_(ioc), acceptor_(boost::asio::make_strand(ioc)), resolver_(std::move(resolver)),
        cache_(std::move(cache)), observability_(std::move(observability)) {
    boost::beast::error_code ec;

    acceptor_.open(endpoint.protocol(), ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.set_option(boost::asio::socket_base::reuse_address(true), ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.bind(endpoint, ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.listen(boost::asio::socket_base::max_listen_connections, ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }
  }

  void Run() { DoAccept(); }

  void Stop() {
    boost::beast::error_code ec;
    acceptor_.close(ec);
  }

 private:
  void DoAccept() {
    acceptor_.async_accept(
        boost::asio::make_strand(ioc_),
        [self = shared_from_this()](boost::beast::error_code ec, boost::asio::ip::tcp::socket socket) {
          if (!ec) {
            std::make_shared<HttpSession>(std::move(socket), self->resolver_, self->cache_, self->observability_)
                ->Run();
          }
          if (self->acceptor_.is_open()) {
            self->DoAccept();
          }
        });
  }

  boost::asio::io_context& ioc_;
  boost::asio::ip::tcp::acceptor acceptor_;
  std::shared_ptr<TokenResolver> resolver_;
  std::shared_ptr<SessionCache> cache_;
  std::shared_ptr<Observability> observability_;
};

RelayApp::RelayApp(const AppConfig& config)
    : config_(config), ioc_(), work_guard_(boost::asio::make_work_guard(ioc_)), signals_(ioc_, SIGINT, SIGTERM) {
  observability_ = std::make_shared<Observability>(ParseLogLevel(config.log_level));

  auto keys = KeyMaterial::LoadFromFiles(config.private_key_path, config.auth_server_public_key_path);
  auto transport = std::make_shared<BeastAuthTransport>(AuthEndpoint::Parse(config.auth_server_url),
                                                        std::chrono::seconds(config.auth_server_timeout_seconds));
  auth_client_ = std::make_shared<AuthServerClient>(keys, transport, config.rejected_request_status, observability_);

  auto client = auth_client_;
  cache_ = std::make_shared<SessionCache>(
      [client](const std::string& session_id) { return client->Fetch(session_id); }, config.session_cache_size);

  JwtVerifierConfig verifier_config;
  verifier_config.audience = config.id_token_audience;
  verifier_config.clock_skew = std::chrono::seconds(config.id_token_clock_skew_seconds);
  std::shared_ptr<const ClaimsVerifier> verifier =
      JwtClaimsVerifier::FromCertsJson(ReadSecretFile(config.id_token_certs_path), verifier_config);

  resolver_ = std::make_shared<TokenResolver>(cache_, verifier, observability_);
}

RelayApp::~RelayApp() { Stop(); }

void RelayApp::Run() {
  running_ = true;
  boost::asio::ip::tcp::endpoint endpoint{boost::asio::ip::tcp::v4(), config_.port};
  listener_ = std::make_shared<Listener>(ioc_, endpoint, resolver_, cache_, observability_);
  listener_->Run();
  signals_.async_wait([this](const boost::beast::error_code& ec, int signal_number) {
    if (ec) {
      return;
    }
    std::cout << "신호 " << signal_number << " 수신, 종료합니다\n";
    ioc_.stop();
  });

  LogContext ctx;
  ctx.name = "server.started";
  ctx.detail = "port=" + std::to_string(config_.port);
  observability_->Log(ctx);

  RunWorkers();
  ioc_.run();
  Stop();
}

void RelayApp::RunWorkers() {
  const std::size_t thread_count =
      config_.threads > 0 ? config_.threads : std::max(1u, std::thread::hardware_concurrency());
  // 현재 스레드도 run()을 호출하므로 워커는 thread_count - 1개만 생성한다.
  for (std::size_t i = 0; i + 1 < thread_count; ++i) {
    workers_.emplace_back([this]() { ioc_.run(); });
  }
}

void RelayApp::Stop() {
  if (!running_.exchange(false)) {
    return;
  }
  work_guard_.reset();
  if (listener_) {
    listener_->Stop();
  }
  boost::beast::error_code ec;
  signals_.cancel(ec);
  ioc_.stop();
  for (auto& worker : workers_) {
    if (worker.joinable()) {
      worker.join();
    }
  }
}

}  // namespace relay
