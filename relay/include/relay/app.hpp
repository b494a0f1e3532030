/*
 * 설명: 릴레이 서버 전체 수명주기(구성요소 조립, 리스너, 워커 스레드)를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: relay/tests/e2e/token_flow_test.cpp
 */
#pragma once

#include <atomic>
#include <memory>
#include <thread>
#include <vector>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include "relay/auth_server_client.hpp"
#include "relay/config.hpp"
#include "relay/observability.hpp"
#include "relay/token_resolver.hpp"

namespace relay {

class Listener;

class RelayApp {
 public:
  // 키 파일이나 인증서를 읽지 못하면 KeyLoadError를 던진다.
  explicit RelayApp(const AppConfig& config);
  ~RelayApp();

  void Run();
  void Stop();

  const AppConfig& GetConfig() const { return config_; }
  std::shared_ptr<SessionCache> GetSessionCache() { return cache_; }
  std::shared_ptr<Observability> GetObservability() { return observability_; }

 private:
  void RunWorkers();

  AppConfig config_;
  boost::asio::io_context ioc_;
  boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_guard_;
  boost::asio::signal_set signals_;
  std::shared_ptr<Listener> listener_;
  std::shared_ptr<Observability> observability_;
  std::shared_ptr<AuthServerClient> auth_client_;
  std::shared_ptr<SessionCache> cache_;
  std::shared_ptr<TokenResolver> resolver_;
  std::vector<std::thread> workers_;
  std::atomic<bool> running_{false};
};

}  // namespace relay
