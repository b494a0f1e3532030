/*
 * 설명: 릴레이 진입점으로 환경설정을 로드해 실행한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: relay/tests/e2e/token_flow_test.cpp
 */
#include <exception>
#include <iostream>

#include "relay/app.hpp"
#include "relay/config.hpp"

int main() {
  using namespace relay;
  try {
    AppConfig config = LoadConfigFromEnv();
    RelayApp app(config);
    app.Run();
  } catch (const std::exception& ex) {
    std::cerr << "릴레이 실행 중 예외: " << ex.what() << "\n";
    return 1;
  }
  return 0;
}
