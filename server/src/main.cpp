/*
 * 설명: 서버 진입점으로 환경설정을 로드해 실행한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/betting_flow_test.cpp
 */
#include <iostream>

#include "wager/app.hpp"

int main() {
  using namespace wager;
  AppConfig config;
  try {
    config = LoadConfigFromEnv();
  } catch (const ConfigException& ex) {
    std::cerr << ex.what() << "\n";
    return 1;
  }
  // SIGINT/SIGTERM은 ServerApp이 io_context에서 받아 정리한다.
  ServerApp app(config);
  app.Run();
  return app.Failed() ? 1 : 0;
}
