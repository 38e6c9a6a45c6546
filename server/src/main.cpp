/*
 * 설명: 서버 진입점으로 환경설정을 로드해 실행한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/rooms_api_test.cpp
 */
#include <iostream>
#include <stdexcept>

#include "wormhole/app.hpp"

int main() {
  using namespace wormhole;
  AppConfig config;
  try {
    config = LoadConfigFromEnv();
  } catch (const std::invalid_argument& ex) {
    std::cerr << ex.what() << "\n";
    return 1;
  }
  ServerApp app(config);
  // SIGINT/SIGTERM을 받으면 Run()이 반환되고 소멸자에서 정리한다.
  app.Run();
  return 0;
}
