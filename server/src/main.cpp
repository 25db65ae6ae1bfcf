/*
 * 설명: 서버 진입점으로 환경설정을 로드해 실행한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/queue_preview_test.cpp
 */
#include <csignal>
#include <exception>
#include <iostream>

#include "rotation/app.hpp"

int main() {
  using namespace rotation;
  AppConfig config;
  try {
    config = LoadConfigFromEnv();
  } catch (const std::exception& ex) {
    std::cerr << "환경설정 값이 올바르지 않습니다: " << ex.what() << "\n";
    return 1;
  }

  try {
    ServerApp app(config);
    std::signal(SIGINT, [](int) {
      std::cout << "SIGINT 수신, 종료를 준비합니다\n";
    });
    app.Run();
  } catch (const ContractViolation& ex) {
    std::cerr << "큐 설정이 올바르지 않습니다: " << ex.what() << "\n";
    return 1;
  }
  return 0;
}
