/*
 * 설명: 서버 진입점으로 환경설정을 로드해 아레나 서버를 실행한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: arena/tests/e2e/arena_api_test.cpp
 */
#include <csignal>
#include <iostream>

#include "arena/app.hpp"
#include "arena/errors.hpp"

int main() {
  using namespace arena;
  try {
    ArenaConfig config = LoadConfigFromEnv();
    ArenaApp app(config);

    std::signal(SIGINT, [](int) {
      std::cout << "SIGINT 수신, 종료를 준비합니다\n";
    });

    app.Run();
  } catch (const ConfigurationError& ex) {
    std::cerr << "설정 오류(" << ex.code << "): " << ex.what() << "\n";
    return 2;
  } catch (const std::exception& ex) {
    std::cerr << "서버 시작 실패: " << ex.what() << "\n";
    return 1;
  }
  return 0;
}
