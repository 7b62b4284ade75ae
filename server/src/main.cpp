/*
 * 설명: 서버 진입점으로 환경설정과 맵을 로드해 실행한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol.md
 * 테스트: server/tests/e2e/race_flow_test.cpp
 */
#include <csignal>
#include <iostream>
#include <stdexcept>

#include "cuberace/app.hpp"
#include "cuberace/map_definition.hpp"

int main() {
  using namespace cuberace;

  std::signal(SIGINT, [](int) {
    std::cout << "SIGINT 수신, 종료를 준비합니다\n";
  });

  try {
    AppConfig config = LoadConfigFromEnv();
    ServerApp app(config);
    app.Run();
  } catch (const MapLoadError& ex) {
    std::cerr << "맵 로딩 실패: " << ex.what() << "\n";
    return 1;
  } catch (const std::logic_error& ex) {
    // std::stoi/stoul 변환 실패
    std::cerr << "환경설정 값이 올바르지 않습니다: " << ex.what() << "\n";
    return 1;
  }
  return 0;
}
