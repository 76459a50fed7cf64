/*
 * 설명: 릴레이 서버 진입점. 위치 인자와 환경변수로 설정을 읽어 실행한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/relay_flow_test.cpp
 */
#include <exception>
#include <iostream>

#include "relay/app.hpp"

int main(int argc, char** argv) {
  using namespace relay;
  try {
    AppConfig config = LoadConfig(argc, argv);
    RelayApp app(config);
    app.Run();
  } catch (const std::exception& ex) {
    std::cerr << "서버 실행 중 예외: " << ex.what() << "\n";
    return 1;
  }
  return 0;
}
