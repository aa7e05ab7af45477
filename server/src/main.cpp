/*
 * 설명: 서버 진입점으로 환경설정을 로드해 실행한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/room_flow_test.cpp
 */
#include "focusroom/app.hpp"

int main() {
  using namespace focusroom;
  AppConfig config = LoadConfigFromEnv();
  ServerApp app(config);
  app.Run();
  return 0;
}
