/*
 * 설명: 서버 환경설정 로딩과 기본값을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/config_test.cpp, server/tests/e2e/room_flow_test.cpp
 */
#pragma once

#include <cstddef>
#include <string>

namespace focusroom {

struct AppConfig {
  unsigned short port;
  std::string log_level;
  std::size_t focus_duration_seconds;
  std::size_t break_duration_seconds;
  double base_rate_per_second;
  double penalty_per_distracted;
  std::size_t metrics_interval_ms;
  std::size_t ws_queue_limit_messages;
  std::size_t ws_queue_limit_bytes;
};

AppConfig LoadConfigFromEnv();

}  // namespace focusroom
