/*
 * 설명: 서버 환경설정 로딩과 기본값을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol.md
 * 테스트: server/tests/unit/config_test.cpp, server/tests/e2e/race_flow_test.cpp
 */
#pragma once

#include <cstddef>
#include <string>

namespace cuberace {

struct AppConfig {
  unsigned short port;
  std::string map_dir;
  std::string log_level;
  std::size_t tick_interval_ms;
  std::size_t command_cooldown_ms;
  std::size_t reset_delay_ms;
  std::size_t ws_queue_limit_messages;
  std::size_t ws_queue_limit_bytes;
};

AppConfig LoadConfigFromEnv();

}  // namespace cuberace
