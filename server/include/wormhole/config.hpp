/*
 * 설명: 서버 환경설정 로딩과 기본값을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/config_test.cpp, server/tests/e2e/rooms_api_test.cpp
 */
#pragma once

#include <cstddef>
#include <string>

namespace wormhole {

constexpr const char* kHostEnvVar = "WORMHOLE_HOST";
constexpr const char* kPortEnvVar = "WORMHOLE_PORT";
constexpr const char* kDefaultHost = "127.0.0.1";
constexpr unsigned short kDefaultPort = 8080;

struct AppConfig {
  std::string host;
  unsigned short port;
  std::string log_level;
  std::size_t room_idle_timeout_seconds;
  std::size_t room_id_max_attempts;
  std::size_t deletion_channel_capacity;
};

// 값이 잘못된 환경 변수가 있으면 변수 이름을 담은 std::invalid_argument를 던진다.
AppConfig LoadConfigFromEnv();

}  // namespace wormhole
