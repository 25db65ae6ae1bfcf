/*
 * 설명: 서버 환경설정 로딩과 기본값을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/queue_preview_test.cpp
 */
#pragma once

#include <cstddef>
#include <string>

#include "rotation/queue_builder.hpp"

namespace rotation {

struct AppConfig {
  unsigned short port;
  std::string db_host;
  unsigned short db_port;
  std::string db_user;
  std::string db_password;
  std::string db_name;
  std::string log_level;
  std::size_t queue_max_rounds;
  std::size_t queue_recency_window;
  std::size_t queue_max_active;
  std::size_t queue_scoring_threads;
  std::string ops_token;
};

AppConfig LoadConfigFromEnv();

QueueConfig ToQueueConfig(const AppConfig& config);

}  // namespace rotation
