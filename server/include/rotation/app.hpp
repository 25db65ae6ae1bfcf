/*
 * 설명: 서버 전체 수명주기와 의존 객체 조립을 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/queue_preview_test.cpp
 */
#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <thread>
#include <vector>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include "rotation/config.hpp"
#include "rotation/db_client.hpp"
#include "rotation/observability.hpp"
#include "rotation/rotation_service.hpp"
#include "rotation/session_store.hpp"

namespace rotation {

class Listener;

class ServerApp {
 public:
  explicit ServerApp(const AppConfig& config);
  // 저장소를 직접 주입한다. 테스트에서 메모리 저장소를 쓸 때 사용한다.
  ServerApp(const AppConfig& config, std::shared_ptr<SessionStore> store);
  ~ServerApp();

  void Run();
  void Stop();

 private:
  void RunWorkers();

  AppConfig config_;
  boost::asio::io_context ioc_;
  boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_guard_;
  std::shared_ptr<Listener> listener_;
  std::shared_ptr<Observability> observability_;
  std::shared_ptr<MariaDbClient> db_client_;
  std::shared_ptr<SessionStore> store_;
  std::shared_ptr<RotationService> rotation_service_;
  std::vector<std::thread> workers_;
  std::atomic<bool> running_{false};
};

}  // namespace rotation
