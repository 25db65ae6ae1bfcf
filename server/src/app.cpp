/*
 * 설명: 서버 수명주기, 리스닝 소켓, 환경설정 로딩을 담당한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/queue_preview_test.cpp
 */
#include "rotation/app.hpp"

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <string>

#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>

#include "rotation/http_session.hpp"
#include "rotation/mariadb_session_store.hpp"

namespace rotation {

class Listener : public std::enable_shared_from_this<Listener> {
 public:
  Listener(boost::asio::io_context& ioc, const boost::asio::ip::tcp::endpoint& endpoint, const AppConfig& config,
           std::shared_ptr<RotationService> rotation_service, std::shared_ptr<Observability> observability)
      : ioc_(ioc), acceptor_(boost::asio::make_strand(ioc)), config_(config),
        rotation_service_(std::move(rotation_service)), observability_(std::move(observability)) {
    boost::beast::error_code ec;

    acceptor_.open(endpoint.protocol(), ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.set_option(boost::asio::socket_base::reuse_address(true), ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.bind(endpoint, ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.listen(boost::asio::socket_base::max_listen_connections, ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }
  }

  void Run() { DoAccept(); }

  void Stop() {
    boost::beast::error_code ec;
    acceptor_.close(ec);
  }

 private:
  void DoAccept() {
    acceptor_.async_accept(
        boost::asio::make_strand(ioc_),
        [self = shared_from_this()](boost::beast::error_code ec, boost::asio::ip::tcp::socket socket) {
          if (!ec) {
            std::make_shared<HttpSession>(std::move(socket), self->config_, self->rotation_service_,
                                          self->observability_)
                ->Run();
          }
          if (self->acceptor_.is_open()) {
            self->DoAccept();
          }
        });
  }

  boost::asio::io_context& ioc_;
  boost::asio::ip::tcp::acceptor acceptor_;
  AppConfig config_;
  std::shared_ptr<RotationService> rotation_service_;
  std::shared_ptr<Observability> observability_;
};

ServerApp::ServerApp(const AppConfig& config) : ServerApp(config, nullptr) {}

ServerApp::ServerApp(const AppConfig& config, std::shared_ptr<SessionStore> store)
    : config_(config), ioc_(1), work_guard_(boost::asio::make_work_guard(ioc_)) {
  observability_ = std::make_shared<Observability>(ParseLogLevel(config.log_level));
  if (store) {
    store_ = std::move(store);
  } else {
    DbConfig db_config{config.db_host, config.db_port, config.db_user, config.db_password, config.db_name};
    db_client_ = std::make_shared<MariaDbClient>(db_config);
    store_ = std::make_shared<MariaDbSessionStore>(db_client_);
  }
  rotation_service_ = std::make_shared<RotationService>(store_, ToQueueConfig(config), config.queue_max_active,
                                                        observability_);
}

ServerApp::~ServerApp() { Stop(); }

void ServerApp::Run() {
  try {
    running_ = true;
    boost::asio::ip::tcp::endpoint endpoint{boost::asio::ip::tcp::v4(), config_.port};
    listener_ = std::make_shared<Listener>(ioc_, endpoint, config_, rotation_service_, observability_);
    listener_->Run();
    LogContext started;
    started.trace_id = observability_->NextTraceId();
    started.name = "server.started";
    started.fields = {{"port", config_.port}};
    observability_->Log(started);
    RunWorkers();
    ioc_.run();
  } catch (const std::exception& ex) {
    std::cerr << "서버 실행 중 예외: " << ex.what() << "\n";
  }
}

void ServerApp::RunWorkers() {
  const unsigned int thread_count = std::max(1u, std::thread::hardware_concurrency());
  // 현재 스레드도 run()을 호출하므로 워커는 thread_count - 1개만 생성한다.
  for (unsigned int i = 0; i + 1 < thread_count; ++i) {
    workers_.emplace_back([this]() { ioc_.run(); });
  }
}

void ServerApp::Stop() {
  if (!running_) {
    return;
  }
  running_ = false;
  work_guard_.reset();
  if (listener_) {
    listener_->Stop();
  }
  ioc_.stop();
  for (auto& worker : workers_) {
    if (worker.joinable()) {
      worker.join();
    }
  }
}

AppConfig LoadConfigFromEnv() {
  auto get_env = [](const char* key, const char* def) -> std::string {
    const char* val = std::getenv(key);
    return val ? std::string{val} : std::string{def};
  };

  AppConfig cfg;
  cfg.port = static_cast<unsigned short>(std::stoi(get_env("SERVER_PORT", "8080")));
  cfg.db_host = get_env("DB_HOST", "mariadb");
  cfg.db_port = static_cast<unsigned short>(std::stoi(get_env("DB_PORT", "3306")));
  cfg.db_user = get_env("DB_USER", "app");
  cfg.db_password = get_env("DB_PASSWORD", "app_pass");
  cfg.db_name = get_env("DB_NAME", "app_db");
  cfg.log_level = get_env("LOG_LEVEL", "info");
  cfg.queue_max_rounds = static_cast<std::size_t>(std::stoul(get_env("QUEUE_MAX_ROUNDS", "3")));
  cfg.queue_recency_window = static_cast<std::size_t>(std::stoul(get_env("QUEUE_RECENCY_WINDOW", "10")));
  cfg.queue_max_active = static_cast<std::size_t>(std::stoul(get_env("QUEUE_MAX_ACTIVE", "24")));
  cfg.queue_scoring_threads = static_cast<std::size_t>(std::stoul(get_env("QUEUE_SCORING_THREADS", "1")));
  cfg.ops_token = get_env("OPS_TOKEN", "");
  return cfg;
}

QueueConfig ToQueueConfig(const AppConfig& config) {
  QueueConfig queue_config;
  queue_config.max_rounds = config.queue_max_rounds;
  queue_config.recency_window = config.queue_recency_window;
  queue_config.scoring_threads = config.queue_scoring_threads;
  return queue_config;
}

}  // namespace rotation
