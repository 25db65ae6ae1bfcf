/*
 * 설명: MariaDB 연결, 재시도, 결과 행 추출을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/it/session_store_it_test.cpp
 */
#include "rotation/db_client.hpp"

#include <chrono>
#include <random>
#include <thread>

#include <mariadb/errmsg.h>

namespace rotation {
namespace {
constexpr std::size_t kMaxAttempts = 3;
constexpr unsigned int kDeadlock = 1213;
constexpr unsigned int kLockWaitTimeout = 1205;

struct ResultCloser {
  void operator()(MYSQL_RES* res) const {
    if (res) {
      mysql_free_result(res);
    }
  }
};
}  // namespace

MariaDbClient::MariaDbClient(const DbConfig& config) : config_(config) {}

MariaDbClient::ConnectionHandle MariaDbClient::Connect() const {
  ConnectionHandle conn(mysql_init(nullptr));
  if (!conn) {
    throw DbException("MariaDB 초기화 실패", 0, true);
  }
  mysql_options(conn.get(), MYSQL_OPT_CONNECT_TIMEOUT, &connect_timeout_seconds_);
  mysql_options(conn.get(), MYSQL_OPT_READ_TIMEOUT, &query_timeout_seconds_);
  mysql_options(conn.get(), MYSQL_OPT_WRITE_TIMEOUT, &query_timeout_seconds_);
  if (!mysql_real_connect(conn.get(), config_.host.c_str(), config_.user.c_str(), config_.password.c_str(),
                          config_.database.c_str(), config_.port, nullptr, 0)) {
    RaiseError(conn.get(), "연결 실패");
  }
  if (mysql_query(conn.get(), "SET SESSION innodb_lock_wait_timeout=2;") != 0) {
    RaiseError(conn.get(), "락 대기 타임아웃 설정 실패");
  }
  return conn;
}

bool MariaDbClient::RunWithRetry(bool transactional, const std::function<bool(MYSQL*)>& work) const {
  for (std::size_t attempt = 1; attempt <= kMaxAttempts; ++attempt) {
    ConnectionHandle conn;
    try {
      conn = Connect();
      if (transactional) {
        mysql_autocommit(conn.get(), 0);
      }
      if (transient_injector_ && transient_injector_(attempt)) {
        throw DbException("주입된 일시 오류", kDeadlock, true);
      }
      bool commit = work(conn.get());
      if (transactional) {
        if (commit) {
          if (mysql_commit(conn.get()) != 0) {
            RaiseError(conn.get(), "커밋 실패");
          }
        } else {
          mysql_rollback(conn.get());
        }
      }
      return commit;
    } catch (const DbException& ex) {
      if (conn && transactional) {
        mysql_rollback(conn.get());
      }
      if (ex.retryable && attempt < kMaxAttempts) {
        conn.reset();
        Backoff(attempt);
        continue;
      }
      throw;
    } catch (...) {
      if (conn && transactional) {
        mysql_rollback(conn.get());
      }
      throw;
    }
  }
  return false;
}

bool MariaDbClient::ExecuteTransactionWithRetry(const std::function<bool(MYSQL*)>& work) const {
  return RunWithRetry(true, work);
}

void MariaDbClient::WithConnectionRetry(const std::function<void(MYSQL*)>& work) const {
  RunWithRetry(false, [&work](MYSQL* conn) {
    work(conn);
    return true;
  });
}

std::vector<DbRow> MariaDbClient::Query(MYSQL* conn, const std::string& sql, const std::string& ctx) const {
  if (mysql_query(conn, sql.c_str()) != 0) {
    RaiseError(conn, ctx);
  }
  std::unique_ptr<MYSQL_RES, ResultCloser> res(mysql_store_result(conn));
  if (!res) {
    RaiseError(conn, ctx + " 결과 없음");
  }
  std::vector<DbRow> rows;
  const unsigned int fields = mysql_num_fields(res.get());
  MYSQL_ROW row;
  while ((row = mysql_fetch_row(res.get())) != nullptr) {
    DbRow values;
    values.reserve(fields);
    for (unsigned int i = 0; i < fields; ++i) {
      values.push_back(row[i] ? std::optional<std::string>(row[i]) : std::nullopt);
    }
    rows.push_back(std::move(values));
  }
  return rows;
}

std::uint64_t MariaDbClient::Execute(MYSQL* conn, const std::string& sql, const std::string& ctx) const {
  if (mysql_query(conn, sql.c_str()) != 0) {
    RaiseError(conn, ctx);
  }
  return static_cast<std::uint64_t>(mysql_affected_rows(conn));
}

void MariaDbClient::RaiseError(MYSQL* conn, const std::string& ctx) const {
  unsigned int code = mysql_errno(conn);
  bool retryable = IsRetryable(code);
  std::string message = ctx + ": " + mysql_error(conn);
  throw DbException(message, code, retryable);
}

bool MariaDbClient::IsRetryable(unsigned int code) const {
  return code == kDeadlock || code == kLockWaitTimeout || code == CR_SERVER_LOST || code == CR_SERVER_GONE_ERROR ||
         code == CR_CONN_HOST_ERROR || code == CR_SERVER_LOST_EXTENDED;
}

void MariaDbClient::Backoff(std::size_t attempt) const {
  std::size_t base_ms = 50 * (1u << (attempt - 1));
  std::random_device rd;
  std::mt19937 gen(rd());
  std::uniform_int_distribution<int> dist(0, 25);
  std::size_t delay_ms = base_ms + static_cast<std::size_t>(dist(gen));
  std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms));
}

void MariaDbClient::SetTransientInjector(const std::function<bool(std::size_t)>& injector) {
  transient_injector_ = injector;
}

}  // namespace rotation
