/*
 * 설명: 구조화 로그와 요청/큐 생성 메트릭 카운터를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/observability_test.cpp, server/tests/e2e/queue_preview_test.cpp
 */
#pragma once

#include <atomic>
#include <cstdint>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace rotation {

enum class LogLevel { kDebug = 0, kInfo = 1, kWarn = 2, kError = 3 };

LogLevel ParseLogLevel(std::string_view text);
std::string_view ToString(LogLevel level);

struct LogContext {
  std::string trace_id;
  std::optional<int> session_id;
  std::string name;
  long latency_ms{0};
  LogLevel level{LogLevel::kInfo};
  nlohmann::json fields;
};

struct MetricsSnapshot {
  std::uint64_t request_total{0};
  std::uint64_t request_errors{0};
  std::uint64_t queues_generated{0};
  std::uint64_t games_queued{0};
  std::uint64_t candidates_scored{0};
};

class Observability {
 public:
  explicit Observability(LogLevel min_level = LogLevel::kInfo);
  // 테스트에서 출력 대상을 바꿀 때 사용한다. sink 의 수명은 호출자가 보장한다.
  Observability(LogLevel min_level, std::ostream& sink);

  std::string NextTraceId();
  void IncrementRequest();
  void IncrementError();
  void RecordQueue(std::uint64_t games, std::uint64_t candidates_scored);
  MetricsSnapshot Snapshot() const;
  void Log(const LogContext& ctx) const;
  bool Enabled(LogLevel level) const { return level >= min_level_; }

 private:
  LogLevel min_level_;
  std::ostream* sink_;
  mutable std::mutex sink_mutex_;
  std::atomic<std::uint64_t> request_total_{0};
  std::atomic<std::uint64_t> request_errors_{0};
  std::atomic<std::uint64_t> queues_generated_{0};
  std::atomic<std::uint64_t> games_queued_{0};
  std::atomic<std::uint64_t> candidates_scored_{0};
  std::atomic<std::uint64_t> trace_counter_{0};
};

}  // namespace rotation
