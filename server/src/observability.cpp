/*
 * 설명: 구조화 로그와 메트릭 카운터를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/observability_test.cpp
 */
#include "rotation/observability.hpp"

#include <chrono>
#include <iostream>
#include <sstream>

namespace rotation {

LogLevel ParseLogLevel(std::string_view text) {
  if (text == "debug") {
    return LogLevel::kDebug;
  }
  if (text == "warn") {
    return LogLevel::kWarn;
  }
  if (text == "error") {
    return LogLevel::kError;
  }
  return LogLevel::kInfo;
}

std::string_view ToString(LogLevel level) {
  switch (level) {
    case LogLevel::kDebug:
      return "debug";
    case LogLevel::kInfo:
      return "info";
    case LogLevel::kWarn:
      return "warn";
    case LogLevel::kError:
      return "error";
  }
  return "info";
}

Observability::Observability(LogLevel min_level) : Observability(min_level, std::cout) {}

Observability::Observability(LogLevel min_level, std::ostream& sink) : min_level_(min_level), sink_(&sink) {}

std::string Observability::NextTraceId() {
  auto now = std::chrono::steady_clock::now().time_since_epoch().count();
  std::ostringstream oss;
  oss << std::hex << now << "-" << trace_counter_.fetch_add(1);
  return oss.str();
}

void Observability::IncrementRequest() { request_total_.fetch_add(1); }

void Observability::IncrementError() { request_errors_.fetch_add(1); }

void Observability::RecordQueue(std::uint64_t games, std::uint64_t candidates_scored) {
  queues_generated_.fetch_add(1);
  games_queued_.fetch_add(games);
  candidates_scored_.fetch_add(candidates_scored);
}

MetricsSnapshot Observability::Snapshot() const {
  MetricsSnapshot snapshot;
  snapshot.request_total = request_total_.load();
  snapshot.request_errors = request_errors_.load();
  snapshot.queues_generated = queues_generated_.load();
  snapshot.games_queued = games_queued_.load();
  snapshot.candidates_scored = candidates_scored_.load();
  return snapshot;
}

void Observability::Log(const LogContext& ctx) const {
  if (!Enabled(ctx.level)) {
    return;
  }
  nlohmann::json log_json;
  log_json["level"] = std::string(ToString(ctx.level));
  log_json["traceId"] = ctx.trace_id;
  log_json["eventName"] = ctx.name;
  log_json["latencyMs"] = ctx.latency_ms;
  if (ctx.session_id) {
    log_json["sessionId"] = *ctx.session_id;
  }
  if (!ctx.fields.is_null()) {
    log_json["fields"] = ctx.fields;
  }
  std::lock_guard<std::mutex> lock(sink_mutex_);
  *sink_ << log_json.dump() << std::endl;
}

}  // namespace rotation
