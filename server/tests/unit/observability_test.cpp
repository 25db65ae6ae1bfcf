#include <sstream>
#include <string>

#include <gtest/gtest.h>

#include "rotation/observability.hpp"

TEST(ObservabilityTest, LogWritesOneJsonObjectPerLine) {
  std::ostringstream sink;
  rotation::Observability obs(rotation::LogLevel::kInfo, sink);

  rotation::LogContext ctx;
  ctx.trace_id = "t-1";
  ctx.session_id = 7;
  ctx.name = "queue.generated";
  ctx.latency_ms = 12;
  ctx.fields = {{"games", 3}};
  obs.Log(ctx);
  ctx.session_id.reset();
  ctx.fields = nullptr;
  obs.Log(ctx);

  std::istringstream lines(sink.str());
  std::string line;
  ASSERT_TRUE(std::getline(lines, line));
  auto first = nlohmann::json::parse(line);
  EXPECT_EQ(first["level"], "info");
  EXPECT_EQ(first["traceId"], "t-1");
  EXPECT_EQ(first["eventName"], "queue.generated");
  EXPECT_EQ(first["latencyMs"], 12);
  EXPECT_EQ(first["sessionId"], 7);
  EXPECT_EQ(first["fields"]["games"], 3);

  ASSERT_TRUE(std::getline(lines, line));
  auto second = nlohmann::json::parse(line);
  EXPECT_FALSE(second.contains("sessionId"));
  EXPECT_FALSE(second.contains("fields"));
  EXPECT_FALSE(std::getline(lines, line));
}

TEST(ObservabilityTest, LevelBelowMinimumIsDropped) {
  std::ostringstream sink;
  rotation::Observability obs(rotation::LogLevel::kWarn, sink);

  rotation::LogContext ctx;
  ctx.name = "participant.status";
  obs.Log(ctx);
  EXPECT_TRUE(sink.str().empty());

  ctx.level = rotation::LogLevel::kError;
  obs.Log(ctx);
  EXPECT_NE(sink.str().find("\"level\":\"error\""), std::string::npos);
}

TEST(ObservabilityTest, ParseLogLevelFallsBackToInfo) {
  EXPECT_EQ(rotation::ParseLogLevel("debug"), rotation::LogLevel::kDebug);
  EXPECT_EQ(rotation::ParseLogLevel("warn"), rotation::LogLevel::kWarn);
  EXPECT_EQ(rotation::ParseLogLevel("error"), rotation::LogLevel::kError);
  EXPECT_EQ(rotation::ParseLogLevel("verbose"), rotation::LogLevel::kInfo);
}

TEST(ObservabilityTest, CountersAccumulate) {
  std::ostringstream sink;
  rotation::Observability obs(rotation::LogLevel::kInfo, sink);
  obs.IncrementRequest();
  obs.IncrementRequest();
  obs.IncrementError();
  obs.RecordQueue(3, 210);
  obs.RecordQueue(1, 3);

  auto snapshot = obs.Snapshot();
  EXPECT_EQ(snapshot.request_total, 2u);
  EXPECT_EQ(snapshot.request_errors, 1u);
  EXPECT_EQ(snapshot.queues_generated, 2u);
  EXPECT_EQ(snapshot.games_queued, 4u);
  EXPECT_EQ(snapshot.candidates_scored, 213u);
  EXPECT_NE(obs.NextTraceId(), obs.NextTraceId());
}
