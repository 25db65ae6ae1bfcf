#include <limits>
#include <stdexcept>

#include <gtest/gtest.h>

#include "rotation/queue_codec.hpp"

TEST(QueueCodecTest, ParsesParticipantsMatchesAndRounds) {
  auto body = nlohmann::json::parse(R"({
    "participants": [
      {"id": 1, "name": "kim", "lifetimeMatches": 12},
      {"id": 2},
      {"id": 3, "name": "lee"},
      {"id": 4, "lifetimeMatches": 0}
    ],
    "matches": [
      {"teamA": [1, 2], "teamB": [3, 4], "status": "playing"},
      {"teamA": [1, 3], "teamB": [2, 4]}
    ],
    "maxRounds": 2
  })");

  auto request = rotation::ParseQueueRequest(body);
  ASSERT_EQ(request.participants.size(), 4u);
  EXPECT_EQ(request.participants[0].name, "kim");
  EXPECT_EQ(request.participants[0].lifetime_matches, 12);
  EXPECT_EQ(request.participants[1].lifetime_matches, 0);
  ASSERT_EQ(request.matches.size(), 2u);
  EXPECT_EQ(request.matches[0].status, rotation::MatchStatus::kPlaying);
  EXPECT_EQ(request.matches[1].status, rotation::MatchStatus::kCompleted);
  EXPECT_EQ(request.matches[1].team_b[1], 4);
  ASSERT_TRUE(request.max_rounds.has_value());
  EXPECT_EQ(*request.max_rounds, 2u);
}

TEST(QueueCodecTest, RejectsMalformedBodies) {
  EXPECT_THROW(rotation::ParseQueueRequest(nlohmann::json::array()), std::invalid_argument);
  EXPECT_THROW(rotation::ParseQueueRequest(nlohmann::json::parse(R"({"participants": [{"name": "x"}]})")),
               std::invalid_argument);
  EXPECT_THROW(rotation::ParseQueueRequest(nlohmann::json::parse(R"({"participants": [{"id": "1"}]})")),
               std::invalid_argument);
  EXPECT_THROW(rotation::ParseQueueRequest(
                   nlohmann::json::parse(R"({"participants": [], "matches": [{"teamA": [1], "teamB": [2, 3]}]})")),
               std::invalid_argument);
  EXPECT_THROW(rotation::ParseQueueRequest(nlohmann::json::parse(
                   R"({"participants": [], "matches": [{"teamA": [1, 2], "teamB": [3, 4], "status": "done"}]})")),
               std::invalid_argument);
  EXPECT_THROW(rotation::ParseQueueRequest(nlohmann::json::parse(R"({"participants": [], "maxRounds": 0})")),
               std::invalid_argument);
}

TEST(QueueCodecTest, RejectsIntegersOutsideIntRange) {
  // 4294967297 을 int 로 자르면 1 이 되어 id 1 과 겹친다.
  EXPECT_THROW(rotation::ParseQueueRequest(nlohmann::json::parse(R"({"participants": [{"id": 4294967297}]})")),
               std::invalid_argument);
  EXPECT_THROW(rotation::ParseQueueRequest(nlohmann::json::parse(R"({"participants": [{"id": -4294967295}]})")),
               std::invalid_argument);
  EXPECT_THROW(rotation::ParseQueueRequest(
                   nlohmann::json::parse(R"({"participants": [{"id": 1, "lifetimeMatches": 2147483648}]})")),
               std::invalid_argument);
  EXPECT_THROW(rotation::ParseQueueRequest(nlohmann::json::parse(
                   R"({"participants": [], "matches": [{"teamA": [1, 4294967298], "teamB": [3, 4]}]})")),
               std::invalid_argument);

  auto at_limit = rotation::ParseQueueRequest(
      nlohmann::json::parse(R"({"participants": [{"id": 2147483647, "lifetimeMatches": 2147483647}]})"));
  ASSERT_EQ(at_limit.participants.size(), 1u);
  EXPECT_EQ(at_limit.participants[0].id, std::numeric_limits<int>::max());
  EXPECT_EQ(at_limit.participants[0].lifetime_matches, std::numeric_limits<int>::max());
}

TEST(QueueCodecTest, RejectsRoundOverrideAboveLimit) {
  nlohmann::json body{{"participants", nlohmann::json::array()}};
  body["maxRounds"] = rotation::QueueBuilder::kMaxRoundLimit;
  auto request = rotation::ParseQueueRequest(body);
  ASSERT_TRUE(request.max_rounds.has_value());
  EXPECT_EQ(*request.max_rounds, rotation::QueueBuilder::kMaxRoundLimit);

  body["maxRounds"] = rotation::QueueBuilder::kMaxRoundLimit + 1;
  EXPECT_THROW(rotation::ParseQueueRequest(body), std::invalid_argument);
  EXPECT_THROW(rotation::ParseQueueRequest(nlohmann::json::parse(R"({"participants": [], "maxRounds": 1000000000000})")),
               std::invalid_argument);
  EXPECT_THROW(rotation::ParseQueueRequest(nlohmann::json::parse(R"({"participants": [], "maxRounds": -3})")),
               std::invalid_argument);

  rotation::QueueConfig config;
  config.max_rounds = rotation::QueueBuilder::kMaxRoundLimit + 1;
  EXPECT_THROW(rotation::QueueBuilder{config}, rotation::ContractViolation);
}

TEST(QueueCodecTest, QueueResultShape) {
  rotation::QueueResult result;
  rotation::ScoredCandidate scored;
  scored.candidate = rotation::Candidate{{1, 2}, {3, 4}};
  scored.score = -3'999'000;
  result.queue.push_back(scored);
  result.usage = {{1, 1}, {2, 1}, {3, 1}, {4, 1}, {5, 0}};
  result.outcome = rotation::QueueOutcome::kRoundLimit;
  result.rounds_scored = 1;
  result.candidates_scored = 15;

  auto j = rotation::ToJson(result);
  ASSERT_EQ(j["queue"].size(), 1u);
  EXPECT_EQ(j["queue"][0]["teamA"], nlohmann::json::array({1, 2}));
  EXPECT_EQ(j["queue"][0]["teamB"], nlohmann::json::array({3, 4}));
  EXPECT_EQ(j["queue"][0]["score"], -3'999'000);
  EXPECT_EQ(j["usage"][4]["id"], 5);
  EXPECT_EQ(j["usage"][4]["count"], 0);
  EXPECT_EQ(j["outcome"], "round_limit");
  EXPECT_EQ(j["roundsScored"], 1);
  EXPECT_EQ(j["candidatesScored"], 15);
}

TEST(QueueCodecTest, StoredGameShape) {
  rotation::StoredGame game;
  game.game_id = 40;
  game.session_id = 3;
  game.game_number = 7;
  game.record = rotation::MatchRecord{{5, 6}, {7, 8}, rotation::MatchStatus::kQueued};

  auto j = rotation::ToJson(game);
  EXPECT_EQ(j["gameId"], 40);
  EXPECT_EQ(j["sessionId"], 3);
  EXPECT_EQ(j["gameNumber"], 7);
  EXPECT_EQ(j["teamA"], nlohmann::json::array({5, 6}));
  EXPECT_EQ(j["status"], "queued");
}
