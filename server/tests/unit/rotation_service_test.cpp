#include <sstream>

#include <gtest/gtest.h>

#include "rotation/rotation_service.hpp"
#include "support/memory_session_store.hpp"

namespace {

class RotationServiceTest : public ::testing::Test {
 protected:
  void SetUp() override {
    store_ = std::make_shared<rotation_test::MemorySessionStore>();
    observability_ = std::make_shared<rotation::Observability>(rotation::LogLevel::kInfo, log_);
    service_ = std::make_unique<rotation::RotationService>(store_, rotation::QueueConfig{}, 8, observability_);
  }

  std::ostringstream log_;
  std::shared_ptr<rotation_test::MemorySessionStore> store_;
  std::shared_ptr<rotation::Observability> observability_;
  std::unique_ptr<rotation::RotationService> service_;
  std::string code_;
  std::string message_;
};

// 스냅샷을 돌려준 직후 한 참가자를 left 로 바꿔 조회와 저장 사이의 이탈을 재현한다.
class DepartingAfterLoadStore : public rotation_test::MemorySessionStore {
 public:
  explicit DepartingAfterLoadStore(rotation::ParticipantId leaving) : leaving_(leaving) {}

  std::optional<rotation::SessionSnapshot> LoadSession(int session_id) override {
    auto snapshot = MemorySessionStore::LoadSession(session_id);
    if (snapshot && !departed_) {
      departed_ = true;
      SetParticipantStatus(session_id, leaving_, rotation::ParticipantStatus::kLeft);
    }
    return snapshot;
  }

 private:
  rotation::ParticipantId leaving_;
  bool departed_{false};
};

}  // namespace

TEST_F(RotationServiceTest, GeneratesAndNumbersQueuedGames) {
  store_->AddSession(1, rotation_test::MakeParticipants(6));
  store_->AddGame(1, rotation::MatchRecord{{1, 2}, {3, 4}, rotation::MatchStatus::kCompleted});

  auto generated = service_->GenerateForSession(1, code_, message_);
  ASSERT_TRUE(generated.has_value()) << code_;
  ASSERT_EQ(generated->games.size(), 3u);
  EXPECT_EQ(generated->games[0].game_number, 2);
  EXPECT_EQ(generated->games[2].game_number, 4);
  for (const auto& game : generated->games) {
    EXPECT_EQ(game.record.status, rotation::MatchStatus::kQueued);
  }

  auto again = service_->GenerateForSession(1, code_, message_);
  ASSERT_TRUE(again.has_value());
  EXPECT_EQ(again->games.front().game_number, 5);

  auto metrics = observability_->Snapshot();
  EXPECT_EQ(metrics.queues_generated, 2u);
  EXPECT_EQ(metrics.games_queued, 6u);
  EXPECT_NE(log_.str().find("queue.generated"), std::string::npos);
}

TEST_F(RotationServiceTest, ExistingQueueCountsAsHistory) {
  store_->AddSession(1, rotation_test::MakeParticipants(4));
  auto first = service_->GenerateForSession(1, code_, message_);
  ASSERT_TRUE(first.has_value());
  EXPECT_EQ(first->games.size(), 1u);

  // 4명 세션의 유일한 그룹이 이미 대기열에 있어도 이력 기준으로 다시 채점된다.
  auto second = service_->GenerateForSession(1, code_, message_);
  ASSERT_TRUE(second.has_value());
  EXPECT_GT(second->result.queue.front().breakdown.recency, 0);
}

TEST_F(RotationServiceTest, LeftParticipantsAreExcluded) {
  store_->AddSession(1, rotation_test::MakeParticipants(5));
  std::size_t removed = 0;
  ASSERT_TRUE(service_->SetParticipantStatus(1, 5, rotation::ParticipantStatus::kLeft, removed, code_, message_));

  auto generated = service_->GenerateForSession(1, code_, message_);
  ASSERT_TRUE(generated.has_value());
  for (const auto& game : generated->games) {
    EXPECT_FALSE(game.record.Contains(5));
  }
}

TEST_F(RotationServiceTest, LeavingRemovesOnlyQueuedGamesWithParticipant) {
  store_->AddSession(1, rotation_test::MakeParticipants(6));
  store_->AddGame(1, rotation::MatchRecord{{1, 2}, {3, 4}, rotation::MatchStatus::kCompleted});
  auto generated = service_->GenerateForSession(1, code_, message_);
  ASSERT_TRUE(generated.has_value());

  std::size_t expected = 0;
  for (const auto& game : generated->games) {
    if (game.record.Contains(1)) {
      ++expected;
    }
  }
  std::size_t removed = 0;
  ASSERT_TRUE(service_->SetParticipantStatus(1, 1, rotation::ParticipantStatus::kLeft, removed, code_, message_));
  EXPECT_EQ(removed, expected);

  auto games = service_->ListGames(1, code_, message_);
  ASSERT_TRUE(games.has_value());
  ASSERT_EQ(games->completed.size(), 1u);
  EXPECT_TRUE(games->completed[0].record.Contains(1));
  for (const auto& game : games->queued) {
    EXPECT_FALSE(game.record.Contains(1));
  }
}

TEST_F(RotationServiceTest, RejectsSmallAndOversizedPools) {
  store_->AddSession(1, rotation_test::MakeParticipants(3));
  EXPECT_FALSE(service_->GenerateForSession(1, code_, message_).has_value());
  EXPECT_EQ(code_, "not_enough_players");

  store_->AddSession(2, rotation_test::MakeParticipants(9));
  EXPECT_FALSE(service_->GenerateForSession(2, code_, message_).has_value());
  EXPECT_EQ(code_, "too_many_players");

  EXPECT_FALSE(service_->Preview(rotation_test::MakeParticipants(9), {}, std::nullopt, code_, message_).has_value());
  EXPECT_EQ(code_, "too_many_players");
}

TEST_F(RotationServiceTest, MissingOrClosedSessionIsRejected) {
  EXPECT_FALSE(service_->GenerateForSession(42, code_, message_).has_value());
  EXPECT_EQ(code_, "session_not_found");

  store_->AddSession(2, rotation_test::MakeParticipants(4), false);
  EXPECT_FALSE(service_->GenerateForSession(2, code_, message_).has_value());
  EXPECT_EQ(code_, "session_closed");

  EXPECT_FALSE(service_->ListGames(42, code_, message_).has_value());
  EXPECT_EQ(code_, "session_not_found");
}

TEST_F(RotationServiceTest, UnknownParticipantStatusChangeFails) {
  store_->AddSession(1, rotation_test::MakeParticipants(4));
  std::size_t removed = 0;
  EXPECT_FALSE(service_->SetParticipantStatus(1, 99, rotation::ParticipantStatus::kLeft, removed, code_, message_));
  EXPECT_EQ(code_, "participant_not_found");
}

TEST_F(RotationServiceTest, GamesMoveThroughLifecycle) {
  store_->AddSession(1, rotation_test::MakeParticipants(5));
  EXPECT_FALSE(service_->StartNextGame(1, code_, message_).has_value());
  EXPECT_EQ(code_, "queue_empty");

  auto generated = service_->GenerateForSession(1, code_, message_);
  ASSERT_TRUE(generated.has_value());

  auto started = service_->StartNextGame(1, code_, message_);
  ASSERT_TRUE(started.has_value());
  EXPECT_EQ(started->game_id, generated->games.front().game_id);
  EXPECT_EQ(started->record.status, rotation::MatchStatus::kPlaying);

  auto not_playing = service_->CompleteGame(1, generated->games.back().game_id, code_, message_);
  EXPECT_FALSE(not_playing.has_value());
  EXPECT_EQ(code_, "invalid_transition");

  auto completed = service_->CompleteGame(1, started->game_id, code_, message_);
  ASSERT_TRUE(completed.has_value());
  EXPECT_EQ(completed->record.status, rotation::MatchStatus::kCompleted);

  EXPECT_FALSE(service_->CompleteGame(1, started->game_id, code_, message_).has_value());
  EXPECT_EQ(code_, "invalid_transition");
  EXPECT_FALSE(service_->CompleteGame(1, 999, code_, message_).has_value());
  EXPECT_EQ(code_, "game_not_found");

  auto games = service_->ListGames(1, code_, message_);
  ASSERT_TRUE(games.has_value());
  EXPECT_EQ(games->completed.size(), 1u);
  EXPECT_EQ(games->playing.size(), 0u);
  EXPECT_EQ(games->queued.size(), generated->games.size() - 1);
  int total = 0;
  for (const auto& entry : games->games_per_participant) {
    total += entry.second;
  }
  EXPECT_EQ(total, static_cast<int>(generated->games.size() * 4));
}

TEST_F(RotationServiceTest, PreviewHonoursRoundOverrideAndInvalidInput) {
  auto preview = service_->Preview(rotation_test::MakeParticipants(6), {}, std::size_t{1}, code_, message_);
  ASSERT_TRUE(preview.has_value());
  EXPECT_EQ(preview->queue.size(), 1u);

  auto duplicated = rotation_test::MakeParticipants(4);
  duplicated[1].id = duplicated[0].id;
  EXPECT_FALSE(service_->Preview(duplicated, {}, std::nullopt, code_, message_).has_value());
  EXPECT_EQ(code_, "invalid_participants");

  auto small = service_->Preview(rotation_test::MakeParticipants(3), {}, std::nullopt, code_, message_);
  ASSERT_TRUE(small.has_value());
  EXPECT_TRUE(small->queue.empty());
  EXPECT_EQ(small->outcome, rotation::QueueOutcome::kInsufficientParticipants);
}

TEST_F(RotationServiceTest, DepartureAfterSnapshotRejectsWholeBatch) {
  auto store = std::make_shared<DepartingAfterLoadStore>(6);
  store->AddSession(1, rotation_test::MakeParticipants(6));
  rotation::RotationService service(store, rotation::QueueConfig{}, 8, observability_);

  EXPECT_FALSE(service.GenerateForSession(1, code_, message_).has_value());
  EXPECT_EQ(code_, "roster_changed");
  EXPECT_NE(log_.str().find("roster_changed"), std::string::npos);
  auto games = service.ListGames(1, code_, message_);
  ASSERT_TRUE(games.has_value());
  EXPECT_TRUE(games->queued.empty());

  auto retried = service.GenerateForSession(1, code_, message_);
  ASSERT_TRUE(retried.has_value()) << code_;
  EXPECT_EQ(retried->games.front().game_number, 1);
  for (const auto& game : retried->games) {
    EXPECT_FALSE(game.record.Contains(6));
  }
}

TEST_F(RotationServiceTest, PreviewRejectsRoundOverrideAboveLimit) {
  auto too_many = rotation::QueueBuilder::kMaxRoundLimit + 1;
  EXPECT_FALSE(service_->Preview(rotation_test::MakeParticipants(6), {}, too_many, code_, message_).has_value());
  EXPECT_EQ(code_, "bad_request");

  auto at_limit = service_->Preview(rotation_test::MakeParticipants(6), {}, rotation::QueueBuilder::kMaxRoundLimit,
                                    code_, message_);
  ASSERT_TRUE(at_limit.has_value());
  EXPECT_EQ(at_limit->queue.size(), rotation::QueueBuilder::kMaxRoundLimit);
  EXPECT_EQ(service_->GetQueueConfig().max_rounds, 3u);
}
