/*
 * 설명: 세션 단위 큐 생성과 참가자/경기 상태 전환을 조율한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/rotation_service_test.cpp
 */
#include "rotation/rotation_service.hpp"

#include <algorithm>
#include <sstream>
#include <utility>

namespace rotation {

RotationService::RotationService(std::shared_ptr<SessionStore> store, QueueConfig queue_config,
                                 std::size_t max_active_participants, std::shared_ptr<Observability> observability)
    : store_(std::move(store)), builder_(queue_config),
      max_active_participants_(max_active_participants), observability_(std::move(observability)) {}

std::optional<QueueResult> RotationService::Preview(const std::vector<Participant>& participants,
                                                    const std::vector<MatchRecord>& matches,
                                                    std::optional<std::size_t> max_rounds, std::string& error_code,
                                                    std::string& error_message) const {
  if (!CheckPoolSize(participants.size(), error_code, error_message)) {
    return std::nullopt;
  }
  if (max_rounds && (*max_rounds == 0 || *max_rounds > QueueBuilder::kMaxRoundLimit)) {
    std::ostringstream oss;
    oss << "maxRounds 는 1 이상 " << QueueBuilder::kMaxRoundLimit << " 이하여야 합니다";
    error_code = "bad_request";
    error_message = oss.str();
    return std::nullopt;
  }
  try {
    QueueResult result;
    if (max_rounds && *max_rounds != builder_.Config().max_rounds) {
      QueueConfig config = builder_.Config();
      config.max_rounds = *max_rounds;
      result = QueueBuilder(config).Build(participants, matches);
    } else {
      result = builder_.Build(participants, matches);
    }
    if (observability_) {
      observability_->RecordQueue(result.queue.size(), result.candidates_scored);
    }
    return result;
  } catch (const ContractViolation& ex) {
    error_code = "invalid_participants";
    error_message = ex.what();
    return std::nullopt;
  }
}

std::optional<GeneratedQueue> RotationService::GenerateForSession(int session_id, std::string& error_code,
                                                                  std::string& error_message) {
  auto session = LoadOpenSession(session_id, error_code, error_message);
  if (!session) {
    return std::nullopt;
  }

  std::vector<Participant> active;
  for (const auto& player : session->players) {
    if (player.status == ParticipantStatus::kActive) {
      active.push_back(player.participant);
    }
  }
  if (active.size() < QueueBuilder::kMinParticipants) {
    error_code = "not_enough_players";
    error_message = "큐를 만들려면 활성 참가자가 4명 이상 필요합니다";
    LogEvent("queue.rejected", session_id, {{"reason", error_code}, {"active", active.size()}}, LogLevel::kWarn);
    return std::nullopt;
  }
  if (!CheckPoolSize(active.size(), error_code, error_message)) {
    LogEvent("queue.rejected", session_id, {{"reason", error_code}, {"active", active.size()}}, LogLevel::kWarn);
    return std::nullopt;
  }

  std::vector<MatchRecord> universe;
  universe.reserve(session->games.size());
  for (const auto& game : session->games) {
    universe.push_back(game.record);
  }

  GeneratedQueue generated;
  try {
    generated.result = builder_.Build(active, universe);
  } catch (const ContractViolation& ex) {
    error_code = "invalid_participants";
    error_message = ex.what();
    return std::nullopt;
  }
  if (observability_) {
    observability_->RecordQueue(generated.result.queue.size(), generated.result.candidates_scored);
  }
  if (generated.result.queue.empty()) {
    error_code = "queue_exhausted";
    error_message = "조건을 만족하는 새 경기를 만들 수 없습니다";
    LogEvent("queue.rejected", session_id, {{"reason", error_code}}, LogLevel::kWarn);
    return std::nullopt;
  }

  std::vector<Candidate> candidates;
  candidates.reserve(generated.result.queue.size());
  for (const auto& scored : generated.result.queue) {
    candidates.push_back(scored.candidate);
  }
  auto appended = store_->AppendQueuedGames(session_id, candidates);
  switch (appended.outcome) {
    case AppendOutcome::kAppended:
      break;
    case AppendOutcome::kSessionNotFound:
      error_code = "session_not_found";
      error_message = "세션을 찾을 수 없습니다";
      return std::nullopt;
    case AppendOutcome::kRosterChanged:
      // 스냅샷을 읽은 뒤 참가자가 나갔다. 아무것도 저장되지 않았으므로 클라이언트가 다시 요청하면 된다.
      error_code = "roster_changed";
      error_message = "큐를 만드는 동안 참가자 구성이 바뀌었습니다";
      LogEvent("queue.rejected", session_id, {{"reason", error_code}}, LogLevel::kWarn);
      return std::nullopt;
  }
  generated.games = std::move(appended.games);

  LogEvent("queue.generated", session_id,
           {{"games", generated.games.size()},
            {"outcome", std::string(ToString(generated.result.outcome))},
            {"candidatesScored", generated.result.candidates_scored},
            {"firstGameNumber", generated.games.front().game_number}});
  return generated;
}

std::optional<SessionGames> RotationService::ListGames(int session_id, std::string& error_code,
                                                       std::string& error_message) {
  auto session = store_->LoadSession(session_id);
  if (!session) {
    error_code = "session_not_found";
    error_message = "세션을 찾을 수 없습니다";
    return std::nullopt;
  }
  SessionGames games;
  games.session_id = session_id;
  for (const auto& player : session->players) {
    games.games_per_participant[player.participant.id] = 0;
  }
  for (const auto& game : session->games) {
    switch (game.record.status) {
      case MatchStatus::kQueued:
        games.queued.push_back(game);
        break;
      case MatchStatus::kPlaying:
        games.playing.push_back(game);
        break;
      case MatchStatus::kCompleted:
        games.completed.push_back(game);
        break;
    }
    for (ParticipantId id : game.record.Members()) {
      ++games.games_per_participant[id];
    }
  }
  return games;
}

bool RotationService::SetParticipantStatus(int session_id, ParticipantId player_id, ParticipantStatus status,
                                           std::size_t& removed, std::string& error_code,
                                           std::string& error_message) {
  removed = 0;
  if (!LoadOpenSession(session_id, error_code, error_message)) {
    return false;
  }
  if (!store_->SetParticipantStatus(session_id, player_id, status)) {
    error_code = "participant_not_found";
    error_message = "세션 참가자가 아닙니다";
    return false;
  }
  if (status == ParticipantStatus::kLeft) {
    removed = store_->DeleteQueuedGamesWith(session_id, player_id);
  }
  LogEvent("participant.status", session_id,
           {{"playerId", player_id}, {"status", std::string(ToString(status))}, {"removedQueued", removed}});
  return true;
}

std::optional<StoredGame> RotationService::StartNextGame(int session_id, std::string& error_code,
                                                         std::string& error_message) {
  auto session = LoadOpenSession(session_id, error_code, error_message);
  if (!session) {
    return std::nullopt;
  }
  auto it = std::find_if(session->games.begin(), session->games.end(),
                         [](const StoredGame& game) { return game.record.status == MatchStatus::kQueued; });
  if (it == session->games.end()) {
    error_code = "queue_empty";
    error_message = "대기 중인 경기가 없습니다";
    return std::nullopt;
  }
  if (!store_->UpdateGameStatus(session_id, it->game_id, MatchStatus::kQueued, MatchStatus::kPlaying)) {
    error_code = "invalid_transition";
    error_message = "경기 상태가 이미 변경되었습니다";
    return std::nullopt;
  }
  StoredGame started = *it;
  started.record.status = MatchStatus::kPlaying;
  LogEvent("game.status", session_id,
           {{"gameId", started.game_id}, {"gameNumber", started.game_number}, {"status", "playing"}});
  return started;
}

std::optional<StoredGame> RotationService::CompleteGame(int session_id, int game_id, std::string& error_code,
                                                        std::string& error_message) {
  auto session = LoadOpenSession(session_id, error_code, error_message);
  if (!session) {
    return std::nullopt;
  }
  auto it = std::find_if(session->games.begin(), session->games.end(),
                         [game_id](const StoredGame& game) { return game.game_id == game_id; });
  if (it == session->games.end()) {
    error_code = "game_not_found";
    error_message = "경기를 찾을 수 없습니다";
    return std::nullopt;
  }
  if (it->record.status != MatchStatus::kPlaying ||
      !store_->UpdateGameStatus(session_id, game_id, MatchStatus::kPlaying, MatchStatus::kCompleted)) {
    error_code = "invalid_transition";
    error_message = "진행 중인 경기만 완료할 수 있습니다";
    return std::nullopt;
  }
  StoredGame completed = *it;
  completed.record.status = MatchStatus::kCompleted;
  LogEvent("game.status", session_id,
           {{"gameId", completed.game_id}, {"gameNumber", completed.game_number}, {"status", "completed"}});
  return completed;
}

std::optional<SessionSnapshot> RotationService::LoadOpenSession(int session_id, std::string& error_code,
                                                                std::string& error_message) {
  auto session = store_->LoadSession(session_id);
  if (!session) {
    error_code = "session_not_found";
    error_message = "세션을 찾을 수 없습니다";
    return std::nullopt;
  }
  if (!session->in_progress) {
    error_code = "session_closed";
    error_message = "이미 종료된 세션입니다";
    return std::nullopt;
  }
  return session;
}

bool RotationService::CheckPoolSize(std::size_t active_count, std::string& error_code,
                                    std::string& error_message) const {
  if (max_active_participants_ > 0 && active_count > max_active_participants_) {
    std::ostringstream oss;
    oss << "활성 참가자는 최대 " << max_active_participants_ << "명까지 허용됩니다";
    error_code = "too_many_players";
    error_message = oss.str();
    return false;
  }
  return true;
}

void RotationService::LogEvent(const std::string& name, int session_id, nlohmann::json fields,
                               LogLevel level) const {
  if (!observability_) {
    return;
  }
  LogContext ctx;
  ctx.trace_id = observability_->NextTraceId();
  ctx.session_id = session_id;
  ctx.name = name;
  ctx.level = level;
  ctx.fields = std::move(fields);
  observability_->Log(ctx);
}

}  // namespace rotation
