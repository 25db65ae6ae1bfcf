/*
 * 설명: 세션 저장소에서 입력을 모아 큐를 생성/저장하고 참가자·경기 상태 전환을 처리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/rotation_service_test.cpp
 */
#pragma once

#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "rotation/match_types.hpp"
#include "rotation/observability.hpp"
#include "rotation/queue_builder.hpp"
#include "rotation/session_store.hpp"

namespace rotation {

struct GeneratedQueue {
  std::vector<StoredGame> games;
  QueueResult result;
};

struct SessionGames {
  int session_id{0};
  std::vector<StoredGame> queued;
  std::vector<StoredGame> playing;
  std::vector<StoredGame> completed;
  // 큐/진행/완료 경기를 모두 합친 세션 내 참가 횟수.
  std::map<ParticipantId, int> games_per_participant;
};

class RotationService {
 public:
  RotationService(std::shared_ptr<SessionStore> store, QueueConfig queue_config, std::size_t max_active_participants,
                  std::shared_ptr<Observability> observability = nullptr);

  // 저장소 없이 입력만으로 큐를 미리 계산한다.
  std::optional<QueueResult> Preview(const std::vector<Participant>& participants,
                                     const std::vector<MatchRecord>& matches, std::optional<std::size_t> max_rounds,
                                     std::string& error_code, std::string& error_message) const;

  std::optional<GeneratedQueue> GenerateForSession(int session_id, std::string& error_code,
                                                   std::string& error_message);
  std::optional<SessionGames> ListGames(int session_id, std::string& error_code, std::string& error_message);
  // left 로 바뀌면 그 참가자가 포함된 queued 경기를 삭제하고 삭제 수를 removed 에 담는다.
  bool SetParticipantStatus(int session_id, ParticipantId player_id, ParticipantStatus status,
                            std::size_t& removed, std::string& error_code, std::string& error_message);
  std::optional<StoredGame> StartNextGame(int session_id, std::string& error_code, std::string& error_message);
  std::optional<StoredGame> CompleteGame(int session_id, int game_id, std::string& error_code,
                                         std::string& error_message);

  std::size_t MaxActiveParticipants() const { return max_active_participants_; }
  const QueueConfig& GetQueueConfig() const { return builder_.Config(); }

 private:
  std::optional<SessionSnapshot> LoadOpenSession(int session_id, std::string& error_code, std::string& error_message);
  bool CheckPoolSize(std::size_t active_count, std::string& error_code, std::string& error_message) const;
  void LogEvent(const std::string& name, int session_id, nlohmann::json fields, LogLevel level = LogLevel::kInfo) const;

  std::shared_ptr<SessionStore> store_;
  QueueBuilder builder_;
  std::size_t max_active_participants_;
  std::shared_ptr<Observability> observability_;
};

}  // namespace rotation
