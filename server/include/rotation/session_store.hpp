/*
 * 설명: 세션 참가자와 경기 기록을 읽고 큐를 저장하는 영속 계층 인터페이스.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/rotation_service_test.cpp, server/tests/it/session_store_it_test.cpp
 */
#pragma once

#include <cstddef>
#include <optional>
#include <string_view>
#include <vector>

#include "rotation/match_types.hpp"

namespace rotation {

enum class ParticipantStatus { kActive, kLeft };

std::string_view ToString(ParticipantStatus status);
std::optional<ParticipantStatus> ParseParticipantStatus(std::string_view text);

struct SessionPlayer {
  Participant participant;
  ParticipantStatus status{ParticipantStatus::kActive};
};

struct StoredGame {
  int game_id{0};
  int session_id{0};
  int game_number{0};
  MatchRecord record;
};

struct SessionSnapshot {
  int session_id{0};
  bool in_progress{true};
  std::vector<SessionPlayer> players;
  // game_number 오름차순.
  std::vector<StoredGame> games;
};

enum class AppendOutcome { kAppended, kSessionNotFound, kRosterChanged };

struct AppendResult {
  AppendOutcome outcome{AppendOutcome::kAppended};
  std::vector<StoredGame> games;
};

class SessionStore {
 public:
  virtual ~SessionStore() = default;

  virtual std::optional<SessionSnapshot> LoadSession(int session_id) = 0;
  // 기존 최대 game_number 다음 번호부터 차례로 부여하여 queued 상태로 저장한다.
  // 세션 잠금 아래에서 후보 구성원이 모두 active 가 아니면 아무것도 저장하지 않고 kRosterChanged 를 돌려준다.
  virtual AppendResult AppendQueuedGames(int session_id, const std::vector<Candidate>& candidates) = 0;
  virtual bool SetParticipantStatus(int session_id, ParticipantId player_id, ParticipantStatus status) = 0;
  virtual std::size_t DeleteQueuedGamesWith(int session_id, ParticipantId player_id) = 0;
  // 현재 상태가 from 일 때만 to 로 바꾸고 성공 여부를 돌려준다.
  virtual bool UpdateGameStatus(int session_id, int game_id, MatchStatus from, MatchStatus to) = 0;
};

}  // namespace rotation
