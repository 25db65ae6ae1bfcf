/*
 * 설명: SessionStore 의 MariaDB 구현. 세션/참가자/경기 테이블을 읽고 큐 경기를 저장한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md, server/sql/schema.sql
 * 테스트: server/tests/it/session_store_it_test.cpp
 */
#pragma once

#include <memory>
#include <optional>
#include <vector>

#include <mariadb/mysql.h>

#include "rotation/db_client.hpp"
#include "rotation/session_store.hpp"

namespace rotation {

class MariaDbSessionStore : public SessionStore {
 public:
  explicit MariaDbSessionStore(std::shared_ptr<MariaDbClient> db_client);

  std::optional<SessionSnapshot> LoadSession(int session_id) override;
  AppendResult AppendQueuedGames(int session_id, const std::vector<Candidate>& candidates) override;
  bool SetParticipantStatus(int session_id, ParticipantId player_id, ParticipantStatus status) override;
  std::size_t DeleteQueuedGamesWith(int session_id, ParticipantId player_id) override;
  bool UpdateGameStatus(int session_id, int game_id, MatchStatus from, MatchStatus to) override;

 private:
  // 트랜잭션 안에서 세션 행을 FOR UPDATE 로 잠근다. 세션이 없으면 false.
  bool LockSession(MYSQL* conn, int session_id) const;
  StoredGame BuildGame(const DbRow& row) const;

  std::shared_ptr<MariaDbClient> db_client_;
};

}  // namespace rotation
