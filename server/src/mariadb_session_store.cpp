/*
 * 설명: 세션 스냅샷 조회, 큐 경기 번호 부여/저장, 참가/경기 상태 갱신을 MariaDB 로 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md, server/sql/schema.sql
 * 테스트: server/tests/it/session_store_it_test.cpp
 */
#include "rotation/mariadb_session_store.hpp"

#include <set>
#include <sstream>
#include <string>

namespace rotation {
namespace {
int ToInt(const std::optional<std::string>& value) { return value ? std::stoi(*value) : 0; }

constexpr const char* kGameColumns =
    "id, session_id, game_number, team_a_player1, team_a_player2, team_b_player1, team_b_player2, status";
}  // namespace

MariaDbSessionStore::MariaDbSessionStore(std::shared_ptr<MariaDbClient> db_client)
    : db_client_(std::move(db_client)) {}

std::optional<SessionSnapshot> MariaDbSessionStore::LoadSession(int session_id) {
  std::optional<SessionSnapshot> snapshot;
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    snapshot.reset();
    std::ostringstream session_sql;
    session_sql << "SELECT id, status FROM sessions WHERE id=" << session_id << ";";
    auto session_rows = db_client_->Query(conn, session_sql.str(), "세션 조회 실패");
    if (session_rows.empty()) {
      return;
    }
    SessionSnapshot loaded;
    loaded.session_id = session_id;
    loaded.in_progress = session_rows.front()[1].value_or("") == "in-progress";

    std::ostringstream players_sql;
    players_sql << "SELECT p.id, p.name, p.total_games_played, sp.status FROM session_players sp "
                << "JOIN players p ON p.id = sp.player_id WHERE sp.session_id=" << session_id
                << " ORDER BY p.id ASC;";
    for (const auto& row : db_client_->Query(conn, players_sql.str(), "세션 참가자 조회 실패")) {
      SessionPlayer player;
      player.participant.id = ToInt(row[0]);
      player.participant.name = row[1].value_or("");
      player.participant.lifetime_matches = ToInt(row[2]);
      player.status = ParseParticipantStatus(row[3].value_or("active")).value_or(ParticipantStatus::kActive);
      loaded.players.push_back(player);
    }

    std::ostringstream games_sql;
    games_sql << "SELECT " << kGameColumns << " FROM games WHERE session_id=" << session_id
              << " ORDER BY game_number ASC;";
    for (const auto& row : db_client_->Query(conn, games_sql.str(), "세션 경기 조회 실패")) {
      loaded.games.push_back(BuildGame(row));
    }
    snapshot = std::move(loaded);
  });
  return snapshot;
}

AppendResult MariaDbSessionStore::AppendQueuedGames(int session_id, const std::vector<Candidate>& candidates) {
  AppendResult result;
  db_client_->ExecuteTransactionWithRetry([&](MYSQL* conn) {
    result = AppendResult{};
    // 같은 세션에 대한 동시 큐 생성/참가 상태 변경과 직렬화되도록 세션 행을 잠근다.
    if (!LockSession(conn, session_id)) {
      result.outcome = AppendOutcome::kSessionNotFound;
      return false;
    }

    std::ostringstream active_sql;
    active_sql << "SELECT player_id FROM session_players WHERE session_id=" << session_id
               << " AND status='active';";
    std::set<ParticipantId> active;
    for (const auto& row : db_client_->Query(conn, active_sql.str(), "활성 참가자 조회 실패")) {
      active.insert(ToInt(row[0]));
    }
    for (const auto& candidate : candidates) {
      for (ParticipantId id : candidate.Members()) {
        if (active.count(id) == 0) {
          result.outcome = AppendOutcome::kRosterChanged;
          return false;
        }
      }
    }

    std::ostringstream max_sql;
    max_sql << "SELECT COALESCE(MAX(game_number), 0) FROM games WHERE session_id=" << session_id << ";";
    auto max_rows = db_client_->Query(conn, max_sql.str(), "경기 번호 조회 실패");
    int next_number = (max_rows.empty() ? 0 : ToInt(max_rows.front()[0])) + 1;

    for (const auto& candidate : candidates) {
      std::ostringstream insert_sql;
      insert_sql << "INSERT INTO games(session_id, game_number, team_a_player1, team_a_player2, team_b_player1, "
                 << "team_b_player2, status, updated_at) VALUES (" << session_id << ", " << next_number << ", "
                 << candidate.team_a[0] << ", " << candidate.team_a[1] << ", " << candidate.team_b[0] << ", "
                 << candidate.team_b[1] << ", 'queued', NOW(6));";
      db_client_->Execute(conn, insert_sql.str(), "큐 경기 저장 실패");
      StoredGame game;
      game.game_id = static_cast<int>(mysql_insert_id(conn));
      game.session_id = session_id;
      game.game_number = next_number++;
      game.record = candidate.ToQueuedRecord();
      result.games.push_back(game);
    }
    return true;
  });
  return result;
}

bool MariaDbSessionStore::SetParticipantStatus(int session_id, ParticipantId player_id, ParticipantStatus status) {
  return db_client_->ExecuteTransactionWithRetry([&](MYSQL* conn) {
    if (!LockSession(conn, session_id)) {
      return false;
    }
    std::ostringstream exists_sql;
    exists_sql << "SELECT player_id FROM session_players WHERE session_id=" << session_id
               << " AND player_id=" << player_id << " FOR UPDATE;";
    if (db_client_->Query(conn, exists_sql.str(), "세션 참가자 조회 실패").empty()) {
      return false;
    }
    std::ostringstream update_sql;
    update_sql << "UPDATE session_players SET status='" << ToString(status) << "' WHERE session_id=" << session_id
               << " AND player_id=" << player_id << ";";
    db_client_->Execute(conn, update_sql.str(), "참가 상태 갱신 실패");
    return true;
  });
}

std::size_t MariaDbSessionStore::DeleteQueuedGamesWith(int session_id, ParticipantId player_id) {
  std::uint64_t deleted = 0;
  db_client_->ExecuteTransactionWithRetry([&](MYSQL* conn) {
    std::ostringstream delete_sql;
    delete_sql << "DELETE FROM games WHERE session_id=" << session_id << " AND status='queued' AND ("
               << "team_a_player1=" << player_id << " OR team_a_player2=" << player_id
               << " OR team_b_player1=" << player_id << " OR team_b_player2=" << player_id << ");";
    deleted = db_client_->Execute(conn, delete_sql.str(), "큐 경기 삭제 실패");
    return true;
  });
  return static_cast<std::size_t>(deleted);
}

bool MariaDbSessionStore::UpdateGameStatus(int session_id, int game_id, MatchStatus from, MatchStatus to) {
  return db_client_->ExecuteTransactionWithRetry([&](MYSQL* conn) {
    std::ostringstream update_sql;
    update_sql << "UPDATE games SET status='" << ToString(to) << "', updated_at=NOW(6) WHERE id=" << game_id
               << " AND session_id=" << session_id << " AND status='" << ToString(from) << "';";
    return db_client_->Execute(conn, update_sql.str(), "경기 상태 갱신 실패") == 1;
  });
}

bool MariaDbSessionStore::LockSession(MYSQL* conn, int session_id) const {
  std::ostringstream lock_sql;
  lock_sql << "SELECT id FROM sessions WHERE id=" << session_id << " FOR UPDATE;";
  return !db_client_->Query(conn, lock_sql.str(), "세션 잠금 실패").empty();
}

StoredGame MariaDbSessionStore::BuildGame(const DbRow& row) const {
  StoredGame game;
  game.game_id = ToInt(row[0]);
  game.session_id = ToInt(row[1]);
  game.game_number = ToInt(row[2]);
  game.record.team_a = Team{ToInt(row[3]), ToInt(row[4])};
  game.record.team_b = Team{ToInt(row[5]), ToInt(row[6])};
  game.record.status = ParseMatchStatus(row[7].value_or("completed")).value_or(MatchStatus::kCompleted);
  return game;
}

}  // namespace rotation
