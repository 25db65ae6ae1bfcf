#pragma once

#include <algorithm>
#include <map>
#include <mutex>
#include <string>

#include "rotation/session_store.hpp"

namespace rotation_test {

// MariaDB 없이 서비스/HTTP 흐름을 검증하기 위한 메모리 저장소.
class MemorySessionStore : public rotation::SessionStore {
 public:
  void AddSession(int session_id, const std::vector<rotation::Participant>& participants, bool in_progress = true) {
    std::lock_guard<std::mutex> lock(mutex_);
    rotation::SessionSnapshot snapshot;
    snapshot.session_id = session_id;
    snapshot.in_progress = in_progress;
    for (const auto& p : participants) {
      snapshot.players.push_back(rotation::SessionPlayer{p, rotation::ParticipantStatus::kActive});
    }
    sessions_[session_id] = snapshot;
  }

  void AddGame(int session_id, const rotation::MatchRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& games = sessions_.at(session_id).games;
    games.push_back(rotation::StoredGame{next_game_id_++, session_id, NextNumber(games), record});
  }

  std::optional<rotation::SessionSnapshot> LoadSession(int session_id) override {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
      return std::nullopt;
    }
    return it->second;
  }

  rotation::AppendResult AppendQueuedGames(int session_id, const std::vector<rotation::Candidate>& candidates) override {
    std::lock_guard<std::mutex> lock(mutex_);
    rotation::AppendResult result;
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
      result.outcome = rotation::AppendOutcome::kSessionNotFound;
      return result;
    }
    for (const auto& candidate : candidates) {
      for (rotation::ParticipantId id : candidate.Members()) {
        if (!IsActive(it->second, id)) {
          result.outcome = rotation::AppendOutcome::kRosterChanged;
          return result;
        }
      }
    }
    for (const auto& candidate : candidates) {
      rotation::StoredGame game{next_game_id_++, session_id, NextNumber(it->second.games), candidate.ToQueuedRecord()};
      it->second.games.push_back(game);
      result.games.push_back(game);
    }
    return result;
  }

  bool SetParticipantStatus(int session_id, rotation::ParticipantId player_id,
                            rotation::ParticipantStatus status) override {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
      return false;
    }
    for (auto& player : it->second.players) {
      if (player.participant.id == player_id) {
        player.status = status;
        return true;
      }
    }
    return false;
  }

  std::size_t DeleteQueuedGamesWith(int session_id, rotation::ParticipantId player_id) override {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
      return 0;
    }
    auto& games = it->second.games;
    auto before = games.size();
    games.erase(std::remove_if(games.begin(), games.end(),
                               [player_id](const rotation::StoredGame& game) {
                                 return game.record.status == rotation::MatchStatus::kQueued &&
                                        game.record.Contains(player_id);
                               }),
                games.end());
    return before - games.size();
  }

  bool UpdateGameStatus(int session_id, int game_id, rotation::MatchStatus from, rotation::MatchStatus to) override {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
      return false;
    }
    for (auto& game : it->second.games) {
      if (game.game_id == game_id && game.record.status == from) {
        game.record.status = to;
        return true;
      }
    }
    return false;
  }

 private:
  static bool IsActive(const rotation::SessionSnapshot& session, rotation::ParticipantId id) {
    return std::any_of(session.players.begin(), session.players.end(), [id](const rotation::SessionPlayer& player) {
      return player.participant.id == id && player.status == rotation::ParticipantStatus::kActive;
    });
  }

  static int NextNumber(const std::vector<rotation::StoredGame>& games) {
    int max_number = 0;
    for (const auto& game : games) {
      max_number = std::max(max_number, game.game_number);
    }
    return max_number + 1;
  }

  std::mutex mutex_;
  std::map<int, rotation::SessionSnapshot> sessions_;
  int next_game_id_{1};
};

inline std::vector<rotation::Participant> MakeParticipants(int count, int first_id = 1) {
  std::vector<rotation::Participant> participants;
  for (int i = 0; i < count; ++i) {
    int id = first_id + i;
    participants.push_back(rotation::Participant{id, "player" + std::to_string(id), 0});
  }
  return participants;
}

}  // namespace rotation_test
