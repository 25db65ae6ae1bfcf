/*
 * 설명: 경기 기록을 순회하며 페어링 이력과 최근 상호작용 점수를 계산한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/pairing_history_test.cpp
 */
#include "rotation/pairing_history.hpp"

namespace rotation {
namespace {
bool OnTeam(const Team& team, ParticipantId id) { return team[0] == id || team[1] == id; }
}  // namespace

PairingCounts PairingHistory(ParticipantId p1, ParticipantId p2, const std::vector<MatchRecord>& matches) {
  PairingCounts counts;
  if (p1 == p2) {
    return counts;
  }
  for (const auto& match : matches) {
    bool p1_a = OnTeam(match.team_a, p1);
    bool p1_b = OnTeam(match.team_b, p1);
    bool p2_a = OnTeam(match.team_a, p2);
    bool p2_b = OnTeam(match.team_b, p2);
    if ((p1_a && p2_a) || (p1_b && p2_b)) {
      ++counts.teammates;
    } else if ((p1_a && p2_b) || (p1_b && p2_a)) {
      ++counts.opponents;
    }
  }
  return counts;
}

int InteractionScore(ParticipantId p1, ParticipantId p2, const std::vector<MatchRecord>& recent,
                     std::size_t window) {
  if (p1 == p2 || window == 0) {
    return 0;
  }
  const std::size_t total = recent.size();
  const std::size_t begin = total > window ? total - window : 0;
  int score = 0;
  for (std::size_t i = begin; i < total; ++i) {
    const auto& match = recent[i];
    if (!match.Contains(p1) || !match.Contains(p2)) {
      continue;
    }
    const std::size_t distance = total - i;
    score += static_cast<int>(window - distance + 1) * 2;
  }
  return score;
}

}  // namespace rotation
