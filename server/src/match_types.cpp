/*
 * 설명: 경기 상태 문자열 변환과 입력 계약 검증을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/queue_builder_test.cpp, server/tests/unit/queue_codec_test.cpp
 */
#include "rotation/match_types.hpp"

#include <algorithm>
#include <sstream>
#include <unordered_set>

namespace rotation {

std::string_view ToString(MatchStatus status) {
  switch (status) {
    case MatchStatus::kQueued:
      return "queued";
    case MatchStatus::kPlaying:
      return "playing";
    case MatchStatus::kCompleted:
      return "completed";
  }
  return "completed";
}

std::optional<MatchStatus> ParseMatchStatus(std::string_view text) {
  if (text == "queued") {
    return MatchStatus::kQueued;
  }
  if (text == "playing") {
    return MatchStatus::kPlaying;
  }
  if (text == "completed") {
    return MatchStatus::kCompleted;
  }
  return std::nullopt;
}

bool MatchRecord::Contains(ParticipantId id) const {
  return team_a[0] == id || team_a[1] == id || team_b[0] == id || team_b[1] == id;
}

bool operator==(const Candidate& lhs, const Candidate& rhs) {
  return lhs.team_a == rhs.team_a && lhs.team_b == rhs.team_b;
}

bool HasDistinctMembers(const Group& group) {
  for (std::size_t i = 0; i < group.size(); ++i) {
    for (std::size_t j = i + 1; j < group.size(); ++j) {
      if (group[i] == group[j]) {
        return false;
      }
    }
  }
  return true;
}

void ValidateParticipants(const std::vector<Participant>& participants) {
  std::unordered_set<ParticipantId> seen;
  seen.reserve(participants.size());
  for (const auto& p : participants) {
    if (!seen.insert(p.id).second) {
      std::ostringstream oss;
      oss << "참가자 id 중복: " << p.id;
      throw ContractViolation(oss.str());
    }
    if (p.lifetime_matches < 0) {
      std::ostringstream oss;
      oss << "누적 경기 수가 음수입니다: " << p.id;
      throw ContractViolation(oss.str());
    }
  }
}

void ValidateMatchRecords(const std::vector<MatchRecord>& matches) {
  for (std::size_t i = 0; i < matches.size(); ++i) {
    if (!HasDistinctMembers(matches[i].Members())) {
      std::ostringstream oss;
      oss << "경기 기록 " << i << "에 같은 참가자가 두 번 이상 있습니다";
      throw ContractViolation(oss.str());
    }
  }
}

}  // namespace rotation
