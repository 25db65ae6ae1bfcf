/*
 * 설명: 참가자, 경기 기록, 후보 매치 등 스케줄러가 다루는 고정 형태 값 타입을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/pairing_history_test.cpp, server/tests/unit/queue_builder_test.cpp
 */
#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace rotation {

using ParticipantId = int;
using Team = std::array<ParticipantId, 2>;
using Group = std::array<ParticipantId, 4>;

struct Participant {
  ParticipantId id{0};
  std::string name;
  int lifetime_matches{0};
};

enum class MatchStatus { kQueued, kPlaying, kCompleted };

std::string_view ToString(MatchStatus status);
std::optional<MatchStatus> ParseMatchStatus(std::string_view text);

struct MatchRecord {
  Team team_a{};
  Team team_b{};
  MatchStatus status{MatchStatus::kCompleted};

  bool Contains(ParticipantId id) const;
  Group Members() const { return {team_a[0], team_a[1], team_b[0], team_b[1]}; }
};

struct Candidate {
  Team team_a{};
  Team team_b{};

  Group Members() const { return {team_a[0], team_a[1], team_b[0], team_b[1]}; }
  MatchRecord ToQueuedRecord() const { return MatchRecord{team_a, team_b, MatchStatus::kQueued}; }
};

bool operator==(const Candidate& lhs, const Candidate& rhs);
inline bool operator!=(const Candidate& lhs, const Candidate& rhs) { return !(lhs == rhs); }

// 가중치를 곱하기 전의 항목별 원시 값.
struct ScoreBreakdown {
  int underused_members{0};
  int usage_spread{0};
  int usage_total{0};
  int teammate_repeats{0};
  int opponent_repeats{0};
  // 구성원 4명의 누적 경기 수 합. 각 값이 int 최대치여도 넘치지 않도록 64비트로 더한다.
  std::int64_t lifetime_matches{0};
  int recency{0};
};

struct ScoredCandidate {
  Candidate candidate;
  std::int64_t score{0};
  ScoreBreakdown breakdown;
};

// 호출자가 지켜야 할 입력 계약(중복 id, 음수 카운터 등)이 깨졌을 때 던진다.
class ContractViolation : public std::invalid_argument {
 public:
  explicit ContractViolation(const std::string& message) : std::invalid_argument(message) {}
};

bool HasDistinctMembers(const Group& group);
void ValidateParticipants(const std::vector<Participant>& participants);
void ValidateMatchRecords(const std::vector<MatchRecord>& matches);

}  // namespace rotation
