/*
 * 설명: 후보 매치의 항목별 원시 값을 모으고 가중합 점수를 계산한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/match_scorer_test.cpp
 */
#include "rotation/match_scorer.hpp"

#include <algorithm>

namespace rotation {

std::int64_t WeightedTotal(const ScoreBreakdown& b, const ScoringWeights& w) {
  std::int64_t total = 0;
  total -= static_cast<std::int64_t>(b.underused_members) * w.underused_bonus;
  total += static_cast<std::int64_t>(b.usage_spread) * w.usage_spread;
  total += static_cast<std::int64_t>(b.usage_total) * w.usage_total;
  total += static_cast<std::int64_t>(b.teammate_repeats) * w.teammate_repeat;
  total += static_cast<std::int64_t>(b.opponent_repeats) * w.opponent_repeat;
  total += b.lifetime_matches * w.lifetime_load;
  total += static_cast<std::int64_t>(b.recency) * w.recency;
  return total;
}

MatchScorer::MatchScorer(ScoringWeights weights, std::size_t recency_window)
    : weights_(weights), recency_window_(recency_window) {}

ScoreBreakdown MatchScorer::Breakdown(const Candidate& candidate, const UsageLedger& usage,
                                      const std::vector<MatchRecord>& universe) const {
  ScoreBreakdown b;
  const Group members = candidate.Members();

  int min_in_group = usage.Usage(members[0]);
  int max_in_group = min_in_group;
  for (ParticipantId id : members) {
    int count = usage.Usage(id);
    if (usage.IsAtMinimum(id)) {
      ++b.underused_members;
    }
    min_in_group = std::min(min_in_group, count);
    max_in_group = std::max(max_in_group, count);
    b.usage_total += count;
    b.lifetime_matches += usage.LifetimeMatches(id);
  }
  b.usage_spread = max_in_group - min_in_group;

  b.teammate_repeats += PairingHistory(candidate.team_a[0], candidate.team_a[1], universe).teammates;
  b.teammate_repeats += PairingHistory(candidate.team_b[0], candidate.team_b[1], universe).teammates;

  for (ParticipantId a : candidate.team_a) {
    for (ParticipantId other : candidate.team_b) {
      b.opponent_repeats += PairingHistory(a, other, universe).opponents;
    }
  }

  for (std::size_t i = 0; i < members.size(); ++i) {
    for (std::size_t j = i + 1; j < members.size(); ++j) {
      b.recency += InteractionScore(members[i], members[j], universe, recency_window_);
    }
  }
  return b;
}

ScoredCandidate MatchScorer::Score(const Candidate& candidate, const UsageLedger& usage,
                                   const std::vector<MatchRecord>& universe) const {
  ScoredCandidate scored;
  scored.candidate = candidate;
  scored.breakdown = Breakdown(candidate, usage, universe);
  scored.score = WeightedTotal(scored.breakdown, weights_);
  return scored;
}

}  // namespace rotation
