/*
 * 설명: 후보 매치 하나에 공정성/다양성 항목을 가중합한 점수를 매긴다. 낮을수록 좋다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/match_scorer_test.cpp
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "rotation/match_types.hpp"
#include "rotation/pairing_history.hpp"
#include "rotation/usage_ledger.hpp"

namespace rotation {

// 항목 간 우선순위가 유지되도록 큰 자릿수 차이를 둔다.
struct ScoringWeights {
  std::int64_t underused_bonus{1'000'000};
  std::int64_t usage_spread{100'000};
  std::int64_t usage_total{10'000};
  std::int64_t teammate_repeat{5'000};
  std::int64_t opponent_repeat{3'000};
  std::int64_t lifetime_load{100};
  std::int64_t recency{10};
};

std::int64_t WeightedTotal(const ScoreBreakdown& breakdown, const ScoringWeights& weights);

class MatchScorer {
 public:
  explicit MatchScorer(ScoringWeights weights = {}, std::size_t recency_window = kDefaultRecencyWindow);

  // universe 는 이력 + 이전 큐 + 이번 호출에서 확정된 경기를 오래된 순으로 이은 것.
  ScoreBreakdown Breakdown(const Candidate& candidate, const UsageLedger& usage,
                           const std::vector<MatchRecord>& universe) const;
  ScoredCandidate Score(const Candidate& candidate, const UsageLedger& usage,
                        const std::vector<MatchRecord>& universe) const;

 private:
  ScoringWeights weights_;
  std::size_t recency_window_;
};

}  // namespace rotation
