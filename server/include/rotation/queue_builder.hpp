/*
 * 설명: 라운드마다 모든 후보를 채점해 최저 점수 매치를 확정하는 탐욕적 큐 생성기.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/queue_builder_test.cpp
 */
#pragma once

#include <cstddef>
#include <optional>
#include <set>
#include <string_view>
#include <vector>

#include "rotation/candidate_enumerator.hpp"
#include "rotation/match_scorer.hpp"
#include "rotation/match_types.hpp"
#include "rotation/usage_ledger.hpp"

namespace rotation {

enum class QueueOutcome { kInsufficientParticipants, kRoundLimit, kExhausted };

std::string_view ToString(QueueOutcome outcome);

struct QueueConfig {
  std::size_t max_rounds{3};
  std::size_t recency_window{kDefaultRecencyWindow};
  ScoringWeights weights;
  // 1 이면 순차 채점. 후보 수가 parallel_threshold 이상일 때만 스레드 풀을 쓴다.
  std::size_t scoring_threads{1};
  std::size_t parallel_threshold{4096};
};

struct QueueResult {
  std::vector<ScoredCandidate> queue;
  std::vector<UsageEntry> usage;
  QueueOutcome outcome{QueueOutcome::kInsufficientParticipants};
  std::size_t rounds_scored{0};
  std::size_t candidates_scored{0};
};

class QueueBuilder {
 public:
  static constexpr std::size_t kMinParticipants = CandidateEnumerator::kGroupSize;
  // 최소 배정 인원이 이 수 이상이면 최소 배정 인원이 3명 미만인 그룹은 채점하지 않는다.
  static constexpr std::size_t kFairnessPoolThreshold = 4;
  static constexpr int kFairnessMinMembers = 3;
  // 한 번의 호출에서 허용하는 max_rounds 상한.
  static constexpr std::size_t kMaxRoundLimit = 100;

  explicit QueueBuilder(QueueConfig config = {});

  // active 순서와 무관하게 id 오름차순으로 열거하며, 동점이면 먼저 열거된 후보가 이긴다.
  QueueResult Build(const std::vector<Participant>& active, const std::vector<MatchRecord>& universe) const;

  const QueueConfig& Config() const { return config_; }

 private:
  struct RoundBest {
    std::optional<ScoredCandidate> best;
    std::size_t ordinal{0};
    std::size_t scored{0};
  };

  struct RoundInput {
    const CandidateEnumerator& enumerator;
    const UsageLedger& usage;
    const std::vector<MatchRecord>& universe;
    const std::set<Group>& used_groups;
    bool fairness_filter;
  };

  RoundBest ScoreRound(const RoundInput& input, bool parallel) const;
  RoundBest ScoreStripe(const RoundInput& input, std::size_t stripe, std::size_t stripes) const;
  static void Merge(RoundBest& into, const RoundBest& other);
  static bool PassesFairnessFilter(const Group& group, const UsageLedger& usage);

  QueueConfig config_;
  MatchScorer scorer_;
};

}  // namespace rotation
