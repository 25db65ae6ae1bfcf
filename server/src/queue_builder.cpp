/*
 * 설명: 라운드 루프, 공정성 사전 필터, 사용 카운터 누적을 포함한 큐 생성을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/queue_builder_test.cpp
 */
#include "rotation/queue_builder.hpp"

#include <algorithm>
#include <future>
#include <memory>
#include <string>

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>

namespace rotation {

std::string_view ToString(QueueOutcome outcome) {
  switch (outcome) {
    case QueueOutcome::kInsufficientParticipants:
      return "insufficient_participants";
    case QueueOutcome::kRoundLimit:
      return "round_limit";
    case QueueOutcome::kExhausted:
      return "exhausted";
  }
  return "exhausted";
}

QueueBuilder::QueueBuilder(QueueConfig config)
    : config_(config), scorer_(config.weights, config.recency_window) {
  if (config_.max_rounds == 0) {
    throw ContractViolation("max_rounds 는 1 이상이어야 합니다");
  }
  if (config_.max_rounds > kMaxRoundLimit) {
    throw ContractViolation("max_rounds 는 " + std::to_string(kMaxRoundLimit) + " 이하여야 합니다");
  }
  if (config_.recency_window == 0) {
    throw ContractViolation("recency_window 는 1 이상이어야 합니다");
  }
  if (config_.scoring_threads == 0) {
    config_.scoring_threads = 1;
  }
}

QueueResult QueueBuilder::Build(const std::vector<Participant>& active,
                                const std::vector<MatchRecord>& universe) const {
  ValidateParticipants(active);
  ValidateMatchRecords(universe);

  QueueResult result;
  if (active.size() < kMinParticipants) {
    result.outcome = QueueOutcome::kInsufficientParticipants;
    for (const auto& p : active) {
      result.usage.push_back(UsageEntry{p.id, 0});
    }
    return result;
  }

  std::vector<Participant> ordered = active;
  std::sort(ordered.begin(), ordered.end(),
            [](const Participant& lhs, const Participant& rhs) { return lhs.id < rhs.id; });

  CandidateEnumerator enumerator(ordered);
  UsageLedger ledger(active);
  std::vector<MatchRecord> working_universe = universe;
  std::set<Group> used_groups;
  // 4명 풀은 조합이 하나뿐이므로 같은 그룹을 다시 내지 않고 소진으로 끝낸다.
  // 5명 이상에서는 재사용을 막지 않고 반복/최근성 항으로만 억제한다.
  const bool exclude_used_groups = ordered.size() == kMinParticipants;
  const bool parallel =
      config_.scoring_threads > 1 && enumerator.CandidateCount() >= config_.parallel_threshold;

  result.outcome = QueueOutcome::kRoundLimit;
  while (result.queue.size() < config_.max_rounds) {
    ++result.rounds_scored;
    RoundInput input{enumerator, ledger, working_universe, used_groups,
                     ledger.CountAtMinimum() >= kFairnessPoolThreshold};
    RoundBest round = ScoreRound(input, parallel);
    result.candidates_scored += round.scored;
    if (!round.best) {
      result.outcome = QueueOutcome::kExhausted;
      break;
    }

    const Candidate& winner = round.best->candidate;
    if (exclude_used_groups) {
      Group group = winner.Members();
      std::sort(group.begin(), group.end());
      used_groups.insert(group);
    }
    ledger.Commit(winner);
    working_universe.push_back(winner.ToQueuedRecord());
    result.queue.push_back(*round.best);
  }

  result.usage = ledger.Snapshot();
  return result;
}

QueueBuilder::RoundBest QueueBuilder::ScoreRound(const RoundInput& input, bool parallel) const {
  if (!parallel) {
    return ScoreStripe(input, 0, 1);
  }

  const std::size_t stripes = config_.scoring_threads;
  boost::asio::thread_pool pool(stripes);
  std::vector<std::future<RoundBest>> futures;
  futures.reserve(stripes);
  for (std::size_t stripe = 0; stripe < stripes; ++stripe) {
    auto task = std::make_shared<std::packaged_task<RoundBest()>>(
        [this, &input, stripe, stripes]() { return ScoreStripe(input, stripe, stripes); });
    futures.push_back(task->get_future());
    boost::asio::post(pool, [task]() { (*task)(); });
  }
  pool.join();

  RoundBest merged;
  for (auto& future : futures) {
    Merge(merged, future.get());
  }
  return merged;
}

QueueBuilder::RoundBest QueueBuilder::ScoreStripe(const RoundInput& input, std::size_t stripe,
                                                  std::size_t stripes) const {
  RoundBest best;
  input.enumerator.ForEachGroup(
      [&](std::size_t ordinal, const Group& group,
          const std::array<Candidate, CandidateEnumerator::kSplitsPerGroup>& candidates) {
        if (ordinal % stripes != stripe) {
          return;
        }
        if (input.used_groups.count(group) > 0) {
          return;
        }
        if (input.fairness_filter && !PassesFairnessFilter(group, input.usage)) {
          return;
        }
        for (std::size_t split = 0; split < candidates.size(); ++split) {
          ScoredCandidate scored = scorer_.Score(candidates[split], input.usage, input.universe);
          ++best.scored;
          if (!best.best || scored.score < best.best->score) {
            best.best = scored;
            best.ordinal = ordinal * CandidateEnumerator::kSplitsPerGroup + split;
          }
        }
      });
  return best;
}

void QueueBuilder::Merge(RoundBest& into, const RoundBest& other) {
  into.scored += other.scored;
  if (!other.best) {
    return;
  }
  if (!into.best || other.best->score < into.best->score ||
      (other.best->score == into.best->score && other.ordinal < into.ordinal)) {
    into.best = other.best;
    into.ordinal = other.ordinal;
  }
}

bool QueueBuilder::PassesFairnessFilter(const Group& group, const UsageLedger& usage) {
  int at_minimum = 0;
  for (ParticipantId id : group) {
    if (usage.IsAtMinimum(id)) {
      ++at_minimum;
    }
  }
  return at_minimum >= kFairnessMinMembers;
}

}  // namespace rotation
