/*
 * 설명: 한 번의 큐 생성 호출 동안 참가자별 큐 배정 횟수를 누적한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/match_scorer_test.cpp, server/tests/unit/queue_builder_test.cpp
 */
#pragma once

#include <cstddef>
#include <unordered_map>
#include <vector>

#include "rotation/match_types.hpp"

namespace rotation {

struct UsageEntry {
  ParticipantId id{0};
  int count{0};
};

class UsageLedger {
 public:
  explicit UsageLedger(const std::vector<Participant>& participants);

  int Usage(ParticipantId id) const;
  int LifetimeMatches(ParticipantId id) const;
  int MinUsage() const { return min_usage_; }
  int MaxUsage() const;
  bool IsAtMinimum(ParticipantId id) const { return Usage(id) == min_usage_; }
  std::size_t CountAtMinimum() const;

  void Commit(const Candidate& candidate);

  // 생성자에 전달된 참가자 순서를 따른다.
  std::vector<UsageEntry> Snapshot() const;

 private:
  struct Entry {
    int usage{0};
    int lifetime_matches{0};
  };

  const Entry& Find(ParticipantId id) const;
  void RefreshMinimum();

  std::vector<ParticipantId> order_;
  std::unordered_map<ParticipantId, Entry> entries_;
  int min_usage_{0};
};

}  // namespace rotation
