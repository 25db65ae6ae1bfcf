/*
 * 설명: 활성 참가자에서 4인 조합과 조합별 2:2 팀 분할 3가지를 지연 열거한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/candidate_enumerator_test.cpp
 */
#pragma once

#include <array>
#include <cstddef>
#include <functional>
#include <vector>

#include "rotation/match_types.hpp"

namespace rotation {

std::size_t CombinationCount(std::size_t n, std::size_t k);

// 인덱스 기반 k-조합 반복자. 사전식 순서로 {0..k-1} 부터 {n-k..n-1} 까지 진행한다.
class CombinationIterator {
 public:
  CombinationIterator(std::size_t n, std::size_t k);

  bool Done() const { return done_; }
  const std::vector<std::size_t>& Indices() const { return indices_; }
  void Next();

 private:
  std::size_t n_;
  std::size_t k_;
  std::vector<std::size_t> indices_;
  bool done_{false};
};

class CandidateEnumerator {
 public:
  static constexpr std::size_t kGroupSize = 4;
  static constexpr std::size_t kSplitsPerGroup = 3;

  // ordinal 은 열거 순서상의 그룹 번호, candidates 는 그 그룹의 3가지 분할.
  using GroupVisitor = std::function<void(std::size_t ordinal, const Group& group,
                                          const std::array<Candidate, kSplitsPerGroup>& candidates)>;

  explicit CandidateEnumerator(const std::vector<Participant>& participants);

  std::size_t GroupCount() const { return CombinationCount(ids_.size(), kGroupSize); }
  std::size_t CandidateCount() const { return GroupCount() * kSplitsPerGroup; }

  void ForEachGroup(const GroupVisitor& visitor) const;

  // 첫 번째 구성원과 나머지 각각을 짝지은 분할 3가지.
  static std::array<Candidate, kSplitsPerGroup> SplitsOf(const Group& group);

 private:
  std::vector<ParticipantId> ids_;
};

}  // namespace rotation
