/*
 * 설명: k-조합 반복자와 후보 매치 열거기를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/candidate_enumerator_test.cpp
 */
#include "rotation/candidate_enumerator.hpp"

namespace rotation {

std::size_t CombinationCount(std::size_t n, std::size_t k) {
  if (k > n) {
    return 0;
  }
  if (k > n - k) {
    k = n - k;
  }
  std::size_t result = 1;
  for (std::size_t i = 1; i <= k; ++i) {
    result = result * (n - k + i) / i;
  }
  return result;
}

CombinationIterator::CombinationIterator(std::size_t n, std::size_t k) : n_(n), k_(k) {
  if (k_ == 0 || k_ > n_) {
    done_ = true;
    return;
  }
  indices_.resize(k_);
  for (std::size_t i = 0; i < k_; ++i) {
    indices_[i] = i;
  }
}

void CombinationIterator::Next() {
  if (done_) {
    return;
  }
  // 오른쪽에서부터 아직 올릴 수 있는 자리를 찾는다.
  std::size_t pos = k_;
  while (pos > 0) {
    --pos;
    if (indices_[pos] < n_ - k_ + pos) {
      ++indices_[pos];
      for (std::size_t j = pos + 1; j < k_; ++j) {
        indices_[j] = indices_[j - 1] + 1;
      }
      return;
    }
  }
  done_ = true;
}

CandidateEnumerator::CandidateEnumerator(const std::vector<Participant>& participants) {
  ids_.reserve(participants.size());
  for (const auto& p : participants) {
    ids_.push_back(p.id);
  }
}

void CandidateEnumerator::ForEachGroup(const GroupVisitor& visitor) const {
  std::size_t ordinal = 0;
  for (CombinationIterator it(ids_.size(), kGroupSize); !it.Done(); it.Next()) {
    const auto& idx = it.Indices();
    Group group{ids_[idx[0]], ids_[idx[1]], ids_[idx[2]], ids_[idx[3]]};
    visitor(ordinal, group, SplitsOf(group));
    ++ordinal;
  }
}

std::array<Candidate, CandidateEnumerator::kSplitsPerGroup> CandidateEnumerator::SplitsOf(const Group& group) {
  return {Candidate{{group[0], group[1]}, {group[2], group[3]}},
          Candidate{{group[0], group[2]}, {group[1], group[3]}},
          Candidate{{group[0], group[3]}, {group[1], group[2]}}};
}

}  // namespace rotation
