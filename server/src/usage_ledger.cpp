/*
 * 설명: 참가자별 큐 배정 카운터를 관리하고 최소값을 추적한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/queue_builder_test.cpp
 */
#include "rotation/usage_ledger.hpp"

#include <algorithm>
#include <limits>
#include <sstream>

namespace rotation {

UsageLedger::UsageLedger(const std::vector<Participant>& participants) {
  order_.reserve(participants.size());
  entries_.reserve(participants.size());
  for (const auto& p : participants) {
    order_.push_back(p.id);
    entries_[p.id] = Entry{0, p.lifetime_matches};
  }
}

const UsageLedger::Entry& UsageLedger::Find(ParticipantId id) const {
  auto it = entries_.find(id);
  if (it == entries_.end()) {
    std::ostringstream oss;
    oss << "활성 참가자가 아닙니다: " << id;
    throw ContractViolation(oss.str());
  }
  return it->second;
}

int UsageLedger::Usage(ParticipantId id) const { return Find(id).usage; }

int UsageLedger::LifetimeMatches(ParticipantId id) const { return Find(id).lifetime_matches; }

int UsageLedger::MaxUsage() const {
  int max_usage = 0;
  for (const auto& entry : entries_) {
    max_usage = std::max(max_usage, entry.second.usage);
  }
  return max_usage;
}

std::size_t UsageLedger::CountAtMinimum() const {
  std::size_t count = 0;
  for (const auto& entry : entries_) {
    if (entry.second.usage == min_usage_) {
      ++count;
    }
  }
  return count;
}

void UsageLedger::Commit(const Candidate& candidate) {
  const auto members = candidate.Members();
  for (ParticipantId id : members) {
    Find(id);
  }
  for (ParticipantId id : members) {
    ++entries_[id].usage;
  }
  RefreshMinimum();
}

void UsageLedger::RefreshMinimum() {
  if (entries_.empty()) {
    min_usage_ = 0;
    return;
  }
  int min_usage = std::numeric_limits<int>::max();
  for (const auto& entry : entries_) {
    min_usage = std::min(min_usage, entry.second.usage);
  }
  min_usage_ = min_usage;
}

std::vector<UsageEntry> UsageLedger::Snapshot() const {
  std::vector<UsageEntry> snapshot;
  snapshot.reserve(order_.size());
  for (ParticipantId id : order_) {
    snapshot.push_back(UsageEntry{id, entries_.at(id).usage});
  }
  return snapshot;
}

}  // namespace rotation
