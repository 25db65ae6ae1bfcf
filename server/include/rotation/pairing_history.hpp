/*
 * 설명: 두 참가자의 팀원/상대 이력 집계와 최근 경기 기반 상호작용 점수를 계산한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/pairing_history_test.cpp
 */
#pragma once

#include <cstddef>
#include <vector>

#include "rotation/match_types.hpp"

namespace rotation {

constexpr std::size_t kDefaultRecencyWindow = 10;

struct PairingCounts {
  int teammates{0};
  int opponents{0};
};

// p1 == p2 이면 항상 {0, 0}.
PairingCounts PairingHistory(ParticipantId p1, ParticipantId p2, const std::vector<MatchRecord>& matches);

// recent 는 오래된 순서로 정렬되어 있어야 한다. 마지막 window 개 경기만 본다.
// 가장 최근 경기의 거리는 1 이며 가중치는 (window - distance + 1) * 2.
int InteractionScore(ParticipantId p1, ParticipantId p2, const std::vector<MatchRecord>& recent,
                     std::size_t window = kDefaultRecencyWindow);

}  // namespace rotation
