/*
 * 설명: 큐 생성 요청/응답과 저장된 경기의 JSON 변환을 담당한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/queue_codec_test.cpp
 */
#pragma once

#include <cstddef>
#include <optional>
#include <vector>

#include <nlohmann/json.hpp>

#include "rotation/match_types.hpp"
#include "rotation/queue_builder.hpp"
#include "rotation/session_store.hpp"

namespace rotation {

struct QueueRequest {
  std::vector<Participant> participants;
  std::vector<MatchRecord> matches;
  std::optional<std::size_t> max_rounds;
};

// 형식이 맞지 않으면 std::invalid_argument 를 던진다.
QueueRequest ParseQueueRequest(const nlohmann::json& body);
Participant ParticipantFromJson(const nlohmann::json& j);
MatchRecord MatchRecordFromJson(const nlohmann::json& j);

nlohmann::json ToJson(const Candidate& candidate);
nlohmann::json ToJson(const ScoredCandidate& scored);
nlohmann::json ToJson(const QueueResult& result);
nlohmann::json ToJson(const StoredGame& game);

}  // namespace rotation
