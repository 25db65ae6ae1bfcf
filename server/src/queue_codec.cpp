/*
 * 설명: 큐 생성 요청 본문을 파싱하고 결과/경기를 JSON 으로 직렬화한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/queue_codec_test.cpp
 */
#include "rotation/queue_codec.hpp"

#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>

namespace rotation {
namespace {
// JSON 정수를 int 범위로 읽는다. 범위를 벗어난 값은 잘라내지 않고 거부한다.
int ReadInt(const nlohmann::json& value, const char* what) {
  if (!value.is_number_integer()) {
    throw std::invalid_argument(std::string(what) + " 는 정수여야 합니다");
  }
  if (value.is_number_unsigned()) {
    if (value.get<std::uint64_t>() > static_cast<std::uint64_t>(std::numeric_limits<int>::max())) {
      throw std::invalid_argument(std::string(what) + " 가 허용 범위를 벗어났습니다");
    }
    return static_cast<int>(value.get<std::uint64_t>());
  }
  const auto raw = value.get<std::int64_t>();
  if (raw < std::numeric_limits<int>::min() || raw > std::numeric_limits<int>::max()) {
    throw std::invalid_argument(std::string(what) + " 가 허용 범위를 벗어났습니다");
  }
  return static_cast<int>(raw);
}

ParticipantId ReadId(const nlohmann::json& value, const char* what) { return ReadInt(value, what); }

Team ReadTeam(const nlohmann::json& j, const char* key) {
  if (!j.contains(key) || !j[key].is_array() || j[key].size() != 2) {
    throw std::invalid_argument(std::string(key) + " 는 2명으로 구성된 배열이어야 합니다");
  }
  return Team{ReadId(j[key][0], key), ReadId(j[key][1], key)};
}

nlohmann::json TeamJson(const Team& team) { return nlohmann::json::array({team[0], team[1]}); }
}  // namespace

Participant ParticipantFromJson(const nlohmann::json& j) {
  if (!j.is_object() || !j.contains("id")) {
    throw std::invalid_argument("참가자에는 id 가 필요합니다");
  }
  Participant p;
  p.id = ReadId(j["id"], "id");
  if (j.contains("name")) {
    if (!j["name"].is_string()) {
      throw std::invalid_argument("name 은 문자열이어야 합니다");
    }
    p.name = j["name"].get<std::string>();
  }
  if (j.contains("lifetimeMatches")) {
    p.lifetime_matches = ReadInt(j["lifetimeMatches"], "lifetimeMatches");
  }
  return p;
}

MatchRecord MatchRecordFromJson(const nlohmann::json& j) {
  if (!j.is_object()) {
    throw std::invalid_argument("경기 기록은 객체여야 합니다");
  }
  MatchRecord record;
  record.team_a = ReadTeam(j, "teamA");
  record.team_b = ReadTeam(j, "teamB");
  if (j.contains("status")) {
    if (!j["status"].is_string()) {
      throw std::invalid_argument("status 는 문자열이어야 합니다");
    }
    auto status = ParseMatchStatus(j["status"].get<std::string>());
    if (!status) {
      throw std::invalid_argument("알 수 없는 status 입니다");
    }
    record.status = *status;
  }
  return record;
}

QueueRequest ParseQueueRequest(const nlohmann::json& body) {
  if (!body.is_object() || !body.contains("participants") || !body["participants"].is_array()) {
    throw std::invalid_argument("participants 배열이 필요합니다");
  }
  QueueRequest request;
  for (const auto& entry : body["participants"]) {
    request.participants.push_back(ParticipantFromJson(entry));
  }
  if (body.contains("matches")) {
    if (!body["matches"].is_array()) {
      throw std::invalid_argument("matches 는 배열이어야 합니다");
    }
    for (const auto& entry : body["matches"]) {
      request.matches.push_back(MatchRecordFromJson(entry));
    }
  }
  if (body.contains("maxRounds")) {
    const auto& rounds = body["maxRounds"];
    if (!rounds.is_number_unsigned() || rounds.get<std::uint64_t>() == 0 ||
        rounds.get<std::uint64_t>() > QueueBuilder::kMaxRoundLimit) {
      throw std::invalid_argument("maxRounds 는 1 이상 " + std::to_string(QueueBuilder::kMaxRoundLimit) +
                                  " 이하의 정수여야 합니다");
    }
    request.max_rounds = static_cast<std::size_t>(rounds.get<std::uint64_t>());
  }
  return request;
}

nlohmann::json ToJson(const Candidate& candidate) {
  return nlohmann::json{{"teamA", TeamJson(candidate.team_a)}, {"teamB", TeamJson(candidate.team_b)}};
}

nlohmann::json ToJson(const ScoredCandidate& scored) {
  auto j = ToJson(scored.candidate);
  j["score"] = scored.score;
  return j;
}

nlohmann::json ToJson(const QueueResult& result) {
  nlohmann::json queue = nlohmann::json::array();
  for (const auto& scored : result.queue) {
    queue.push_back(ToJson(scored));
  }
  nlohmann::json usage = nlohmann::json::array();
  for (const auto& entry : result.usage) {
    usage.push_back({{"id", entry.id}, {"count", entry.count}});
  }
  return nlohmann::json{{"queue", queue},
                        {"usage", usage},
                        {"outcome", std::string(ToString(result.outcome))},
                        {"roundsScored", result.rounds_scored},
                        {"candidatesScored", result.candidates_scored}};
}

nlohmann::json ToJson(const StoredGame& game) {
  return nlohmann::json{{"gameId", game.game_id},
                        {"sessionId", game.session_id},
                        {"gameNumber", game.game_number},
                        {"teamA", TeamJson(game.record.team_a)},
                        {"teamB", TeamJson(game.record.team_b)},
                        {"status", std::string(ToString(game.record.status))}};
}

}  // namespace rotation
