/*
 * 설명: 세션 참가 상태 문자열 변환을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/rotation_service_test.cpp
 */
#include "rotation/session_store.hpp"

namespace rotation {

std::string_view ToString(ParticipantStatus status) {
  return status == ParticipantStatus::kLeft ? "left" : "active";
}

std::optional<ParticipantStatus> ParseParticipantStatus(std::string_view text) {
  if (text == "active") {
    return ParticipantStatus::kActive;
  }
  if (text == "left") {
    return ParticipantStatus::kLeft;
  }
  return std::nullopt;
}

}  // namespace rotation
