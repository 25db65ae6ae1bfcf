/*
 * 설명: JSON 응답 엔벨로프를 생성한다. meta 에는 시각과 추적 id 를 담는다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/json_envelope_test.cpp
 */
#include "rotation/api_response.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace rotation {
namespace {
std::string CurrentTimestamp() {
  using clock = std::chrono::system_clock;
  auto itt = clock::to_time_t(clock::now());
  std::ostringstream ss;
  ss << std::put_time(std::gmtime(&itt), "%FT%TZ");
  return ss.str();
}

nlohmann::json BuildMeta(std::string_view trace_id) {
  nlohmann::json meta{{"timestamp", CurrentTimestamp()}};
  if (!trace_id.empty()) {
    meta["traceId"] = std::string(trace_id);
  }
  return meta;
}
}  // namespace

nlohmann::json MakeSuccessEnvelope(const nlohmann::json& data, std::string_view trace_id) {
  nlohmann::json envelope;
  envelope["success"] = true;
  envelope["data"] = data;
  envelope["error"] = nullptr;
  envelope["meta"] = BuildMeta(trace_id);
  return envelope;
}

nlohmann::json MakeErrorEnvelope(std::string_view code, std::string_view message, const nlohmann::json& detail,
                                 std::string_view trace_id) {
  nlohmann::json envelope;
  envelope["success"] = false;
  envelope["data"] = nullptr;
  envelope["error"] = {{"code", std::string(code)}, {"message", std::string(message)}, {"detail", detail}};
  envelope["meta"] = BuildMeta(trace_id);
  return envelope;
}

}  // namespace rotation
