/*
 * 설명: HTTP 요청을 읽어 큐 미리보기, 세션 큐 생성, 참가자/경기 상태 전환, 메트릭 엔드포인트로 분기한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/queue_preview_test.cpp
 */
#include "rotation/http_session.hpp"

#include <limits>
#include <sstream>
#include <unordered_map>

#include <boost/beast/version.hpp>

#include "rotation/api_response.hpp"
#include "rotation/db_client.hpp"
#include "rotation/queue_codec.hpp"

namespace rotation {

namespace {
namespace http = boost::beast::http;

constexpr const char* kServiceVersion = "v1.0.0";

std::vector<std::string> SplitPath(const std::string& path) {
  std::vector<std::string> segments;
  std::size_t pos = 0;
  while (pos < path.size()) {
    auto slash = path.find('/', pos);
    auto end = slash == std::string::npos ? path.size() : slash;
    if (end > pos) {
      segments.push_back(path.substr(pos, end - pos));
    }
    pos = end + 1;
  }
  return segments;
}

std::optional<int> ParsePositiveId(const std::string& value) {
  try {
    std::size_t idx = 0;
    auto parsed = std::stol(value, &idx);
    if (idx != value.size() || parsed <= 0 || parsed > std::numeric_limits<int>::max()) {
      return std::nullopt;
    }
    return static_cast<int>(parsed);
  } catch (const std::exception&) {
    return std::nullopt;
  }
}

http::status StatusForError(const std::string& code) {
  static const std::unordered_map<std::string, http::status> kStatuses{
      {"bad_request", http::status::bad_request},
      {"invalid_participants", http::status::bad_request},
      {"too_many_players", http::status::bad_request},
      {"session_not_found", http::status::not_found},
      {"participant_not_found", http::status::not_found},
      {"game_not_found", http::status::not_found},
      {"not_enough_players", http::status::conflict},
      {"queue_exhausted", http::status::conflict},
      {"session_closed", http::status::conflict},
      {"queue_empty", http::status::conflict},
      {"invalid_transition", http::status::conflict},
      {"roster_changed", http::status::conflict},
  };
  auto it = kStatuses.find(code);
  return it == kStatuses.end() ? http::status::bad_request : it->second;
}

nlohmann::json GamesJson(const std::vector<StoredGame>& games) {
  nlohmann::json list = nlohmann::json::array();
  for (const auto& game : games) {
    list.push_back(ToJson(game));
  }
  return list;
}
}  // namespace

HttpSession::HttpSession(boost::asio::ip::tcp::socket socket, const AppConfig& config,
                         std::shared_ptr<RotationService> rotation_service,
                         std::shared_ptr<Observability> observability)
    : stream_(std::move(socket)), config_(config), rotation_service_(std::move(rotation_service)),
      observability_(std::move(observability)) {}

void HttpSession::Run() { DoRead(); }

void HttpSession::DoRead() {
  auto self = shared_from_this();
  req_ = {};
  stream_.expires_after(std::chrono::seconds(30));
  http::async_read(stream_, buffer_, req_, [self](boost::beast::error_code ec, std::size_t bytes_transferred) {
    self->OnRead(ec, bytes_transferred);
  });
}

void HttpSession::OnRead(boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
  if (ec == http::error::end_of_stream) {
    boost::beast::error_code ignored;
    stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ignored);
    return;
  }
  if (ec) {
    return;
  }
  HandleRequest();
}

void HttpSession::HandleRequest() {
  request_start_ = std::chrono::steady_clock::now();
  trace_id_ = observability_ ? observability_->NextTraceId() : std::string{};
  log_session_id_.reset();
  if (observability_) {
    observability_->IncrementRequest();
  }
  auto res = std::make_shared<Response>();
  res->version(req_.version());
  res->set(http::field::server, "court-rotation");
  res->set(http::field::content_type, "application/json; charset=utf-8");

  std::string target_str = std::string(req_.target());
  auto qpos = target_str.find('?');
  std::string path = qpos == std::string::npos ? target_str : target_str.substr(0, qpos);

  try {
    Route(path, *res);
  } catch (const DbException& ex) {
    if (observability_) {
      LogContext ctx;
      ctx.trace_id = trace_id_;
      ctx.session_id = log_session_id_;
      ctx.name = "storage.error";
      ctx.level = LogLevel::kError;
      ctx.fields = {{"code", ex.code}, {"message", ex.what()}};
      observability_->Log(ctx);
    }
    WriteError(*res, http::status::service_unavailable, "storage_error", "저장소에 접근할 수 없습니다");
  } catch (const std::exception& ex) {
    if (observability_) {
      LogContext ctx;
      ctx.trace_id = trace_id_;
      ctx.session_id = log_session_id_;
      ctx.name = "request.failed";
      ctx.level = LogLevel::kError;
      ctx.fields = {{"path", path}, {"message", ex.what()}};
      observability_->Log(ctx);
    }
    WriteError(*res, http::status::internal_server_error, "internal_error", "요청을 처리하지 못했습니다");
  }
  SendResponse(res);
}

void HttpSession::Route(const std::string& path, Response& res) {
  if (req_.method() == http::verb::get && path == "/api/health") {
    return WriteSuccess(res, http::status::ok, {{"status", "ok"}, {"version", kServiceVersion}});
  }

  if (req_.method() == http::verb::get && path == "/metrics") {
    auto snapshot = observability_->Snapshot();
    nlohmann::json data{{"requests", {{"total", snapshot.request_total}, {"errors", snapshot.request_errors}}},
                        {"queues",
                         {{"generated", snapshot.queues_generated},
                          {"gamesQueued", snapshot.games_queued},
                          {"candidatesScored", snapshot.candidates_scored}}}};
    return WriteSuccess(res, http::status::ok, data);
  }

  if (req_.method() == http::verb::get && path == "/ops/status") {
    auto header_it = req_.base().find("X-Ops-Token");
    std::string header_token = header_it == req_.base().end() ? std::string() : std::string(header_it->value());
    if (config_.ops_token.empty() || header_token != config_.ops_token) {
      return WriteError(res, http::status::unauthorized, "unauthorized", "운영 토큰이 올바르지 않습니다");
    }
    auto snapshot = observability_->Snapshot();
    const auto& queue_config = rotation_service_->GetQueueConfig();
    nlohmann::json data{{"requestTotal", snapshot.request_total},
                        {"errorCount", snapshot.request_errors},
                        {"queuesGenerated", snapshot.queues_generated},
                        {"limits",
                         {{"maxRounds", queue_config.max_rounds},
                          {"recencyWindow", queue_config.recency_window},
                          {"maxActiveParticipants", rotation_service_->MaxActiveParticipants()},
                          {"scoringThreads", queue_config.scoring_threads}}}};
    return WriteSuccess(res, http::status::ok, data);
  }

  if (req_.method() == http::verb::post && path == "/api/queue/preview") {
    QueueRequest request;
    try {
      request = ParseQueueRequest(nlohmann::json::parse(req_.body()));
    } catch (const std::exception& ex) {
      return WriteError(res, http::status::bad_request, "bad_request", ex.what());
    }
    std::string error_code;
    std::string error_message;
    auto result =
        rotation_service_->Preview(request.participants, request.matches, request.max_rounds, error_code, error_message);
    if (!result) {
      return WriteError(res, StatusForError(error_code), error_code, error_message);
    }
    return WriteSuccess(res, http::status::ok, ToJson(*result));
  }

  auto segments = SplitPath(path);
  if (segments.size() >= 3 && segments[0] == "api" && segments[1] == "sessions") {
    return HandleSessionRoute(segments, res);
  }

  WriteError(res, http::status::not_found, "not_found", "지원되지 않는 경로입니다");
}

void HttpSession::HandleSessionRoute(const std::vector<std::string>& segments, Response& res) {
  auto session_id = ParsePositiveId(segments[2]);
  if (!session_id) {
    return WriteError(res, http::status::bad_request, "bad_request", "세션 id 가 올바르지 않습니다");
  }
  log_session_id_ = *session_id;
  std::string error_code;
  std::string error_message;
  const auto method = req_.method();

  // POST /api/sessions/{id}/queue
  if (method == http::verb::post && segments.size() == 4 && segments[3] == "queue") {
    auto generated = rotation_service_->GenerateForSession(*session_id, error_code, error_message);
    if (!generated) {
      return WriteError(res, StatusForError(error_code), error_code, error_message);
    }
    nlohmann::json data{{"sessionId", *session_id},
                        {"games", GamesJson(generated->games)},
                        {"outcome", std::string(ToString(generated->result.outcome))}};
    return WriteSuccess(res, http::status::created, data);
  }

  // GET /api/sessions/{id}/games
  if (method == http::verb::get && segments.size() == 4 && segments[3] == "games") {
    auto games = rotation_service_->ListGames(*session_id, error_code, error_message);
    if (!games) {
      return WriteError(res, StatusForError(error_code), error_code, error_message);
    }
    nlohmann::json counts = nlohmann::json::array();
    for (const auto& entry : games->games_per_participant) {
      counts.push_back({{"id", entry.first}, {"games", entry.second}});
    }
    nlohmann::json data{{"sessionId", *session_id},
                        {"queued", GamesJson(games->queued)},
                        {"playing", GamesJson(games->playing)},
                        {"completed", GamesJson(games->completed)},
                        {"participantGames", counts}};
    return WriteSuccess(res, http::status::ok, data);
  }

  // POST /api/sessions/{id}/games/start
  if (method == http::verb::post && segments.size() == 5 && segments[3] == "games" && segments[4] == "start") {
    auto game = rotation_service_->StartNextGame(*session_id, error_code, error_message);
    if (!game) {
      return WriteError(res, StatusForError(error_code), error_code, error_message);
    }
    return WriteSuccess(res, http::status::ok, ToJson(*game));
  }

  // POST /api/sessions/{id}/games/{gameId}/complete
  if (method == http::verb::post && segments.size() == 6 && segments[3] == "games" && segments[5] == "complete") {
    auto game_id = ParsePositiveId(segments[4]);
    if (!game_id) {
      return WriteError(res, http::status::bad_request, "bad_request", "경기 id 가 올바르지 않습니다");
    }
    auto game = rotation_service_->CompleteGame(*session_id, *game_id, error_code, error_message);
    if (!game) {
      return WriteError(res, StatusForError(error_code), error_code, error_message);
    }
    return WriteSuccess(res, http::status::ok, ToJson(*game));
  }

  // POST /api/sessions/{id}/players/{playerId}/status
  if (method == http::verb::post && segments.size() == 6 && segments[3] == "players" && segments[5] == "status") {
    auto player_id = ParsePositiveId(segments[4]);
    std::optional<ParticipantStatus> status;
    try {
      auto body_json = nlohmann::json::parse(req_.body());
      if (body_json.contains("status") && body_json["status"].is_string()) {
        status = ParseParticipantStatus(body_json["status"].get<std::string>());
      }
    } catch (const nlohmann::json::exception&) {
      status.reset();
    }
    if (!player_id || !status) {
      return WriteError(res, http::status::bad_request, "bad_request", "참가자 id 또는 status 가 올바르지 않습니다");
    }
    std::size_t removed = 0;
    if (!rotation_service_->SetParticipantStatus(*session_id, *player_id, *status, removed, error_code,
                                                 error_message)) {
      return WriteError(res, StatusForError(error_code), error_code, error_message);
    }
    nlohmann::json data{{"playerId", *player_id},
                        {"status", std::string(ToString(*status))},
                        {"removedQueuedGames", removed}};
    return WriteSuccess(res, http::status::ok, data);
  }

  WriteError(res, http::status::not_found, "not_found", "지원되지 않는 경로입니다");
}

void HttpSession::WriteSuccess(Response& res, http::status status, const nlohmann::json& data) {
  res.result(status);
  res.body() = MakeSuccessEnvelope(data, trace_id_).dump();
  res.content_length(res.body().size());
}

void HttpSession::WriteError(Response& res, http::status status, const std::string& code,
                             const std::string& message) {
  res.result(status);
  res.body() = MakeErrorEnvelope(code, message, nullptr, trace_id_).dump();
  res.content_length(res.body().size());
}

void HttpSession::SendResponse(std::shared_ptr<Response> res) {
  auto self = shared_from_this();
  if (observability_) {
    if (static_cast<unsigned>(res->result_int()) >= 400) {
      observability_->IncrementError();
    }
    auto latency = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - request_start_)
                       .count();
    LogContext ctx;
    ctx.trace_id = trace_id_;
    ctx.session_id = log_session_id_;
    ctx.name = std::string(req_.target());
    ctx.latency_ms = static_cast<long>(latency);
    ctx.fields = {{"method", std::string(req_.method_string())}, {"status", res->result_int()}};
    observability_->Log(ctx);
  }
  http::async_write(stream_, *res, [self, res](boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
    if (ec) {
      return;
    }
    self->stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ec);
  });
}

}  // namespace rotation
