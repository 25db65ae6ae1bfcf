/*
 * 설명: HTTP 연결을 처리하고 큐 미리보기/세션 큐/경기 상태/운영 엔드포인트를 제공한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/queue_preview_test.cpp
 */
#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <nlohmann/json.hpp>

#include "rotation/config.hpp"
#include "rotation/observability.hpp"
#include "rotation/rotation_service.hpp"

namespace rotation {

class HttpSession : public std::enable_shared_from_this<HttpSession> {
 public:
  using Response = boost::beast::http::response<boost::beast::http::string_body>;

  HttpSession(boost::asio::ip::tcp::socket socket, const AppConfig& config,
              std::shared_ptr<RotationService> rotation_service, std::shared_ptr<Observability> observability);
  void Run();

 private:
  void DoRead();
  void OnRead(boost::beast::error_code ec, std::size_t bytes_transferred);
  void HandleRequest();
  void Route(const std::string& path, Response& res);
  void HandleSessionRoute(const std::vector<std::string>& segments, Response& res);
  void WriteSuccess(Response& res, boost::beast::http::status status, const nlohmann::json& data);
  void WriteError(Response& res, boost::beast::http::status status, const std::string& code,
                  const std::string& message);
  void SendResponse(std::shared_ptr<Response> res);

  boost::beast::tcp_stream stream_;
  boost::beast::flat_buffer buffer_;
  boost::beast::http::request<boost::beast::http::string_body> req_;
  AppConfig config_;
  std::shared_ptr<RotationService> rotation_service_;
  std::shared_ptr<Observability> observability_;
  std::chrono::steady_clock::time_point request_start_;
  std::string trace_id_;
  std::optional<int> log_session_id_;
};

}  // namespace rotation
