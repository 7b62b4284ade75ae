/*
 * 설명: HTTP 연결을 처리하고 헬스체크/메트릭 엔드포인트와 WS 업그레이드를 제공한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol.md
 * 테스트: server/tests/e2e/race_flow_test.cpp
 */
#pragma once

#include <chrono>
#include <memory>
#include <string>

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>

#include "cuberace/config.hpp"
#include "cuberace/observability.hpp"
#include "cuberace/protocol.hpp"
#include "cuberace/race_service.hpp"
#include "cuberace/realtime.hpp"

namespace cuberace {

class HttpSession : public std::enable_shared_from_this<HttpSession> {
 public:
  using Response = boost::beast::http::response<boost::beast::http::string_body>;

  HttpSession(boost::asio::ip::tcp::socket socket, const AppConfig& config,
              std::shared_ptr<RealtimeCoordinator> coordinator, std::shared_ptr<RaceService> race_service,
              std::shared_ptr<Observability> observability);
  void Run();

 private:
  void DoRead();
  void OnRead(boost::beast::error_code ec, std::size_t bytes_transferred);
  void HandleRequest();
  void SendJson(std::shared_ptr<Response> res, boost::beast::http::status status, const nlohmann::json& body);
  void SendResponse(std::shared_ptr<Response> res);
  void HandleWebSocket();

  boost::beast::tcp_stream stream_;
  boost::beast::flat_buffer buffer_;
  boost::beast::http::request<boost::beast::http::string_body> req_;
  AppConfig config_;
  std::shared_ptr<RealtimeCoordinator> coordinator_;
  std::shared_ptr<RaceService> race_service_;
  std::shared_ptr<Observability> observability_;
  std::chrono::steady_clock::time_point request_start_;
  std::string trace_id_;
};

}  // namespace cuberace
