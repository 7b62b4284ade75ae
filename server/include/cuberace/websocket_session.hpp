/*
 * 설명: WebSocket 연결의 메시지 처리, 백프레셔, 경주 이벤트 전달을 관리한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol.md
 * 테스트: server/tests/e2e/race_flow_test.cpp
 */
#pragma once

#include <deque>
#include <memory>
#include <string>
#include <string_view>

#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>

#include "cuberace/protocol.hpp"
#include "cuberace/race_service.hpp"
#include "cuberace/realtime.hpp"

namespace cuberace {

class WebSocketSession : public std::enable_shared_from_this<WebSocketSession> {
 public:
  WebSocketSession(boost::beast::websocket::stream<boost::beast::tcp_stream> ws, std::string player_id,
                   std::shared_ptr<RealtimeCoordinator> coordinator, std::shared_ptr<RaceService> race_service,
                   std::size_t max_queue_messages, std::size_t max_queue_bytes);
  ~WebSocketSession();
  void Run();

  // 다른 strand에서 호출해도 된다. 세션 strand로 게시된다.
  void SendServerEvent(const std::string& event, const nlohmann::json& payload);
  void SendServerError(const std::string& code, const std::string& message, const nlohmann::json& detail);
  void SendFrame(std::shared_ptr<const std::string> frame);

 private:
  void DoRead();
  void OnRead(boost::beast::error_code ec, std::size_t bytes_transferred);
  void SendError(std::string_view code, std::string_view message, std::uint64_t seq);
  void EnqueueMessage(std::shared_ptr<const std::string> message);
  void WriteNext();
  void OnWrite(boost::beast::error_code ec);
  void TriggerBackpressureClose();

  boost::beast::websocket::stream<boost::beast::tcp_stream> ws_;
  boost::beast::flat_buffer buffer_;
  std::string player_id_;
  std::shared_ptr<RealtimeCoordinator> coordinator_;
  std::shared_ptr<RaceService> race_service_;
  std::deque<std::shared_ptr<const std::string>> send_queue_;
  std::size_t queued_bytes_{0};
  bool writing_{false};
  bool closing_{false};
  std::size_t max_queue_messages_;
  std::size_t max_queue_bytes_;
};

}  // namespace cuberace
