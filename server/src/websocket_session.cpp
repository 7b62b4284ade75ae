/*
 * 설명: WebSocket 메시지를 읽어 경주 요청으로 전달하고 백프레셔를 지키며 서버 이벤트를 전송한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol.md
 * 테스트: server/tests/e2e/race_flow_test.cpp
 */
#include "cuberace/websocket_session.hpp"

#include <boost/asio/post.hpp>
#include <boost/beast/core/buffers_to_string.hpp>
#include <boost/beast/websocket.hpp>

namespace cuberace {

WebSocketSession::WebSocketSession(boost::beast::websocket::stream<boost::beast::tcp_stream> ws,
                                   std::string player_id, std::shared_ptr<RealtimeCoordinator> coordinator,
                                   std::shared_ptr<RaceService> race_service, std::size_t max_queue_messages,
                                   std::size_t max_queue_bytes)
    : ws_(std::move(ws)), player_id_(std::move(player_id)), coordinator_(std::move(coordinator)),
      race_service_(std::move(race_service)), max_queue_messages_(max_queue_messages),
      max_queue_bytes_(max_queue_bytes) {}

WebSocketSession::~WebSocketSession() {
  coordinator_->Unregister(player_id_, this);
  race_service_->Disconnect(player_id_);
}

void WebSocketSession::Run() {
  coordinator_->Register(player_id_, shared_from_this());
  race_service_->Connect(player_id_);
  DoRead();
}

void WebSocketSession::DoRead() {
  if (closing_) {
    return;
  }
  auto self = shared_from_this();
  ws_.async_read(buffer_, [self](boost::beast::error_code ec, std::size_t bytes_transferred) {
    self->OnRead(ec, bytes_transferred);
  });
}

void WebSocketSession::OnRead(boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
  if (ec == boost::beast::websocket::error::closed || closing_) {
    return;
  }
  if (ec) {
    return;
  }

  auto data = boost::beast::buffers_to_string(buffer_.data());
  buffer_.consume(buffer_.size());
  auto parsed = ParseClientMessage(data);
  if (!parsed.ok) {
    SendError("bad_request", parsed.error_message, parsed.message.seq);
    return DoRead();
  }

  switch (parsed.message.event) {
    case ClientEvent::kCommand:
      race_service_->SubmitCommand(player_id_, parsed.message.direction);
      break;
    case ClientEvent::kStartRace:
      race_service_->RequestStart(player_id_);
      break;
    case ClientEvent::kNextMap:
      race_service_->RequestNextMap(player_id_);
      break;
  }

  DoRead();
}

void WebSocketSession::SendError(std::string_view code, std::string_view message, std::uint64_t seq) {
  WsEnvelope env{.type = "error", .event = "", .seq = seq, .payload = {{"code", std::string(code)}, {"message", std::string(message)}}};
  EnqueueMessage(std::make_shared<const std::string>(ToWsJson(env).dump()));
}

void WebSocketSession::SendServerEvent(const std::string& event, const nlohmann::json& payload) {
  WsEnvelope env{.type = "event", .event = event, .seq = 0, .payload = payload};
  SendFrame(std::make_shared<const std::string>(ToWsJson(env).dump()));
}

void WebSocketSession::SendServerError(const std::string& code, const std::string& message,
                                       const nlohmann::json& detail) {
  nlohmann::json payload = detail.is_object() ? detail : nlohmann::json::object();
  payload["code"] = code;
  payload["message"] = message;
  WsEnvelope env{.type = "error", .event = "", .seq = 0, .payload = payload};
  SendFrame(std::make_shared<const std::string>(ToWsJson(env).dump()));
}

void WebSocketSession::SendFrame(std::shared_ptr<const std::string> frame) {
  boost::asio::post(ws_.get_executor(), [self = shared_from_this(), frame = std::move(frame)]() mutable {
    self->EnqueueMessage(std::move(frame));
  });
}

void WebSocketSession::EnqueueMessage(std::shared_ptr<const std::string> message) {
  if (closing_) {
    return;
  }
  const auto message_size = message->size();
  if (send_queue_.size() >= max_queue_messages_ || queued_bytes_ + message_size > max_queue_bytes_) {
    TriggerBackpressureClose();
    return;
  }
  send_queue_.push_back(std::move(message));
  queued_bytes_ += message_size;
  if (!writing_) {
    WriteNext();
  }
}

void WebSocketSession::WriteNext() {
  if (send_queue_.empty() || closing_) {
    return;
  }
  writing_ = true;
  auto self = shared_from_this();
  ws_.text(true);
  ws_.async_write(boost::asio::buffer(*send_queue_.front()),
                  [self](boost::beast::error_code ec, std::size_t /*bytes_transferred*/) { self->OnWrite(ec); });
}

void WebSocketSession::OnWrite(boost::beast::error_code ec) {
  if (!send_queue_.empty()) {
    queued_bytes_ -= send_queue_.front()->size();
    send_queue_.pop_front();
  }
  if (ec) {
    closing_ = true;
    return;
  }
  writing_ = false;
  if (!send_queue_.empty()) {
    WriteNext();
  }
}

void WebSocketSession::TriggerBackpressureClose() {
  if (closing_) {
    return;
  }
  closing_ = true;
  send_queue_.clear();
  queued_bytes_ = 0;
  boost::beast::websocket::close_reason reason{boost::beast::websocket::close_code::policy_error};
  reason.reason = "backpressure_exceeded";
  auto self = shared_from_this();
  ws_.async_close(reason, [self](boost::beast::error_code) {});
}

}  // namespace cuberace
