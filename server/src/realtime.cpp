/*
 * 설명: 플레이어별 WebSocket 세션을 관리하고 서버 이벤트를 안전하게 전달한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol.md
 * 테스트: server/tests/e2e/race_flow_test.cpp
 */
#include "cuberace/realtime.hpp"

#include <sstream>

#include "cuberace/protocol.hpp"
#include "cuberace/websocket_session.hpp"

namespace cuberace {

std::string RealtimeCoordinator::NextPlayerId() {
  std::ostringstream oss;
  oss << "player-" << next_player_id_.fetch_add(1);
  return oss.str();
}

void RealtimeCoordinator::Register(const std::string& player_id, const std::shared_ptr<WebSocketSession>& session) {
  std::lock_guard<std::mutex> lock(mutex_);
  connections_[player_id] = Entry{session, session.get(), {}};
  if (observability_) {
    observability_->SetWebsocketActive(connections_.size());
  }
}

void RealtimeCoordinator::Unregister(const std::string& player_id, const WebSocketSession* session) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = connections_.find(player_id);
  if (it == connections_.end()) {
    return;
  }
  if (it->second.raw == session) {
    connections_.erase(it);
    if (observability_) {
      observability_->SetWebsocketActive(connections_.size());
    }
  }
}

void RealtimeCoordinator::AssignTeam(const std::string& player_id, const std::string& team_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = connections_.find(player_id);
  if (it != connections_.end()) {
    it->second.team_id = team_id;
  }
}

void RealtimeCoordinator::SendEventToPlayer(const std::string& player_id, const std::string& event,
                                            const nlohmann::json& payload) {
  std::shared_ptr<WebSocketSession> session_ptr;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = connections_.find(player_id);
    if (it == connections_.end()) {
      return;
    }
    session_ptr = it->second.session.lock();
  }
  if (session_ptr) {
    session_ptr->SendServerEvent(event, payload);
  }
}

void RealtimeCoordinator::SendErrorToPlayer(const std::string& player_id, const std::string& code,
                                            const std::string& message, const nlohmann::json& detail) {
  std::shared_ptr<WebSocketSession> session_ptr;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = connections_.find(player_id);
    if (it == connections_.end()) {
      return;
    }
    session_ptr = it->second.session.lock();
  }
  if (session_ptr) {
    session_ptr->SendServerError(code, message, detail);
  }
}

void RealtimeCoordinator::SendEventToTeam(const std::string& team_id, const std::string& exclude_player_id,
                                          const std::string& event, const nlohmann::json& payload) {
  for (const auto& session : CollectSessions(team_id, exclude_player_id)) {
    session->SendServerEvent(event, payload);
  }
}

void RealtimeCoordinator::Broadcast(const std::string& event, const nlohmann::json& payload) {
  // 직렬화는 한 번만 하고 세션마다 같은 문자열을 큐에 넣는다.
  auto sessions = CollectSessions({}, {});
  if (sessions.empty()) {
    return;
  }
  auto frame = std::make_shared<const std::string>(
      ToWsJson(WsEnvelope{.type = "event", .event = event, .seq = 0, .payload = payload}).dump());
  for (const auto& session : sessions) {
    session->SendFrame(frame);
  }
}

std::vector<std::shared_ptr<WebSocketSession>> RealtimeCoordinator::CollectSessions(
    const std::string& team_id, const std::string& exclude_player_id) const {
  std::vector<std::shared_ptr<WebSocketSession>> sessions;
  std::lock_guard<std::mutex> lock(mutex_);
  sessions.reserve(connections_.size());
  for (const auto& entry : connections_) {
    // 팀 배정 전(init 전송 전) 연결은 제외한다.
    if (entry.second.team_id.empty()) {
      continue;
    }
    if (!team_id.empty() && entry.second.team_id != team_id) {
      continue;
    }
    if (!exclude_player_id.empty() && entry.first == exclude_player_id) {
      continue;
    }
    if (auto session = entry.second.session.lock()) {
      sessions.push_back(std::move(session));
    }
  }
  return sessions;
}

}  // namespace cuberace
