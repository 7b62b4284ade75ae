/*
 * 설명: 플레이어별 WebSocket 연결과 팀 소속을 관리하고 전체/팀/개인 이벤트 전달을 중계한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol.md
 * 테스트: server/tests/e2e/race_flow_test.cpp
 */
#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

#include "cuberace/observability.hpp"

namespace cuberace {

class WebSocketSession;

class RealtimeCoordinator {
 public:
  void SetObservability(const std::shared_ptr<Observability>& observability) { observability_ = observability; }
  std::string NextPlayerId();
  void Register(const std::string& player_id, const std::shared_ptr<WebSocketSession>& session);
  void Unregister(const std::string& player_id, const WebSocketSession* session);
  void AssignTeam(const std::string& player_id, const std::string& team_id);

  void SendEventToPlayer(const std::string& player_id, const std::string& event, const nlohmann::json& payload);
  void SendErrorToPlayer(const std::string& player_id, const std::string& code, const std::string& message,
                         const nlohmann::json& detail = nlohmann::json::object());
  // exclude_player_id 는 빈 문자열이면 팀 전원에게 보낸다.
  void SendEventToTeam(const std::string& team_id, const std::string& exclude_player_id, const std::string& event,
                       const nlohmann::json& payload);
  void Broadcast(const std::string& event, const nlohmann::json& payload);

 private:
  struct Entry {
    std::weak_ptr<WebSocketSession> session;
    const WebSocketSession* raw{nullptr};
    std::string team_id;
  };

  std::vector<std::shared_ptr<WebSocketSession>> CollectSessions(const std::string& team_id,
                                                                 const std::string& exclude_player_id) const;

  std::unordered_map<std::string, Entry> connections_;
  mutable std::mutex mutex_;
  std::shared_ptr<Observability> observability_;
  std::atomic<std::uint64_t> next_player_id_{1};
};

}  // namespace cuberace
