/*
 * 설명: 경주 엔진을 단일 strand에서 소유하며 틱 루프, 승리 후 지연 리셋, 입력/시작/맵 변경 요청을 직렬화한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol.md
 * 테스트: server/tests/e2e/race_flow_test.cpp
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>

#include <nlohmann/json.hpp>

#include "cuberace/map_definition.hpp"
#include "cuberace/observability.hpp"
#include "cuberace/race_engine.hpp"
#include "cuberace/realtime.hpp"

namespace cuberace {

struct RaceTiming {
  std::chrono::milliseconds tick_interval{300};
  std::chrono::milliseconds command_cooldown{1000};
  std::chrono::milliseconds reset_delay{3000};
};

class RaceService : public std::enable_shared_from_this<RaceService> {
 public:
  RaceService(boost::asio::io_context& ioc, std::shared_ptr<RealtimeCoordinator> coordinator,
              std::shared_ptr<Observability> observability, MapCatalog catalog, const RaceTiming& timing);

  void Start();
  void Stop();

  // 아래 요청은 모두 strand에 게시되며 결과는 coordinator를 통해 전달된다.
  void Connect(const std::string& player_id);
  void Disconnect(const std::string& player_id);
  void SubmitCommand(const std::string& player_id, const std::string& direction);
  void RequestStart(const std::string& player_id);
  void RequestNextMap(const std::string& player_id);

 private:
  void ScheduleTick();
  void HandleTick();
  void ScheduleReset(std::uint64_t ticket);
  void HandleReset(std::uint64_t ticket);
  void BroadcastSnapshot(const std::string& event, const std::optional<std::string>& winner);
  void LogEvent(LogLevel level, const std::string& name, const std::optional<std::string>& player_id,
                const std::optional<std::string>& team_id, nlohmann::json detail = nullptr);

  boost::asio::strand<boost::asio::io_context::executor_type> strand_;
  boost::asio::steady_timer tick_timer_;
  boost::asio::steady_timer reset_timer_;
  std::shared_ptr<RealtimeCoordinator> coordinator_;
  std::shared_ptr<Observability> observability_;
  MapCatalog catalog_;
  RaceTiming timing_;
  RaceEngine engine_;
  bool stopped_{false};
};

}  // namespace cuberace
