/*
 * 설명: 레벨별 구조화 로그와 경주/연결 메트릭 카운터를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol.md
 * 테스트: server/tests/unit/observability_test.cpp
 */
#pragma once

#include <atomic>
#include <cstdint>
#include <iosfwd>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace cuberace {

enum class LogLevel { kDebug = 0, kInfo = 1, kWarn = 2, kError = 3 };

LogLevel ParseLogLevel(std::string_view text);
std::string_view ToString(LogLevel level);

struct LogContext {
  std::string trace_id;
  std::optional<std::string> player_id;
  std::optional<std::string> team_id;
  std::string name;
  long latency_ms{0};
  nlohmann::json detail;
};

struct MetricsSnapshot {
  std::uint64_t request_total{0};
  std::uint64_t request_errors{0};
  std::uint64_t websocket_active{0};
  std::uint64_t players_connected{0};
  std::uint64_t ticks{0};
  std::uint64_t commands_accepted{0};
  std::uint64_t commands_rejected{0};
  std::uint64_t races_finished{0};
  bool race_running{false};
};

class Observability {
 public:
  explicit Observability(LogLevel level = LogLevel::kInfo);
  // 테스트에서 출력 스트림을 바꿔 끼운다.
  Observability(LogLevel level, std::ostream& out);

  std::string NextTraceId();
  void IncrementRequest();
  void IncrementError();
  void SetWebsocketActive(std::uint64_t count);
  void SetPlayersConnected(std::uint64_t count);
  void SetRaceRunning(bool running);
  void IncrementTick();
  void IncrementCommand(bool accepted);
  void IncrementRaceFinished();
  MetricsSnapshot Snapshot() const;

  bool Enabled(LogLevel level) const { return level >= level_; }
  void Log(LogLevel level, const LogContext& ctx) const;

 private:
  LogLevel level_;
  std::ostream& out_;
  mutable std::mutex out_mutex_;
  std::atomic<std::uint64_t> request_total_{0};
  std::atomic<std::uint64_t> request_errors_{0};
  std::atomic<std::uint64_t> websocket_active_{0};
  std::atomic<std::uint64_t> players_connected_{0};
  std::atomic<std::uint64_t> ticks_{0};
  std::atomic<std::uint64_t> commands_accepted_{0};
  std::atomic<std::uint64_t> commands_rejected_{0};
  std::atomic<std::uint64_t> races_finished_{0};
  std::atomic<bool> race_running_{false};
  std::atomic<std::uint64_t> trace_counter_{0};
};

}  // namespace cuberace
