/*
 * 설명: 레벨별 구조화 로그와 경주/연결 메트릭 카운터를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol.md
 * 테스트: server/tests/unit/observability_test.cpp
 */
#include "cuberace/observability.hpp"

#include <chrono>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace cuberace {

LogLevel ParseLogLevel(std::string_view text) {
  if (text == "debug") {
    return LogLevel::kDebug;
  }
  if (text == "warn" || text == "warning") {
    return LogLevel::kWarn;
  }
  if (text == "error") {
    return LogLevel::kError;
  }
  return LogLevel::kInfo;
}

std::string_view ToString(LogLevel level) {
  switch (level) {
    case LogLevel::kDebug:
      return "debug";
    case LogLevel::kInfo:
      return "info";
    case LogLevel::kWarn:
      return "warn";
    case LogLevel::kError:
      return "error";
  }
  return "info";
}

Observability::Observability(LogLevel level) : Observability(level, std::cout) {}

Observability::Observability(LogLevel level, std::ostream& out) : level_(level), out_(out) {}

std::string Observability::NextTraceId() {
  auto now = std::chrono::steady_clock::now().time_since_epoch().count();
  std::ostringstream oss;
  oss << std::hex << now << "-" << trace_counter_.fetch_add(1);
  return oss.str();
}

void Observability::IncrementRequest() { request_total_.fetch_add(1); }

void Observability::IncrementError() { request_errors_.fetch_add(1); }

void Observability::SetWebsocketActive(std::uint64_t count) { websocket_active_.store(count); }

void Observability::SetPlayersConnected(std::uint64_t count) { players_connected_.store(count); }

void Observability::SetRaceRunning(bool running) { race_running_.store(running); }

void Observability::IncrementTick() { ticks_.fetch_add(1); }

void Observability::IncrementCommand(bool accepted) {
  if (accepted) {
    commands_accepted_.fetch_add(1);
  } else {
    commands_rejected_.fetch_add(1);
  }
}

void Observability::IncrementRaceFinished() { races_finished_.fetch_add(1); }

MetricsSnapshot Observability::Snapshot() const {
  MetricsSnapshot snapshot;
  snapshot.request_total = request_total_.load();
  snapshot.request_errors = request_errors_.load();
  snapshot.websocket_active = websocket_active_.load();
  snapshot.players_connected = players_connected_.load();
  snapshot.ticks = ticks_.load();
  snapshot.commands_accepted = commands_accepted_.load();
  snapshot.commands_rejected = commands_rejected_.load();
  snapshot.races_finished = races_finished_.load();
  snapshot.race_running = race_running_.load();
  return snapshot;
}

void Observability::Log(LogLevel level, const LogContext& ctx) const {
  if (!Enabled(level)) {
    return;
  }
  nlohmann::json log_json;
  log_json["level"] = std::string(ToString(level));
  log_json["traceId"] = ctx.trace_id;
  log_json["eventName"] = ctx.name;
  log_json["latencyMs"] = ctx.latency_ms;
  if (ctx.player_id) {
    log_json["playerId"] = *ctx.player_id;
  }
  if (ctx.team_id) {
    log_json["teamId"] = *ctx.team_id;
  }
  if (!ctx.detail.is_null()) {
    log_json["detail"] = ctx.detail;
  }
  std::lock_guard<std::mutex> lock(out_mutex_);
  out_ << log_json.dump() << std::endl;
}

}  // namespace cuberace
