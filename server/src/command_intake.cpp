/*
 * 설명: 팀 배정과 플레이어별 쿨다운 기반 명령 접수를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol.md
 * 테스트: server/tests/unit/command_intake_test.cpp
 */
#include "cuberace/command_intake.hpp"

#include <stdexcept>

namespace cuberace {

std::string_view ToString(IntakeStatus status) {
  switch (status) {
    case IntakeStatus::kAccepted:
      return "accepted";
    case IntakeStatus::kInvalidDirection:
      return "invalid_direction";
    case IntakeStatus::kRaceNotRunning:
      return "race_not_started";
    case IntakeStatus::kOnCooldown:
      return "rate_limited";
    case IntakeStatus::kUnknownPlayer:
      return "unknown_player";
  }
  return "unknown_player";
}

CommandIntake::CommandIntake(std::vector<std::string> team_order, std::chrono::milliseconds cooldown)
    : team_order_(std::move(team_order)), cooldown_(cooldown) {
  if (team_order_.empty()) {
    throw std::invalid_argument("team_order must not be empty");
  }
}

std::string CommandIntake::AssignPlayer(const std::string& player_id) {
  auto existing = players_.find(player_id);
  if (existing != players_.end()) {
    return existing->second.team_id;
  }

  auto counts = TeamCounts();
  std::string best = team_order_.front();
  for (const auto& team_id : team_order_) {
    if (counts[team_id] < counts[best]) {
      best = team_id;
    }
  }
  players_[player_id] = PlayerRecord{best, std::nullopt};
  return best;
}

bool CommandIntake::RemovePlayer(const std::string& player_id) { return players_.erase(player_id) > 0; }

std::optional<std::string> CommandIntake::TeamOf(const std::string& player_id) const {
  auto it = players_.find(player_id);
  if (it == players_.end()) {
    return std::nullopt;
  }
  return it->second.team_id;
}

std::map<std::string, std::size_t> CommandIntake::TeamCounts() const {
  std::map<std::string, std::size_t> counts;
  for (const auto& team_id : team_order_) {
    counts[team_id] = 0;
  }
  for (const auto& entry : players_) {
    auto it = counts.find(entry.second.team_id);
    if (it != counts.end()) {
      ++it->second;
    }
  }
  return counts;
}

IntakeResult CommandIntake::Submit(const std::string& player_id, std::string_view raw_direction, bool race_running,
                                   Clock::time_point now) {
  IntakeResult result;
  auto it = players_.find(player_id);
  if (it == players_.end()) {
    result.status = IntakeStatus::kUnknownPlayer;
    return result;
  }
  auto& player = it->second;
  result.team_id = player.team_id;

  result.direction = ParseDirection(raw_direction);
  if (!result.direction) {
    result.status = IntakeStatus::kInvalidDirection;
    return result;
  }

  if (!race_running) {
    result.status = IntakeStatus::kRaceNotRunning;
    return result;
  }

  if (player.last_accepted_at) {
    const auto elapsed = now - *player.last_accepted_at;
    if (elapsed < cooldown_) {
      result.status = IntakeStatus::kOnCooldown;
      result.remaining = std::chrono::ceil<std::chrono::milliseconds>(cooldown_ - elapsed);
      return result;
    }
  }

  player.last_accepted_at = now;
  result.status = IntakeStatus::kAccepted;
  return result;
}

}  // namespace cuberace
