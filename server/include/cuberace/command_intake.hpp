/*
 * 설명: 플레이어 팀 배정과 방향 명령 접수(방향 검증, 경주 상태, 쿨다운)를 담당한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol.md
 * 테스트: server/tests/unit/command_intake_test.cpp
 */
#pragma once

#include <chrono>
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "cuberace/grid.hpp"

namespace cuberace {

enum class IntakeStatus { kAccepted, kInvalidDirection, kRaceNotRunning, kOnCooldown, kUnknownPlayer };

struct IntakeResult {
  IntakeStatus status{IntakeStatus::kUnknownPlayer};
  std::string team_id;
  std::optional<Direction> direction;
  std::chrono::milliseconds remaining{0};

  bool accepted() const { return status == IntakeStatus::kAccepted; }
};

std::string_view ToString(IntakeStatus status);

class CommandIntake {
 public:
  using Clock = std::chrono::steady_clock;

  CommandIntake(std::vector<std::string> team_order, std::chrono::milliseconds cooldown);

  // 인원이 가장 적은 팀을 배정한다. 동률이면 팀 순서상 앞선 팀.
  std::string AssignPlayer(const std::string& player_id);
  bool RemovePlayer(const std::string& player_id);
  std::optional<std::string> TeamOf(const std::string& player_id) const;
  std::map<std::string, std::size_t> TeamCounts() const;
  std::size_t PlayerCount() const { return players_.size(); }

  IntakeResult Submit(const std::string& player_id, std::string_view raw_direction, bool race_running,
                      Clock::time_point now);

 private:
  struct PlayerRecord {
    std::string team_id;
    std::optional<Clock::time_point> last_accepted_at;
  };

  std::vector<std::string> team_order_;
  std::chrono::milliseconds cooldown_;
  std::unordered_map<std::string, PlayerRecord> players_;
};

}  // namespace cuberace
