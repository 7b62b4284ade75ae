/*
 * 설명: 경주 상태 머신(대기/진행), 팀별 명령 큐 소모 틱, 승자 판정과 리셋 티켓을 제공한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol.md
 * 테스트: server/tests/unit/race_engine_test.cpp
 */
#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "cuberace/command_intake.hpp"
#include "cuberace/map_definition.hpp"
#include "cuberace/movement.hpp"
#include "cuberace/terrain.hpp"

namespace cuberace {

enum class RaceStatus { kWaiting, kRunning };

std::string_view ToString(RaceStatus status);

struct TeamConfig {
  std::string id;
  std::string display_name;
  std::string color;
};

// red, blue 순서. 이 순서가 틱 처리 순서와 동시 도착 판정 순서가 된다.
std::vector<TeamConfig> DefaultTeams();
std::vector<std::string> TeamIds(const std::vector<TeamConfig>& teams);

struct AppliedMove {
  std::string team_id;
  Direction direction;
  MoveOutcome outcome;
};

struct TickReport {
  std::uint64_t tick{0};
  bool running{false};
  std::vector<AppliedMove> moves;
  // 승리한 틱이어도 상태는 아직 running이다. FinishRace로 종료한다.
  std::optional<std::string> winner;
};

// 목표 칸에 있는 첫 번째 팀(고정 순서)을 돌려준다.
std::optional<std::string> FindWinner(const RaceWorld& world);

class RaceEngine {
 public:
  RaceEngine(std::vector<TeamConfig> teams, NamedMap initial_map, std::chrono::milliseconds cooldown);

  std::string AddPlayer(const std::string& player_id);
  bool RemovePlayer(const std::string& player_id);

  // 접수된 명령은 플레이어 팀 큐 뒤에 붙는다.
  IntakeResult SubmitCommand(const std::string& player_id, std::string_view raw_direction,
                             CommandIntake::Clock::time_point now);

  // 이미 진행 중이면 false.
  bool StartRace();
  void ChangeMap(NamedMap next_map);
  TickReport TickOnce();
  // 승리 틱의 state 전송 후 호출한다. 대기 상태로 바꾸고 리셋 티켓을 발급한다.
  // 진행 중이 아니면 nullopt.
  std::optional<std::uint64_t> FinishRace();

  // 티켓 발급 이후 시작/맵 변경이 있었다면 아무것도 하지 않고 false.
  bool ApplyScheduledReset(std::uint64_t ticket);

  RaceStatus Status() const { return status_; }
  bool IsRunning() const { return status_ == RaceStatus::kRunning; }
  std::uint64_t CurrentTick() const { return current_tick_; }
  const RaceWorld& World() const { return world_; }
  const MapDefinition& Map() const { return *world_.map; }
  const std::string& MapName() const { return map_name_; }
  std::map<std::string, std::size_t> TeamCounts() const { return intake_.TeamCounts(); }
  std::size_t PlayerCount() const { return intake_.PlayerCount(); }
  std::optional<std::string> TeamOf(const std::string& player_id) const { return intake_.TeamOf(player_id); }
  std::optional<std::uint64_t> PendingResetTicket() const { return pending_reset_; }

 private:
  void ResetToStart();

  std::vector<std::string> team_ids_;
  RaceWorld world_;
  std::string map_name_;
  CommandIntake intake_;
  RaceStatus status_{RaceStatus::kWaiting};
  std::uint64_t current_tick_{0};
  std::uint64_t generation_{0};
  std::optional<std::uint64_t> pending_reset_;
};

}  // namespace cuberace
