/*
 * 설명: 팀 순서대로 틱당 한 명령씩 소모하고 승자 판정 후 대기 상태로 전이한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol.md
 * 테스트: server/tests/unit/race_engine_test.cpp
 */
#include "cuberace/race_engine.hpp"

#include <stdexcept>

namespace cuberace {

std::string_view ToString(RaceStatus status) {
  return status == RaceStatus::kRunning ? "running" : "waiting";
}

std::vector<TeamConfig> DefaultTeams() {
  return {{"red", "RED", "#e74c3c"}, {"blue", "BLUE", "#3498db"}};
}

std::vector<std::string> TeamIds(const std::vector<TeamConfig>& teams) {
  std::vector<std::string> ids;
  ids.reserve(teams.size());
  for (const auto& team : teams) {
    ids.push_back(team.id);
  }
  return ids;
}

std::optional<std::string> FindWinner(const RaceWorld& world) {
  for (const auto& team : world.teams) {
    if (team.cube == world.map->goal) {
      return team.id;
    }
  }
  return std::nullopt;
}

RaceEngine::RaceEngine(std::vector<TeamConfig> teams, NamedMap initial_map, std::chrono::milliseconds cooldown)
    : team_ids_(TeamIds(teams)), intake_(team_ids_, cooldown) {
  if (!initial_map.map) {
    throw std::invalid_argument("initial map must not be null");
  }
  ValidateMap(*initial_map.map, team_ids_, initial_map.name);
  world_.map = std::move(initial_map.map);
  map_name_ = std::move(initial_map.name);
  for (auto& team : teams) {
    world_.teams.push_back(TeamState{std::move(team.id), std::move(team.display_name), std::move(team.color), Cell{}, {}});
  }
  ResetToStart();
}

std::string RaceEngine::AddPlayer(const std::string& player_id) { return intake_.AssignPlayer(player_id); }

bool RaceEngine::RemovePlayer(const std::string& player_id) { return intake_.RemovePlayer(player_id); }

IntakeResult RaceEngine::SubmitCommand(const std::string& player_id, std::string_view raw_direction,
                                       CommandIntake::Clock::time_point now) {
  auto result = intake_.Submit(player_id, raw_direction, IsRunning(), now);
  if (!result.accepted()) {
    return result;
  }
  for (auto& team : world_.teams) {
    if (team.id == result.team_id) {
      team.queue.push_back(*result.direction);
      break;
    }
  }
  return result;
}

bool RaceEngine::StartRace() {
  if (IsRunning()) {
    return false;
  }
  ++generation_;
  pending_reset_.reset();
  ResetToStart();
  status_ = RaceStatus::kRunning;
  return true;
}

void RaceEngine::ChangeMap(NamedMap next_map) {
  if (!next_map.map) {
    throw std::invalid_argument("next map must not be null");
  }
  ValidateMap(*next_map.map, team_ids_, next_map.name);
  ++generation_;
  pending_reset_.reset();
  world_.map = std::move(next_map.map);
  map_name_ = std::move(next_map.name);
  status_ = RaceStatus::kWaiting;
  ResetToStart();
}

TickReport RaceEngine::TickOnce() {
  TickReport report;
  report.tick = ++current_tick_;
  report.running = IsRunning();
  if (!report.running) {
    return report;
  }

  for (std::size_t i = 0; i < world_.teams.size(); ++i) {
    auto& team = world_.teams[i];
    if (team.queue.empty()) {
      continue;
    }
    const Direction direction = team.queue.front();
    team.queue.pop_front();
    // 앞 팀의 이동이 반영된 상태로 다음 팀을 판정한다.
    const auto outcome = ResolveMove(TerrainQuery(world_), team.cube, direction);
    ApplyMove(world_, i, outcome);
    report.moves.push_back(AppliedMove{team.id, direction, outcome});
  }

  report.winner = FindWinner(world_);
  return report;
}

std::optional<std::uint64_t> RaceEngine::FinishRace() {
  if (!IsRunning()) {
    return std::nullopt;
  }
  status_ = RaceStatus::kWaiting;
  pending_reset_ = ++generation_;
  return pending_reset_;
}

bool RaceEngine::ApplyScheduledReset(std::uint64_t ticket) {
  if (!pending_reset_ || *pending_reset_ != ticket || ticket != generation_) {
    return false;
  }
  pending_reset_.reset();
  ResetToStart();
  return true;
}

void RaceEngine::ResetToStart() {
  const auto& map = *world_.map;
  for (auto& team : world_.teams) {
    team.cube = map.starts.at(team.id);
    team.queue.clear();
  }
  world_.boulders = map.initial_boulders;
}

}  // namespace cuberace
