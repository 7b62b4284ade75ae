/*
 * 설명: 맵, 팀, 바위, 승자, 팀 인원 정보를 JSON 스냅샷으로 직렬화한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol.md
 * 테스트: server/tests/unit/projection_test.cpp
 */
#include "cuberace/projection.hpp"

namespace cuberace {
namespace {
template <typename Cells>
nlohmann::json CellsToJson(const Cells& cells) {
  nlohmann::json out = nlohmann::json::array();
  for (const auto& cell : cells) {
    out.push_back(CellToJson(cell));
  }
  return out;
}
}  // namespace

nlohmann::json CellToJson(const Cell& cell) { return {{"x", cell.x}, {"y", cell.y}}; }

nlohmann::json MapToJson(const MapDefinition& map) {
  nlohmann::json starts = nlohmann::json::object();
  for (const auto& entry : map.starts) {
    starts[entry.first] = CellToJson(entry.second);
  }
  return {{"width", map.width},
          {"height", map.height},
          {"walls", CellsToJson(map.walls)},
          {"ledges", CellsToJson(map.ledges)},
          {"goal", CellToJson(map.goal)},
          {"starts", starts},
          {"boulders", CellsToJson(map.initial_boulders)}};
}

nlohmann::json TeamsToJson(const std::vector<TeamState>& teams) {
  nlohmann::json out = nlohmann::json::object();
  for (const auto& team : teams) {
    out[team.id] = {{"id", team.id},
                    {"name", team.display_name},
                    {"color", team.color},
                    {"cube", CellToJson(team.cube)},
                    {"queueLength", team.queue.size()}};
  }
  return out;
}

nlohmann::json BuildRaceSnapshot(const RaceEngine& engine, const std::optional<std::string>& winner) {
  nlohmann::json counts = nlohmann::json::object();
  for (const auto& entry : engine.TeamCounts()) {
    counts[entry.first] = entry.second;
  }
  return {{"tick", engine.CurrentTick()},
          {"status", std::string(ToString(engine.Status()))},
          {"raceStarted", engine.IsRunning()},
          {"teams", TeamsToJson(engine.World().teams)},
          {"boulders", CellsToJson(engine.World().boulders)},
          {"winner", winner ? nlohmann::json(*winner) : nlohmann::json(nullptr)},
          {"teamCounts", counts},
          {"map", MapToJson(engine.Map())},
          {"mapName", engine.MapName()}};
}

nlohmann::json BuildInitPayload(const RaceEngine& engine, const std::string& player_id, const std::string& team_id) {
  auto payload = BuildRaceSnapshot(engine, std::nullopt);
  payload["playerId"] = player_id;
  payload["teamId"] = team_id;
  return payload;
}

}  // namespace cuberace
