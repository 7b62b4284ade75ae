/*
 * 설명: 현재 맵과 동적 장애물(바위, 큐브)에 대한 칸 질의를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol.md
 * 테스트: server/tests/unit/terrain_test.cpp
 */
#include "cuberace/terrain.hpp"

namespace cuberace {

bool TerrainQuery::InBounds(const Cell& cell) const {
  const auto& map = *world_.map;
  return cell.x >= 0 && cell.x < map.width && cell.y >= 0 && cell.y < map.height;
}

bool TerrainQuery::IsWall(const Cell& cell) const { return world_.map->walls.count(cell) > 0; }

bool TerrainQuery::IsLedge(const Cell& cell) const { return world_.map->ledges.count(cell) > 0; }

std::optional<std::size_t> TerrainQuery::BoulderAt(const Cell& cell) const {
  for (std::size_t i = 0; i < world_.boulders.size(); ++i) {
    if (world_.boulders[i] == cell) {
      return i;
    }
  }
  return std::nullopt;
}

bool TerrainQuery::CubeAt(const Cell& cell, const std::optional<Cell>& excluding) const {
  for (const auto& team : world_.teams) {
    if (excluding && team.cube == *excluding) {
      continue;
    }
    if (team.cube == cell) {
      return true;
    }
  }
  return false;
}

}  // namespace cuberace
