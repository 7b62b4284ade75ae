/*
 * 설명: 경주 월드(맵, 팀 큐브, 바위) 컨텍스트와 지형 질의를 정의한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol.md
 * 테스트: server/tests/unit/terrain_test.cpp, server/tests/unit/movement_test.cpp
 */
#pragma once

#include <cstddef>
#include <deque>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "cuberace/grid.hpp"
#include "cuberace/map_definition.hpp"

namespace cuberace {

struct TeamState {
  std::string id;
  std::string display_name;
  std::string color;
  Cell cube;
  std::deque<Direction> queue;
};

// 틱과 입력 처리가 공유하는 가변 상태. 팀 순서는 고정이다.
struct RaceWorld {
  std::shared_ptr<const MapDefinition> map;
  std::vector<TeamState> teams;
  std::vector<Cell> boulders;
};

class TerrainQuery {
 public:
  explicit TerrainQuery(const RaceWorld& world) : world_(world) {}

  bool InBounds(const Cell& cell) const;
  bool IsWall(const Cell& cell) const;
  bool IsLedge(const Cell& cell) const;
  std::optional<std::size_t> BoulderAt(const Cell& cell) const;
  // excluding 칸 위의 큐브는 무시한다.
  bool CubeAt(const Cell& cell, const std::optional<Cell>& excluding) const;

 private:
  const RaceWorld& world_;
};

}  // namespace cuberace
