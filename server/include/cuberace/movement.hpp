/*
 * 설명: 큐브 이동 요청을 지형 규칙(벽, 낭떠러지, 바위 밀기, 큐브 충돌)에 따라 판정한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol.md
 * 테스트: server/tests/unit/movement_test.cpp
 */
#pragma once

#include <cstddef>
#include <optional>

#include "cuberace/grid.hpp"
#include "cuberace/terrain.hpp"

namespace cuberace {

enum class MoveKind { kUnchanged, kMoved, kMovedWithPush };

struct MoveOutcome {
  MoveKind kind{MoveKind::kUnchanged};
  Cell position;
  std::size_t boulder_index{0};
  Cell boulder_position;
};

// 상태를 변경하지 않는다. 결과 반영은 호출자 책임이다.
MoveOutcome ResolveMove(const TerrainQuery& terrain, const Cell& position, std::optional<Direction> direction);

// 판정 결과를 월드에 반영한다. 바위 인덱스는 같은 월드에서 얻은 값이어야 한다.
void ApplyMove(RaceWorld& world, std::size_t team_index, const MoveOutcome& outcome);

}  // namespace cuberace
