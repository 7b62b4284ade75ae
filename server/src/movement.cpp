/*
 * 설명: 이동 판정 순서(바위 → 벽 → 낭떠러지 → 큐브 → 일반 이동)를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol.md
 * 테스트: server/tests/unit/movement_test.cpp
 */
#include "cuberace/movement.hpp"

namespace cuberace {
namespace {
MoveOutcome Unchanged(const Cell& position) { return MoveOutcome{MoveKind::kUnchanged, position, 0, Cell{}}; }

MoveOutcome MovedTo(const Cell& position) { return MoveOutcome{MoveKind::kMoved, position, 0, Cell{}}; }

// 밀린 바위나 낙하한 큐브가 들어갈 칸인지 확인한다.
bool IsClearDestination(const TerrainQuery& terrain, const Cell& cell, const Cell& mover) {
  return terrain.InBounds(cell) && !terrain.IsWall(cell) && !terrain.IsLedge(cell) && !terrain.BoulderAt(cell) &&
         !terrain.CubeAt(cell, mover);
}
}  // namespace

MoveOutcome ResolveMove(const TerrainQuery& terrain, const Cell& position, std::optional<Direction> direction) {
  if (!direction) {
    return Unchanged(position);
  }

  const Cell target = Step(position, *direction);
  if (!terrain.InBounds(target)) {
    return Unchanged(position);
  }

  if (auto boulder = terrain.BoulderAt(target)) {
    const Cell push_target = Step(target, *direction);
    if (!IsClearDestination(terrain, push_target, position)) {
      return Unchanged(position);
    }
    return MoveOutcome{MoveKind::kMovedWithPush, target, *boulder, push_target};
  }

  if (terrain.IsWall(target)) {
    return Unchanged(position);
  }

  if (terrain.IsLedge(target)) {
    if (*direction != Direction::kDown) {
      return Unchanged(position);
    }
    const Cell landing = Step(target, Direction::kDown);
    if (!IsClearDestination(terrain, landing, position)) {
      return Unchanged(position);
    }
    return MovedTo(landing);
  }

  if (terrain.CubeAt(target, position)) {
    return Unchanged(position);
  }
  return MovedTo(target);
}

void ApplyMove(RaceWorld& world, std::size_t team_index, const MoveOutcome& outcome) {
  switch (outcome.kind) {
    case MoveKind::kUnchanged:
      return;
    case MoveKind::kMovedWithPush:
      world.boulders.at(outcome.boulder_index) = outcome.boulder_position;
      world.teams.at(team_index).cube = outcome.position;
      return;
    case MoveKind::kMoved:
      world.teams.at(team_index).cube = outcome.position;
      return;
  }
}

}  // namespace cuberace
