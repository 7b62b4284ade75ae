/*
 * 설명: 방향 문자열 파싱과 단위 이동을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol.md
 * 테스트: server/tests/unit/movement_test.cpp
 */
#include "cuberace/grid.hpp"

namespace cuberace {

std::optional<Direction> ParseDirection(std::string_view text) {
  if (text == "up") {
    return Direction::kUp;
  }
  if (text == "down") {
    return Direction::kDown;
  }
  if (text == "left") {
    return Direction::kLeft;
  }
  if (text == "right") {
    return Direction::kRight;
  }
  return std::nullopt;
}

std::string_view ToString(Direction direction) {
  switch (direction) {
    case Direction::kUp:
      return "up";
    case Direction::kDown:
      return "down";
    case Direction::kLeft:
      return "left";
    case Direction::kRight:
      return "right";
  }
  return "up";
}

Cell Step(const Cell& from, Direction direction) {
  switch (direction) {
    case Direction::kUp:
      return Cell{from.x, from.y - 1};
    case Direction::kDown:
      return Cell{from.x, from.y + 1};
    case Direction::kLeft:
      return Cell{from.x - 1, from.y};
    case Direction::kRight:
      return Cell{from.x + 1, from.y};
  }
  return from;
}

}  // namespace cuberace
