/*
 * 설명: 격자 좌표와 이동 방향, 방향 문자열 변환을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol.md
 * 테스트: server/tests/unit/movement_test.cpp
 */
#pragma once

#include <optional>
#include <string_view>

namespace cuberace {

struct Cell {
  int x{0};
  int y{0};
};

inline bool operator==(const Cell& lhs, const Cell& rhs) { return lhs.x == rhs.x && lhs.y == rhs.y; }
inline bool operator!=(const Cell& lhs, const Cell& rhs) { return !(lhs == rhs); }

// 행 우선 정렬. std::set 키로 사용한다.
inline bool operator<(const Cell& lhs, const Cell& rhs) {
  if (lhs.y != rhs.y) {
    return lhs.y < rhs.y;
  }
  return lhs.x < rhs.x;
}

enum class Direction { kUp, kDown, kLeft, kRight };

std::optional<Direction> ParseDirection(std::string_view text);
std::string_view ToString(Direction direction);
Cell Step(const Cell& from, Direction direction);

}  // namespace cuberace
