/*
 * 설명: 텍스트 맵을 파싱/검증하고 맵 디렉터리를 순환 카탈로그로 관리한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol.md
 * 테스트: server/tests/unit/map_definition_test.cpp
 */
#include "cuberace/map_definition.hpp"

#include <algorithm>
#include <fstream>
#include <optional>
#include <sstream>

namespace cuberace {
namespace {
std::vector<std::string> SplitRows(std::string_view text) {
  std::vector<std::string> rows;
  std::string current;
  for (char ch : text) {
    if (ch == '\r') {
      continue;
    }
    if (ch == '\n') {
      rows.push_back(std::move(current));
      current.clear();
      continue;
    }
    current.push_back(ch);
  }
  rows.push_back(std::move(current));
  while (!rows.empty() && rows.back().empty()) {
    rows.pop_back();
  }
  return rows;
}

std::string Describe(std::string_view source) {
  return source.empty() ? std::string{"<inline>"} : std::string{source};
}
}  // namespace

void ValidateMap(const MapDefinition& map, const std::vector<std::string>& team_ids, std::string_view source) {
  if (map.width <= 0 || map.height <= 0) {
    throw MapLoadError("맵 '" + Describe(source) + "'의 크기가 비어 있습니다");
  }
  for (const auto& team_id : team_ids) {
    auto it = map.starts.find(team_id);
    if (it == map.starts.end()) {
      throw MapLoadError("맵 '" + Describe(source) + "'에 팀 '" + team_id + "'의 시작 위치가 없습니다");
    }
    if (map.walls.count(it->second) > 0) {
      throw MapLoadError("맵 '" + Describe(source) + "'의 팀 '" + team_id + "' 시작 위치가 벽입니다");
    }
  }
  if (map.walls.count(map.goal) > 0) {
    throw MapLoadError("맵 '" + Describe(source) + "'의 목표 지점이 벽입니다");
  }
}

MapDefinition ParseMap(std::string_view text, std::string_view source, const std::vector<std::string>& team_ids) {
  auto rows = SplitRows(text);
  if (rows.empty()) {
    throw MapLoadError("맵 '" + Describe(source) + "'이 비어 있습니다");
  }

  MapDefinition map;
  map.height = static_cast<int>(rows.size());
  std::optional<Cell> goal;
  for (std::size_t y = 0; y < rows.size(); ++y) {
    const auto& row = rows[y];
    map.width = std::max(map.width, static_cast<int>(row.size()));
    for (std::size_t x = 0; x < row.size(); ++x) {
      Cell cell{static_cast<int>(x), static_cast<int>(y)};
      switch (row[x]) {
        case '#':
          map.walls.insert(cell);
          break;
        case 'V':
          map.ledges.insert(cell);
          break;
        case 'O':
          map.initial_boulders.push_back(cell);
          break;
        case 'R':
          map.starts["red"] = cell;
          break;
        case 'B':
          map.starts["blue"] = cell;
          break;
        case 'G':
          goal = cell;
          break;
        default:
          break;
      }
    }
  }

  if (!goal) {
    throw MapLoadError("맵 '" + Describe(source) + "'에 목표 지점 'G'가 없습니다");
  }
  map.goal = *goal;
  ValidateMap(map, team_ids, source);
  return map;
}

MapDefinition LoadMapFile(const std::filesystem::path& path, const std::vector<std::string>& team_ids) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw MapLoadError("맵 파일을 열 수 없습니다: " + path.string());
  }
  std::ostringstream oss;
  oss << in.rdbuf();
  return ParseMap(oss.str(), path.filename().string(), team_ids);
}

MapCatalog::MapCatalog(std::vector<NamedMap> maps) : maps_(std::move(maps)) {
  if (maps_.empty()) {
    throw MapLoadError("맵 카탈로그가 비어 있습니다");
  }
}

MapCatalog MapCatalog::LoadDirectory(const std::filesystem::path& directory,
                                     const std::vector<std::string>& team_ids) {
  std::error_code ec;
  if (!std::filesystem::is_directory(directory, ec)) {
    throw MapLoadError("맵 디렉터리를 찾을 수 없습니다: " + directory.string());
  }

  std::vector<std::filesystem::path> files;
  for (const auto& entry : std::filesystem::directory_iterator(directory)) {
    if (entry.is_regular_file() && entry.path().extension() == ".txt") {
      files.push_back(entry.path());
    }
  }
  std::sort(files.begin(), files.end(), [](const auto& lhs, const auto& rhs) {
    return lhs.filename().string() < rhs.filename().string();
  });
  if (files.empty()) {
    throw MapLoadError("맵 디렉터리에 .txt 맵이 없습니다: " + directory.string());
  }

  std::vector<NamedMap> maps;
  maps.reserve(files.size());
  for (const auto& file : files) {
    maps.push_back(NamedMap{file.filename().string(),
                            std::make_shared<const MapDefinition>(LoadMapFile(file, team_ids))});
  }
  return MapCatalog(std::move(maps));
}

const NamedMap& MapCatalog::Advance() {
  index_ = (index_ + 1) % maps_.size();
  return maps_[index_];
}

}  // namespace cuberace
