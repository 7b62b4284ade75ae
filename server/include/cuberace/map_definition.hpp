/*
 * 설명: 맵 데이터 모델과 텍스트 맵 로더, 맵 디렉터리 카탈로그를 정의한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol.md
 * 테스트: server/tests/unit/map_definition_test.cpp
 */
#pragma once

#include <cstddef>
#include <filesystem>
#include <map>
#include <memory>
#include <set>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "cuberace/grid.hpp"

namespace cuberace {

class MapLoadError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

struct MapDefinition {
  int width{0};
  int height{0};
  std::set<Cell> walls;
  std::set<Cell> ledges;
  Cell goal;
  std::map<std::string, Cell> starts;
  std::vector<Cell> initial_boulders;
};

// 팀 시작 위치, 목표 지점, 크기 조건을 검사한다. 위반 시 MapLoadError.
void ValidateMap(const MapDefinition& map, const std::vector<std::string>& team_ids, std::string_view source);

// '#' 벽, 'V' 낭떠러지, 'O' 바위, 'R'/'B' 팀 시작, 'G' 목표. 나머지는 빈 칸이다.
// 파싱 후 team_ids 기준으로 ValidateMap을 수행한다.
MapDefinition ParseMap(std::string_view text, std::string_view source, const std::vector<std::string>& team_ids);
MapDefinition LoadMapFile(const std::filesystem::path& path, const std::vector<std::string>& team_ids);

struct NamedMap {
  std::string name;
  std::shared_ptr<const MapDefinition> map;
};

class MapCatalog {
 public:
  explicit MapCatalog(std::vector<NamedMap> maps);

  // 디렉터리의 *.txt 파일을 이름순으로 모두 읽고 검증한다.
  static MapCatalog LoadDirectory(const std::filesystem::path& directory, const std::vector<std::string>& team_ids);

  const NamedMap& Current() const { return maps_.at(index_); }
  const NamedMap& Advance();
  std::size_t Size() const { return maps_.size(); }

 private:
  std::vector<NamedMap> maps_;
  std::size_t index_{0};
};

}  // namespace cuberace
