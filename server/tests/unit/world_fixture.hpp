#pragma once

#include <memory>
#include <string_view>

#include "cuberace/map_definition.hpp"
#include "cuberace/race_engine.hpp"
#include "cuberace/terrain.hpp"

namespace cuberace::testing {

inline NamedMap NamedMapFromText(std::string_view text, std::string name = "test.txt") {
  return NamedMap{std::move(name), std::make_shared<const MapDefinition>(ParseMap(text, "test", TeamIds(DefaultTeams())))};
}

// 엔진 없이 이동 판정만 검사할 때 쓰는 월드. 큐브는 맵 시작 위치에 놓인다.
inline RaceWorld WorldFromText(std::string_view text) {
  RaceWorld world;
  world.map = std::make_shared<const MapDefinition>(ParseMap(text, "test", TeamIds(DefaultTeams())));
  for (const auto& team : DefaultTeams()) {
    world.teams.push_back(TeamState{team.id, team.display_name, team.color, world.map->starts.at(team.id), {}});
  }
  world.boulders = world.map->initial_boulders;
  return world;
}

}  // namespace cuberace::testing
