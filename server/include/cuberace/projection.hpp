/*
 * 설명: 경주 엔진 상태를 클라이언트 브로드캐스트용 JSON 스냅샷으로 변환한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol.md
 * 테스트: server/tests/unit/projection_test.cpp
 */
#pragma once

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "cuberace/race_engine.hpp"

namespace cuberace {

nlohmann::json CellToJson(const Cell& cell);
nlohmann::json MapToJson(const MapDefinition& map);
nlohmann::json TeamsToJson(const std::vector<TeamState>& teams);

// state, race_started, reset, map_changed 이벤트가 공유하는 전체 스냅샷.
nlohmann::json BuildRaceSnapshot(const RaceEngine& engine, const std::optional<std::string>& winner);
nlohmann::json BuildInitPayload(const RaceEngine& engine, const std::string& player_id, const std::string& team_id);

}  // namespace cuberace
