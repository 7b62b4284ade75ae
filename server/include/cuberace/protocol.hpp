/*
 * 설명: REST/WS 응답 엔벨로프 생성과 클라이언트 WS 메시지 파싱을 담당한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol.md
 * 테스트: server/tests/unit/protocol_test.cpp
 */
#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace cuberace {

nlohmann::json MakeSuccessEnvelope(const nlohmann::json& data);
nlohmann::json MakeErrorEnvelope(std::string_view code, std::string_view message);

struct WsEnvelope {
  std::string type;
  std::string event;
  std::uint64_t seq;
  nlohmann::json payload;
};

nlohmann::json ToWsJson(const WsEnvelope& env);

enum class ClientEvent { kCommand, kStartRace, kNextMap };

struct ClientMessage {
  ClientEvent event{ClientEvent::kCommand};
  std::uint64_t seq{0};
  // command 이벤트의 방향 원문. 값 검증은 명령 접수 단계에서 한다.
  std::string direction;
};

struct ParseResult {
  bool ok{false};
  ClientMessage message;
  std::string error_message;
};

ParseResult ParseClientMessage(std::string_view raw);

}  // namespace cuberace
