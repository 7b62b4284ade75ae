/*
 * 설명: JSON 응답 엔벨로프를 생성하고 클라이언트 WS 이벤트를 해석한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol.md
 * 테스트: server/tests/unit/protocol_test.cpp
 */
#include "cuberace/protocol.hpp"

#include <chrono>
#include <iomanip>
#include <sstream>

namespace cuberace {
namespace {
std::string CurrentTimestamp() {
  using clock = std::chrono::system_clock;
  auto now = clock::now();
  auto itt = clock::to_time_t(now);
  std::ostringstream ss;
  ss << std::put_time(std::gmtime(&itt), "%FT%TZ");
  return ss.str();
}

ParseResult Fail(std::uint64_t seq, std::string message) {
  ParseResult result;
  result.message.seq = seq;
  result.error_message = std::move(message);
  return result;
}
}  // namespace

nlohmann::json MakeSuccessEnvelope(const nlohmann::json& data) {
  nlohmann::json envelope;
  envelope["success"] = true;
  envelope["data"] = data;
  envelope["error"] = nullptr;
  envelope["meta"] = {{"timestamp", CurrentTimestamp()}};
  return envelope;
}

nlohmann::json MakeErrorEnvelope(std::string_view code, std::string_view message) {
  nlohmann::json envelope;
  envelope["success"] = false;
  envelope["data"] = nullptr;
  envelope["error"] = {{"code", std::string(code)}, {"message", std::string(message)}, {"detail", nullptr}};
  envelope["meta"] = {{"timestamp", CurrentTimestamp()}};
  return envelope;
}

nlohmann::json ToWsJson(const WsEnvelope& env) {
  nlohmann::json j;
  j["t"] = env.type;
  j["seq"] = env.seq;
  if (env.type == "event") {
    j["event"] = env.event;
  } else {
    j["event"] = nullptr;
  }
  j["p"] = env.payload;
  return j;
}

ParseResult ParseClientMessage(std::string_view raw) {
  auto message = nlohmann::json::parse(raw.begin(), raw.end(), nullptr, false);
  if (message.is_discarded() || !message.is_object()) {
    return Fail(0, "JSON 파싱 오류");
  }

  std::uint64_t seq = 0;
  auto seq_it = message.find("seq");
  if (seq_it != message.end() && seq_it->is_number_unsigned()) {
    seq = seq_it->get<std::uint64_t>();
  }

  auto type_it = message.find("t");
  if (type_it == message.end() || !type_it->is_string() || *type_it != "event") {
    return Fail(seq, "알 수 없는 메시지 유형");
  }
  auto event_it = message.find("event");
  if (event_it == message.end() || !event_it->is_string()) {
    return Fail(seq, "event 필드가 필요합니다");
  }

  ParseResult result;
  result.message.seq = seq;
  const auto event = event_it->get<std::string>();
  if (event == "start_race") {
    result.message.event = ClientEvent::kStartRace;
  } else if (event == "next_map") {
    result.message.event = ClientEvent::kNextMap;
  } else if (event == "command") {
    auto payload_it = message.find("p");
    if (payload_it == message.end() || !payload_it->is_object()) {
      return Fail(seq, "payload가 누락되었습니다");
    }
    auto direction_it = payload_it->find("direction");
    if (direction_it == payload_it->end() || !direction_it->is_string()) {
      return Fail(seq, "direction 필드가 필요합니다");
    }
    result.message.event = ClientEvent::kCommand;
    result.message.direction = direction_it->get<std::string>();
  } else {
    return Fail(seq, "알 수 없는 이벤트");
  }
  result.ok = true;
  return result;
}

}  // namespace cuberace
