#include <gtest/gtest.h>

#include "cuberace/protocol.hpp"

TEST(JsonEnvelopeTest, SuccessShape) {
  nlohmann::json payload{{"status", "ok"}};
  auto env = cuberace::MakeSuccessEnvelope(payload);
  EXPECT_TRUE(env["success"].get<bool>());
  EXPECT_EQ(env["data"], payload);
  EXPECT_TRUE(env["error"].is_null());
  EXPECT_TRUE(env.contains("meta"));
  EXPECT_TRUE(env["meta"].contains("timestamp"));
}

TEST(JsonEnvelopeTest, ErrorShape) {
  auto env = cuberace::MakeErrorEnvelope("not_found", "에러");
  EXPECT_FALSE(env["success"].get<bool>());
  EXPECT_TRUE(env["data"].is_null());
  EXPECT_EQ(env["error"]["code"], "not_found");
  EXPECT_EQ(env["error"]["message"], "에러");
  EXPECT_TRUE(env["error"].contains("detail"));
}

TEST(JsonEnvelopeTest, WsEventAndErrorShape) {
  auto event = cuberace::ToWsJson({"event", "state", 0, {{"tick", 3}}});
  EXPECT_EQ(event["t"], "event");
  EXPECT_EQ(event["event"], "state");
  EXPECT_EQ(event["seq"], 0);
  EXPECT_EQ(event["p"]["tick"], 3);

  auto error = cuberace::ToWsJson({"error", "ignored", 5, {{"code", "rate_limited"}}});
  EXPECT_EQ(error["t"], "error");
  EXPECT_TRUE(error["event"].is_null());
  EXPECT_EQ(error["seq"], 5);
  EXPECT_EQ(error["p"]["code"], "rate_limited");
}

TEST(ClientMessageTest, ParsesCommandWithSeq) {
  auto result = cuberace::ParseClientMessage(R"({"t":"event","seq":9,"event":"command","p":{"direction":"left"}})");
  ASSERT_TRUE(result.ok) << result.error_message;
  EXPECT_EQ(result.message.event, cuberace::ClientEvent::kCommand);
  EXPECT_EQ(result.message.seq, 9u);
  EXPECT_EQ(result.message.direction, "left");
}

TEST(ClientMessageTest, KeepsUnknownDirectionForIntake) {
  auto result = cuberace::ParseClientMessage(R"({"t":"event","event":"command","p":{"direction":"sideways"}})");
  ASSERT_TRUE(result.ok);
  EXPECT_EQ(result.message.direction, "sideways");
}

TEST(ClientMessageTest, ParsesControlEventsWithoutPayload) {
  auto start = cuberace::ParseClientMessage(R"({"t":"event","event":"start_race"})");
  ASSERT_TRUE(start.ok);
  EXPECT_EQ(start.message.event, cuberace::ClientEvent::kStartRace);

  auto next = cuberace::ParseClientMessage(R"({"t":"event","event":"next_map","p":{}})");
  ASSERT_TRUE(next.ok);
  EXPECT_EQ(next.message.event, cuberace::ClientEvent::kNextMap);
}

TEST(ClientMessageTest, RejectsMalformedInput) {
  struct Case {
    const char* raw;
    const char* error;
  };
  const Case cases[] = {
      {"not json", "JSON 파싱 오류"},
      {"[1,2]", "JSON 파싱 오류"},
      {R"({"t":"ping","event":"command"})", "알 수 없는 메시지 유형"},
      {R"({"t":"event"})", "event 필드가 필요합니다"},
      {R"({"t":"event","event":"command"})", "payload가 누락되었습니다"},
      {R"({"t":"event","event":"command","p":{}})", "direction 필드가 필요합니다"},
      {R"({"t":"event","event":"command","p":{"direction":1}})", "direction 필드가 필요합니다"},
      {R"({"t":"event","event":"dance"})", "알 수 없는 이벤트"},
  };
  for (const auto& c : cases) {
    auto result = cuberace::ParseClientMessage(c.raw);
    EXPECT_FALSE(result.ok) << c.raw;
    EXPECT_EQ(result.error_message, c.error) << c.raw;
  }
}

TEST(ClientMessageTest, ErrorKeepsSeqForReply) {
  auto result = cuberace::ParseClientMessage(R"({"t":"event","seq":4,"event":"dance"})");
  EXPECT_FALSE(result.ok);
  EXPECT_EQ(result.message.seq, 4u);
}
