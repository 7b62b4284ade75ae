#include <sstream>
#include <string>

#include <gtest/gtest.h>

#include "cuberace/observability.hpp"

using cuberace::LogLevel;

TEST(ObservabilityTest, ParsesLogLevels) {
  EXPECT_EQ(cuberace::ParseLogLevel("debug"), LogLevel::kDebug);
  EXPECT_EQ(cuberace::ParseLogLevel("warning"), LogLevel::kWarn);
  EXPECT_EQ(cuberace::ParseLogLevel("warn"), LogLevel::kWarn);
  EXPECT_EQ(cuberace::ParseLogLevel("error"), LogLevel::kError);
  EXPECT_EQ(cuberace::ParseLogLevel("verbose"), LogLevel::kInfo);
}

TEST(ObservabilityTest, WritesStructuredLine) {
  std::ostringstream out;
  cuberace::Observability obs(LogLevel::kInfo, out);
  obs.Log(LogLevel::kInfo, {.trace_id = "t-1",
           .player_id = "player-1",
           .team_id = "red",
           .name = "race_won",
           .latency_ms = 3,
           .detail = {{"tick", 12}}});

  auto line = nlohmann::json::parse(out.str());
  EXPECT_EQ(line["level"], "info");
  EXPECT_EQ(line["traceId"], "t-1");
  EXPECT_EQ(line["eventName"], "race_won");
  EXPECT_EQ(line["latencyMs"], 3);
  EXPECT_EQ(line["playerId"], "player-1");
  EXPECT_EQ(line["teamId"], "red");
  EXPECT_EQ(line["detail"]["tick"], 12);
}

TEST(ObservabilityTest, OmitsMissingFields) {
  std::ostringstream out;
  cuberace::Observability obs(LogLevel::kInfo, out);
  obs.Log(LogLevel::kWarn, {.trace_id = "t-2", .name = "ws_handshake_failed"});

  auto line = nlohmann::json::parse(out.str());
  EXPECT_EQ(line["level"], "warn");
  EXPECT_FALSE(line.contains("playerId"));
  EXPECT_FALSE(line.contains("teamId"));
  EXPECT_FALSE(line.contains("detail"));
}

TEST(ObservabilityTest, FiltersBelowConfiguredLevel) {
  std::ostringstream out;
  cuberace::Observability obs(LogLevel::kWarn, out);
  obs.Log(LogLevel::kDebug, {.name = "move_applied"});
  obs.Log(LogLevel::kInfo, {.name = "player_connected"});
  EXPECT_TRUE(out.str().empty());
  EXPECT_FALSE(obs.Enabled(LogLevel::kInfo));
  EXPECT_TRUE(obs.Enabled(LogLevel::kError));
}

TEST(ObservabilityTest, CountersFeedSnapshot) {
  std::ostringstream out;
  cuberace::Observability obs(LogLevel::kInfo, out);
  obs.IncrementRequest();
  obs.IncrementRequest();
  obs.IncrementError();
  obs.SetWebsocketActive(3);
  obs.SetPlayersConnected(2);
  obs.SetRaceRunning(true);
  obs.IncrementTick();
  obs.IncrementCommand(true);
  obs.IncrementCommand(false);
  obs.IncrementCommand(false);
  obs.IncrementRaceFinished();

  auto snapshot = obs.Snapshot();
  EXPECT_EQ(snapshot.request_total, 2u);
  EXPECT_EQ(snapshot.request_errors, 1u);
  EXPECT_EQ(snapshot.websocket_active, 3u);
  EXPECT_EQ(snapshot.players_connected, 2u);
  EXPECT_TRUE(snapshot.race_running);
  EXPECT_EQ(snapshot.ticks, 1u);
  EXPECT_EQ(snapshot.commands_accepted, 1u);
  EXPECT_EQ(snapshot.commands_rejected, 2u);
  EXPECT_EQ(snapshot.races_finished, 1u);
}

TEST(ObservabilityTest, TraceIdsAreUnique) {
  cuberace::Observability obs(LogLevel::kError);
  EXPECT_NE(obs.NextTraceId(), obs.NextTraceId());
}
