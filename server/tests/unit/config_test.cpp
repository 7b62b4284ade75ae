#include <cstdlib>
#include <stdexcept>

#include <gtest/gtest.h>

#include "cuberace/config.hpp"

namespace {

const char* const kKeys[] = {"SERVER_PORT",         "MAP_DIR",        "LOG_LEVEL",
                             "TICK_INTERVAL_MS",    "COMMAND_COOLDOWN_MS", "RESET_DELAY_MS",
                             "WS_QUEUE_LIMIT_MESSAGES", "WS_QUEUE_LIMIT_BYTES"};

class ConfigTest : public ::testing::Test {
 protected:
  void SetUp() override { ClearEnv(); }
  void TearDown() override { ClearEnv(); }

  static void ClearEnv() {
    for (const char* key : kKeys) {
      unsetenv(key);
    }
  }
};

}  // namespace

TEST_F(ConfigTest, DefaultsMatchReferenceTiming) {
  auto cfg = cuberace::LoadConfigFromEnv();
  EXPECT_EQ(cfg.port, 3000);
  EXPECT_EQ(cfg.map_dir, "maps");
  EXPECT_EQ(cfg.log_level, "info");
  EXPECT_EQ(cfg.tick_interval_ms, 300u);
  EXPECT_EQ(cfg.command_cooldown_ms, 1000u);
  EXPECT_EQ(cfg.reset_delay_ms, 3000u);
  EXPECT_EQ(cfg.ws_queue_limit_messages, 64u);
  EXPECT_EQ(cfg.ws_queue_limit_bytes, 262144u);
}

TEST_F(ConfigTest, EnvironmentOverrides) {
  setenv("SERVER_PORT", "18081", 1);
  setenv("MAP_DIR", "/tmp/race-maps", 1);
  setenv("LOG_LEVEL", "debug", 1);
  setenv("TICK_INTERVAL_MS", "50", 1);
  setenv("COMMAND_COOLDOWN_MS", "200", 1);
  setenv("RESET_DELAY_MS", "500", 1);

  auto cfg = cuberace::LoadConfigFromEnv();
  EXPECT_EQ(cfg.port, 18081);
  EXPECT_EQ(cfg.map_dir, "/tmp/race-maps");
  EXPECT_EQ(cfg.log_level, "debug");
  EXPECT_EQ(cfg.tick_interval_ms, 50u);
  EXPECT_EQ(cfg.command_cooldown_ms, 200u);
  EXPECT_EQ(cfg.reset_delay_ms, 500u);
}

TEST_F(ConfigTest, NonNumericValueThrows) {
  setenv("TICK_INTERVAL_MS", "fast", 1);
  EXPECT_THROW(cuberace::LoadConfigFromEnv(), std::invalid_argument);
}

TEST_F(ConfigTest, ZeroTickIntervalIsRejected) {
  setenv("TICK_INTERVAL_MS", "0", 1);
  EXPECT_THROW(cuberace::LoadConfigFromEnv(), std::invalid_argument);
}
