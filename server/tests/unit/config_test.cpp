#include <cstdlib>
#include <stdexcept>

#include <gtest/gtest.h>

#include "wormhole/config.hpp"

namespace {

class ConfigEnvTest : public ::testing::Test {
 protected:
  void SetUp() override { ClearAll(); }
  void TearDown() override { ClearAll(); }

  static void ClearAll() {
    for (const char* key : {"WORMHOLE_HOST", "WORMHOLE_PORT", "LOG_LEVEL", "ROOM_IDLE_TIMEOUT_SECONDS",
                            "ROOM_ID_MAX_ATTEMPTS", "ROOM_DELETION_CHANNEL_CAPACITY"}) {
      unsetenv(key);
    }
  }
};

}  // namespace

TEST_F(ConfigEnvTest, FallsBackToDefaults) {
  auto cfg = wormhole::LoadConfigFromEnv();
  EXPECT_EQ(cfg.host, "127.0.0.1");
  EXPECT_EQ(cfg.port, 8080);
  EXPECT_EQ(cfg.log_level, "info");
  EXPECT_EQ(cfg.room_idle_timeout_seconds, 30u);
  EXPECT_EQ(cfg.room_id_max_attempts, 5u);
  EXPECT_EQ(cfg.deletion_channel_capacity, 100u);
}

TEST_F(ConfigEnvTest, ReadsOverridesFromEnvironment) {
  setenv("WORMHOLE_HOST", "0.0.0.0", 1);
  setenv("WORMHOLE_PORT", "9090", 1);
  setenv("LOG_LEVEL", "debug", 1);
  setenv("ROOM_IDLE_TIMEOUT_SECONDS", "5", 1);
  setenv("ROOM_ID_MAX_ATTEMPTS", "3", 1);
  setenv("ROOM_DELETION_CHANNEL_CAPACITY", "10", 1);

  auto cfg = wormhole::LoadConfigFromEnv();
  EXPECT_EQ(cfg.host, "0.0.0.0");
  EXPECT_EQ(cfg.port, 9090);
  EXPECT_EQ(cfg.log_level, "debug");
  EXPECT_EQ(cfg.room_idle_timeout_seconds, 5u);
  EXPECT_EQ(cfg.room_id_max_attempts, 3u);
  EXPECT_EQ(cfg.deletion_channel_capacity, 10u);
}

TEST_F(ConfigEnvTest, RejectsInvalidPort) {
  setenv("WORMHOLE_PORT", "eighty", 1);
  EXPECT_THROW(wormhole::LoadConfigFromEnv(), std::invalid_argument);

  setenv("WORMHOLE_PORT", "70000", 1);
  EXPECT_THROW(wormhole::LoadConfigFromEnv(), std::invalid_argument);
}

TEST_F(ConfigEnvTest, RejectsZeroChannelCapacity) {
  setenv("ROOM_DELETION_CHANNEL_CAPACITY", "0", 1);
  EXPECT_THROW(wormhole::LoadConfigFromEnv(), std::invalid_argument);
}
