#include <gtest/gtest.h>

#include <cstdlib>

#include "tracer/Config.hpp"
#include "tracer/Logger.hpp"

using namespace tracer;

namespace {

class ConfigTest : public ::testing::Test {
protected:
  void SetUp() override { clear(); }
  void TearDown() override { clear(); }

  static void clear() {
    ::unsetenv("TRACER_LEVEL");
    ::unsetenv("TRACER_UTC");
    ::unsetenv("TRACER_INDENT");
  }
};

} // namespace

TEST_F(ConfigTest, DefaultsWithoutEnvironment) {
  const LoggerConfig config = LoggerConfig::fromEnvironment();
  EXPECT_EQ(config.minLevel, Level::Info);
  EXPECT_TRUE(config.indentation);
  EXPECT_EQ(config.timeType, TimeType::Local);
}

TEST_F(ConfigTest, EnvironmentOverridesBase) {
  ::setenv("TRACER_LEVEL", "error", 1);
  ::setenv("TRACER_UTC", "Yes", 1);
  ::setenv("TRACER_INDENT", "0", 1);

  const LoggerConfig config =
      LoggerConfig::fromEnvironment(LoggerConfig{.minLevel = Level::Debug});
  EXPECT_EQ(config.minLevel, Level::Error);
  EXPECT_EQ(config.timeType, TimeType::Utc);
  EXPECT_FALSE(config.indentation);
}

TEST_F(ConfigTest, UnparseableValuesAreIgnored) {
  ::setenv("TRACER_LEVEL", "loud", 1);
  ::setenv("TRACER_UTC", "maybe", 1);

  const LoggerConfig base{.minLevel = Level::Warn, .timeType = TimeType::Utc};
  const LoggerConfig config = LoggerConfig::fromEnvironment(base);
  EXPECT_EQ(config.minLevel, Level::Warn);
  EXPECT_EQ(config.timeType, TimeType::Utc);
}

TEST_F(ConfigTest, LoggerTakesEnvironmentConfig) {
  ::setenv("TRACER_LEVEL", "debug", 1);
  ::setenv("TRACER_UTC", "on", 1);

  Logger logger("svc", LoggerConfig::fromEnvironment());
  EXPECT_EQ(logger.getLogLevel(), Level::Debug);
  EXPECT_TRUE(logger.isUtcForced());

  logger.debug("visible");
  EXPECT_EQ(logger.logs().size(), 1u);
}
