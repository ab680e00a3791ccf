#include <gtest/gtest.h>

#include <fstream>
#include <unistd.h>

#include "Config.h"
#include "Log.h"

TEST(Config, EmptyObjectKeepsDefaults) {
  AppConfig cfg;
  ASSERT_TRUE(parseConfig("{}", cfg));
  EXPECT_EQ(cfg.port, "");
  EXPECT_EQ(cfg.baud, (uint32_t)PDL_DEFAULT_BAUD);
  EXPECT_EQ(cfg.timeout_ms, (uint32_t)PDL_LINK_TIMEOUT_MS);
  EXPECT_EQ(cfg.retries, (uint32_t)PDL_READ_RETRIES);
  EXPECT_DOUBLE_EQ(cfg.rate_hz, PDL_DEFAULT_RATE_HZ);
  EXPECT_DOUBLE_EQ(cfg.duration_s, 0.0);
  EXPECT_EQ(cfg.output, "session.csv");
  EXPECT_EQ(cfg.log_level, "info");
  EXPECT_FALSE(cfg.calibration[0].has_low);
  EXPECT_FALSE(cfg.calibration[1].has_high);
}

TEST(Config, ParsesFullDocument) {
  const char* json = R"({
    "port": "/dev/ttyACM0",
    "baud": 115200,
    "timeout_ms": 300,
    "retries": 2,
    "rate_hz": 25.5,
    "duration_s": 60,
    "output": "run1.csv",
    "print_every_ms": 250,
    "log_level": "debug",
    "calibration": {
      "pressure": {
        "low":  { "voltage": 0.5, "value": 0 },
        "high": { "voltage": 4.5, "value": 100 }
      },
      "displacement": {
        "high": { "voltage": 3.0, "value": 5.0 }
      }
    }
  })";
  AppConfig cfg;
  ASSERT_TRUE(parseConfig(json, cfg));
  EXPECT_EQ(cfg.port, "/dev/ttyACM0");
  EXPECT_EQ(cfg.baud, 115200u);
  EXPECT_EQ(cfg.timeout_ms, 300u);
  EXPECT_EQ(cfg.retries, 2u);
  EXPECT_DOUBLE_EQ(cfg.rate_hz, 25.5);
  EXPECT_DOUBLE_EQ(cfg.duration_s, 60.0);
  EXPECT_EQ(cfg.output, "run1.csv");
  EXPECT_EQ(cfg.print_every_ms, 250u);
  EXPECT_EQ(cfg.log_level, "debug");

  const CalibrationPreset& p = cfg.calibration[channelIndex(Channel::Pressure)];
  EXPECT_TRUE(p.has_low);
  EXPECT_TRUE(p.has_high);
  EXPECT_FLOAT_EQ(p.low_V, 0.5f);
  EXPECT_FLOAT_EQ(p.high_value, 100.0f);

  const CalibrationPreset& d = cfg.calibration[channelIndex(Channel::Displacement)];
  EXPECT_FALSE(d.has_low);
  EXPECT_TRUE(d.has_high);
  EXPECT_FLOAT_EQ(d.high_V, 3.0f);
}

TEST(Config, FailureLeavesOutputUntouched) {
  AppConfig cfg;
  cfg.port = "/dev/ttyUSB7";
  EXPECT_FALSE(parseConfig("{ \"port\": \"/dev/ttyS0\", ", cfg));
  EXPECT_EQ(cfg.port, "/dev/ttyUSB7");

  EXPECT_FALSE(parseConfig("{ \"port\": \"/dev/ttyS0\", \"rate_hz\": \"fast\" }", cfg));
  EXPECT_EQ(cfg.port, "/dev/ttyUSB7");
}

TEST(Config, RejectsWrongShapes) {
  AppConfig cfg;
  EXPECT_FALSE(parseConfig("[1, 2]", cfg));
  EXPECT_FALSE(parseConfig("{ \"baud\": -9600 }", cfg));
  EXPECT_FALSE(parseConfig("{ \"port\": 3 }", cfg));
  EXPECT_FALSE(parseConfig("{ \"calibration\": 1 }", cfg));
  EXPECT_FALSE(parseConfig("{ \"calibration\": { \"pressure\": { \"low\": { \"voltage\": 1 } } } }", cfg));
}

TEST(Config, RejectsOutOfRangeValues) {
  AppConfig cfg;
  EXPECT_FALSE(parseConfig("{ \"rate_hz\": 0 }", cfg));
  EXPECT_FALSE(parseConfig("{ \"rate_hz\": 5000 }", cfg));
  EXPECT_FALSE(parseConfig("{ \"duration_s\": -1 }", cfg));
  EXPECT_FALSE(parseConfig("{ \"timeout_ms\": 0 }", cfg));
  EXPECT_FALSE(parseConfig("{ \"baud\": 0 }", cfg));
  EXPECT_FALSE(parseConfig("{ \"log_level\": \"loud\" }", cfg));
  EXPECT_TRUE(parseConfig("{ \"rate_hz\": 1000 }", cfg));
}

TEST(Config, LoadsFromFile) {
  const std::string path = testing::TempDir() + "pdl_config_test.json";
  {
    std::ofstream f(path);
    f << "{ \"port\": \"/dev/ttyACM1\", \"rate_hz\": 20 }";
  }
  AppConfig cfg;
  ASSERT_TRUE(loadConfig(path, cfg));
  EXPECT_EQ(cfg.port, "/dev/ttyACM1");
  EXPECT_DOUBLE_EQ(cfg.rate_hz, 20.0);
  unlink(path.c_str());

  EXPECT_FALSE(loadConfig(path, cfg));
}

TEST(Config, LogLevelNames) {
  EXPECT_TRUE(pdlSetLogLevel("debug"));
  EXPECT_EQ(pdlLog("CONFIG")->level(), spdlog::level::debug);
  EXPECT_FALSE(pdlSetLogLevel("loud"));
  EXPECT_EQ(pdlLog("CONFIG")->level(), spdlog::level::debug);
  EXPECT_TRUE(pdlSetLogLevel("info"));
}
