// Repository: Reprise
// Component: Logger unit tests

#include <gtest/gtest.h>

#include <string>
#include <utility>
#include <vector>

#include "reprise/util/Logger.hpp"

namespace reprise::util {
namespace {

class LoggerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    saved_level_ = Logger::MinLevel();
    Logger::SetSink([this](LogLevel level, const std::string& line) {
      captured_.emplace_back(level, line);
    });
  }

  void TearDown() override {
    Logger::SetSink(nullptr);
    Logger::SetMinLevel(saved_level_);
  }

  LogLevel saved_level_ = LogLevel::kInfo;
  std::vector<std::pair<LogLevel, std::string>> captured_;
};

TEST_F(LoggerTest, LinesBelowThresholdAreDiscarded) {
  Logger::SetMinLevel(LogLevel::kWarn);
  Logger::Debug("[Test] debug");
  Logger::Info("[Test] info");
  Logger::Warn("[Test] warn");
  Logger::Error("[Test] error");

  ASSERT_EQ(captured_.size(), 2u);
  EXPECT_EQ(captured_[0].first, LogLevel::kWarn);
  EXPECT_EQ(captured_[0].second, "[Test] warn");
  EXPECT_EQ(captured_[1].first, LogLevel::kError);
}

TEST_F(LoggerTest, DebugThresholdPassesEverything) {
  Logger::SetMinLevel(LogLevel::kDebug);
  Logger::Debug("[Test] a");
  Logger::Info("[Test] b");
  ASSERT_EQ(captured_.size(), 2u);
  EXPECT_EQ(captured_[0].first, LogLevel::kDebug);
}

TEST(LogLevelTest, ParsesNamesCaseInsensitively) {
  EXPECT_EQ(ParseLogLevel("debug"), LogLevel::kDebug);
  EXPECT_EQ(ParseLogLevel("WARN"), LogLevel::kWarn);
  EXPECT_EQ(ParseLogLevel("Error"), LogLevel::kError);
  EXPECT_FALSE(ParseLogLevel("verbose").has_value());
  EXPECT_STREQ(LogLevelName(LogLevel::kInfo), "info");
}

}  // namespace
}  // namespace reprise::util
