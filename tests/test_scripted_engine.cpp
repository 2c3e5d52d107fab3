// Repository: Reprise
// Component: Scripted media engine unit tests

#include <gtest/gtest.h>

#include <sstream>
#include <stdexcept>
#include <vector>

#include "reprise/engine/ScriptedMediaEngine.hpp"
#include "support/ManualSerialExecutor.hpp"

namespace reprise::engine {
namespace {

using tests::ManualSerialExecutor;

TEST(EngineScriptTest, ParsesStepsSortedByTime) {
  std::istringstream in(
      "# comment\n"
      "{\"at_ms\":500,\"type\":\"error\",\"code\":\"network_timeout\",\"message\":\"slow\"}\n"
      "\n"
      "{\"at_ms\":0,\"type\":\"progress\",\"position_ms\":0,\"duration_ms\":60000}\n"
      "{\"at_ms\":900,\"type\":\"tracks\",\"track_type\":\"audio\",\"sample_mime\":\"audio/eac3\"}\n");
  const auto steps = ParseEngineScript(in);
  ASSERT_EQ(steps.size(), 3u);
  EXPECT_EQ(steps[0].type, ScriptStep::Type::kProgress);
  EXPECT_EQ(steps[0].duration_ms, std::optional<int64_t>(60'000));
  EXPECT_EQ(steps[1].type, ScriptStep::Type::kError);
  EXPECT_EQ(steps[1].error_code, EngineErrorCode::kNetworkTimeout);
  EXPECT_EQ(steps[1].message, "slow");
  EXPECT_EQ(steps[2].track_type, "audio");
}

TEST(EngineScriptTest, RejectsUnknownTypesAndCodes) {
  std::istringstream bad_type("{\"at_ms\":0,\"type\":\"explode\"}\n");
  EXPECT_THROW(ParseEngineScript(bad_type), std::runtime_error);
  std::istringstream bad_code("{\"at_ms\":0,\"type\":\"error\",\"code\":\"oops\"}\n");
  EXPECT_THROW(ParseEngineScript(bad_code), std::runtime_error);
  std::istringstream no_time("{\"type\":\"ready\"}\n");
  EXPECT_THROW(ParseEngineScript(no_time), std::runtime_error);
}

TEST(ScriptedMediaEngineTest, FiresEventsWithSnapshotsOnTimeline) {
  std::istringstream in(
      "{\"at_ms\":0,\"type\":\"progress\",\"position_ms\":1000,\"duration_ms\":60000}\n"
      "{\"at_ms\":100,\"type\":\"error\",\"code\":\"container_malformed\",\"position_ms\":30000}\n"
      "{\"at_ms\":200,\"type\":\"ended\"}\n");
  ManualSerialExecutor timeline;
  ScriptedMediaEngine engine(timeline, ParseEngineScript(in));
  std::vector<EngineEvent> events;
  engine.SetEventCallback([&events](const EngineEvent& e) { events.push_back(e); });
  ASSERT_TRUE(engine.Open("http://h/a.mkv", 0));
  engine.Play();

  timeline.AdvanceMs(150);
  ASSERT_EQ(events.size(), 1u);
  EXPECT_EQ(events[0].type, EngineEvent::Type::kError);
  EXPECT_EQ(events[0].error.code, EngineErrorCode::kContainerMalformed);
  ASSERT_TRUE(events[0].snapshot.has_value());
  EXPECT_EQ(events[0].snapshot->position_ms, 30'000);
  EXPECT_EQ(events[0].snapshot->duration_ms, 60'000);

  ASSERT_TRUE(engine.SeekTo(35'000));
  EXPECT_EQ(engine.Snapshot().position_ms, 35'000);

  timeline.AdvanceMs(100);
  ASSERT_EQ(events.size(), 2u);
  EXPECT_EQ(events[1].state, PlaybackState::kEnded);
  EXPECT_EQ(events[1].snapshot->position_ms, 60'000);
  EXPECT_EQ(engine.fired_steps(), 3u);
}

TEST(ScriptedMediaEngineTest, ReleaseCancelsRemainingSteps) {
  std::istringstream in("{\"at_ms\":1000,\"type\":\"ended\",\"duration_ms\":5000}\n");
  ManualSerialExecutor timeline;
  ScriptedMediaEngine engine(timeline, ParseEngineScript(in));
  int fired = 0;
  engine.SetEventCallback([&fired](const EngineEvent&) { ++fired; });
  ASSERT_TRUE(engine.Open("ref", 0));
  engine.Release();
  timeline.AdvanceMs(2'000);
  EXPECT_EQ(fired, 0);
  EXPECT_FALSE(engine.Prepare());
  EXPECT_FALSE(engine.Open("ref", 0));
}

}  // namespace
}  // namespace reprise::engine
