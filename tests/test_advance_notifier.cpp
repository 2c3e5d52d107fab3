// Repository: Reprise
// Component: Advance notifier and heartbeat reporter unit tests

#include <gtest/gtest.h>

#include <memory>

#include "reprise/heartbeat/HeartbeatReporter.hpp"
#include "reprise/notify/AdvanceNotifier.hpp"
#include "reprise/util/JsonText.hpp"
#include "fixtures/FakeAdvanceNotifier.h"
#include "fixtures/FakeResolvers.h"
#include "support/ManualSerialExecutor.hpp"

namespace reprise::notify {
namespace {

using tests::fixtures::FakeHttpTransport;

session::PlaybackSnapshot Snap(int64_t position_ms, int64_t duration_ms, bool playing = true) {
  session::PlaybackSnapshot s;
  s.position_ms = position_ms;
  s.duration_ms = duration_ms;
  s.is_playing = playing;
  return s;
}

TEST(ResolveCallbackUrlTest, ExplicitBeatsQueryParameter) {
  const std::string ref = "http://h/a.mkv?callback=http%3A%2F%2F127.0.0.1%3A9%2Frpc";
  EXPECT_EQ(ResolveCallbackUrl("http://explicit/rpc", ref), "http://explicit/rpc");
  EXPECT_EQ(ResolveCallbackUrl("", ref), "http://127.0.0.1:9/rpc");
  EXPECT_EQ(ResolveCallbackUrl("", "http://h/a.mkv"), "");
}

TEST(JsonRpcNotifierTest, WithoutCallbackEverythingIsRefused) {
  auto transport = std::make_shared<FakeHttpTransport>();
  JsonRpcNotifier notifier("", transport, 1'000, 8);
  EXPECT_FALSE(notifier.HasCallback());
  EXPECT_FALSE(notifier.SendHeartbeat(Snap(1'000, 10'000)));
  EXPECT_FALSE(notifier.SendNextEpisode(1, 6, "", "x"));
  notifier.WaitIdle();
  EXPECT_TRUE(transport->requests.empty());
}

TEST(JsonRpcNotifierTest, UnsupportedSchemeDisablesNotifier) {
  auto transport = std::make_shared<FakeHttpTransport>();
  JsonRpcNotifier notifier("ftp://secure/rpc", transport, 1'000, 8);
  EXPECT_FALSE(notifier.HasCallback());
}

TEST(JsonRpcNotifierTest, HttpsCallbackIsAccepted) {
  auto transport = std::make_shared<FakeHttpTransport>();
  JsonRpcNotifier notifier("https://secure/rpc", transport, 1'000, 8);
  ASSERT_TRUE(notifier.HasCallback());
  EXPECT_TRUE(notifier.SendStopped(Snap(5'000, 10'000)));
  notifier.WaitIdle();
  ASSERT_EQ(transport->requests.size(), 1u);
  EXPECT_EQ(transport->requests[0].url, "https://secure/rpc");
}

TEST(JsonRpcNotifierTest, DeliversMessagesInOrder) {
  auto transport = std::make_shared<FakeHttpTransport>();
  JsonRpcNotifier notifier("http://127.0.0.1:9/rpc", transport, 1'000, 8);
  ASSERT_TRUE(notifier.HasCallback());
  EXPECT_TRUE(notifier.SendHeartbeat(Snap(1'000, 10'000, false)));
  EXPECT_TRUE(notifier.SendNextEpisode(1, 6, "tt1", "http://h/S01E05.mkv"));
  EXPECT_TRUE(notifier.SendStopped(Snap(9'900, 10'000)));
  notifier.WaitIdle();

  ASSERT_EQ(transport->requests.size(), 3u);
  for (const auto& r : transport->requests) {
    EXPECT_EQ(r.method, "POST");
    EXPECT_EQ(r.url, "http://127.0.0.1:9/rpc");
  }
  std::string event;
  bool paused = false;
  ASSERT_TRUE(util::ExtractString(transport->requests[0].body, "event", &event));
  ASSERT_TRUE(util::ExtractBool(transport->requests[0].body, "paused", &paused));
  EXPECT_EQ(event, "time");
  EXPECT_TRUE(paused);
  EXPECT_NE(transport->requests[1].body.find("\"method\":\"nextEpisode\""), std::string::npos);
  ASSERT_TRUE(util::ExtractString(transport->requests[2].body, "event", &event));
  EXPECT_EQ(event, "stopped");
  EXPECT_EQ(notifier.GetStats().delivered, 3u);
}

TEST(JsonRpcNotifierTest, FailedDeliveryIsCountedNotRetried) {
  auto transport = std::make_shared<FakeHttpTransport>();
  transport->response = HttpResponse{false, 500, "", ""};
  JsonRpcNotifier notifier("http://127.0.0.1:9/rpc", transport, 1'000, 8);
  EXPECT_TRUE(notifier.SendStopped(Snap(0, 10'000)));
  notifier.WaitIdle();
  EXPECT_EQ(transport->requests.size(), 1u);
  EXPECT_EQ(notifier.GetStats().failed, 1u);
}

}  // namespace
}  // namespace reprise::notify

namespace reprise::heartbeat {
namespace {

using tests::ManualSerialExecutor;
using tests::fixtures::FakeAdvanceNotifier;

TEST(HeartbeatReporterTest, SendsOncePerIntervalWhileRunning) {
  ManualSerialExecutor executor;
  FakeAdvanceNotifier notifier;
  HeartbeatReporter reporter(executor, notifier, 1'000);
  int64_t position = 0;
  reporter.Start([&position]() -> std::optional<session::PlaybackSnapshot> {
    session::PlaybackSnapshot s;
    s.position_ms = position;
    s.duration_ms = 60'000;
    s.is_playing = true;
    position += 1'000;
    return s;
  });
  EXPECT_TRUE(reporter.running());
  executor.AdvanceMs(3'500);
  EXPECT_EQ(reporter.sent_count(), 3u);
  ASSERT_EQ(notifier.heartbeats.size(), 3u);
  EXPECT_EQ(notifier.heartbeats[2].position_ms, 2'000);

  reporter.Stop();
  reporter.Stop();
  executor.AdvanceMs(5'000);
  EXPECT_EQ(notifier.heartbeats.size(), 3u);
  EXPECT_FALSE(reporter.running());
}

TEST(HeartbeatReporterTest, SkipsUntilDurationKnown) {
  ManualSerialExecutor executor;
  FakeAdvanceNotifier notifier;
  HeartbeatReporter reporter(executor, notifier, 1'000);
  int64_t duration = 0;
  reporter.Start([&duration]() -> std::optional<session::PlaybackSnapshot> {
    session::PlaybackSnapshot s;
    s.duration_ms = duration;
    return s;
  });
  executor.AdvanceMs(2'000);
  EXPECT_EQ(reporter.skipped_count(), 2u);
  EXPECT_TRUE(notifier.heartbeats.empty());
  duration = 10'000;
  executor.AdvanceMs(1'000);
  EXPECT_EQ(notifier.heartbeats.size(), 1u);
}

TEST(HeartbeatReporterTest, IdleWithoutCallback) {
  ManualSerialExecutor executor;
  FakeAdvanceNotifier notifier(false);
  HeartbeatReporter reporter(executor, notifier, 1'000);
  reporter.Start([]() -> std::optional<session::PlaybackSnapshot> { return std::nullopt; });
  EXPECT_FALSE(reporter.running());
  EXPECT_EQ(executor.pending(), 0u);
}

}  // namespace
}  // namespace reprise::heartbeat
