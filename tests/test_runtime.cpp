// Repository: Reprise
// Component: Serial executor and session config unit tests

#include <gtest/gtest.h>

#include <chrono>
#include <cstdlib>
#include <future>
#include <thread>
#include <vector>

#include "reprise/config/SessionConfig.hpp"
#include "reprise/runtime/SerialExecutor.hpp"
#include "support/ManualSerialExecutor.hpp"

namespace reprise::runtime {
namespace {

TEST(ThreadSerialExecutorTest, RunsPostedTasksInOrderOnOneThread) {
  ThreadSerialExecutor executor("order");
  std::vector<int> seen;
  std::promise<void> done;
  for (int i = 0; i < 5; ++i) {
    executor.Post([&seen, &executor, i] {
      EXPECT_TRUE(executor.RunsTasksOnCurrentThread());
      seen.push_back(i);
    });
  }
  executor.Post([&done] { done.set_value(); });
  ASSERT_EQ(done.get_future().wait_for(std::chrono::seconds(5)), std::future_status::ready);
  EXPECT_EQ(seen, (std::vector<int>{0, 1, 2, 3, 4}));
  EXPECT_FALSE(executor.RunsTasksOnCurrentThread());
}

TEST(ThreadSerialExecutorTest, CancelledDelayedTaskNeverRuns) {
  ThreadSerialExecutor executor("cancel");
  bool cancelled_ran = false;
  std::promise<void> done;
  const TaskId id = executor.PostDelayed(50, [&cancelled_ran] { cancelled_ran = true; });
  executor.Cancel(id);
  executor.PostDelayed(100, [&done] { done.set_value(); });
  ASSERT_EQ(done.get_future().wait_for(std::chrono::seconds(5)), std::future_status::ready);
  EXPECT_FALSE(cancelled_ran);
}

TEST(ThreadSerialExecutorTest, DelayedTasksRunByDueTime) {
  ThreadSerialExecutor executor("due");
  std::vector<int> seen;
  std::promise<void> done;
  executor.PostDelayed(80, [&seen, &done] {
    seen.push_back(2);
    done.set_value();
  });
  executor.PostDelayed(10, [&seen] { seen.push_back(1); });
  ASSERT_EQ(done.get_future().wait_for(std::chrono::seconds(5)), std::future_status::ready);
  EXPECT_EQ(seen, (std::vector<int>{1, 2}));
}

TEST(ThreadSerialExecutorTest, RejectsWorkAfterShutdown) {
  ThreadSerialExecutor executor("shutdown");
  executor.Shutdown();
  executor.Shutdown();
  EXPECT_EQ(executor.PostDelayed(0, [] {}), kInvalidTaskId);
}

TEST(ManualSerialExecutorTest, AdvancesVirtualTime) {
  tests::ManualSerialExecutor executor(1'000);
  std::vector<int64_t> at;
  executor.PostDelayed(500, [&] { at.push_back(executor.NowMs()); });
  executor.PostDelayed(200, [&] {
    at.push_back(executor.NowMs());
    executor.PostDelayed(100, [&] { at.push_back(executor.NowMs()); });
  });
  executor.AdvanceMs(1'000);
  EXPECT_EQ(at, (std::vector<int64_t>{1'200, 1'300, 1'500}));
  EXPECT_EQ(executor.NowMs(), 2'000);
}

}  // namespace
}  // namespace reprise::runtime

namespace reprise::config {
namespace {

class SessionConfigEnvTest : public ::testing::Test {
 protected:
  void TearDown() override {
    unsetenv("REPRISE_MAX_RETRIES");
    unsetenv("REPRISE_RETRY_DELAY_MS");
    unsetenv("REPRISE_TAIL_SKIP_FRACTION");
    unsetenv("REPRISE_HEARTBEAT_INTERVAL_MS");
    unsetenv("REPRISE_RPC_TIMEOUT_MS");
  }
};

TEST_F(SessionConfigEnvTest, DefaultsMatchDocumentedValues) {
  const SessionConfig config = SessionConfig::FromEnvironment();
  EXPECT_EQ(config.max_retries, 3);
  EXPECT_EQ(config.retry_delay_ms, 2'000);
  EXPECT_EQ(config.end_epsilon_ms, 1'000);
  EXPECT_EQ(config.near_end_window_ms, 5'000);
  EXPECT_EQ(config.loop_window_ms, 10'000);
  EXPECT_DOUBLE_EQ(config.tail_skip_fraction, 0.999);
  EXPECT_EQ(config.heartbeat_interval_ms, 1'000);
  EXPECT_EQ(config.resume_save_interval_ms, 5'000);
  EXPECT_FALSE(config.expect_result);
}

TEST_F(SessionConfigEnvTest, EnvironmentOverridesValidValues) {
  setenv("REPRISE_MAX_RETRIES", "5", 1);
  setenv("REPRISE_RETRY_DELAY_MS", "250", 1);
  setenv("REPRISE_TAIL_SKIP_FRACTION", "0.99", 1);
  const SessionConfig config = SessionConfig::FromEnvironment();
  EXPECT_EQ(config.max_retries, 5);
  EXPECT_EQ(config.retry_delay_ms, 250);
  EXPECT_DOUBLE_EQ(config.tail_skip_fraction, 0.99);
}

TEST_F(SessionConfigEnvTest, MalformedValuesKeepDefaults) {
  setenv("REPRISE_MAX_RETRIES", "three", 1);
  setenv("REPRISE_TAIL_SKIP_FRACTION", "1.5", 1);
  setenv("REPRISE_HEARTBEAT_INTERVAL_MS", "0", 1);
  const SessionConfig config = SessionConfig::FromEnvironment();
  EXPECT_EQ(config.max_retries, 3);
  EXPECT_DOUBLE_EQ(config.tail_skip_fraction, 0.999);
  EXPECT_EQ(config.heartbeat_interval_ms, 1'000);
}

TEST_F(SessionConfigEnvTest, ValuesBeyondIntRangeKeepDefaults) {
  const int default_timeout = SessionConfig().rpc_timeout_ms;
  setenv("REPRISE_MAX_RETRIES", "4294967297", 1);
  setenv("REPRISE_RPC_TIMEOUT_MS", "2147483648", 1);
  const SessionConfig config = SessionConfig::FromEnvironment();
  EXPECT_EQ(config.max_retries, 3);
  EXPECT_EQ(config.rpc_timeout_ms, default_timeout);
}

TEST_F(SessionConfigEnvTest, IntRangeUpperBoundIsAccepted) {
  setenv("REPRISE_RPC_TIMEOUT_MS", "2147483647", 1);
  const SessionConfig config = SessionConfig::FromEnvironment();
  EXPECT_EQ(config.rpc_timeout_ms, 2147483647);
}

}  // namespace
}  // namespace reprise::config
