// Repository: Reprise
// Component: Heartbeat Reporter
// Purpose: Periodic progress samples forwarded to the advance notifier.
// Copyright (c) 2026 Reprise

#ifndef REPRISE_HEARTBEAT_HEARTBEAT_REPORTER_HPP_
#define REPRISE_HEARTBEAT_HEARTBEAT_REPORTER_HPP_

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>

#include "reprise/notify/AdvanceNotifier.hpp"
#include "reprise/runtime/SerialExecutor.hpp"
#include "reprise/session/Session.hpp"

namespace reprise::heartbeat {

// Ticks on the owner's serial executor. Start/Stop and destruction must
// happen on that executor's sequence (or after it has shut down).
class HeartbeatReporter {
 public:
  using SnapshotSource = std::function<std::optional<session::PlaybackSnapshot>()>;

  HeartbeatReporter(runtime::ISerialExecutor& executor,
                    notify::IAdvanceNotifier& notifier,
                    int64_t interval_ms);
  ~HeartbeatReporter();

  HeartbeatReporter(const HeartbeatReporter&) = delete;
  HeartbeatReporter& operator=(const HeartbeatReporter&) = delete;

  void Start(SnapshotSource source);
  // Idempotent. A tick already dequeued sees the cleared liveness flag and
  // does nothing.
  void Stop();

  [[nodiscard]] bool running() const { return running_; }
  [[nodiscard]] uint64_t sent_count() const { return sent_; }
  [[nodiscard]] uint64_t skipped_count() const { return skipped_; }

 private:
  void ScheduleNext();
  void Tick();

  runtime::ISerialExecutor& executor_;
  notify::IAdvanceNotifier& notifier_;
  const int64_t interval_ms_;

  SnapshotSource source_;
  bool running_ = false;
  runtime::TaskId pending_ = runtime::kInvalidTaskId;
  // Replaced on every Start/Stop; scheduled ticks hold a weak reference.
  std::shared_ptr<bool> alive_;
  uint64_t sent_ = 0;
  uint64_t skipped_ = 0;
};

}  // namespace reprise::heartbeat

#endif  // REPRISE_HEARTBEAT_HEARTBEAT_REPORTER_HPP_
