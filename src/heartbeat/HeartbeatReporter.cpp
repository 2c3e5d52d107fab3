// Repository: Reprise
// Component: Heartbeat Reporter
// Purpose: Periodic progress samples forwarded to the advance notifier.
// Copyright (c) 2026 Reprise

#include "reprise/heartbeat/HeartbeatReporter.hpp"

#include "reprise/util/Logger.hpp"

namespace reprise::heartbeat {

HeartbeatReporter::HeartbeatReporter(runtime::ISerialExecutor& executor,
                                     notify::IAdvanceNotifier& notifier,
                                     int64_t interval_ms)
    : executor_(executor),
      notifier_(notifier),
      interval_ms_(interval_ms > 0 ? interval_ms : 1000) {}

HeartbeatReporter::~HeartbeatReporter() {
  Stop();
}

void HeartbeatReporter::Start(SnapshotSource source) {
  Stop();
  if (!notifier_.HasCallback()) {
    util::Logger::Debug("[Heartbeat] no callback channel, reporter idle");
    return;
  }
  source_ = std::move(source);
  alive_ = std::make_shared<bool>(true);
  running_ = true;
  ScheduleNext();
}

void HeartbeatReporter::Stop() {
  if (alive_) *alive_ = false;
  alive_.reset();
  executor_.Cancel(pending_);
  pending_ = runtime::kInvalidTaskId;
  running_ = false;
  source_ = nullptr;
}

void HeartbeatReporter::ScheduleNext() {
  std::weak_ptr<bool> token = alive_;
  pending_ = executor_.PostDelayed(interval_ms_, [this, token] {
    auto alive = token.lock();
    if (!alive || !*alive) return;
    Tick();
  });
}

void HeartbeatReporter::Tick() {
  pending_ = runtime::kInvalidTaskId;
  const auto snapshot = source_ ? source_() : std::nullopt;
  if (snapshot && snapshot->HasDuration()) {
    if (notifier_.SendHeartbeat(*snapshot)) {
      ++sent_;
    } else {
      ++skipped_;
    }
  } else {
    // Duration still unknown (or engine gone): nothing meaningful to report.
    ++skipped_;
  }
  if (running_) ScheduleNext();
}

}  // namespace reprise::heartbeat
