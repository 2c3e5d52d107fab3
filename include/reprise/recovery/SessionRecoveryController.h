// Repository: Reprise
// Component: Session Recovery Controller
// Purpose: Error classification, bounded retries and exactly-once completion for one session.
// Copyright (c) 2026 Reprise

#ifndef REPRISE_RECOVERY_SESSION_RECOVERY_CONTROLLER_H_
#define REPRISE_RECOVERY_SESSION_RECOVERY_CONTROLLER_H_

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>

#include "reprise/advance/EpisodeAdvanceProtocol.hpp"
#include "reprise/config/SessionConfig.hpp"
#include "reprise/engine/IMediaEngine.h"
#include "reprise/heartbeat/HeartbeatReporter.hpp"
#include "reprise/notify/AdvanceNotifier.hpp"
#include "reprise/recovery/ErrorClassifier.h"
#include "reprise/resume/ResumeStore.hpp"
#include "reprise/runtime/SerialExecutor.hpp"
#include "reprise/session/Session.hpp"
#include "reprise/session/SessionOutcome.hpp"

namespace reprise::recovery {

// SessionRecoveryController
//
// Owns one playback session from Start() to its terminal outcome. It
// decides whether the engine really finished, whether an error is worth a
// retry, and which external action follows. Completion fires at most once
// per session and retries are bounded by max_retries.
//
// Threading: a single serial actor. Start, Stop, OnEngineEvent, the
// accessors and destruction run on the serial executor's sequence.
// PostEngineEvent is the only thread-safe entry point; engine callbacks go
// through it.
class SessionRecoveryController {
 public:
  enum class State {
    kIdle = 0,       // Not started
    kPlaying,        // Engine rendering
    kErrorDetected,  // Transient: classifying an engine error
    kRetrying,       // Delayed resume scheduled
    kCompleting,     // Completion action running (grace delay / advance protocol)
    kTerminated,     // Absorbing
  };

  enum class StartError {
    kNone = 0,
    kEngineUnavailable,
    kAlreadyStarted,
  };

  struct StartResult {
    bool success = false;
    StartError error = StartError::kNone;
    std::string message;
    int64_t start_position_ms = 0;
  };

  struct Dependencies {
    runtime::ISerialExecutor* serial = nullptr;
    // Runs blocking lookups for the advance protocol.
    runtime::ISerialExecutor* background = nullptr;
    engine::EngineFactory engine_factory;
    resume::IResumeStore* resume_store = nullptr;
    notify::IAdvanceNotifier* notifier = nullptr;
    std::shared_ptr<advance::ICatalogResolver> catalog;
    std::shared_ptr<advance::IStreamResolver> streams;
  };

  struct MetricsSnapshot {
    std::map<std::pair<State, State>, uint64_t> transitions;
    uint64_t illegal_transition_total = 0;
    uint64_t retry_total = 0;
    uint64_t completion_total = 0;
    uint64_t duplicate_completion_total = 0;
    uint64_t spurious_terminal_total = 0;
    uint64_t ignored_event_total = 0;
    uint64_t resume_save_total = 0;
    uint64_t stopped_message_total = 0;
    State state = State::kIdle;
  };

  using OutcomeCallback = std::function<void(const session::TerminalOutcome&)>;

  // Throws std::invalid_argument if serial, background, resume_store or
  // notifier is missing.
  SessionRecoveryController(Dependencies deps, config::SessionConfig config);
  ~SessionRecoveryController();

  SessionRecoveryController(const SessionRecoveryController&) = delete;
  SessionRecoveryController& operator=(const SessionRecoveryController&) = delete;

  // Starts at resume_hint_ms when > 0, else the best resume-store match,
  // else zero.
  StartResult Start(session::Session session, std::optional<int64_t> resume_hint_ms);

  // Sole mutation entry point for engine activity.
  void OnEngineEvent(const engine::EngineEvent& event);

  // Marshals an engine event onto the serial queue. Thread-safe.
  void PostEngineEvent(const engine::EngineEvent& event);

  // Idempotent teardown: persists or clears the resume point, cancels every
  // timer, sends the stop message if still owed, releases the engine.
  void Stop();

  // Invoked once, on the serial queue, when the session terminates.
  void SetOutcomeCallback(OutcomeCallback callback);

  [[nodiscard]] State state() const { return state_; }
  [[nodiscard]] const RetryState& retry_state() const { return retry_; }
  [[nodiscard]] bool completion_handled() const { return guard_.handled(); }
  [[nodiscard]] const session::Session& session() const { return session_; }
  [[nodiscard]] const std::optional<session::TerminalOutcome>& outcome() const {
    return output_.Get();
  }
  // Target of the scheduled retry, if one is pending.
  [[nodiscard]] std::optional<int64_t> pending_retry_target() const {
    return pending_retry_target_;
  }
  [[nodiscard]] const advance::EpisodeAdvanceProtocol& advance_protocol() const {
    return *advance_;
  }
  [[nodiscard]] MetricsSnapshot Snapshot() const;

  static const char* StateName(State state);

 private:
  session::PlaybackSnapshot ReadSnapshot(const engine::EngineEvent* event);
  void HandleTerminalSignal(const session::PlaybackSnapshot& snapshot);
  void HandleError(const engine::EngineError& error, const session::PlaybackSnapshot& snapshot);
  void ScheduleRetry(const Classification& classification);
  void ExecuteRetry(uint64_t generation, int64_t target_ms);
  void CancelRetry();
  void EnterCompleting(const std::string& reason, const session::PlaybackSnapshot& snapshot);
  void CompleteMovie(const session::PlaybackSnapshot& snapshot);
  void Terminate(session::TerminalOutcome fallback);
  void SendStoppedOnce();
  void SchedulePeriodicSave();
  void PeriodicSave();
  void PersistResume(int64_t position_ms, const char* why);
  void CancelTimers();

  bool TransitionTo(State next);
  void RecordIllegalTransition(State from, State to);

  Dependencies deps_;
  const config::SessionConfig config_;

  State state_ = State::kIdle;
  session::Session session_;
  RetryState retry_;
  CompletionGuard guard_;
  session::TerminalOutput output_;
  std::unique_ptr<engine::IMediaEngine> engine_;
  std::unique_ptr<heartbeat::HeartbeatReporter> heartbeat_;
  std::unique_ptr<advance::EpisodeAdvanceProtocol> advance_;
  OutcomeCallback outcome_callback_;

  std::optional<int64_t> pending_retry_target_;
  uint64_t retry_generation_ = 0;
  runtime::TaskId retry_task_ = runtime::kInvalidTaskId;
  runtime::TaskId save_task_ = runtime::kInvalidTaskId;
  runtime::TaskId grace_task_ = runtime::kInvalidTaskId;
  session::PlaybackSnapshot last_snapshot_;
  bool stopped_ = false;
  bool stopped_message_sent_ = false;

  // Cleared on destruction; queued tasks hold a weak reference.
  std::shared_ptr<bool> alive_;

  MetricsSnapshot metrics_;
};

}  // namespace reprise::recovery

#endif  // REPRISE_RECOVERY_SESSION_RECOVERY_CONTROLLER_H_
