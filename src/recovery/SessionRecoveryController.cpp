// Repository: Reprise
// Component: Session Recovery Controller
// Purpose: Error classification, bounded retries and exactly-once completion for one session.
// Copyright (c) 2026 Reprise

#include "reprise/recovery/SessionRecoveryController.h"

#include <stdexcept>
#include <string>
#include <variant>

#include "reprise/util/Logger.hpp"

namespace reprise::recovery {

namespace {

const std::string kTag = "[SessionRecovery] ";

bool IsLegalTransition(SessionRecoveryController::State from,
                       SessionRecoveryController::State to) {
  using State = SessionRecoveryController::State;
  switch (from) {
    case State::kIdle:
      return to == State::kPlaying;
    case State::kPlaying:
      return to == State::kErrorDetected || to == State::kCompleting || to == State::kTerminated;
    case State::kErrorDetected:
      return to == State::kRetrying || to == State::kCompleting || to == State::kTerminated;
    case State::kRetrying:
      return to == State::kPlaying || to == State::kErrorDetected || to == State::kTerminated;
    case State::kCompleting:
      return to == State::kTerminated;
    case State::kTerminated:
      return false;
  }
  return false;
}

std::string Ms(int64_t ms) { return std::to_string(ms) + "ms"; }

}  // namespace

const char* SessionRecoveryController::StateName(State state) {
  switch (state) {
    case State::kIdle: return "Idle";
    case State::kPlaying: return "Playing";
    case State::kErrorDetected: return "ErrorDetected";
    case State::kRetrying: return "Retrying";
    case State::kCompleting: return "Completing";
    case State::kTerminated: return "Terminated";
  }
  return "Unknown";
}

SessionRecoveryController::SessionRecoveryController(Dependencies deps,
                                                     config::SessionConfig config)
    : deps_(std::move(deps)),
      config_(config),
      alive_(std::make_shared<bool>(true)) {
  if (deps_.serial == nullptr || deps_.background == nullptr) {
    throw std::invalid_argument("SessionRecoveryController: executors are required");
  }
  if (deps_.resume_store == nullptr || deps_.notifier == nullptr) {
    throw std::invalid_argument("SessionRecoveryController: resume store and notifier are required");
  }
  heartbeat_ = std::make_unique<heartbeat::HeartbeatReporter>(
      *deps_.serial, *deps_.notifier, config_.heartbeat_interval_ms);
  advance_ = std::make_unique<advance::EpisodeAdvanceProtocol>(
      *deps_.serial, *deps_.background, *deps_.notifier, deps_.catalog, deps_.streams, config_);
}

SessionRecoveryController::~SessionRecoveryController() {
  Stop();
  *alive_ = false;
}

void SessionRecoveryController::SetOutcomeCallback(OutcomeCallback callback) {
  outcome_callback_ = std::move(callback);
}

SessionRecoveryController::StartResult SessionRecoveryController::Start(
    session::Session session, std::optional<int64_t> resume_hint_ms) {
  StartResult result;
  if (state_ != State::kIdle || stopped_) {
    result.error = StartError::kAlreadyStarted;
    result.message = "session already started on this controller";
    util::Logger::Warn(kTag + result.message);
    return result;
  }

  engine_ = deps_.engine_factory ? deps_.engine_factory() : nullptr;
  if (!engine_) {
    result.error = StartError::kEngineUnavailable;
    result.message = "media engine unavailable";
    util::Logger::Error(kTag + result.message);
    return result;
  }

  session_ = std::move(session);
  session_.started_at_ms = deps_.serial->NowMs();
  retry_.Reset();
  guard_ = CompletionGuard{};
  output_.Reset();

  int64_t start_ms = 0;
  if (resume_hint_ms && *resume_hint_ms > 0) {
    start_ms = *resume_hint_ms;
  } else {
    start_ms = deps_.resume_store->GetBest(session_.content_ref);
  }

  std::weak_ptr<bool> token = alive_;
  engine_->SetEventCallback([this, token](const engine::EngineEvent& event) {
    if (token.expired()) return;
    PostEngineEvent(event);
  });

  if (!engine_->Open(session_.content_ref, start_ms)) {
    engine_->SetEventCallback(nullptr);
    engine_->Release();
    engine_.reset();
    result.error = StartError::kEngineUnavailable;
    result.message = "media engine failed to open " + session_.content_ref;
    util::Logger::Error(kTag + result.message);
    return result;
  }
  engine_->Play();
  TransitionTo(State::kPlaying);

  util::Logger::Info(kTag + "started " + session::DescribeKind(session_.kind) +
                     " at " + Ms(start_ms) + " ref=" + session_.content_ref);
  util::Logger::Debug(kTag + "diagnostics\n" + engine::FormatDiagnostics(engine_->Diagnostics()));

  heartbeat_->Start([this]() -> std::optional<session::PlaybackSnapshot> {
    if (!engine_) return std::nullopt;
    return engine_->Snapshot();
  });
  SchedulePeriodicSave();

  result.success = true;
  result.start_position_ms = start_ms;
  return result;
}

void SessionRecoveryController::PostEngineEvent(const engine::EngineEvent& event) {
  std::weak_ptr<bool> token = alive_;
  deps_.serial->Post([this, token, event] {
    auto alive = token.lock();
    if (!alive || !*alive) return;
    OnEngineEvent(event);
  });
}

session::PlaybackSnapshot SessionRecoveryController::ReadSnapshot(
    const engine::EngineEvent* event) {
  session::PlaybackSnapshot snapshot;
  if (event != nullptr && event->snapshot) {
    snapshot = *event->snapshot;
  } else if (engine_) {
    snapshot = engine_->Snapshot();
  }
  if (snapshot.duration_ms > 0) {
    session_.last_known_duration_ms = snapshot.duration_ms;
  } else {
    snapshot.duration_ms = session_.last_known_duration_ms;
  }
  last_snapshot_ = snapshot;
  return snapshot;
}

void SessionRecoveryController::OnEngineEvent(const engine::EngineEvent& event) {
  if (state_ == State::kIdle || state_ == State::kTerminated) {
    ++metrics_.ignored_event_total;
    util::Logger::Debug(kTag + "ignoring engine event in state " + StateName(state_));
    return;
  }

  const session::PlaybackSnapshot snapshot = ReadSnapshot(&event);
  switch (event.type) {
    case engine::EngineEvent::Type::kTracksChanged:
      if (engine_) {
        util::Logger::Debug(kTag + "tracks changed\n" +
                            engine::FormatDiagnostics(engine_->Diagnostics()));
      }
      return;
    case engine::EngineEvent::Type::kStateChanged:
      if (event.state == engine::PlaybackState::kEnded) {
        HandleTerminalSignal(snapshot);
      } else {
        util::Logger::Debug(kTag + "engine state " + engine::PlaybackStateName(event.state));
      }
      return;
    case engine::EngineEvent::Type::kError:
      HandleError(event.error, snapshot);
      return;
  }
}

void SessionRecoveryController::HandleTerminalSignal(const session::PlaybackSnapshot& snapshot) {
  if (guard_.handled()) {
    ++metrics_.duplicate_completion_total;
    util::Logger::Info(kTag + "duplicate terminal signal ignored");
    return;
  }
  if (state_ != State::kPlaying) {
    ++metrics_.ignored_event_total;
    util::Logger::Debug(kTag + "terminal signal ignored in state " + StateName(state_));
    return;
  }
  const auto remaining = snapshot.RemainingMs();
  if (!remaining || *remaining > config_.end_epsilon_ms) {
    ++metrics_.spurious_terminal_total;
    util::Logger::Warn(kTag + "terminal signal at " + Ms(snapshot.position_ms) + "/" +
                       Ms(snapshot.duration_ms) + " not at end, ignoring");
    return;
  }
  EnterCompleting("engine reached end", snapshot);
}

void SessionRecoveryController::HandleError(const engine::EngineError& error,
                                            const session::PlaybackSnapshot& snapshot) {
  if (guard_.handled()) {
    ++metrics_.ignored_event_total;
    util::Logger::Info(kTag + "error after completion ignored: " + error.message);
    return;
  }
  if (state_ != State::kPlaying && state_ != State::kRetrying) {
    ++metrics_.ignored_event_total;
    return;
  }
  TransitionTo(State::kErrorDetected);

  const Classification c = ClassifyError(error, snapshot, retry_, config_);
  util::Logger::Warn(kTag + "error " + engine::EngineErrorCodeName(error.code) +
                     " at " + Ms(snapshot.position_ms) + "/" + Ms(snapshot.duration_ms) +
                     " -> " + VerdictName(c.verdict) + " (" + ErrorKindName(c.kind) + ": " +
                     c.reason + ")");

  retry_.last_error_kind = c.kind;
  retry_.last_error_position_ms = snapshot.position_ms;
  if (IsParseError(error)) {
    retry_.last_parse_error_position_ms = snapshot.position_ms;
    if (c.loop_detected) retry_.loop_suspected = true;
  }

  switch (c.verdict) {
    case Verdict::kRetryable:
      ScheduleRetry(c);
      return;
    case Verdict::kTreatAsCompletion:
      EnterCompleting(c.reason, snapshot);
      return;
    case Verdict::kFatal: {
      session::TerminalOutcome outcome;
      outcome.kind = session::OutcomeKind::kExit;
      outcome.reason = std::string(ErrorKindName(c.kind)) + ": " + c.reason;
      Terminate(std::move(outcome));
      return;
    }
  }
}

void SessionRecoveryController::ScheduleRetry(const Classification& classification) {
  ++retry_.attempts;
  if (classification.kind == ErrorKind::kRetryLoop) retry_.tail_skip_used = true;
  CancelRetry();
  TransitionTo(State::kRetrying);
  ++metrics_.retry_total;

  const int64_t target = classification.retry_target_ms;
  pending_retry_target_ = target;
  const uint64_t generation = ++retry_generation_;
  util::Logger::Info(kTag + "retry " + std::to_string(retry_.attempts) + "/" +
                     std::to_string(config_.max_retries) + " to " + Ms(target) + " in " +
                     Ms(config_.retry_delay_ms));

  std::weak_ptr<bool> token = alive_;
  retry_task_ = deps_.serial->PostDelayed(config_.retry_delay_ms, [this, token, generation, target] {
    auto alive = token.lock();
    if (!alive || !*alive) return;
    ExecuteRetry(generation, target);
  });
}

void SessionRecoveryController::ExecuteRetry(uint64_t generation, int64_t target_ms) {
  if (generation != retry_generation_ || state_ != State::kRetrying) {
    util::Logger::Debug(kTag + "stale retry dropped");
    return;
  }
  retry_task_ = runtime::kInvalidTaskId;
  pending_retry_target_.reset();

  if (engine_ && engine_->SeekTo(target_ms) && engine_->Prepare()) {
    engine_->Play();
    TransitionTo(State::kPlaying);
    util::Logger::Info(kTag + "resumed at " + Ms(target_ms));
    return;
  }

  engine::EngineError error;
  error.code = engine::EngineErrorCode::kUnspecified;
  error.message = "engine rejected resume";
  session::PlaybackSnapshot snapshot = ReadSnapshot(nullptr);
  snapshot.position_ms = target_ms;
  HandleError(error, snapshot);
}

void SessionRecoveryController::CancelRetry() {
  ++retry_generation_;
  deps_.serial->Cancel(retry_task_);
  retry_task_ = runtime::kInvalidTaskId;
  pending_retry_target_.reset();
}

void SessionRecoveryController::EnterCompleting(const std::string& reason,
                                                const session::PlaybackSnapshot& snapshot) {
  if (!guard_.TryAcquire()) {
    ++metrics_.duplicate_completion_total;
    util::Logger::Info(kTag + "duplicate completion ignored (" + reason + ")");
    return;
  }
  CancelRetry();
  deps_.serial->Cancel(save_task_);
  save_task_ = runtime::kInvalidTaskId;
  heartbeat_->Stop();
  TransitionTo(State::kCompleting);
  ++metrics_.completion_total;
  util::Logger::Info(kTag + "completing " + session::DescribeKind(session_.kind) + ": " + reason);

  if (const auto* episode = std::get_if<session::Episode>(&session_.kind)) {
    PersistResume(0, "episode complete");
    advance::AdvanceRequest request;
    request.content_ref = session_.content_ref;
    request.current = *episode;
    request.duration_ms = snapshot.duration_ms > 0 ? snapshot.duration_ms
                                                   : session_.last_known_duration_ms;
    advance_->Run(request, output_, [this] {
      session::TerminalOutcome fallback;
      fallback.kind = session::OutcomeKind::kExit;
      fallback.reason = "advance protocol finished without output";
      Terminate(std::move(fallback));
    });
    return;
  }

  std::weak_ptr<bool> token = alive_;
  grace_task_ = deps_.serial->PostDelayed(config_.movie_grace_ms, [this, token, snapshot] {
    auto alive = token.lock();
    if (!alive || !*alive) return;
    grace_task_ = runtime::kInvalidTaskId;
    if (state_ != State::kCompleting) return;
    CompleteMovie(snapshot);
  });
}

void SessionRecoveryController::CompleteMovie(const session::PlaybackSnapshot& snapshot) {
  PersistResume(0, "movie complete");
  SendStoppedOnce();
  session::TerminalOutcome outcome;
  outcome.kind = session::OutcomeKind::kStop;
  outcome.reason = "movie finished";
  if (config_.expect_result) {
    const int64_t duration = snapshot.duration_ms > 0 ? snapshot.duration_ms
                                                      : session_.last_known_duration_ms;
    session::SessionResult result;
    result.position_ms = duration;
    result.duration_ms = duration;
    outcome.result = result;
  }
  Terminate(std::move(outcome));
}

void SessionRecoveryController::Terminate(session::TerminalOutcome fallback) {
  if (state_ == State::kTerminated) return;
  CancelTimers();
  output_.TrySet(std::move(fallback));
  SendStoppedOnce();
  TransitionTo(State::kTerminated);

  const auto& outcome = *output_.Get();
  util::Logger::Info(kTag + "terminated outcome=" + session::OutcomeKindName(outcome.kind) +
                     " reason=" + outcome.reason);
  if (outcome_callback_) outcome_callback_(outcome);
}

void SessionRecoveryController::SendStoppedOnce() {
  if (stopped_message_sent_) return;
  stopped_message_sent_ = true;
  session::PlaybackSnapshot snapshot = last_snapshot_;
  if (engine_) {
    snapshot = engine_->Snapshot();
    if (snapshot.duration_ms <= 0) snapshot.duration_ms = session_.last_known_duration_ms;
  }
  if (deps_.notifier->SendStopped(snapshot)) {
    ++metrics_.stopped_message_total;
  }
}

void SessionRecoveryController::SchedulePeriodicSave() {
  std::weak_ptr<bool> token = alive_;
  save_task_ = deps_.serial->PostDelayed(config_.resume_save_interval_ms, [this, token] {
    auto alive = token.lock();
    if (!alive || !*alive) return;
    save_task_ = runtime::kInvalidTaskId;
    PeriodicSave();
  });
}

void SessionRecoveryController::PeriodicSave() {
  if (state_ == State::kTerminated || state_ == State::kCompleting || stopped_) return;
  if (state_ == State::kPlaying && engine_) {
    const session::PlaybackSnapshot snapshot = ReadSnapshot(nullptr);
    // The top of the range belongs to the completion-clears-to-zero rule.
    if (snapshot.HasDuration() && snapshot.position_ms > 0 &&
        snapshot.PercentWatched() < config_.resume_save_ceiling_percent) {
      PersistResume(snapshot.position_ms, "periodic");
    }
  }
  SchedulePeriodicSave();
}

void SessionRecoveryController::PersistResume(int64_t position_ms, const char* why) {
  deps_.resume_store->Put(session_.content_ref, position_ms);
  ++metrics_.resume_save_total;
  util::Logger::Debug(kTag + "resume " + why + " -> " + Ms(position_ms));
}

void SessionRecoveryController::CancelTimers() {
  CancelRetry();
  deps_.serial->Cancel(save_task_);
  save_task_ = runtime::kInvalidTaskId;
  deps_.serial->Cancel(grace_task_);
  grace_task_ = runtime::kInvalidTaskId;
  heartbeat_->Stop();
}

void SessionRecoveryController::Stop() {
  if (stopped_) return;
  stopped_ = true;
  if (state_ == State::kIdle) return;

  const session::PlaybackSnapshot snapshot = engine_ ? ReadSnapshot(nullptr) : last_snapshot_;
  if (guard_.handled()) {
    PersistResume(0, "completed before stop");
  } else if (snapshot.HasDuration() &&
             snapshot.PercentWatched() >= config_.resume_save_ceiling_percent) {
    PersistResume(0, "watched past ceiling");
  } else if (snapshot.position_ms > 0) {
    PersistResume(snapshot.position_ms, "stop");
  }

  advance_->Cancel();
  CancelTimers();
  // A movie waiting out its grace delay has already finished; Stop only
  // shortens the wait.
  if (state_ == State::kCompleting && guard_.handled() &&
      std::holds_alternative<session::Movie>(session_.kind)) {
    CompleteMovie(last_snapshot_);
  }
  if (state_ != State::kTerminated) {
    session::TerminalOutcome outcome;
    outcome.kind = session::OutcomeKind::kExit;
    outcome.reason = "stopped by caller";
    Terminate(std::move(outcome));
  }

  if (engine_) {
    engine_->SetEventCallback(nullptr);
    engine_->Release();
    engine_.reset();
  }
  util::Logger::Info(kTag + "stopped");
}

SessionRecoveryController::MetricsSnapshot SessionRecoveryController::Snapshot() const {
  MetricsSnapshot snapshot = metrics_;
  snapshot.state = state_;
  return snapshot;
}

bool SessionRecoveryController::TransitionTo(State next) {
  if (!IsLegalTransition(state_, next)) {
    RecordIllegalTransition(state_, next);
    return false;
  }
  metrics_.transitions[{state_, next}] += 1;
  util::Logger::Debug(kTag + StateName(state_) + " -> " + StateName(next));
  state_ = next;
  return true;
}

void SessionRecoveryController::RecordIllegalTransition(State from, State to) {
  ++metrics_.illegal_transition_total;
  util::Logger::Error(kTag + "illegal transition " + StateName(from) + " -> " + StateName(to));
}

}  // namespace reprise::recovery
