// Repository: Reprise
// Component: Episode Advance Protocol
// Purpose: Tiered next-episode progression after an episode completes.
// Copyright (c) 2026 Reprise

#include "reprise/advance/EpisodeAdvanceProtocol.hpp"

#include <exception>

#include "reprise/session/ContentIdentity.hpp"
#include "reprise/util/Logger.hpp"

namespace reprise::advance {

namespace {

std::string EpisodeLabel(int season, int episode) {
  return "S" + std::to_string(season) + "E" + std::to_string(episode);
}

}  // namespace

const char* AdvanceTierName(AdvanceTier tier) {
  switch (tier) {
    case AdvanceTier::kNone: return "none";
    case AdvanceTier::kCallback: return "callback";
    case AdvanceTier::kResultChannel: return "result_channel";
    case AdvanceTier::kExternalLookup: return "external_lookup";
    case AdvanceTier::kGiveUp: return "give_up";
  }
  return "unknown";
}

EpisodeAdvanceProtocol::EpisodeAdvanceProtocol(runtime::ISerialExecutor& serial,
                                               runtime::ISerialExecutor& background,
                                               notify::IAdvanceNotifier& notifier,
                                               std::shared_ptr<ICatalogResolver> catalog,
                                               std::shared_ptr<IStreamResolver> streams,
                                               const config::SessionConfig& config)
    : serial_(serial),
      background_(background),
      notifier_(notifier),
      catalog_(std::move(catalog)),
      streams_(std::move(streams)),
      config_(config) {}

EpisodeAdvanceProtocol::~EpisodeAdvanceProtocol() {
  Cancel();
}

bool EpisodeAdvanceProtocol::Run(const AdvanceRequest& request,
                                 session::TerminalOutput& output,
                                 DoneCallback done) {
  if (in_progress_) {
    util::Logger::Warn("[EpisodeAdvance] run already in progress, ignoring");
    return false;
  }
  request_ = request;
  output_ = &output;
  done_ = std::move(done);
  in_progress_ = true;
  winning_tier_ = AdvanceTier::kNone;
  attempted_.clear();
  alive_ = std::make_shared<bool>(true);

  util::Logger::Info("[EpisodeAdvance] requesting " +
                     EpisodeLabel(request_.current.season, request_.current.episode + 1));
  TryCallbackTier();
  return true;
}

void EpisodeAdvanceProtocol::Cancel() {
  if (alive_) *alive_ = false;
  alive_.reset();
  serial_.Cancel(wait_task_);
  wait_task_ = runtime::kInvalidTaskId;
  if (in_progress_) {
    util::Logger::Info("[EpisodeAdvance] cancelled");
  }
  in_progress_ = false;
  done_ = nullptr;
  output_ = nullptr;
}

void EpisodeAdvanceProtocol::TryCallbackTier() {
  attempted_.push_back(AdvanceTier::kCallback);
  const int next = request_.current.episode + 1;
  if (!notifier_.HasCallback()) {
    TryResultTier();
    return;
  }
  if (!notifier_.SendNextEpisode(request_.current.season, next, request_.current.show_id,
                                 request_.content_ref)) {
    util::Logger::Warn("[EpisodeAdvance] callback tier refused the message");
    TryResultTier();
    return;
  }

  session::TerminalOutcome outcome;
  outcome.kind = session::OutcomeKind::kAdvance;
  outcome.reason = "nextEpisode sent over callback";
  if (config_.expect_result) {
    session::SessionResult result;
    result.position_ms = request_.duration_ms;
    result.duration_ms = request_.duration_ms;
    result.season = request_.current.season;
    result.episode = next;
    outcome.result = result;
  }
  if (output_->TrySet(outcome)) winning_tier_ = AdvanceTier::kCallback;

  // Give the orchestrator time to react before the session goes away.
  std::weak_ptr<bool> token = alive_;
  wait_task_ = serial_.PostDelayed(config_.advance_notify_wait_ms, [this, token] {
    auto alive = token.lock();
    if (!alive || !*alive) return;
    wait_task_ = runtime::kInvalidTaskId;
    Finish(AdvanceTier::kCallback, session::TerminalOutcome{});
  });
}

void EpisodeAdvanceProtocol::TryResultTier() {
  attempted_.push_back(AdvanceTier::kResultChannel);
  if (!config_.expect_result) {
    TryLookupTier();
    return;
  }
  session::SessionResult result;
  result.position_ms = request_.duration_ms;
  result.duration_ms = request_.duration_ms;
  result.season = request_.current.season;
  result.episode = request_.current.episode + 1;

  session::TerminalOutcome outcome;
  outcome.kind = session::OutcomeKind::kAdvance;
  outcome.reason = "next episode returned on result channel";
  outcome.result = result;
  Finish(AdvanceTier::kResultChannel, std::move(outcome));
}

void EpisodeAdvanceProtocol::TryLookupTier() {
  attempted_.push_back(AdvanceTier::kExternalLookup);
  const bool have_show_id = !request_.current.show_id.empty();
  const std::string title_hint = session::DeriveTitleHint(request_.content_ref);
  if (!streams_ || (!have_show_id && (!catalog_ || title_hint.empty()))) {
    GiveUp("external lookup unavailable");
    return;
  }

  util::Logger::Info("[EpisodeAdvance] external lookup title_hint=\"" + title_hint + "\"");
  std::weak_ptr<bool> token = alive_;
  auto catalog = catalog_;
  auto streams = streams_;
  const session::Episode current = request_.current;
  runtime::ISerialExecutor* serial = &serial_;

  background_.Post([this, token, catalog, streams, current, title_hint, serial] {
    LookupResult result;
    try {
      result.show_id = current.show_id;
      if (result.show_id.empty()) {
        auto resolved = catalog->ResolveShowId(title_hint);
        if (resolved) result.show_id = *resolved;
      }
      if (result.show_id.empty()) {
        result.failure = "catalog has no match for \"" + title_hint + "\"";
      } else {
        result.stream = SelectBestStream(
            streams->ResolveEpisodeStreams(result.show_id, current.season, current.episode + 1));
        if (!result.stream) result.failure = "no playable stream";
      }
    } catch (const std::exception& e) {
      result.failure = std::string("lookup threw: ") + e.what();
    }
    serial->Post([this, token, result] {
      auto alive = token.lock();
      if (!alive || !*alive) {
        util::Logger::Info("[EpisodeAdvance] discarding late lookup result");
        return;
      }
      OnLookupComplete(result);
    });
  });
}

void EpisodeAdvanceProtocol::OnLookupComplete(const LookupResult& result) {
  if (!result.stream) {
    GiveUp(result.failure);
    return;
  }
  session::Episode next_episode;
  next_episode.show_id = result.show_id;
  next_episode.season = request_.current.season;
  next_episode.episode = request_.current.episode + 1;

  session::TerminalOutcome outcome;
  outcome.kind = session::OutcomeKind::kNextSession;
  outcome.reason = "resolved " + EpisodeLabel(next_episode.season, next_episode.episode) +
                   " via external lookup";
  outcome.next = session::NextSessionRequest{result.stream->url, next_episode};
  Finish(AdvanceTier::kExternalLookup, std::move(outcome));
}

void EpisodeAdvanceProtocol::GiveUp(const std::string& reason) {
  attempted_.push_back(AdvanceTier::kGiveUp);
  util::Logger::Warn("[EpisodeAdvance] giving up: " + reason);
  session::TerminalOutcome outcome;
  outcome.kind = session::OutcomeKind::kExit;
  outcome.reason = "no next-episode signal (" + reason + ")";
  Finish(AdvanceTier::kGiveUp, std::move(outcome));
}

void EpisodeAdvanceProtocol::Finish(AdvanceTier tier, session::TerminalOutcome outcome) {
  if (!in_progress_) return;
  // The callback tier already set its outcome before waiting.
  if (tier != AdvanceTier::kCallback && output_ != nullptr && output_->TrySet(std::move(outcome))) {
    winning_tier_ = tier;
  }
  util::Logger::Info(std::string("[EpisodeAdvance] finished via ") + AdvanceTierName(tier));
  in_progress_ = false;
  if (alive_) *alive_ = false;
  alive_.reset();
  output_ = nullptr;
  DoneCallback done = std::move(done_);
  done_ = nullptr;
  if (done) done();
}

}  // namespace reprise::advance
