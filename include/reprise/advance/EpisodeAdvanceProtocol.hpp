// Repository: Reprise
// Component: Episode Advance Protocol
// Purpose: Tiered next-episode progression after an episode completes.
// Copyright (c) 2026 Reprise

#ifndef REPRISE_ADVANCE_EPISODE_ADVANCE_PROTOCOL_HPP_
#define REPRISE_ADVANCE_EPISODE_ADVANCE_PROTOCOL_HPP_

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "reprise/advance/ExternalLookup.hpp"
#include "reprise/config/SessionConfig.hpp"
#include "reprise/notify/AdvanceNotifier.hpp"
#include "reprise/runtime/SerialExecutor.hpp"
#include "reprise/session/Session.hpp"
#include "reprise/session/SessionOutcome.hpp"

namespace reprise::advance {

enum class AdvanceTier {
  kNone = 0,
  kCallback = 1,
  kResultChannel = 2,
  kExternalLookup = 3,
  kGiveUp = 4,
};

const char* AdvanceTierName(AdvanceTier tier);

struct AdvanceRequest {
  std::string content_ref;
  session::Episode current;
  int64_t duration_ms = 0;
};

// Tiers run in order, each only when the previous one is unavailable or
// fails:
//   1. nextEpisode over the notifier callback, then a bounded wait
//   2. structured result with position == duration and episode + 1
//   3. title hint -> catalog id -> next-episode stream -> NextSessionRequest
//   4. plain exit
// The winning tier sets the TerminalOutput; `done` fires exactly once.
// Run, Cancel and destruction happen on the serial executor; tier 3 lookups
// run on the background executor and post their result back.
class EpisodeAdvanceProtocol {
 public:
  using DoneCallback = std::function<void()>;

  EpisodeAdvanceProtocol(runtime::ISerialExecutor& serial,
                         runtime::ISerialExecutor& background,
                         notify::IAdvanceNotifier& notifier,
                         std::shared_ptr<ICatalogResolver> catalog,
                         std::shared_ptr<IStreamResolver> streams,
                         const config::SessionConfig& config);
  ~EpisodeAdvanceProtocol();

  EpisodeAdvanceProtocol(const EpisodeAdvanceProtocol&) = delete;
  EpisodeAdvanceProtocol& operator=(const EpisodeAdvanceProtocol&) = delete;

  // Returns false if a run is already in progress.
  bool Run(const AdvanceRequest& request, session::TerminalOutput& output, DoneCallback done);

  // Drops the pending wait or lookup; `done` is not called afterwards.
  void Cancel();

  [[nodiscard]] bool in_progress() const { return in_progress_; }
  [[nodiscard]] AdvanceTier winning_tier() const { return winning_tier_; }
  [[nodiscard]] const std::vector<AdvanceTier>& attempted_tiers() const { return attempted_; }

 private:
  struct LookupResult {
    std::string show_id;
    std::optional<StreamCandidate> stream;
    std::string failure;
  };

  void TryCallbackTier();
  void TryResultTier();
  void TryLookupTier();
  void OnLookupComplete(const LookupResult& result);
  void GiveUp(const std::string& reason);
  void Finish(AdvanceTier tier, session::TerminalOutcome outcome);

  runtime::ISerialExecutor& serial_;
  runtime::ISerialExecutor& background_;
  notify::IAdvanceNotifier& notifier_;
  std::shared_ptr<ICatalogResolver> catalog_;
  std::shared_ptr<IStreamResolver> streams_;
  const config::SessionConfig config_;

  AdvanceRequest request_;
  session::TerminalOutput* output_ = nullptr;
  DoneCallback done_;
  bool in_progress_ = false;
  AdvanceTier winning_tier_ = AdvanceTier::kNone;
  std::vector<AdvanceTier> attempted_;
  runtime::TaskId wait_task_ = runtime::kInvalidTaskId;
  std::shared_ptr<bool> alive_;
};

}  // namespace reprise::advance

#endif  // REPRISE_ADVANCE_EPISODE_ADVANCE_PROTOCOL_HPP_
