// Repository: Reprise
// Component: Episode advance protocol contract tests
// Tier order, single outcome, exactly-once completion callback.

#include <gtest/gtest.h>

#include <memory>

#include "reprise/advance/EpisodeAdvanceProtocol.hpp"
#include "fixtures/FakeAdvanceNotifier.h"
#include "fixtures/FakeResolvers.h"
#include "support/ManualSerialExecutor.hpp"

namespace reprise::advance {
namespace {

using tests::ManualSerialExecutor;
using tests::fixtures::FakeAdvanceNotifier;
using tests::fixtures::FakeCatalogResolver;
using tests::fixtures::FakeStreamResolver;

constexpr int64_t kDuration = 2'700'000;

class EpisodeAdvanceContractTest : public ::testing::Test {
 protected:
  void Build(bool has_callback, bool expect_result) {
    notifier_ = std::make_unique<FakeAdvanceNotifier>(has_callback);
    config_.expect_result = expect_result;
    protocol_ = std::make_unique<EpisodeAdvanceProtocol>(serial_, background_, *notifier_,
                                                         catalog_, streams_, config_);
  }

  AdvanceRequest Request(const std::string& show_id = "") {
    AdvanceRequest r;
    r.content_ref = "http://cdn/tv/Breaking.Bad.S01E05.720p.mkv";
    r.current.season = 1;
    r.current.episode = 5;
    r.current.show_id = show_id;
    r.duration_ms = kDuration;
    return r;
  }

  void Run(const AdvanceRequest& request) {
    ASSERT_TRUE(protocol_->Run(request, output_, [this] { ++done_calls_; }));
  }

  void Drain() {
    for (int i = 0; i < 4; ++i) {
      serial_.RunUntilIdle();
      background_.RunUntilIdle();
    }
  }

  ManualSerialExecutor serial_;
  ManualSerialExecutor background_;
  config::SessionConfig config_;
  std::shared_ptr<FakeCatalogResolver> catalog_ = std::make_shared<FakeCatalogResolver>();
  std::shared_ptr<FakeStreamResolver> streams_ = std::make_shared<FakeStreamResolver>();
  std::unique_ptr<FakeAdvanceNotifier> notifier_;
  std::unique_ptr<EpisodeAdvanceProtocol> protocol_;
  session::TerminalOutput output_;
  int done_calls_ = 0;
};

TEST_F(EpisodeAdvanceContractTest, CallbackTierWinsAndLaterTiersAreUntouched) {
  Build(/*has_callback=*/true, /*expect_result=*/true);
  Run(Request("tt0903747"));

  ASSERT_EQ(notifier_->next_episodes.size(), 1u);
  EXPECT_EQ(notifier_->next_episodes[0].season, 1);
  EXPECT_EQ(notifier_->next_episodes[0].episode, 6);
  EXPECT_EQ(notifier_->next_episodes[0].show_id, "tt0903747");
  ASSERT_TRUE(output_.IsSet());
  EXPECT_EQ(output_.Get()->kind, session::OutcomeKind::kAdvance);

  // Bounded wait before the session is released.
  serial_.AdvanceMs(config_.advance_notify_wait_ms - 1);
  EXPECT_EQ(done_calls_, 0);
  EXPECT_TRUE(protocol_->in_progress());
  serial_.AdvanceMs(1);
  EXPECT_EQ(done_calls_, 1);

  EXPECT_EQ(protocol_->winning_tier(), AdvanceTier::kCallback);
  EXPECT_EQ(protocol_->attempted_tiers(), std::vector<AdvanceTier>{AdvanceTier::kCallback});
  EXPECT_TRUE(streams_->requests.empty());
  EXPECT_TRUE(catalog_->queries.empty());
}

TEST_F(EpisodeAdvanceContractTest, ResultChannelReportsFullWatchAndNextEpisode) {
  Build(/*has_callback=*/false, /*expect_result=*/true);
  Run(Request());

  EXPECT_EQ(done_calls_, 1);
  ASSERT_TRUE(output_.IsSet());
  const auto& outcome = *output_.Get();
  EXPECT_EQ(outcome.kind, session::OutcomeKind::kAdvance);
  ASSERT_TRUE(outcome.result.has_value());
  EXPECT_EQ(outcome.result->position_ms, outcome.result->duration_ms);
  EXPECT_EQ(outcome.result->duration_ms, kDuration);
  EXPECT_TRUE(outcome.result->FullyWatched());
  EXPECT_EQ(outcome.result->season, std::optional<int>(1));
  EXPECT_EQ(outcome.result->episode, std::optional<int>(6));
  EXPECT_EQ(protocol_->winning_tier(), AdvanceTier::kResultChannel);
  EXPECT_TRUE(streams_->requests.empty());
}

TEST_F(EpisodeAdvanceContractTest, RefusedCallbackFallsThroughToResultChannel) {
  Build(/*has_callback=*/true, /*expect_result=*/true);
  notifier_->reject_next_episode = true;
  Run(Request());
  EXPECT_EQ(protocol_->winning_tier(), AdvanceTier::kResultChannel);
  EXPECT_EQ(done_calls_, 1);
}

TEST_F(EpisodeAdvanceContractTest, ExternalLookupWithKnownShowIdSkipsCatalog) {
  Build(/*has_callback=*/false, /*expect_result=*/false);
  streams_->streams = {
      StreamCandidate{"P2P 1080p", "1 GB", "http://cdn/p2p"},
      StreamCandidate{"[RD+] 1080p", "2 GB", "http://cdn/rd"},
  };
  Run(Request("tt0903747"));
  EXPECT_EQ(done_calls_, 0);
  Drain();

  EXPECT_EQ(done_calls_, 1);
  EXPECT_TRUE(catalog_->queries.empty());
  ASSERT_EQ(streams_->requests.size(), 1u);
  EXPECT_EQ(streams_->requests[0], "tt0903747:1:6");
  ASSERT_TRUE(output_.IsSet());
  const auto& outcome = *output_.Get();
  EXPECT_EQ(outcome.kind, session::OutcomeKind::kNextSession);
  ASSERT_TRUE(outcome.next.has_value());
  EXPECT_EQ(outcome.next->content_ref, "http://cdn/rd");
  ASSERT_TRUE(session::IsEpisode(outcome.next->kind));
  const auto& next = std::get<session::Episode>(outcome.next->kind);
  EXPECT_EQ(next.season, 1);
  EXPECT_EQ(next.episode, 6);
  EXPECT_EQ(next.show_id, "tt0903747");
  EXPECT_EQ(protocol_->winning_tier(), AdvanceTier::kExternalLookup);
}

TEST_F(EpisodeAdvanceContractTest, ExternalLookupResolvesShowIdFromTitleHint) {
  Build(/*has_callback=*/false, /*expect_result=*/false);
  catalog_->ids["Breaking Bad"] = "tt0903747";
  streams_->streams = {StreamCandidate{"[TB]", "720p", "http://cdn/tb"}};
  Run(Request());
  Drain();

  ASSERT_EQ(catalog_->queries.size(), 1u);
  EXPECT_EQ(catalog_->queries[0], "Breaking Bad");
  ASSERT_TRUE(output_.IsSet());
  EXPECT_EQ(output_.Get()->kind, session::OutcomeKind::kNextSession);
  EXPECT_EQ(output_.Get()->next->content_ref, "http://cdn/tb");
}

TEST_F(EpisodeAdvanceContractTest, NothingFoundGivesUpWithExit) {
  Build(/*has_callback=*/false, /*expect_result=*/false);
  Run(Request("tt0903747"));
  Drain();

  EXPECT_EQ(done_calls_, 1);
  ASSERT_TRUE(output_.IsSet());
  EXPECT_EQ(output_.Get()->kind, session::OutcomeKind::kExit);
  EXPECT_EQ(protocol_->winning_tier(), AdvanceTier::kGiveUp);
  EXPECT_EQ(protocol_->attempted_tiers(),
            (std::vector<AdvanceTier>{AdvanceTier::kCallback, AdvanceTier::kResultChannel,
                                      AdvanceTier::kExternalLookup, AdvanceTier::kGiveUp}));
}

TEST_F(EpisodeAdvanceContractTest, NoResolversGiveUpImmediately) {
  streams_.reset();
  Build(/*has_callback=*/false, /*expect_result=*/false);
  Run(Request("tt0903747"));
  EXPECT_EQ(done_calls_, 1);
  EXPECT_EQ(output_.Get()->kind, session::OutcomeKind::kExit);
  EXPECT_EQ(background_.pending(), 0u);
}

TEST_F(EpisodeAdvanceContractTest, CancelledRunDiscardsLateLookupResult) {
  Build(/*has_callback=*/false, /*expect_result=*/false);
  streams_->streams = {StreamCandidate{"[RD]", "", "http://cdn/rd"}};
  Run(Request("tt0903747"));
  background_.RunUntilIdle();
  protocol_->Cancel();
  serial_.RunUntilIdle();

  EXPECT_EQ(done_calls_, 0);
  EXPECT_FALSE(output_.IsSet());
  EXPECT_FALSE(protocol_->in_progress());
}

TEST_F(EpisodeAdvanceContractTest, ExistingOutcomeIsNeverOverwritten) {
  Build(/*has_callback=*/false, /*expect_result=*/true);
  session::TerminalOutcome earlier;
  earlier.kind = session::OutcomeKind::kExit;
  earlier.reason = "set first";
  ASSERT_TRUE(output_.TrySet(earlier));
  Run(Request());
  EXPECT_EQ(done_calls_, 1);
  EXPECT_EQ(output_.Get()->reason, "set first");
}

TEST_F(EpisodeAdvanceContractTest, SecondRunWhileInProgressIsRejected) {
  Build(/*has_callback=*/true, /*expect_result=*/false);
  Run(Request());
  EXPECT_FALSE(protocol_->Run(Request(), output_, [] {}));
  serial_.AdvanceMs(config_.advance_notify_wait_ms);
  EXPECT_EQ(done_calls_, 1);
}

}  // namespace
}  // namespace reprise::advance
