// Repository: Reprise
// Component: Content identity unit tests

#include <gtest/gtest.h>

#include "reprise/session/ContentIdentity.hpp"
#include "reprise/util/UrlText.hpp"

namespace reprise::session {
namespace {

TEST(ContentIdentityTest, PlainFileIsMovie) {
  const auto kind = ResolveContentIdentity({}, "https://host/films/Heat.1995.1080p.mkv");
  EXPECT_TRUE(std::holds_alternative<Movie>(kind));
  EXPECT_EQ(DescribeKind(kind), "Movie");
}

TEST(ContentIdentityTest, FilenamePatternMakesEpisode) {
  const auto kind = ResolveContentIdentity({}, "https://host/tv/Some.Show.S02E07.720p.mkv");
  ASSERT_TRUE(IsEpisode(kind));
  const auto& ep = std::get<Episode>(kind);
  EXPECT_EQ(ep.season, 2);
  EXPECT_EQ(ep.episode, 7);
}

TEST(ContentIdentityTest, AlternateFilenamePattern) {
  const auto pair = ParseSeasonEpisode("Show 3x11 Title.mp4");
  ASSERT_TRUE(pair.has_value());
  EXPECT_EQ(pair->first, 3);
  EXPECT_EQ(pair->second, 11);
  EXPECT_FALSE(ParseSeasonEpisode("Movie 1920x1080.mkv").has_value());
}

TEST(ContentIdentityTest, ExplicitHintsWinOverQueryAndFilename) {
  ContentHints hints;
  hints.season = 1;
  hints.episode = 5;
  hints.show_id = "tt0903747";
  const auto kind =
      ResolveContentIdentity(hints, "https://host/x/Show.S04E09.mkv?season=3&episode=2");
  ASSERT_TRUE(IsEpisode(kind));
  const auto& ep = std::get<Episode>(kind);
  EXPECT_EQ(ep.season, 1);
  EXPECT_EQ(ep.episode, 5);
  EXPECT_EQ(ep.show_id, "tt0903747");
}

TEST(ContentIdentityTest, QueryWinsOverFilenameAndSuppliesShowId) {
  const auto kind = ResolveContentIdentity(
      {}, "https://host/x/Show.S04E09.mkv?season=3&episode=2&imdbId=tt123");
  ASSERT_TRUE(IsEpisode(kind));
  const auto& ep = std::get<Episode>(kind);
  EXPECT_EQ(ep.season, 3);
  EXPECT_EQ(ep.episode, 2);
  EXPECT_EQ(ep.show_id, "tt123");
  EXPECT_EQ(DescribeKind(kind), "Episode S3E2 (tt123)");
}

TEST(ContentIdentityTest, PartialHintsFallThrough) {
  ContentHints hints;
  hints.season = 9;
  const auto kind = ResolveContentIdentity(hints, "/media/Show%20S01E03.mkv");
  ASSERT_TRUE(IsEpisode(kind));
  EXPECT_EQ(std::get<Episode>(kind).season, 1);
  EXPECT_EQ(std::get<Episode>(kind).episode, 3);
}

TEST(TitleHintTest, StripsMarkersAndNoise) {
  EXPECT_EQ(DeriveTitleHint("https://host/tv/The.Office.US.S03E04.1080p.WEB.mkv?x=1"),
            "The Office US");
  EXPECT_EQ(DeriveTitleHint("/media/%5BGroup%5D%20Some_Show%20-%201x05.mkv"), "Some Show");
  EXPECT_EQ(DeriveTitleHint("/media/Heat (1995) 720p.mp4"), "Heat");
}

TEST(UrlTextTest, QueryParamDecodesValues) {
  const std::string url = "http://h/p?callback=http%3A%2F%2Flocalhost%3A9000%2Frpc&a=b+c#frag";
  EXPECT_EQ(util::QueryParam(url, "callback"), std::optional<std::string>("http://localhost:9000/rpc"));
  EXPECT_EQ(util::QueryParam(url, "a"), std::optional<std::string>("b c"));
  EXPECT_FALSE(util::QueryParam(url, "frag").has_value());
  EXPECT_EQ(util::PercentDecode("100%zz%4"), "100%zz%4");
}

}  // namespace
}  // namespace reprise::session
