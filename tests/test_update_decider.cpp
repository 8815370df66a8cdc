#include "appcast/feed/skipped_versions.hpp"
#include "appcast/feed/update_decider.hpp"

#include <gtest/gtest.h>

#include <string>
#include <utility>
#include <vector>

namespace {

appcast::Feed FeedWithVersion(const std::string& version) {
    appcast::Feed f;
    f.version = version;
    f.artifact_url = "https://example.com/app.bin";
    return f;
}

using appcast::UpdateCheckOutcome;

TEST(UpdateDeciderTest, NewerVersionIsOffered) {
    appcast::UpdateDecider decider;
    EXPECT_EQ(decider.Decide(FeedWithVersion("1.3.0"), "1.2.9", false), UpdateCheckOutcome::UpdateAvailable);
    EXPECT_TRUE(decider.ShouldUpdate(FeedWithVersion("1.3.0"), "1.2.9", false));
}

TEST(UpdateDeciderTest, SameOrOlderVersionIsNotOffered) {
    appcast::UpdateDecider decider;
    EXPECT_EQ(decider.Decide(FeedWithVersion("1.2.0"), "1.2.0", false), UpdateCheckOutcome::NoUpdate);
    EXPECT_EQ(decider.Decide(FeedWithVersion("1.1.9"), "1.2.0", false), UpdateCheckOutcome::NoUpdate);
    EXPECT_FALSE(decider.ShouldUpdate(FeedWithVersion("1.2.0"), "1.2.0", false));
}

TEST(UpdateDeciderTest, OrderingHoldsAcrossVersionPairs) {
    appcast::UpdateDecider decider;
    const std::vector<std::pair<std::string, std::string>> newer_older = {
        {"2.0.0", "1.5.0"}, {"1.0.1", "1.0.0"}, {"1.10", "1.9.9"}, {"v3", "2.99.99"}, {"1.0.0", "1.0.0-rc.9"},
    };
    for (const auto& [a, b] : newer_older) {
        EXPECT_TRUE(decider.ShouldUpdate(FeedWithVersion(a), b, false)) << a << " > " << b;
        EXPECT_FALSE(decider.ShouldUpdate(FeedWithVersion(b), a, false)) << b << " < " << a;
        EXPECT_FALSE(decider.ShouldUpdate(FeedWithVersion(a), a, false)) << a;
        EXPECT_TRUE(decider.ShouldUpdate(FeedWithVersion(a), a, true)) << a;
    }
}

TEST(UpdateDeciderTest, ForcedCheckOffersSameVersionButNeverOlder) {
    appcast::UpdateDecider decider;
    EXPECT_EQ(decider.Decide(FeedWithVersion("1.2.0"), "1.2.0", true), UpdateCheckOutcome::Forced);
    EXPECT_EQ(decider.Decide(FeedWithVersion("1.3.0"), "1.2.0", true), UpdateCheckOutcome::Forced);
    EXPECT_EQ(decider.Decide(FeedWithVersion("1.0.0"), "1.2.0", true), UpdateCheckOutcome::NoUpdate);
}

TEST(UpdateDeciderTest, PrereleaseOfCurrentVersionIsOlder) {
    appcast::UpdateDecider decider;
    EXPECT_EQ(decider.Decide(FeedWithVersion("2.0.0-rc.1"), "2.0.0", false), UpdateCheckOutcome::NoUpdate);
    EXPECT_EQ(decider.Decide(FeedWithVersion("2.0.0"), "2.0.0-rc.1", false), UpdateCheckOutcome::UpdateAvailable);
}

TEST(UpdateDeciderTest, UnparsableVersionIsNeverAnUpdate) {
    appcast::UpdateDecider decider;
    EXPECT_EQ(decider.Decide(FeedWithVersion("latest"), "1.0.0", false), UpdateCheckOutcome::NoUpdate);
    EXPECT_EQ(decider.Decide(FeedWithVersion("latest"), "1.0.0", true), UpdateCheckOutcome::NoUpdate);
    EXPECT_EQ(decider.Decide(FeedWithVersion("2.0.0"), "dev-build", false), UpdateCheckOutcome::NoUpdate);
}

TEST(UpdateDeciderTest, SkippedVersionIsSuppressedOnlyForBackgroundChecks) {
    appcast::InMemorySkippedVersionStore store;
    ASSERT_TRUE(store.Skip("1.5.0").is_ok());

    appcast::UpdateDecider decider(&store);
    EXPECT_EQ(decider.Decide(FeedWithVersion("1.5.0"), "1.4.0", false), UpdateCheckOutcome::NoUpdate);
    EXPECT_EQ(decider.Decide(FeedWithVersion("1.5.0"), "1.4.0", true), UpdateCheckOutcome::Forced);
    EXPECT_EQ(decider.Decide(FeedWithVersion("1.6.0"), "1.4.0", false), UpdateCheckOutcome::UpdateAvailable);
}

} // namespace
