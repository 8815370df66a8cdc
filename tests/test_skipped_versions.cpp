#include "appcast/feed/skipped_versions.hpp"
#include "testing.hpp"

#include <gtest/gtest.h>

namespace {

TEST(SkippedVersionsTest, InMemoryStoreRemembersLastSkip) {
    appcast::InMemorySkippedVersionStore store;
    EXPECT_FALSE(store.IsSkipped("1.0.0"));

    ASSERT_TRUE(store.Skip("1.0.0").is_ok());
    EXPECT_TRUE(store.IsSkipped("1.0.0"));

    ASSERT_TRUE(store.Skip("1.1.0").is_ok());
    EXPECT_FALSE(store.IsSkipped("1.0.0"));
    EXPECT_TRUE(store.IsSkipped("1.1.0"));
}

TEST(SkippedVersionsTest, JsonFileStorePersistsAcrossInstances) {
    testutil::TemporaryDirectory tmp;
    const std::string path = tmp.File("skipped.json");

    {
        appcast::JsonFileSkippedVersionStore store(path);
        EXPECT_FALSE(store.IsSkipped("2.0.0"));
        auto r = store.Skip("2.0.0");
        ASSERT_TRUE(r.is_ok()) << r.message();
    }

    appcast::JsonFileSkippedVersionStore reopened(path);
    EXPECT_TRUE(reopened.IsSkipped("2.0.0"));
    ASSERT_TRUE(reopened.Load().has_value());
    EXPECT_EQ(*reopened.Load(), "2.0.0");
    EXPECT_NE(testutil::ReadFile(path).find("\"skipped_version\""), std::string::npos);
}

TEST(SkippedVersionsTest, JsonFileStoreToleratesCorruptFile) {
    testutil::TemporaryDirectory tmp;
    const std::string path = tmp.File("skipped.json");
    testutil::WriteFile(path, "{not json");

    appcast::JsonFileSkippedVersionStore store(path);
    EXPECT_FALSE(store.Load().has_value());
    EXPECT_FALSE(store.IsSkipped("1.0.0"));

    ASSERT_TRUE(store.Skip("1.0.0").is_ok());
    EXPECT_TRUE(store.IsSkipped("1.0.0"));
}

TEST(SkippedVersionsTest, JsonFileStoreReportsUnwritableLocation) {
    appcast::JsonFileSkippedVersionStore store("/nonexistent-dir/appcast/skipped.json");
    auto r = store.Skip("1.0.0");
    EXPECT_FALSE(r.is_ok());
}

} // namespace
