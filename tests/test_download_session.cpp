#include "appcast/update/download_session.hpp"
#include "testing.hpp"

#include <gtest/gtest.h>

#include <set>
#include <utility>

namespace {

TEST(RemoteFileNameTest, TakesLastPathSegment) {
    EXPECT_EQ(appcast::RemoteFileName("https://example.com/releases/app-1.2.0.tar.gz"), "app-1.2.0.tar.gz");
    EXPECT_EQ(appcast::RemoteFileName("file:///srv/feeds/app.bin"), "app.bin");
}

TEST(RemoteFileNameTest, DropsQueryAndFragment) {
    EXPECT_EQ(appcast::RemoteFileName("https://example.com/dl/app.zip?token=abc#frag"), "app.zip");
}

TEST(RemoteFileNameTest, StripsUnsafeCharacters) {
    EXPECT_EQ(appcast::RemoteFileName("https://example.com/dl/my%20app$.bin"), "my20app.bin");
}

TEST(RemoteFileNameTest, FallsBackWhenNothingUsableRemains) {
    EXPECT_EQ(appcast::RemoteFileName("https://example.com"), "artifact");
    EXPECT_EQ(appcast::RemoteFileName("https://example.com/"), "artifact");
    EXPECT_EQ(appcast::RemoteFileName("https://example.com/dl/.."), "artifact");
}

TEST(UniqueTokenTest, ProducesDistinctHexTokens) {
    std::set<std::string> seen;
    for (int i = 0; i < 64; ++i) {
        auto t = appcast::GenerateUniqueToken();
        ASSERT_TRUE(t.has_value()) << t.error();
        ASSERT_EQ(t->size(), 32u);
        EXPECT_EQ(t->find_first_not_of("0123456789abcdef"), std::string::npos);
        EXPECT_TRUE(seen.insert(*t).second);
    }
}

class DownloadSessionTest : public ::testing::Test {
  protected:
    testutil::TemporaryDirectory tmp;
};

TEST_F(DownloadSessionTest, PathLivesInTempDirAndEndsWithRemoteName) {
    auto s = appcast::DownloadSession::Create("https://example.com/app.tar.gz", tmp.Path());
    ASSERT_TRUE(s.has_value()) << s.error();

    EXPECT_EQ(s->Path().rfind(tmp.Path() + "/", 0), 0u);
    EXPECT_EQ(s->Path().size(), tmp.Path().size() + 1 + 32 + std::string("app.tar.gz").size());
    EXPECT_TRUE(s->Path().ends_with("app.tar.gz"));
    EXPECT_EQ(s->GetState(), appcast::DownloadSession::State::Pending);
    EXPECT_EQ(s->ArtifactUrl(), "https://example.com/app.tar.gz");
}

TEST_F(DownloadSessionTest, SessionsForSameUrlNeverCollide) {
    auto a = appcast::DownloadSession::Create("https://example.com/app.bin", tmp.Path());
    auto b = appcast::DownloadSession::Create("https://example.com/app.bin", tmp.Path());
    ASSERT_TRUE(a.has_value());
    ASSERT_TRUE(b.has_value());
    EXPECT_NE(a->Path(), b->Path());
}

TEST_F(DownloadSessionTest, MissingTempDirIsAnError) {
    auto s = appcast::DownloadSession::Create("https://example.com/app.bin", tmp.File("nope"));
    ASSERT_FALSE(s.has_value());
    EXPECT_NE(s.error().find("does not exist"), std::string::npos);
}

TEST_F(DownloadSessionTest, DestructorRemovesUnreleasedArtifact) {
    std::string path;
    {
        auto s = appcast::DownloadSession::Create("https://example.com/app.bin", tmp.Path());
        ASSERT_TRUE(s.has_value());
        path = s->Path();
        testutil::WriteFile(path, "bytes");
        s->MarkCompleted();
    }
    EXPECT_FALSE(testutil::FileExists(path));
}

TEST_F(DownloadSessionTest, MarkFailedDiscardsPartialFile) {
    auto s = appcast::DownloadSession::Create("https://example.com/app.bin", tmp.Path());
    ASSERT_TRUE(s.has_value());
    testutil::WriteFile(s->Path(), "partial");
    s->MarkFailed();
    EXPECT_EQ(s->GetState(), appcast::DownloadSession::State::Failed);
    EXPECT_FALSE(testutil::FileExists(s->Path()));
}

TEST_F(DownloadSessionTest, DiscardOfMissingFileIsOk) {
    auto s = appcast::DownloadSession::Create("https://example.com/app.bin", tmp.Path());
    ASSERT_TRUE(s.has_value());
    auto r = s->Discard();
    EXPECT_TRUE(r.is_ok()) << r.message();
}

TEST_F(DownloadSessionTest, ReleasedArtifactSurvivesSession) {
    std::string path;
    {
        auto s = appcast::DownloadSession::Create("https://example.com/app.bin", tmp.Path());
        ASSERT_TRUE(s.has_value());
        testutil::WriteFile(s->Path(), "keep me");
        s->MarkCompleted();
        path = s->Release();
        EXPECT_EQ(s->GetState(), appcast::DownloadSession::State::Released);
    }
    ASSERT_TRUE(testutil::FileExists(path));
    EXPECT_EQ(testutil::ReadFile(path), "keep me");
}

TEST_F(DownloadSessionTest, MovedFromSessionDoesNotDeleteFile) {
    auto s = appcast::DownloadSession::Create("https://example.com/app.bin", tmp.Path());
    ASSERT_TRUE(s.has_value());
    testutil::WriteFile(s->Path(), "x");
    const std::string path = s->Path();

    std::optional<appcast::DownloadSession> holder;
    {
        appcast::DownloadSession moved(std::move(*s));
        holder.emplace(std::move(moved));
    }
    EXPECT_TRUE(testutil::FileExists(path));
    holder.reset();
    EXPECT_FALSE(testutil::FileExists(path));
}

} // namespace
