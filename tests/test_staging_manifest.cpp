#include <gtest/gtest.h>

#include "crypto/sha256.hpp"
#include "testing.hpp"
#include "update/staging_manifest.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>

namespace selfupdate {
namespace {

constexpr const char* kAbcDigest = "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad";

TEST(StagingManifestTest, ParsesFilesAndVersion) {
    StagingManifest m;
    auto r = StagingManifest::Parse(
        std::string(R"({"version": "1.4.0", "files": [{"name": "App.exe", "sha256": ")") + kAbcDigest +
            R"("}, {"name": "Doc.txt", "sha256": ")" + std::string(64, 'A') + R"("}]})",
        m);
    ASSERT_TRUE(r.is_ok()) << r.msg;
    EXPECT_EQ(m.version, "1.4.0");
    ASSERT_EQ(m.files.size(), 2u);
    EXPECT_EQ(m.ExpectedSha256("App.exe"), std::optional<std::string>(kAbcDigest));
    EXPECT_EQ(m.ExpectedSha256("Doc.txt"), std::optional<std::string>(std::string(64, 'A')));
    EXPECT_FALSE(m.ExpectedSha256("app.exe").has_value());
}

TEST(StagingManifestTest, RejectsInvalidDocuments) {
    StagingManifest m;
    EXPECT_FALSE(StagingManifest::Parse("not json", m).is_ok());
    EXPECT_FALSE(StagingManifest::Parse("[]", m).is_ok());
    EXPECT_FALSE(StagingManifest::Parse(R"({"version": "1"})", m).is_ok());
    EXPECT_FALSE(StagingManifest::Parse(R"({"files": [{"name": "App.exe", "sha256": "abc"}]})", m).is_ok());
    EXPECT_FALSE(StagingManifest::Parse(R"({"files": [{"sha256": ")" + std::string(kAbcDigest) + R"("}]})", m).is_ok());

    auto r = StagingManifest::Parse(
        R"({"files": [{"name": "../App.exe", "sha256": ")" + std::string(kAbcDigest) + R"("}]})", m);
    ASSERT_FALSE(r.is_ok());
    EXPECT_NE(r.msg.find("must not contain a path"), std::string::npos);
}

TEST(StagingManifestTest, MissingFileReportsEnoent) {
    testutil::TemporaryDirectory dir;
    StagingManifest m;
    auto r = StagingManifest::LoadFromFile(dir.Join("update-manifest.json"), m);
    ASSERT_FALSE(r.is_ok());
    EXPECT_EQ(r.err, ENOENT);
}

TEST(StagingManifestTest, LoadsFromFile) {
    testutil::TemporaryDirectory dir;
    const auto path = dir.Join("update-manifest.json");
    testutil::WriteFile(path, std::string(R"({"files": [{"name": "App.exe", "sha256": ")") + kAbcDigest + R"("}]})");

    StagingManifest m;
    auto r = StagingManifest::LoadFromFile(path, m);
    ASSERT_TRUE(r.is_ok()) << r.msg;
    EXPECT_TRUE(m.version.empty());
    EXPECT_TRUE(m.ExpectedSha256("App.exe").has_value());
}

TEST(StagingManifestTest, VerifyFileComparesDigests) {
    testutil::TemporaryDirectory dir;
    const auto path = dir.Join("App.exe");
    testutil::WriteFile(path, "abc");

    EXPECT_TRUE(StagingManifest::VerifyFile(path, kAbcDigest).is_ok());

    std::string upper = kAbcDigest;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    EXPECT_TRUE(StagingManifest::VerifyFile(path, upper).is_ok());

    auto r = StagingManifest::VerifyFile(path, std::string(64, '0'));
    ASSERT_FALSE(r.is_ok());
    EXPECT_NE(r.msg.find("sha256 mismatch"), std::string::npos);

    r = StagingManifest::VerifyFile(path, "");
    ASSERT_FALSE(r.is_ok());
    EXPECT_NE(r.msg.find("expected sha256 is empty"), std::string::npos);

    EXPECT_FALSE(StagingManifest::VerifyFile(dir.Join("missing"), kAbcDigest).is_ok());
}

} // namespace
} // namespace selfupdate
