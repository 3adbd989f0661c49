#include <gtest/gtest.h>

#include "sdk/install_path.hpp"
#include "util/hash.hpp"

namespace espkit {

TEST(InstallPathTest, DerivesHashedSourceDirAndRefLeaf) {
    const auto p = DeriveInstallPath("/home/u/.tools", "https://example/repo", Tag{"v5.0"});
    EXPECT_EQ(p, std::filesystem::path("/home/u/.tools/esp-idf-b9791476036a7605/v5.0"));
}

TEST(InstallPathTest, SameInputsGiveSamePath) {
    const auto a = DeriveInstallPath("/r", "https://github.com/espressif/esp-idf", Branch{"master"});
    const auto b = DeriveInstallPath("/r", "https://github.com/espressif/esp-idf", Branch{"master"});
    EXPECT_EQ(a, b);
}

TEST(InstallPathTest, RefChangesOnlyLastSegment) {
    const auto a = DeriveInstallPath("/r", "https://example/repo", Tag{"v4.4"});
    const auto b = DeriveInstallPath("/r", "https://example/repo", Commit{"abc123"});
    EXPECT_EQ(a.parent_path(), b.parent_path());
    EXPECT_NE(a.filename(), b.filename());
}

TEST(InstallPathTest, SourceChangesHashedSegment) {
    const auto a = DeriveInstallPath("/r", "https://example/repo", Tag{"v4.4"});
    const auto b = DeriveInstallPath("/r", "https://example/fork", Tag{"v4.4"});
    EXPECT_NE(a.parent_path(), b.parent_path());
    EXPECT_EQ(a.filename(), b.filename());
}

TEST(InstallPathTest, SeparatorsInRefAreSanitized) {
    const auto p = DeriveInstallPath("/r", "https://example/repo", Branch{"release/v5.0"});
    EXPECT_EQ(p.filename(), "release-v5.0");
    EXPECT_EQ(p.parent_path().parent_path(), std::filesystem::path("/r"));

    const auto q = DeriveInstallPath("/r", "https://example/repo", Branch{"a\\b"});
    EXPECT_EQ(q.filename(), "a-b");
}

TEST(ToolsLayoutTest, PathsHangOffRoot) {
    const ToolsLayout layout("/opt/esp");
    EXPECT_EQ(layout.DistDir(), std::filesystem::path("/opt/esp/dist"));
    EXPECT_EQ(layout.ToolDir("cmake"), std::filesystem::path("/opt/esp/tools/cmake"));
    EXPECT_EQ(layout.SdkPath("https://example/repo", Tag{"v5.0"}),
              std::filesystem::path("/opt/esp/esp-idf-" + Fnv1a64Hex("https://example/repo") + "/v5.0"));
}

} // namespace espkit
