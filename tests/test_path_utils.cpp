#include <gtest/gtest.h>

#include "util/path_utils.hpp"

TEST(PathUtilsTest, NormalizeArchivePathCleansInput) {
    EXPECT_EQ(espkit::NormalizeArchivePath("./manifest.json"), "manifest.json");
    EXPECT_EQ(espkit::NormalizeArchivePath("/boot//EFI///BOOT"), "boot/EFI/BOOT");
    EXPECT_EQ(espkit::NormalizeArchivePath("////././a//b"), "././a/b");
    EXPECT_EQ(espkit::NormalizeArchivePath(""), "");
}

TEST(PathUtilsTest, SanitizeRefNameReplacesSeparators) {
    EXPECT_EQ(espkit::SanitizeRefName("release/v5.0"), "release-v5.0");
    EXPECT_EQ(espkit::SanitizeRefName("a\\b/c"), "a-b-c");
    EXPECT_EQ(espkit::SanitizeRefName("v4.4"), "v4.4");
}

TEST(PathUtilsTest, FileExtensionIsTextAfterLastDot) {
    EXPECT_EQ(espkit::FileExtension("tools.tar.gz"), "gz");
    EXPECT_EQ(espkit::FileExtension("llvm.tar.xz"), "xz");
    EXPECT_EQ(espkit::FileExtension("win.zip"), "zip");
    EXPECT_EQ(espkit::FileExtension("README"), "");
    EXPECT_EQ(espkit::FileExtension(".hidden"), "");
    EXPECT_EQ(espkit::FileExtension("dir.d/file"), "");
}
