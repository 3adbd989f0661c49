#include <gtest/gtest.h>

#include "platform/platform_resolver.hpp"

namespace espkit {

TEST(PlatformResolverTest, GccNaming) {
    EXPECT_EQ(GccArtifactExtension("x86_64-pc-windows-msvc"), "zip");
    EXPECT_EQ(GccArtifactExtension("x86_64-unknown-linux-gnu"), "tar.gz");
    EXPECT_EQ(GccArch("x86_64-unknown-linux-gnu"), "linux-amd64");
    EXPECT_EQ(GccArch("aarch64-unknown-linux-gnu"), "linux-arm64");
    EXPECT_EQ(GccArch("aarch64-apple-darwin"), "macos");
    EXPECT_EQ(GccArch("x86_64-pc-windows-gnu"), "win64");
}

TEST(PlatformResolverTest, LlvmNaming) {
    EXPECT_EQ(LlvmArtifactExtension("x86_64-pc-windows-gnu"), "zip");
    EXPECT_EQ(LlvmArtifactExtension("x86_64-apple-darwin"), "tar.xz");
    EXPECT_EQ(LlvmArch("x86_64-unknown-linux-gnu"), "linux-amd64");
    EXPECT_EQ(LlvmArch("x86_64-pc-windows-msvc"), "win64");
}

TEST(PlatformResolverTest, InstallerScript) {
    EXPECT_EQ(RustInstallerScript("x86_64-pc-windows-msvc"), "");
    EXPECT_EQ(RustInstallerScript("x86_64-unknown-linux-gnu"), "./install.sh");
}

TEST(PlatformResolverTest, UnknownPlatformPassesThrough) {
    EXPECT_EQ(GccArch("riscv64gc-unknown-linux-gnu"), "riscv64gc-unknown-linux-gnu");
    EXPECT_EQ(LlvmArch("aarch64-unknown-linux-gnu"), "aarch64-unknown-linux-gnu");
    EXPECT_EQ(GccArtifactExtension("riscv64gc-unknown-linux-gnu"), "tar.gz");
}

TEST(PlatformResolverTest, ToolsIndexKeysPreferAppleSilicon) {
    EXPECT_EQ(ToolsIndexPlatformKeys("aarch64-apple-darwin"),
              (std::vector<std::string>{"macos-arm64", "macos"}));
    EXPECT_EQ(ToolsIndexPlatformKeys("x86_64-apple-darwin"), (std::vector<std::string>{"macos"}));
    EXPECT_EQ(ToolsIndexPlatformKeys("x86_64-unknown-linux-gnu"), (std::vector<std::string>{"linux-amd64"}));
    EXPECT_EQ(ToolsIndexPlatformKeys("riscv64gc-unknown-linux-gnu"),
              (std::vector<std::string>{"riscv64gc-unknown-linux-gnu"}));
}

TEST(PlatformResolverTest, ResolveBundlesGccChannel) {
    const auto n = ResolvePlatform("x86_64-pc-windows-msvc");
    EXPECT_EQ(n.archive_extension, "zip");
    EXPECT_EQ(n.arch_label, "win64");
    EXPECT_EQ(n.installer_script, "");
}

TEST(PlatformResolverTest, BuildHostIsNotEmpty) {
    EXPECT_FALSE(BuildHostPlatform().empty());
}

} // namespace espkit
