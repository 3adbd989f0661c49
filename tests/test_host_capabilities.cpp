#include <gtest/gtest.h>

#include "platform/host_capabilities.hpp"

namespace espkit {

TEST(HostCapabilitiesTest, LinuxAmd64) {
    const auto caps = HostCapabilities::ForPlatform("x86_64-unknown-linux-gnu");
    EXPECT_EQ(caps.platform, "x86_64-unknown-linux-gnu");
    EXPECT_FALSE(caps.needs_installer_helper);
    EXPECT_FALSE(caps.needs_compiler_cache);
    EXPECT_FALSE(caps.needs_flashing_utility);
    EXPECT_TRUE(caps.supports_ulp_toolchain);
    EXPECT_EQ(caps.default_generator, Generator::Ninja);
}

TEST(HostCapabilitiesTest, WindowsNeedsHelpers) {
    const auto caps = HostCapabilities::ForPlatform("x86_64-pc-windows-msvc");
    EXPECT_TRUE(caps.needs_installer_helper);
    EXPECT_TRUE(caps.needs_compiler_cache);
    EXPECT_TRUE(caps.needs_flashing_utility);
    EXPECT_TRUE(IsWindowsPlatform(caps.platform));
}

TEST(HostCapabilitiesTest, LinuxArm64UsesMakefilesWithoutUlp) {
    const auto caps = HostCapabilities::ForPlatform("aarch64-unknown-linux-gnu");
    EXPECT_FALSE(caps.supports_ulp_toolchain);
    EXPECT_EQ(caps.default_generator, Generator::UnixMakefiles);
    EXPECT_STREQ(ToString(caps.default_generator), "Unix Makefiles");
}

TEST(HostCapabilitiesTest, AppleSiliconKeepsUlp) {
    const auto caps = HostCapabilities::ForPlatform("aarch64-apple-darwin");
    EXPECT_TRUE(caps.supports_ulp_toolchain);
    EXPECT_FALSE(IsWindowsPlatform(caps.platform));
}

} // namespace espkit
