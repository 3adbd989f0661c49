#include <gtest/gtest.h>

#include "sdk/tool_selection.hpp"

#include <algorithm>

namespace espkit {

namespace {

bool Contains(const std::vector<std::string>& v, const std::string& s) {
    return std::find(v.begin(), v.end(), s) != v.end();
}

const HostCapabilities kLinux = HostCapabilities::ForPlatform("x86_64-unknown-linux-gnu");

} // namespace

TEST(ToolSelectionTest, RecentSdkTakesEverythingFromItsIndex) {
    auto sets = SelectTools({Chip::Esp32, Chip::Esp32c3}, SdkVersion{5, 0, 0}, kLinux, Generator::Ninja);
    ASSERT_EQ(sets.size(), 1u);
    EXPECT_EQ(sets[0].source, ToolSet::Source::SdkIndex);
    EXPECT_EQ(sets[0].names, (std::vector<std::string>{"xtensa-esp32-elf", "esp32ulp-elf", "riscv32-esp-elf",
                                                       "cmake", "openocd-esp32", "ninja"}));
}

TEST(ToolSelectionTest, OldSdkGetsBundledCmake) {
    auto sets = SelectTools({Chip::Esp32}, SdkVersion{4, 3, 2}, kLinux, Generator::Ninja);
    ASSERT_EQ(sets.size(), 2u);
    EXPECT_EQ(sets[0].source, ToolSet::Source::Bundled);
    EXPECT_EQ(sets[0].names, std::vector<std::string>{"cmake"});
    EXPECT_FALSE(Contains(sets[1].names, "cmake"));
}

TEST(ToolSelectionTest, UnknownVersionGetsBundledCmake) {
    const SdkVersionResult unknown = std::unexpected(std::string("no version.cmake"));
    auto sets = SelectTools({Chip::Esp32s2}, unknown, kLinux, Generator::Ninja);
    ASSERT_EQ(sets.size(), 2u);
    EXPECT_EQ(sets[0].source, ToolSet::Source::Bundled);
    EXPECT_TRUE(Contains(sets[1].names, "esp32ulp-elf"));
}

TEST(ToolSelectionTest, FiveDotZeroIsNotMistakenForOld) {
    auto sets = SelectTools({Chip::Esp32}, SdkVersion{5, 0, 0}, kLinux, Generator::Ninja);
    ASSERT_EQ(sets.size(), 1u);
    EXPECT_TRUE(Contains(sets[0].names, "cmake"));
}

TEST(ToolSelectionTest, UlpNameDependsOnVersion) {
    const SdkVersion old{4, 4, 1};
    const SdkVersion recent{4, 4, 2};
    EXPECT_EQ(UlpToolchainName(Chip::Esp32, &old), "esp32ulp-elf");
    EXPECT_EQ(UlpToolchainName(Chip::Esp32s2, &old), "esp32s2ulp-elf");
    EXPECT_EQ(UlpToolchainName(Chip::Esp32s3, &recent), "esp32ulp-elf");
    EXPECT_EQ(UlpToolchainName(Chip::Esp32s3, nullptr), "esp32ulp-elf");
    EXPECT_FALSE(UlpToolchainName(Chip::Esp32c3, &recent).has_value());
}

TEST(ToolSelectionTest, WindowsAddsHelpers) {
    const auto win = HostCapabilities::ForPlatform("x86_64-pc-windows-msvc");
    auto sets = SelectTools({Chip::Esp32c3}, SdkVersion{5, 0, 0}, win, Generator::Ninja);
    ASSERT_EQ(sets.size(), 1u);
    EXPECT_TRUE(Contains(sets[0].names, "idf-exe"));
    EXPECT_TRUE(Contains(sets[0].names, "ccache"));
    EXPECT_TRUE(Contains(sets[0].names, "dfu-util"));
}

TEST(ToolSelectionTest, LinuxArm64SkipsUlpAndNinja) {
    const auto arm = HostCapabilities::ForPlatform("aarch64-unknown-linux-gnu");
    auto sets = SelectTools({Chip::Esp32, Chip::Esp32s3}, SdkVersion{5, 0, 0}, arm, arm.default_generator);
    ASSERT_EQ(sets.size(), 1u);
    EXPECT_FALSE(Contains(sets[0].names, "esp32ulp-elf"));
    EXPECT_FALSE(Contains(sets[0].names, "ninja"));
    EXPECT_TRUE(Contains(sets[0].names, "openocd-esp32"));
}

TEST(ToolSelectionTest, SharedUlpToolchainListedOnce) {
    auto sets = SelectTools({Chip::Esp32, Chip::Esp32s2, Chip::Esp32s3}, SdkVersion{5, 0, 0}, kLinux,
                            Generator::Ninja);
    ASSERT_EQ(sets.size(), 1u);
    EXPECT_EQ(std::count(sets[0].names.begin(), sets[0].names.end(), "esp32ulp-elf"), 1);
}

} // namespace espkit
