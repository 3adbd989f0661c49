#include <gtest/gtest.h>

#include "sdk/tools_index_installer.hpp"
#include "sdk_fixtures.hpp"

namespace espkit {

namespace fs = std::filesystem;

using testutil::FakeTool;
using testutil::IndexJson;
using testutil::MakeTool;
using testutil::SdkTreeRunner;

class ToolsIndexInstallerTest : public ::testing::Test {
  protected:
    testutil::TemporaryDirectory tmp;
    std::shared_ptr<testutil::FakeHttpClient> http = std::make_shared<testutil::FakeHttpClient>();
    std::shared_ptr<SdkTreeRunner> runner = std::make_shared<SdkTreeRunner>();
    const SdkOrigin origin{"https://example/repo", Tag{"v5.0.1"}};

    std::unique_ptr<ToolsIndexInstaller> MakeInstaller(const std::string& bundled = "") {
        ToolsIndexInstaller::Options opt;
        opt.platform = "x86_64-unknown-linux-gnu";
        opt.bundled_index_path = bundled;
        return std::make_unique<ToolsIndexInstaller>(std::make_shared<const Fetcher>(http),
                                                     std::make_shared<const GitCheckout>(runner), opt);
    }

    void Serve(const FakeTool& t) { http->Serve(t.url, t.archive); }

    static ToolSelector Select(std::vector<ToolSet> sets, SdkVersionResult* seen = nullptr) {
        return [sets, seen](const fs::path&, const SdkVersionResult& v)
                   -> std::expected<std::vector<ToolSet>, std::string> {
            if (seen) *seen = v;
            return sets;
        };
    }
};

TEST_F(ToolsIndexInstallerTest, ChecksOutSdkAndInstallsSelectedTools) {
    const auto gcc = MakeTool("xtensa-esp32-elf", "esp-2022r1-11.2.0", "gcc");
    const auto ocd = MakeTool("openocd-esp32", "v0.11.0-esp32-20221026", "openocd");
    runner->tools_json = IndexJson({gcc, ocd});
    Serve(gcc);
    Serve(ocd);

    SdkVersionResult seen = std::unexpected(std::string("not called"));
    auto installer = MakeInstaller();
    auto res = installer->Install(origin, tmp.Path(),
                                  Select({ToolSet{ToolSet::Source::SdkIndex, {gcc.name, ocd.name}}}, &seen));
    ASSERT_TRUE(res.is_ok()) << res.msg;

    ASSERT_TRUE(seen.has_value());
    EXPECT_EQ(*seen, (SdkVersion{5, 0, 1}));

    const ToolsLayout layout(tmp.Path());
    EXPECT_TRUE(fs::exists(layout.SdkPath(origin.repo_url, origin.ref) / "tools/tools.json"));
    EXPECT_EQ(testutil::ReadFile(layout.ToolDir(gcc.name) / gcc.version / "xtensa-esp32-elf/bin/xtensa-esp32-elf"),
              "gcc");
    EXPECT_EQ(testutil::ReadFile(layout.ToolDir(ocd.name) / ocd.version / "openocd-esp32/bin/openocd-esp32"),
              "openocd");
    EXPECT_TRUE(fs::exists(layout.DistDir() / "xtensa-esp32-elf-esp-2022r1-11.2.0-linux-amd64.tar.gz"));
    EXPECT_EQ(http->Requests(), 2);
}

TEST_F(ToolsIndexInstallerTest, SecondRunReusesEverything) {
    const auto gcc = MakeTool("riscv32-esp-elf", "esp-2022r1-11.2.0", "gcc");
    runner->tools_json = IndexJson({gcc});
    Serve(gcc);

    auto installer = MakeInstaller();
    const auto select = Select({ToolSet{ToolSet::Source::SdkIndex, {gcc.name}}});
    ASSERT_TRUE(installer->Install(origin, tmp.Path(), select).is_ok());
    ASSERT_TRUE(installer->Install(origin, tmp.Path(), select).is_ok());

    EXPECT_EQ(runner->clones, 1);
    EXPECT_EQ(http->Requests(), 1);
}

TEST_F(ToolsIndexInstallerTest, ChecksumMismatchDeletesDownload) {
    auto gcc = MakeTool("xtensa-esp32-elf", "esp-2022r1-11.2.0", "gcc");
    gcc.sha256 = std::string(64, '0');
    runner->tools_json = IndexJson({gcc});
    Serve(gcc);

    auto installer = MakeInstaller();
    auto res = installer->Install(origin, tmp.Path(), Select({ToolSet{ToolSet::Source::SdkIndex, {gcc.name}}}));
    ASSERT_FALSE(res.is_ok());
    EXPECT_NE(res.msg.find("Checksum mismatch"), std::string::npos);

    const ToolsLayout layout(tmp.Path());
    EXPECT_FALSE(fs::exists(layout.DistDir() / "xtensa-esp32-elf-esp-2022r1-11.2.0-linux-amd64.tar.gz"));
    EXPECT_FALSE(fs::exists(layout.ToolDir(gcc.name) / gcc.version));
}

TEST_F(ToolsIndexInstallerTest, UnknownToolFails) {
    runner->tools_json = IndexJson({});

    auto installer = MakeInstaller();
    auto res = installer->Install(origin, tmp.Path(), Select({ToolSet{ToolSet::Source::SdkIndex, {"ninja"}}}));
    ASSERT_FALSE(res.is_ok());
    EXPECT_NE(res.msg.find("ninja"), std::string::npos);
    EXPECT_EQ(http->Requests(), 0);
}

TEST_F(ToolsIndexInstallerTest, BundledSetUsesConfiguredIndex) {
    const auto cmake = MakeTool("cmake", "3.20.3", "cmake");
    runner->tools_json = IndexJson({});
    Serve(cmake);

    const std::string bundled = tmp.Path() + "/bundled-tools.json";
    testutil::WriteFile(bundled, IndexJson({cmake}));

    auto installer = MakeInstaller(bundled);
    auto res = installer->Install(origin, tmp.Path(), Select({ToolSet{ToolSet::Source::Bundled, {"cmake"}}}));
    ASSERT_TRUE(res.is_ok()) << res.msg;
    EXPECT_TRUE(fs::exists(ToolsLayout(tmp.Path()).ToolDir("cmake") / "3.20.3" / "cmake/bin/cmake"));
}

TEST_F(ToolsIndexInstallerTest, BundledSetFallsBackToBuiltinIndex) {
    runner->tools_json = IndexJson({});
    const auto cmake = testutil::ServeBuiltinCmake(*http);

    auto installer = MakeInstaller();
    auto res = installer->Install(origin, tmp.Path(), Select({ToolSet{ToolSet::Source::Bundled, {"cmake"}}}));
    ASSERT_TRUE(res.is_ok()) << res.msg;

    const ToolsLayout layout(tmp.Path());
    EXPECT_EQ(testutil::ReadFile(layout.ToolDir("cmake") / cmake.version / "cmake-3.20.3-linux-x86_64/bin/cmake"),
              "cmake");
    EXPECT_EQ(http->Requested(),
              (std::vector<std::string>{testutil::kBuiltinCmakeLinuxUrl, testutil::kBuiltinCmakeDigestsUrl}));
}

TEST_F(ToolsIndexInstallerTest, ListedDigestMismatchFails) {
    runner->tools_json = IndexJson({});
    testutil::ServeBuiltinCmake(*http, std::string(64, '0'));

    auto installer = MakeInstaller();
    auto res = installer->Install(origin, tmp.Path(), Select({ToolSet{ToolSet::Source::Bundled, {"cmake"}}}));
    ASSERT_FALSE(res.is_ok());
    EXPECT_NE(res.msg.find("Checksum mismatch"), std::string::npos);
    EXPECT_FALSE(fs::exists(ToolsLayout(tmp.Path()).ToolDir("cmake") / kBuiltinCmakeVersion));
}

TEST_F(ToolsIndexInstallerTest, AppleSiliconPrefersArm64Download) {
    const auto arm = MakeTool("openocd-esp32", "v0.11.0", "arm64");
    const auto universal = MakeTool("openocd-esp32", "v0.11.0-universal", "universal");
    nlohmann::json ver;
    ver["name"] = "v0.11.0";
    ver["status"] = "recommended";
    ver["macos"] = {{"url", universal.url}, {"sha256", universal.sha256}};
    ver["macos-arm64"] = {{"url", arm.url}, {"sha256", arm.sha256}};
    nlohmann::json j;
    j["tools"] = nlohmann::json::array();
    j["tools"].push_back({{"name", "openocd-esp32"}, {"versions", nlohmann::json::array({ver})}});
    runner->tools_json = j.dump();
    Serve(arm);
    Serve(universal);

    ToolsIndexInstaller::Options opt;
    opt.platform = "aarch64-apple-darwin";
    ToolsIndexInstaller installer(std::make_shared<const Fetcher>(http),
                                  std::make_shared<const GitCheckout>(runner), opt);
    auto res = installer.Install(origin, tmp.Path(), Select({ToolSet{ToolSet::Source::SdkIndex, {"openocd-esp32"}}}));
    ASSERT_TRUE(res.is_ok()) << res.msg;
    EXPECT_EQ(http->Requested(), std::vector<std::string>{arm.url});
}

TEST_F(ToolsIndexInstallerTest, SelectorErrorAborts) {
    runner->tools_json = IndexJson({});

    auto installer = MakeInstaller();
    const ToolSelector failing = [](const fs::path&, const SdkVersionResult&)
        -> std::expected<std::vector<ToolSet>, std::string> { return std::unexpected(std::string("no tools")); };
    auto res = installer->Install(origin, tmp.Path(), failing);
    ASSERT_FALSE(res.is_ok());
    EXPECT_EQ(res.msg, "no tools");
}

} // namespace espkit
