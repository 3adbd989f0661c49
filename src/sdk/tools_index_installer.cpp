#include "sdk/tools_index_installer.hpp"

#include "crypto/sha256.hpp"
#include "sdk/builtin_tools_index.hpp"
#include "util/logger.hpp"

#include <cerrno>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace espkit {

namespace {

std::string UrlBaseName(const std::string& url) {
    std::string_view sv = url;
    if (const auto q = sv.find_first_of("?#"); q != std::string_view::npos) {
        sv = sv.substr(0, q);
    }
    if (const auto slash = sv.rfind('/'); slash != std::string_view::npos) {
        sv.remove_prefix(slash + 1);
    }
    return std::string(sv);
}

} // namespace

ToolsIndexInstaller::ToolsIndexInstaller(std::shared_ptr<const Fetcher> fetcher,
                                         std::shared_ptr<const GitCheckout> git,
                                         Options opt)
    : fetcher_(std::move(fetcher)), git_(std::move(git)), opt_(std::move(opt)) {}

Result ToolsIndexInstaller::Install(const SdkOrigin& origin,
                                    const fs::path& install_dir,
                                    const ToolSelector& select_tools) {
    if (!fetcher_ || !git_) return Result::Fail(-1, "ToolsIndexInstaller is missing its collaborators");

    const ToolsLayout layout(install_dir);
    const fs::path sdk_dir = layout.SdkPath(origin.repo_url, origin.ref);

    auto checkout = git_->Ensure(origin.repo_url, origin.ref, sdk_dir);
    if (!checkout.is_ok()) return checkout;

    const SdkVersionResult version = ReadSdkVersionFromTree(sdk_dir.string());
    if (!version) {
        LogWarn("SDK version unknown: %s", version.error().c_str());
    }

    auto sets = select_tools(sdk_dir, version);
    if (!sets) return Result::Fail(-1, sets.error());

    const std::vector<std::string> platform_keys = ToolsIndexPlatformKeys(opt_.platform);

    for (const auto& set : *sets) {
        if (set.names.empty()) continue;

        ToolsIndex index;
        auto load_res = LoadIndex(set, sdk_dir, index);
        if (!load_res.is_ok()) return load_res;

        for (const auto& name : set.names) {
            ToolRelease release;
            auto resolve_res = index.Resolve(name, platform_keys, release);
            if (!resolve_res.is_ok()) return resolve_res;

            auto install_res = InstallRelease(layout, release);
            if (!install_res.is_ok()) return install_res;
        }
    }
    return Result::Ok();
}

Result ToolsIndexInstaller::LoadIndex(const ToolSet& set, const fs::path& sdk_dir, ToolsIndex& out) const {
    std::string path;
    switch (set.source) {
        case ToolSet::Source::SdkIndex:
            path = (sdk_dir / "tools" / "tools.json").string();
            break;
        case ToolSet::Source::Bundled:
            if (opt_.bundled_index_path.empty()) {
                LogDebug("Using built-in tools index");
                auto builtin = ToolsIndex::Parse(std::string(BuiltinToolsIndexJson()));
                if (!builtin) return Result::Fail(-1, "Cannot load built-in tools index: " + builtin.error());
                out = std::move(*builtin);
                return Result::Ok();
            }
            path = opt_.bundled_index_path;
            break;
    }

    auto parsed = ToolsIndex::LoadFromFile(path);
    if (!parsed) return Result::Fail(-1, "Cannot load tools index: " + parsed.error());
    out = std::move(*parsed);
    return Result::Ok();
}

Result ToolsIndexInstaller::InstallRelease(const ToolsLayout& layout, const ToolRelease& release) const {
    const fs::path tool_dir = layout.ToolDir(release.tool) / release.version;

    std::error_code ec;
    if (fs::exists(tool_dir, ec)) {
        LogInfo("%s %s already installed", release.tool.c_str(), release.version.c_str());
        return Result::Ok();
    }

    const std::string file_name = UrlBaseName(release.download.url);
    if (file_name.empty()) {
        return Result::Fail(-1, "Cannot derive file name from " + release.download.url);
    }

    std::string archive_path;
    auto fetch_res = fetcher_->Fetch(release.download.url, file_name, layout.DistDir().string(), false, archive_path);
    if (!fetch_res.is_ok()) return fetch_res;

    std::string expected_hex = release.download.sha256;
    if (expected_hex.empty()) {
        auto listed_res = ListedSha256(layout, release.download.sha256_list_url, file_name, expected_hex);
        if (!listed_res.is_ok()) return listed_res;
    }

    std::string actual;
    auto hash_res = Sha256HexFile(archive_path, actual);
    if (!hash_res.is_ok()) return hash_res;

    if (!Sha256Equal(actual, expected_hex)) {
        fs::remove(archive_path, ec);
        return Result::Fail(-1, "Checksum mismatch for " + archive_path + ": expected " +
                                    expected_hex + ", got " + actual);
    }

    LogInfo("Installing %s %s", release.tool.c_str(), release.version.c_str());
    auto extract_res = fetcher_->ExtractFile(archive_path, tool_dir.string());
    if (!extract_res.is_ok()) {
        fs::remove_all(tool_dir, ec);
        return extract_res;
    }
    return Result::Ok();
}

Result ToolsIndexInstaller::ListedSha256(const ToolsLayout& layout,
                                         const std::string& list_url,
                                         const std::string& file_name,
                                         std::string& out_hex) const {
    const std::string list_name = UrlBaseName(list_url);
    if (list_name.empty()) {
        return Result::Fail(-1, "Cannot derive file name from " + list_url);
    }

    std::string list_path;
    auto fetch_res = fetcher_->Fetch(list_url, list_name, layout.DistDir().string(), false, list_path);
    if (!fetch_res.is_ok()) return fetch_res;

    std::ifstream is(list_path);
    if (!is.good()) return Result::Fail(errno, "Cannot read " + list_path);
    std::ostringstream ss;
    ss << is.rdbuf();

    auto hex = FindListedSha256(ss.str(), file_name);
    if (!hex) {
        std::error_code ec;
        fs::remove(list_path, ec);
        return Result::Fail(-1, hex.error() + " in " + list_url);
    }
    out_hex = std::move(*hex);
    return Result::Ok();
}

} // namespace espkit
