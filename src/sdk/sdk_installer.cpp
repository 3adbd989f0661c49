#include "sdk/sdk_installer.hpp"

#include "sdk/minifier.hpp"
#include "sdk/remote_ref.hpp"
#include "sdk/tool_selection.hpp"
#include "util/logger.hpp"

namespace fs = std::filesystem;

namespace espkit {

SdkInstaller::SdkInstaller(ToolsLayout layout, std::shared_ptr<IToolInstaller> installer, Options opt)
    : layout_(std::move(layout)), installer_(std::move(installer)), opt_(std::move(opt)) {}

Result SdkInstaller::Install(const std::vector<Chip>& targets,
                             const std::string& version,
                             bool minify,
                             std::string& out_dir) const {
    if (!installer_) return Result::Fail(-1, "No tool installer configured");
    if (targets.empty()) return Result::Fail(-1, "No targets to install for");

    auto ref = ParseRemoteRef(version);
    if (!ref) return Result::Fail(-1, ref.error());

    const Generator generator = opt_.generator.value_or(opt_.caps.default_generator);
    const HostCapabilities caps = opt_.caps;

    const ToolSelector selector = [&targets, caps, generator](const fs::path& sdk_dir,
                                                               const SdkVersionResult& sdk_version)
        -> std::expected<std::vector<ToolSet>, std::string> {
        LogInfo("Using esp-idf %s at %s", FormatVersion(sdk_version).c_str(), sdk_dir.c_str());
        return SelectTools(targets, sdk_version, caps, generator);
    };

    const SdkOrigin origin{opt_.repository_url, *ref};
    LogInfo("Installing esp-idf %s %s from %s", RefKind(origin.ref), RefName(origin.ref).c_str(),
            origin.repo_url.c_str());

    auto res = installer_->Install(origin, layout_.Root(), selector);
    if (!res.is_ok()) return Result::Fail(res.err, "Installing esp-idf failed: " + res.msg);

    const fs::path sdk_dir = DeriveInstallPath(layout_.Root(), origin.repo_url, origin.ref);

    if (minify) {
        LogInfo("Minifying esp-idf at %s", sdk_dir.c_str());
        auto min_res = MinifySdk(sdk_dir);
        if (!min_res.is_ok()) return min_res;
    }

    out_dir = sdk_dir.string();
    return Result::Ok();
}

} // namespace espkit
