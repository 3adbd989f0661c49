#pragma once

#include "fetch/fetcher.hpp"
#include "platform/platform_resolver.hpp"
#include "sdk/git_checkout.hpp"
#include "sdk/install_path.hpp"
#include "sdk/tool_installer.hpp"
#include "sdk/tools_index.hpp"

#include <memory>
#include <string>
#include <vector>

namespace espkit {

// IToolInstaller that checks the SDK out with git and places every selected
// tool from an IDF tools.json index under <root>/tools/<name>/<version>.
class ToolsIndexInstaller final : public IToolInstaller {
  public:
    struct Options {
        PlatformId platform;
        // Index used for ToolSet::Source::Bundled; empty selects the
        // built-in one.
        std::string bundled_index_path;
    };

    ToolsIndexInstaller(std::shared_ptr<const Fetcher> fetcher,
                        std::shared_ptr<const GitCheckout> git,
                        Options opt);

    Result Install(const SdkOrigin& origin,
                   const std::filesystem::path& install_dir,
                   const ToolSelector& select_tools) override;

  private:
    Result LoadIndex(const ToolSet& set, const std::filesystem::path& sdk_dir, ToolsIndex& out) const;
    Result InstallRelease(const ToolsLayout& layout, const ToolRelease& release) const;
    // Expected digest of file_name from a downloaded sha256sum-style list.
    Result ListedSha256(const ToolsLayout& layout,
                        const std::string& list_url,
                        const std::string& file_name,
                        std::string& out_hex) const;

    std::shared_ptr<const Fetcher> fetcher_;
    std::shared_ptr<const GitCheckout> git_;
    Options opt_;
};

} // namespace espkit
