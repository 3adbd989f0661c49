#pragma once

#include "platform/host_capabilities.hpp"
#include "sdk/install_path.hpp"
#include "sdk/tool_installer.hpp"
#include "target/chip.hpp"
#include "util/result.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace espkit {

// Installs one SDK revision with the tools needed for a set of targets.
class SdkInstaller {
  public:
    struct Options {
        std::string repository_url;
        HostCapabilities caps;
        // Defaults to caps.default_generator.
        std::optional<Generator> generator;
    };

    SdkInstaller(ToolsLayout layout, std::shared_ptr<IToolInstaller> installer, Options opt);

    // version is parsed as a remote ref ("branch:", "tag:", "commit:" or a
    // bare version). out_dir receives the SDK checkout directory.
    Result Install(const std::vector<Chip>& targets,
                   const std::string& version,
                   bool minify,
                   std::string& out_dir) const;

  private:
    ToolsLayout layout_;
    std::shared_ptr<IToolInstaller> installer_;
    Options opt_;
};

} // namespace espkit
