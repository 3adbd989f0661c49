#pragma once

#include "sdk/remote_ref.hpp"
#include "sdk/sdk_version.hpp"
#include "sdk/tool_selection.hpp"
#include "util/result.hpp"

#include <expected>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

namespace espkit {

// Where an SDK checkout comes from.
struct SdkOrigin {
    std::string repo_url;
    RemoteRef ref;
};

// Given the checked-out SDK directory and its version, returns the tools to install.
using ToolSelector = std::function<std::expected<std::vector<ToolSet>, std::string>(
    const std::filesystem::path& sdk_dir, const SdkVersionResult& version)>;

class IToolInstaller {
  public:
    virtual ~IToolInstaller() = default;

    // Materializes the SDK from origin under install_dir, then every tool
    // that select_tools asks for.
    virtual Result Install(const SdkOrigin& origin,
                           const std::filesystem::path& install_dir,
                           const ToolSelector& select_tools) = 0;
};

} // namespace espkit
