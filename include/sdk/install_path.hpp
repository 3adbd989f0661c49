#pragma once

#include "sdk/remote_ref.hpp"

#include <filesystem>
#include <string>
#include <string_view>

namespace espkit {

inline constexpr std::string_view kSdkDirPrefix = "esp-idf";

// base / "esp-idf-<fnv1a64 hex of source_url>" / <ref name with / and \ as ->.
// Pure; nothing is created on disk.
std::filesystem::path DeriveInstallPath(const std::filesystem::path& base,
                                        std::string_view source_url,
                                        const RemoteRef& ref);

// Directory layout under the tools root.
class ToolsLayout {
  public:
    explicit ToolsLayout(std::filesystem::path root) : root_(std::move(root)) {}

    const std::filesystem::path& Root() const { return root_; }

    // Download cache for raw archives.
    std::filesystem::path DistDir() const { return root_ / "dist"; }
    std::filesystem::path ToolDir(std::string_view tool_name) const { return root_ / "tools" / tool_name; }
    std::filesystem::path SdkPath(std::string_view source_url, const RemoteRef& ref) const {
        return DeriveInstallPath(root_, source_url, ref);
    }

  private:
    std::filesystem::path root_;
};

} // namespace espkit
