#pragma once

#include "fetch/fetcher.hpp"
#include "platform/platform_resolver.hpp"
#include "sdk/install_path.hpp"
#include "util/result.hpp"

#include <expected>
#include <memory>
#include <string>
#include <string_view>

namespace espkit {

inline constexpr const char* kLlvmReleaseBaseUrl = "https://github.com/espressif/llvm-project/releases/download";
inline constexpr const char* kLlvmToolName = "xtensa-esp32-elf-clang";

// "13" -> "esp-13.0.0-20211203", "14" -> "esp-14.0.0-20220415".
std::expected<std::string, std::string> ParseLlvmVersion(std::string_view major);

// "esp-13.0.0-20211203" -> "13_0_0". Empty when the release name has no
// dotted version field.
std::string LlvmVersionWithUnderscores(std::string_view release);

// Xtensa-enabled LLVM, fetched as one release archive and unpacked in place.
class LlvmToolchain {
  public:
    LlvmToolchain(std::shared_ptr<const Fetcher> fetcher, PlatformId platform);

    std::string ArtifactFileName(const std::string& release) const;
    std::string ArtifactUrl(const std::string& release) const;
    std::filesystem::path InstallDir(const ToolsLayout& layout, const std::string& release) const;

    // Unpacks into "<InstallDir>.partial" and renames it on success. An
    // existing InstallDir counts as installed and nothing is fetched.
    // out_path is InstallDir/ArtifactFileName.
    Result Install(const ToolsLayout& layout, const std::string& release, std::string& out_path) const;

  private:
    std::shared_ptr<const Fetcher> fetcher_;
    PlatformId platform_;
};

} // namespace espkit
