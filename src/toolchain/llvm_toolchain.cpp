#include "toolchain/llvm_toolchain.hpp"

#include "util/logger.hpp"

#include <filesystem>

namespace fs = std::filesystem;

namespace espkit {

std::expected<std::string, std::string> ParseLlvmVersion(std::string_view major) {
    if (major == "13") return std::string("esp-13.0.0-20211203");
    if (major == "14") return std::string("esp-14.0.0-20220415");
    return std::unexpected("Unknown LLVM Version: " + std::string(major));
}

std::string LlvmVersionWithUnderscores(std::string_view release) {
    const auto first = release.find('-');
    if (first == std::string_view::npos) return {};
    std::string_view dotted = release.substr(first + 1);
    if (const auto second = dotted.find('-'); second != std::string_view::npos) {
        dotted = dotted.substr(0, second);
    }

    std::string out(dotted);
    for (auto& c : out) {
        if (c == '.') c = '_';
    }
    return out;
}

LlvmToolchain::LlvmToolchain(std::shared_ptr<const Fetcher> fetcher, PlatformId platform)
    : fetcher_(std::move(fetcher)), platform_(std::move(platform)) {}

std::string LlvmToolchain::ArtifactFileName(const std::string& release) const {
    return "xtensa-esp32-elf-llvm" + LlvmVersionWithUnderscores(release) + "-" + release + "-" +
           std::string(LlvmArch(platform_)) + "." + std::string(LlvmArtifactExtension(platform_));
}

std::string LlvmToolchain::ArtifactUrl(const std::string& release) const {
    return std::string(kLlvmReleaseBaseUrl) + "/" + release + "/" + ArtifactFileName(release);
}

fs::path LlvmToolchain::InstallDir(const ToolsLayout& layout, const std::string& release) const {
    return layout.ToolDir(kLlvmToolName) / (release + "-" + platform_);
}

Result LlvmToolchain::Install(const ToolsLayout& layout, const std::string& release, std::string& out_path) const {
    if (!fetcher_) return Result::Fail(-1, "No fetcher configured");
    if (LlvmVersionWithUnderscores(release).empty()) {
        return Result::Fail(-1, "Malformed LLVM release name: " + release);
    }

    const fs::path dir = InstallDir(layout, release);
    const std::string file_name = ArtifactFileName(release);
    std::error_code ec;
    if (fs::exists(dir, ec)) {
        LogInfo("LLVM %s already installed in %s", release.c_str(), dir.c_str());
        out_path = (dir / file_name).string();
        return Result::Ok();
    }

    const fs::path staging = dir.string() + ".partial";
    fs::remove_all(staging, ec);
    if (ec) {
        return Result::Fail(ec.value(), "Cannot clear stale " + staging.string() + ": " + ec.message());
    }

    LogInfo("Installing LLVM %s into %s", release.c_str(), dir.c_str());
    std::string staged_path;
    auto res = fetcher_->Fetch(ArtifactUrl(release), file_name, staging.string(), true, staged_path);
    if (!res.is_ok()) {
        std::error_code cleanup_ec;
        fs::remove_all(staging, cleanup_ec);
        return res;
    }

    fs::rename(staging, dir, ec);
    if (ec) {
        std::error_code cleanup_ec;
        fs::remove_all(staging, cleanup_ec);
        return Result::Fail(ec.value(), "Moving " + staging.string() + " into place failed: " + ec.message());
    }
    out_path = (dir / file_name).string();
    return Result::Ok();
}

} // namespace espkit
