#include "platform/platform_resolver.hpp"

#include <array>
#include <utility>

namespace espkit {

namespace {

using Entry = std::pair<std::string_view, std::string_view>;

constexpr std::array<Entry, 2> kGccExtensions = {{
    {"x86_64-pc-windows-msvc", "zip"},
    {"x86_64-pc-windows-gnu", "zip"},
}};

constexpr std::array<Entry, 6> kGccArch = {{
    {"aarch64-apple-darwin", "macos"},
    {"aarch64-unknown-linux-gnu", "linux-arm64"},
    {"x86_64-apple-darwin", "macos"},
    {"x86_64-unknown-linux-gnu", "linux-amd64"},
    {"x86_64-pc-windows-msvc", "win64"},
    {"x86_64-pc-windows-gnu", "win64"},
}};

// Hosts with a dedicated tools.json key ahead of their GccArch key.
constexpr std::array<Entry, 1> kToolsIndexArch = {{
    {"aarch64-apple-darwin", "macos-arm64"},
}};

constexpr std::array<Entry, 2> kLlvmExtensions = {{
    {"x86_64-pc-windows-msvc", "zip"},
    {"x86_64-pc-windows-gnu", "zip"},
}};

constexpr std::array<Entry, 5> kLlvmArch = {{
    {"aarch64-apple-darwin", "macos"},
    {"x86_64-apple-darwin", "macos"},
    {"x86_64-unknown-linux-gnu", "linux-amd64"},
    {"x86_64-pc-windows-msvc", "win64"},
    {"x86_64-pc-windows-gnu", "win64"},
}};

constexpr std::array<Entry, 2> kRustInstallers = {{
    {"x86_64-pc-windows-msvc", ""},
    {"x86_64-pc-windows-gnu", ""},
}};

template <size_t N>
std::string_view Lookup(const std::array<Entry, N>& table,
                        std::string_view key,
                        std::string_view fallback) {
    for (const auto& [k, v] : table) {
        if (k == key) return v;
    }
    return fallback;
}

} // namespace

std::string_view GccArtifactExtension(std::string_view platform) {
    return Lookup(kGccExtensions, platform, "tar.gz");
}

std::string_view GccArch(std::string_view platform) {
    return Lookup(kGccArch, platform, platform);
}

std::vector<std::string> ToolsIndexPlatformKeys(std::string_view platform) {
    std::vector<std::string> keys;
    const std::string_view specific = Lookup(kToolsIndexArch, platform, {});
    if (!specific.empty()) keys.emplace_back(specific);
    keys.emplace_back(GccArch(platform));
    return keys;
}

std::string_view LlvmArtifactExtension(std::string_view platform) {
    return Lookup(kLlvmExtensions, platform, "tar.xz");
}

std::string_view LlvmArch(std::string_view platform) {
    return Lookup(kLlvmArch, platform, platform);
}

std::string_view RustInstallerScript(std::string_view platform) {
    return Lookup(kRustInstallers, platform, "./install.sh");
}

PlatformNaming ResolvePlatform(std::string_view platform) {
    return PlatformNaming{
        .archive_extension = std::string(GccArtifactExtension(platform)),
        .arch_label = std::string(GccArch(platform)),
        .installer_script = std::string(RustInstallerScript(platform)),
    };
}

PlatformId BuildHostPlatform() {
#if defined(__x86_64__) && defined(__linux__)
    return "x86_64-unknown-linux-gnu";
#elif defined(__aarch64__) && defined(__linux__)
    return "aarch64-unknown-linux-gnu";
#elif defined(__x86_64__) && defined(__APPLE__)
    return "x86_64-apple-darwin";
#elif defined(__aarch64__) && defined(__APPLE__)
    return "aarch64-apple-darwin";
#elif defined(_WIN32) && defined(__MINGW32__)
    return "x86_64-pc-windows-gnu";
#elif defined(_WIN32)
    return "x86_64-pc-windows-msvc";
#else
    return "unknown";
#endif
}

} // namespace espkit
