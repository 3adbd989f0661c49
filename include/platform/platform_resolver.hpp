#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace espkit {

// Host triple such as "x86_64-unknown-linux-gnu".
using PlatformId = std::string;

// Vendor naming used when building download URLs for a host. Every lookup
// here is total: an unknown triple maps to itself so that new hosts keep
// working with whatever name the vendor publishes for them. Target parsing
// is deliberately strict instead.
struct PlatformNaming {
    std::string archive_extension;
    std::string arch_label;
    std::string installer_script;
};

std::string_view GccArtifactExtension(std::string_view platform);
std::string_view GccArch(std::string_view platform);
std::string_view LlvmArtifactExtension(std::string_view platform);
std::string_view LlvmArch(std::string_view platform);
std::string_view RustInstallerScript(std::string_view platform);

// tools.json platform keys for a host, most specific first. Apple silicon
// tries "macos-arm64" before the generic "macos" entry.
std::vector<std::string> ToolsIndexPlatformKeys(std::string_view platform);

// GCC/component channel naming for one host.
PlatformNaming ResolvePlatform(std::string_view platform);

// Triple of the machine this binary was built for.
PlatformId BuildHostPlatform();

} // namespace espkit
