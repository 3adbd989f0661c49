#include "platform/host_capabilities.hpp"

namespace espkit {

const char* ToString(Generator g) {
    switch (g) {
        case Generator::Ninja:             return "Ninja";
        case Generator::NinjaMultiConfig:  return "Ninja Multi-Config";
        case Generator::UnixMakefiles:     return "Unix Makefiles";
        case Generator::BorlandMakefiles:  return "Borland Makefiles";
        case Generator::MSYSMakefiles:     return "MSYS Makefiles";
        case Generator::MinGWMakefiles:    return "MinGW Makefiles";
        case Generator::NMakeMakefiles:    return "NMake Makefiles";
        case Generator::NMakeMakefilesJOM: return "NMake Makefiles JOM";
        case Generator::WatcomWMake:       return "Watcom WMake";
    }
    return "Unknown";
}

bool IsWindowsPlatform(std::string_view platform) {
    return platform.find("-windows") != std::string_view::npos;
}

HostCapabilities HostCapabilities::ForPlatform(std::string_view platform) {
    HostCapabilities caps;
    caps.platform = std::string(platform);

    const bool windows = IsWindowsPlatform(platform);
    caps.needs_installer_helper = windows;
    caps.needs_compiler_cache = windows;
    caps.needs_flashing_utility = windows;

    // Espressif publishes neither ULP toolchains nor Ninja for aarch64 Linux.
    const bool linux_arm64 = platform.starts_with("aarch64-") &&
                             platform.find("-linux") != std::string_view::npos;
    caps.supports_ulp_toolchain = !linux_arm64;
    caps.default_generator = linux_arm64 ? Generator::UnixMakefiles : Generator::Ninja;
    return caps;
}

} // namespace espkit
