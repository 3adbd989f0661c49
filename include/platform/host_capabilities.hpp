#pragma once

#include "platform/platform_resolver.hpp"

#include <string_view>

namespace espkit {

enum class Generator {
    Ninja,
    NinjaMultiConfig,
    UnixMakefiles,
    BorlandMakefiles,
    MSYSMakefiles,
    MinGWMakefiles,
    NMakeMakefiles,
    NMakeMakefilesJOM,
    WatcomWMake,
};

const char* ToString(Generator g);

// What the SDK tool set needs on a given host, decided at runtime from the
// host triple rather than from the build platform.
struct HostCapabilities {
    PlatformId platform;
    bool needs_installer_helper = false; // idf-exe
    bool needs_compiler_cache = false;   // ccache
    bool needs_flashing_utility = false; // dfu-util
    bool supports_ulp_toolchain = true;
    Generator default_generator = Generator::Ninja;

    static HostCapabilities ForPlatform(std::string_view platform);
};

bool IsWindowsPlatform(std::string_view platform);

} // namespace espkit
