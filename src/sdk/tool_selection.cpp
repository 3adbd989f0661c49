#include "sdk/tool_selection.hpp"

#include <algorithm>

namespace espkit {

namespace {

void PushUnique(std::vector<std::string>& names, std::string name) {
    if (std::find(names.begin(), names.end(), name) == names.end()) {
        names.push_back(std::move(name));
    }
}

} // namespace

std::optional<std::string> UlpToolchainName(Chip chip, const SdkVersion* version) {
    switch (chip) {
        case Chip::Esp32:
            return std::string("esp32ulp-elf");
        case Chip::Esp32s2:
        case Chip::Esp32s3:
            if (!version || *version >= SdkVersion{4, 4, 2}) {
                return std::string("esp32ulp-elf");
            }
            return std::string("esp32s2ulp-elf");
        case Chip::Esp32c3:
            return std::nullopt;
    }
    return std::nullopt;
}

std::vector<ToolSet> SelectTools(const std::vector<Chip>& targets,
                                 const SdkVersionResult& version,
                                 const HostCapabilities& caps,
                                 Generator generator) {
    std::vector<ToolSet> sets;
    ToolSet sdk_tools;
    sdk_tools.source = ToolSet::Source::SdkIndex;

    const SdkVersion* known = version ? &*version : nullptr;

    for (Chip chip : targets) {
        PushUnique(sdk_tools.names, ToolchainName(chip));

        if (caps.supports_ulp_toolchain) {
            if (auto ulp = UlpToolchainName(chip, known)) {
                PushUnique(sdk_tools.names, std::move(*ulp));
            }
        }
    }

    if (known && *known >= kSdkCmakeMinVersion) {
        PushUnique(sdk_tools.names, "cmake");
    } else {
        sets.push_back(ToolSet{ToolSet::Source::Bundled, {"cmake"}});
    }

    PushUnique(sdk_tools.names, "openocd-esp32");
    if (caps.needs_installer_helper) PushUnique(sdk_tools.names, "idf-exe");
    if (caps.needs_compiler_cache) PushUnique(sdk_tools.names, "ccache");
    if (caps.needs_flashing_utility) PushUnique(sdk_tools.names, "dfu-util");

    if (generator == Generator::Ninja) {
        PushUnique(sdk_tools.names, "ninja");
    }

    sets.push_back(std::move(sdk_tools));
    return sets;
}

} // namespace espkit
