#pragma once

#include "platform/host_capabilities.hpp"
#include "sdk/sdk_version.hpp"
#include "target/chip.hpp"

#include <optional>
#include <string>
#include <vector>

namespace espkit {

// A group of tools resolved against one tool index.
struct ToolSet {
    enum class Source {
        SdkIndex, // tools/tools.json of the checked-out SDK
        Bundled,  // index shipped alongside this installer
    };

    Source source = Source::SdkIndex;
    std::vector<std::string> names;
};

// The SDK's own cmake is recent enough (>= 3.20) from this release on.
inline constexpr SdkVersion kSdkCmakeMinVersion{4, 4, 0};

// ULP coprocessor toolchain for chip, if it has one. esp32s2/esp32s3 moved
// to the shared "esp32ulp-elf" in 4.4.2; an unknown version assumes the new name.
std::optional<std::string> UlpToolchainName(Chip chip, const SdkVersion* version);

// The tool list handed to the installer for one SDK checkout.
std::vector<ToolSet> SelectTools(const std::vector<Chip>& targets,
                                 const SdkVersionResult& version,
                                 const HostCapabilities& caps,
                                 Generator generator);

} // namespace espkit
