#pragma once

#include "util/result.hpp"

#include <array>
#include <filesystem>
#include <string_view>

namespace espkit {

// Subtrees of an SDK checkout that are not needed to build firmware.
inline constexpr std::array<std::string_view, 4> kMinifiedSubtrees = {
    "docs",
    "examples",
    "tools/esp_app_trace",
    "tools/test_idf_size",
};

// Removes kMinifiedSubtrees from sdk_dir. Stops at the first failure; a
// subtree that does not exist counts as a failure.
Result MinifySdk(const std::filesystem::path& sdk_dir);

} // namespace espkit
