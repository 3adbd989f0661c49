#pragma once

#include <array>
#include <optional>
#include <string_view>

namespace espkit {

enum class Chip {
    Esp32,
    Esp32s2,
    Esp32s3,
    Esp32c3,
};

// Canonical order, used for the "all" wildcard.
inline constexpr std::array<Chip, 4> kAllChips = {
    Chip::Esp32,
    Chip::Esp32s2,
    Chip::Esp32s3,
    Chip::Esp32c3,
};

const char* ToString(Chip chip);
std::optional<Chip> ChipFromString(std::string_view token);

// GCC toolchain that builds code for chip, e.g. "xtensa-esp32-elf".
const char* ToolchainName(Chip chip);

} // namespace espkit
