#include "target/chip.hpp"

namespace espkit {

const char* ToString(Chip chip) {
    switch (chip) {
        case Chip::Esp32:   return "esp32";
        case Chip::Esp32s2: return "esp32s2";
        case Chip::Esp32s3: return "esp32s3";
        case Chip::Esp32c3: return "esp32c3";
    }
    return "unknown";
}

std::optional<Chip> ChipFromString(std::string_view token) {
    for (Chip chip : kAllChips) {
        if (token == ToString(chip)) return chip;
    }
    return std::nullopt;
}

const char* ToolchainName(Chip chip) {
    switch (chip) {
        case Chip::Esp32:   return "xtensa-esp32-elf";
        case Chip::Esp32s2: return "xtensa-esp32s2-elf";
        case Chip::Esp32s3: return "xtensa-esp32s3-elf";
        case Chip::Esp32c3: return "riscv32-esp-elf";
    }
    return "";
}

} // namespace espkit
