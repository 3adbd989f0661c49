#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace espkit {

// FNV-1a, 64-bit. Stable across hosts and builds.
constexpr std::uint64_t Fnv1a64(std::string_view data) {
    std::uint64_t h = 0xcbf29ce484222325ULL;
    for (char c : data) {
        h ^= static_cast<std::uint8_t>(c);
        h *= 0x100000001b3ULL;
    }
    return h;
}

// Lowercase hex, no leading zeros.
std::string ToHex(std::uint64_t value);

inline std::string Fnv1a64Hex(std::string_view data) { return ToHex(Fnv1a64(data)); }

} // namespace espkit
