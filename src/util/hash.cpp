#include "util/hash.hpp"

#include <array>
#include <charconv>

namespace espkit {

std::string ToHex(std::uint64_t value) {
    std::array<char, 16> buf{};
    const auto [end, ec] = std::to_chars(buf.data(), buf.data() + buf.size(), value, 16);
    if (ec != std::errc{}) return {};
    return std::string(buf.data(), end);
}

} // namespace espkit
