#pragma once

#include "target/chip.hpp"

#include <expected>
#include <string>
#include <string_view>
#include <vector>

namespace espkit {

// Parses a comma/space separated list such as "esp32,esp32c3".
//
// If "all" occurs anywhere in the input the full canonical list is returned
// and every other token is ignored, including unknown ones. Otherwise each
// token must name a chip; the first unknown token fails the whole parse
// with "Unknown target: <token>". Input order is kept and repeated chips
// are dropped.
std::expected<std::vector<Chip>, std::string> ParseTargets(std::string_view input);

} // namespace espkit
