#include "target/target_parser.hpp"

#include "util/logger.hpp"

#include <algorithm>

namespace espkit {

namespace {

constexpr std::string_view kWs = " \t\r\n";

std::string_view Trim(std::string_view s) {
    const auto b = s.find_first_not_of(kWs);
    if (b == std::string_view::npos) return {};
    const auto e = s.find_last_not_of(kWs);
    return s.substr(b, e - b + 1);
}

bool IsDelimiter(char c) { return c == ',' || kWs.find(c) != std::string_view::npos; }

} // namespace

std::expected<std::vector<Chip>, std::string> ParseTargets(std::string_view input) {
    LogDebug("Parsing targets: %.*s", (int)input.size(), input.data());

    if (input.find("all") != std::string_view::npos) {
        return std::vector<Chip>(kAllChips.begin(), kAllChips.end());
    }

    std::vector<Chip> chips;
    size_t pos = 0;
    while (pos <= input.size()) {
        size_t end = pos;
        while (end < input.size() && !IsDelimiter(input[end])) ++end;

        const std::string_view token = Trim(input.substr(pos, end - pos));
        pos = end + 1;
        if (token.empty()) continue;

        const auto chip = ChipFromString(token);
        if (!chip) {
            return std::unexpected("Unknown target: " + std::string(token));
        }
        if (std::ranges::find(chips, *chip) == chips.end()) {
            chips.push_back(*chip);
        }
    }

    if (chips.empty()) {
        return std::unexpected(std::string("No targets given"));
    }
    return chips;
}

} // namespace espkit
