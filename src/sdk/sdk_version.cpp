#include "sdk/sdk_version.hpp"

#include <array>
#include <charconv>
#include <filesystem>
#include <fstream>
#include <ranges>
#include <sstream>

namespace espkit {

std::string SdkVersion::ToString() const {
    return "v" + std::to_string(major) + "." + std::to_string(minor) + "." + std::to_string(patch);
}

SdkVersionResult ParseSdkVersion(std::string_view s) {
    const std::string original(s);
    if (const auto slash = s.rfind('/'); slash != std::string_view::npos) {
        s.remove_prefix(slash + 1);
    }
    if (!s.empty() && (s.front() == 'v' || s.front() == 'V')) {
        s.remove_prefix(1);
    }
    // Drop pre-release suffixes such as "-beta1".
    if (const auto dash = s.find('-'); dash != std::string_view::npos) {
        s = s.substr(0, dash);
    }

    std::array<int, 3> parts{0, 0, 0};
    size_t count = 0;
    for (auto&& rng : s | std::views::split('.')) {
        const std::string_view sv(rng.begin(), rng.end());
        if (count == parts.size() || sv.empty()) {
            return std::unexpected("Malformed SDK version: '" + original + "'");
        }
        int value = 0;
        const auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), value);
        if (ec != std::errc{} || ptr != sv.data() + sv.size()) {
            return std::unexpected("Malformed SDK version: '" + original + "'");
        }
        parts[count++] = value;
    }
    if (count < 2) {
        return std::unexpected("Malformed SDK version: '" + original + "'");
    }
    return SdkVersion{parts[0], parts[1], parts[2]};
}

SdkVersionResult ReadSdkVersionFromTree(const std::string& sdk_dir) {
    const auto path = std::filesystem::path(sdk_dir) / "tools" / "cmake" / "version.cmake";
    std::ifstream is(path);
    if (!is.good()) {
        return std::unexpected("cannot open " + path.string());
    }

    SdkVersion v;
    bool have_major = false;
    bool have_minor = false;
    std::string line;
    while (std::getline(is, line)) {
        std::istringstream ls(line);
        std::string key;
        int value = 0;
        // Lines look like: set(IDF_VERSION_MAJOR 5)
        const auto open = line.find('(');
        if (open == std::string::npos || line.compare(0, open, "set") != 0) continue;
        ls.seekg(static_cast<std::streamoff>(open + 1));
        if (!(ls >> key >> value)) continue;
        if (key == "IDF_VERSION_MAJOR") {
            v.major = value;
            have_major = true;
        } else if (key == "IDF_VERSION_MINOR") {
            v.minor = value;
            have_minor = true;
        } else if (key == "IDF_VERSION_PATCH") {
            v.patch = value;
        }
    }

    if (!have_major || !have_minor) {
        return std::unexpected("IDF_VERSION_MAJOR/MINOR missing in " + path.string());
    }
    return v;
}

std::string FormatVersion(const SdkVersionResult& v) {
    if (v) return v->ToString();
    return "(unknown version: " + v.error() + ")";
}

} // namespace espkit
