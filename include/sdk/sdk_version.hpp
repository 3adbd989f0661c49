#pragma once

#include <compare>
#include <expected>
#include <string>
#include <string_view>

namespace espkit {

struct SdkVersion {
    int major = 0;
    int minor = 0;
    int patch = 0;

    auto operator<=>(const SdkVersion&) const = default;

    std::string ToString() const;
};

// A version that may have failed to resolve; tool selection still runs.
using SdkVersionResult = std::expected<SdkVersion, std::string>;

// Accepts "4.4", "v4.4.2" and ref-like forms such as "release/v5.0".
SdkVersionResult ParseSdkVersion(std::string_view s);

// Reads IDF_VERSION_{MAJOR,MINOR,PATCH} from <sdk_dir>/tools/cmake/version.cmake.
SdkVersionResult ReadSdkVersionFromTree(const std::string& sdk_dir);

std::string FormatVersion(const SdkVersionResult& v);

} // namespace espkit
