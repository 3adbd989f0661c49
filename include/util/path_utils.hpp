#pragma once

#include <string>
#include <string_view>

namespace espkit {

// Normalize archive entry path to a clean relative form:
// - strip leading "./"
// - strip leading "/" (avoid absolute)
// - collapse duplicate slashes
inline std::string NormalizeArchivePath(std::string s) {
    while (s.rfind("./", 0) == 0) s.erase(0, 2);
    while (!s.empty() && s.front() == '/') s.erase(0, 1);

    std::string out;
    out.reserve(s.size());
    bool prev_slash = false;
    for (char c : s) {
        const bool slash = (c == '/');
        if (slash && prev_slash) continue;
        out.push_back(c);
        prev_slash = slash;
    }
    return out;
}

// Replace both directory separators with '-', so a branch name such as
// "release/v5.0" stays a single path component.
inline std::string SanitizeRefName(std::string_view ref) {
    std::string out(ref);
    for (char& c : out) {
        if (c == '/' || c == '\\') c = '-';
    }
    return out;
}

// Text after the last '.', or empty when there is none.
inline std::string_view FileExtension(std::string_view file_name) {
    const auto slash = file_name.find_last_of("/\\");
    if (slash != std::string_view::npos) file_name.remove_prefix(slash + 1);
    const auto dot = file_name.rfind('.');
    if (dot == std::string_view::npos || dot == 0) return {};
    return file_name.substr(dot + 1);
}

} // namespace espkit
