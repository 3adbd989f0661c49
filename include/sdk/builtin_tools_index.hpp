#pragma once

#include <string_view>

namespace espkit {

inline constexpr const char* kBuiltinCmakeVersion = "3.20.3";

// tools.json document shipped with espkit for ToolSet::Source::Bundled sets.
// It carries the Kitware cmake release that SDKs older than 4.4 need, with
// digests taken from Kitware's published SHA-256 list.
std::string_view BuiltinToolsIndexJson();

} // namespace espkit
