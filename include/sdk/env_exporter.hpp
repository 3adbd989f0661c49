#pragma once

#include "util/result.hpp"

#include <string>
#include <vector>

namespace espkit {

// Writes one `export KEY="VALUE"` line per "KEY=VALUE" assignment. The file
// is replaced, not appended to.
Result WriteExportFile(const std::string& path, const std::vector<std::string>& assignments);

} // namespace espkit
