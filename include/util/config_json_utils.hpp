#pragma once

#include "util/config.hpp"

#include <nlohmann/json.hpp>
#include <string>

namespace espkit::config::detail {

bool LoadJsonObjectFromFile(const std::string& path, nlohmann::json& out, std::string& err);
bool FillConfigFromJson(const nlohmann::json& j, InstallerConfigFromFile& cfg, std::string& err);

} // namespace espkit::config::detail
