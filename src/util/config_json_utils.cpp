#include "util/config_json_utils.hpp"

#include <fstream>

namespace espkit::config::detail {

namespace {

bool GetStringIfPresent(const nlohmann::json& j, const char* key, std::optional<std::string>& out) {
    auto it = j.find(key);
    if (it == j.end())
        return false;
    if (!it->is_string())
        return false;
    out = it->get<std::string>();
    return true;
}

bool GetBoolIfPresent(const nlohmann::json& j, const char* key, std::optional<bool>& out) {
    auto it = j.find(key);
    if (it == j.end())
        return false;
    if (!it->is_boolean())
        return false;
    out = it->get<bool>();
    return true;
}

} // namespace

bool LoadJsonObjectFromFile(const std::string& path, nlohmann::json& out, std::string& err) {
    std::ifstream is(path);
    if (!is.good()) {
        err = "cannot open " + path;
        return false;
    }

    try {
        is >> out;
    } catch (const std::exception& e) {
        err = "invalid JSON in " + path + ": " + e.what();
        return false;
    }

    if (!out.is_object()) {
        err = "root must be JSON object: " + path;
        return false;
    }

    return true;
}

bool FillConfigFromJson(const nlohmann::json& j, InstallerConfigFromFile& cfg, std::string& err) {
    GetStringIfPresent(j, "ToolsRoot", cfg.tools_root);
    GetStringIfPresent(j, "SdkRepository", cfg.sdk_repository);
    GetStringIfPresent(j, "BundledToolsIndex", cfg.bundled_tools_index);
    GetStringIfPresent(j, "HostTriple", cfg.host_triple);
    GetBoolIfPresent(j, "Progress", cfg.progress);

    if (cfg.tools_root && cfg.tools_root->empty()) {
        err = "ToolsRoot must not be empty";
        return false;
    }
    if (cfg.sdk_repository && cfg.sdk_repository->empty()) {
        err = "SdkRepository must not be empty";
        return false;
    }

    {
        std::optional<std::string> level;
        if (GetStringIfPresent(j, "LogLevel", level)) {
            cfg.log_level = ParseLogLevel(*level);
            if (!cfg.log_level) {
                err = "unknown LogLevel '" + *level + "'";
                return false;
            }
        }
    }

    return true;
}

} // namespace espkit::config::detail
