#include "util/config.hpp"

#include "util/config_json_utils.hpp"

#include <cstdlib>
#include <filesystem>
#include <pwd.h>
#include <unistd.h>

namespace espkit::config {

void InstallerConfigFromFile::Reset() {
    tools_root.reset();
    sdk_repository.reset();
    bundled_tools_index.reset();
    host_triple.reset();
    log_level.reset();
    progress.reset();
}

Result InstallerConfigFromFile::LoadFile(const std::string& path) {
    Reset();

    nlohmann::json json;
    std::string err;
    if (!detail::LoadJsonObjectFromFile(path, json, err)) {
        return Result::Fail(-1, "Config: " + err);
    }

    if (!detail::FillConfigFromJson(json, *this, err)) {
        Reset();
        return Result::Fail(-1, "Config: " + err + " in " + path);
    }

    return Result::Ok();
}

std::string HomeDir() {
    if (const char* home = std::getenv("HOME"); home && *home) {
        return home;
    }
    if (const passwd* pw = ::getpwuid(::getuid()); pw && pw->pw_dir) {
        return pw->pw_dir;
    }
    return "/";
}

std::string DefaultConfigPath() {
    namespace fs = std::filesystem;
    fs::path base;
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
        base = xdg;
    } else {
        base = fs::path(HomeDir()) / ".config";
    }
    return (base / "espkit" / "config.json").string();
}

std::string ResolveToolsRoot(const std::optional<std::string>& cli_value,
                             const InstallerConfigFromFile& cfg) {
    if (cli_value && !cli_value->empty()) return *cli_value;
    if (cfg.tools_root) return *cfg.tools_root;
    if (const char* env = std::getenv("IDF_TOOLS_PATH"); env && *env) {
        return env;
    }
    return (std::filesystem::path(HomeDir()) / ".espressif").string();
}

} // namespace espkit::config
