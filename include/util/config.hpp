#pragma once

#include "util/logger.hpp"
#include "util/result.hpp"

#include <optional>
#include <string>

namespace espkit::config {

inline constexpr const char* kDefaultSdkRepository = "https://github.com/espressif/esp-idf";

// Settings read from the optional JSON config file. Every key is optional;
// command-line flags override whatever is set here.
class InstallerConfigFromFile {
public:
    std::optional<std::string> tools_root;
    std::optional<std::string> sdk_repository;
    std::optional<std::string> bundled_tools_index;
    std::optional<std::string> host_triple;
    std::optional<LogLevel> log_level;
    std::optional<bool> progress;

    Result LoadFile(const std::string& path);

    void Reset();
};

// $XDG_CONFIG_HOME/espkit/config.json, falling back to ~/.config/espkit/config.json.
std::string DefaultConfigPath();

// --tools-root, then ToolsRoot from the config, then $IDF_TOOLS_PATH, then ~/.espressif.
std::string ResolveToolsRoot(const std::optional<std::string>& cli_value,
                             const InstallerConfigFromFile& cfg);

std::string HomeDir();

} // namespace espkit::config
