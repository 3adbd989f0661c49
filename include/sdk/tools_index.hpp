#pragma once

#include "util/result.hpp"

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace espkit {

struct ToolDownload {
    std::string url;
    std::string sha256;
    // Published digest list ("<hex>  <file name>" per line), consulted when
    // sha256 is empty.
    std::string sha256_list_url;
    std::uint64_t size = 0;
};

struct ToolRelease {
    std::string tool;
    std::string version;
    ToolDownload download;
};

// The "tools" array of an IDF tools.json: per tool a list of versions, each
// carrying a status and one download entry per platform key.
class ToolsIndex {
  public:
    // Platform entry used for architecture-independent archives.
    static constexpr const char* kAnyPlatform = "any";

    static std::expected<ToolsIndex, std::string> Parse(const std::string& json_input);
    static std::expected<ToolsIndex, std::string> LoadFromFile(const std::string& path);

    // Picks the version of tool whose status is "recommended" and its
    // download for the first of platform_keys it carries, falling back to
    // "any".
    Result Resolve(const std::string& tool,
                   const std::vector<std::string>& platform_keys,
                   ToolRelease& out) const;
    Result Resolve(const std::string& tool, const std::string& platform_key, ToolRelease& out) const {
        return Resolve(tool, std::vector<std::string>{platform_key}, out);
    }

    std::size_t ToolCount() const { return tools_.size(); }

  private:
    struct Version {
        std::string name;
        std::string status;
        std::vector<std::pair<std::string, ToolDownload>> downloads;
    };

    struct Tool {
        std::string name;
        std::vector<Version> versions;
    };

    std::vector<Tool> tools_;
};

// Digest of file_name in a sha256sum-style list.
std::expected<std::string, std::string> FindListedSha256(std::string_view list, std::string_view file_name);

} // namespace espkit
