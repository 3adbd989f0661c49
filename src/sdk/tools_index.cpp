#include "sdk/tools_index.hpp"

#include <fstream>
#include <nlohmann/json.hpp>
#include <sstream>

namespace espkit {

using json = nlohmann::json;

namespace {

constexpr const char* kRecommended = "recommended";

// Keys of a version object that are not platform entries.
bool IsVersionMetaKey(const std::string& key) {
    return key == "name" || key == "status";
}

std::expected<ToolDownload, std::string> ParseDownload(const std::string& where, const json& j) {
    if (!j.is_object()) {
        return std::unexpected("download entry must be object: " + where);
    }
    ToolDownload d;
    d.url = j.value("url", "");
    d.sha256 = j.value("sha256", "");
    d.sha256_list_url = j.value("sha256_list_url", "");
    d.size = j.value("size", 0ULL);
    if (d.url.empty()) {
        return std::unexpected("download entry missing url: " + where);
    }
    if (d.sha256.empty() && d.sha256_list_url.empty()) {
        return std::unexpected("download entry missing sha256: " + where);
    }
    return d;
}

} // namespace

std::expected<ToolsIndex, std::string> ToolsIndex::Parse(const std::string& json_input) {
    try {
        if (json_input.find_first_not_of(" \t\n\r") == std::string::npos) {
            return std::unexpected("Empty input");
        }

        auto j = json::parse(json_input);
        if (!j.is_object()) {
            return std::unexpected("JSON root must be an object");
        }
        if (!j.contains("tools") || !j["tools"].is_array()) {
            return std::unexpected("'tools' must be an array");
        }

        ToolsIndex index;
        for (const auto& item : j["tools"]) {
            if (!item.is_object()) {
                return std::unexpected("tool entry must be object");
            }
            Tool tool;
            tool.name = item.value("name", "");
            if (tool.name.empty()) {
                return std::unexpected("tool entry missing name");
            }

            const auto vit = item.find("versions");
            if (vit != item.end()) {
                if (!vit->is_array()) {
                    return std::unexpected("'versions' must be an array: " + tool.name);
                }
                for (const auto& ver : *vit) {
                    if (!ver.is_object()) {
                        return std::unexpected("version entry must be object: " + tool.name);
                    }
                    Version v;
                    v.name = ver.value("name", "");
                    v.status = ver.value("status", "");
                    for (const auto& [key, val] : ver.items()) {
                        if (IsVersionMetaKey(key))
                            continue;
                        auto d = ParseDownload(tool.name + "/" + v.name + "/" + key, val);
                        if (!d)
                            return std::unexpected(d.error());
                        v.downloads.emplace_back(key, std::move(*d));
                    }
                    tool.versions.push_back(std::move(v));
                }
            }
            index.tools_.push_back(std::move(tool));
        }
        return index;
    } catch (const json::parse_error& e) {
        return std::unexpected(std::string("Syntax Error: ") + e.what());
    } catch (const std::exception& e) {
        return std::unexpected(std::string("Internal Error: ") + e.what());
    }
}

std::expected<ToolsIndex, std::string> ToolsIndex::LoadFromFile(const std::string& path) {
    std::ifstream is(path);
    if (!is.good()) {
        return std::unexpected("cannot open " + path);
    }
    std::ostringstream ss;
    ss << is.rdbuf();

    auto parsed = Parse(ss.str());
    if (!parsed) {
        return std::unexpected(path + ": " + parsed.error());
    }
    return parsed;
}

Result ToolsIndex::Resolve(const std::string& tool,
                           const std::vector<std::string>& platform_keys,
                           ToolRelease& out) const {
    const Tool* found = nullptr;
    for (const auto& t : tools_) {
        if (t.name == tool) {
            found = &t;
            break;
        }
    }
    if (!found) {
        return Result::Fail(-1, "Tool not found in index: " + tool);
    }

    const Version* recommended = nullptr;
    for (const auto& v : found->versions) {
        if (v.status == kRecommended) {
            recommended = &v;
            break;
        }
    }
    if (!recommended) {
        return Result::Fail(-1, "No recommended version of " + tool);
    }

    for (const auto& wanted : platform_keys) {
        for (const auto& [key, d] : recommended->downloads) {
            if (key == wanted) {
                out = ToolRelease{tool, recommended->name, d};
                return Result::Ok();
            }
        }
    }
    for (const auto& [key, d] : recommended->downloads) {
        if (key == kAnyPlatform) {
            out = ToolRelease{tool, recommended->name, d};
            return Result::Ok();
        }
    }

    std::string keys;
    for (const auto& k : platform_keys) {
        if (!keys.empty()) keys += " or ";
        keys += k;
    }
    return Result::Fail(-1, "No download of " + tool + " " + recommended->name + " for " + keys);
}

std::expected<std::string, std::string> FindListedSha256(std::string_view list, std::string_view file_name) {
    constexpr std::string_view kWs = " \t\r";
    size_t pos = 0;
    while (pos < list.size()) {
        size_t eol = list.find('\n', pos);
        if (eol == std::string_view::npos) eol = list.size();
        std::string_view line = list.substr(pos, eol - pos);
        pos = eol + 1;

        const auto hex_end = line.find_first_of(kWs);
        if (hex_end == std::string_view::npos) continue;
        const std::string_view hex = line.substr(0, hex_end);
        std::string_view name = line.substr(hex_end);
        const auto name_begin = name.find_first_not_of(kWs);
        if (name_begin == std::string_view::npos) continue;
        name.remove_prefix(name_begin);
        // sha256sum marks binary mode with a leading '*'.
        if (!name.empty() && name.front() == '*') name.remove_prefix(1);
        if (const auto name_end = name.find_last_not_of(kWs); name_end != std::string_view::npos) {
            name = name.substr(0, name_end + 1);
        }
        if (name == file_name) return std::string(hex);
    }
    return std::unexpected("No digest listed for " + std::string(file_name));
}

} // namespace espkit
