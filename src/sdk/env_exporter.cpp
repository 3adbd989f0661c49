#include "sdk/env_exporter.hpp"

#include "io/file_writer.hpp"
#include "util/logger.hpp"

#include <cerrno>
#include <cstdint>
#include <span>

namespace espkit {

namespace {

// Escapes the characters that stay special inside double quotes.
std::string QuoteForShell(std::string_view value) {
    std::string out;
    out.reserve(value.size() + 2);
    out.push_back('"');
    for (char c : value) {
        if (c == '"' || c == '\\' || c == '$' || c == '`') out.push_back('\\');
        out.push_back(c);
    }
    out.push_back('"');
    return out;
}

} // namespace

Result WriteExportFile(const std::string& path, const std::vector<std::string>& assignments) {
    std::string body;
    for (const auto& a : assignments) {
        const auto eq = a.find('=');
        if (eq == std::string::npos || eq == 0) {
            return Result::Fail(EINVAL, "Invalid environment assignment: '" + a + "'");
        }
        body += "export ";
        body.append(a, 0, eq);
        body += '=';
        body += QuoteForShell(std::string_view(a).substr(eq + 1));
        body += '\n';
    }

    FileWriter writer;
    auto res = FileWriter::Open(path, writer);
    if (!res.is_ok()) return res;

    res = writer.WriteAll(std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t*>(body.data()), body.size()));
    if (!res.is_ok()) return res;
    res = writer.FsyncNow();
    if (!res.is_ok()) return res;

    LogInfo("Wrote environment to %s", path.c_str());
    return writer.Close();
}

} // namespace espkit
