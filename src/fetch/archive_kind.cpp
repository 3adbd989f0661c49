#include "fetch/archive_kind.hpp"

#include "util/path_utils.hpp"

namespace espkit {

const char* ToString(ArchiveKind kind) {
    switch (kind) {
        case ArchiveKind::RawFile: return "raw";
        case ArchiveKind::Zip:     return "zip";
        case ArchiveKind::GzTar:   return "tar.gz";
        case ArchiveKind::XzTar:   return "tar.xz";
    }
    return "unknown";
}

std::expected<ArchiveKind, std::string> ArchiveKindFromFileName(std::string_view file_name) {
    const std::string_view ext = FileExtension(file_name);
    if (ext == "zip") return ArchiveKind::Zip;
    if (ext == "gz") return ArchiveKind::GzTar;
    if (ext == "xz") return ArchiveKind::XzTar;
    return std::unexpected("Unsupported file extension: " +
                           (ext.empty() ? std::string("<none>") : std::string(ext)));
}

} // namespace espkit
