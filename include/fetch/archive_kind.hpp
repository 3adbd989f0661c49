#pragma once

#include <expected>
#include <string>
#include <string_view>

namespace espkit {

enum class ArchiveKind {
    RawFile,
    Zip,
    GzTar,
    XzTar,
};

const char* ToString(ArchiveKind kind);

// Picks the decoder from the last extension of file_name ("zip", "gz", "xz").
// Anything else is an error naming the extension; RawFile is never inferred.
std::expected<ArchiveKind, std::string> ArchiveKindFromFileName(std::string_view file_name);

} // namespace espkit
