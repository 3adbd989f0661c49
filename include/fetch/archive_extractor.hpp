#pragma once

#include "fetch/progress.hpp"
#include "io/io.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <string>
#include <string_view>

struct archive;

namespace espkit {

// Unpacks tar streams and zip files into an existing directory using libarchive.
// Decode failures carry FetchError::ArchiveCorrupt; nothing already written is
// rolled back.
class ArchiveExtractor {
  public:
    struct Options {
        bool safe_paths_only = true;
        std::uint64_t progress_interval_bytes = 4 * 1024 * 1024ULL;
        IProgress* progress_sink = nullptr;
    };

    ArchiveExtractor() = default;
    explicit ArchiveExtractor(const Options& opt) : opt_(opt) {}

    // tar_stream must already be decompressed.
    Result
    ExtractTarStream(IReader& tar_stream, const std::string& dst_dir, std::string_view tag) const;

    // Zip needs random access to its central directory, hence a file path.
    Result
    ExtractZipFile(const std::string& zip_path, const std::string& dst_dir, std::string_view tag) const;

  private:
    Result ExtractEntries(struct archive* ar, const std::string& dst_dir, std::string_view tag) const;

    Options opt_{};
};

} // namespace espkit
