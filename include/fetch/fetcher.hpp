#pragma once

#include "fetch/archive_kind.hpp"
#include "fetch/fetch_error.hpp"
#include "fetch/progress.hpp"
#include "io/io.hpp"
#include "net/http_client.hpp"
#include "util/result.hpp"

#include <memory>
#include <string>
#include <string_view>

namespace espkit {

// Download-with-cache. A path that already exists counts as a complete
// download: there is no checksum, size or marker check, so an interrupted
// earlier download is reported as a cache hit. Concurrent processes writing
// the same path are not coordinated either.
class Fetcher {
  public:
    struct Options {
        bool safe_paths_only = true;
        IProgress* progress_sink = nullptr;
    };

    explicit Fetcher(std::shared_ptr<IHttpClient> http);
    Fetcher(std::shared_ptr<IHttpClient> http, Options opt);

    // Materializes url as output_dir/file_name. With uncompress the body is
    // unpacked into output_dir according to file_name's extension instead of
    // being stored. out_path is output_dir/file_name in every case, also when
    // only the extracted tree exists on disk.
    Result Fetch(const std::string& url,
                 const std::string& file_name,
                 const std::string& output_dir,
                 bool uncompress,
                 std::string& out_path) const;

    // Unpacks an archive that is already on disk into output_dir.
    Result ExtractFile(const std::string& archive_path, const std::string& output_dir) const;

  private:
    Result Materialize(ArchiveKind kind,
                       std::unique_ptr<IReader> body,
                       const std::string& full_path,
                       const std::string& output_dir,
                       std::string_view tag) const;

    std::shared_ptr<IHttpClient> http_;
    Options opt_;
};

} // namespace espkit
