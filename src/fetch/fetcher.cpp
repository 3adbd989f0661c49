#include "fetch/fetcher.hpp"

#include "fetch/archive_extractor.hpp"
#include "io/file_reader.hpp"
#include "io/file_writer.hpp"
#include "io/gzip_reader.hpp"
#include "io/temp_file.hpp"
#include "io/xz_reader.hpp"
#include "util/logger.hpp"

#include <filesystem>
#include <stdexcept>
#include <system_error>

namespace espkit {

namespace fs = std::filesystem;

namespace {

class ProgressReader final : public IReader {
public:
    ProgressReader(std::unique_ptr<IReader> inner, IProgress* sink, std::string_view tag)
        : inner_(std::move(inner)), sink_(sink), tag_(tag), total_(inner_->TotalSize()) {}

    ssize_t Read(std::span<std::uint8_t> out) override {
        const ssize_t n = inner_->Read(out);
        if (n <= 0) return n;

        done_ += static_cast<std::uint64_t>(n);
        if (sink_) {
            ProgressEvent event{};
            event.item = tag_;
            event.done = done_;
            event.total = total_.value_or(0);
            sink_->OnProgress(event);
        }
        return n;
    }

    std::optional<std::uint64_t> TotalSize() const override { return total_; }

private:
    std::unique_ptr<IReader> inner_;
    IProgress* sink_ = nullptr;
    std::string_view tag_;
    std::uint64_t done_ = 0;
    std::optional<std::uint64_t> total_;
};

Result WriteStreamToFile(IReader& body, const std::string& path) {
    FileWriter writer;
    auto open_res = FileWriter::Open(path, writer);
    if (!open_res.is_ok()) return Result::Fail(ToErr(FetchError::Io), open_res.msg);

    std::uint64_t copied = 0;
    auto copy_res = CopyReaderToWriter(body, writer, &copied);
    if (!copy_res.is_ok()) {
        return Result::Fail(ToErr(FetchError::Network), "Transfer into " + path + " failed: " + copy_res.msg);
    }

    auto sync_res = writer.FsyncNow();
    if (!sync_res.is_ok()) return Result::Fail(ToErr(FetchError::Io), sync_res.msg);
    auto close_res = writer.Close();
    if (!close_res.is_ok()) return Result::Fail(ToErr(FetchError::Io), close_res.msg);

    LogDebug("Wrote %llu bytes to %s", (unsigned long long)copied, path.c_str());
    return Result::Ok();
}

template <typename Decoder>
Result ExtractCompressedTar(const ArchiveExtractor& extractor,
                            std::unique_ptr<IReader> body,
                            const std::string& output_dir,
                            std::string_view tag) {
    std::unique_ptr<IReader> decoded;
    try {
        decoded = std::make_unique<Decoder>(std::move(body));
    } catch (const std::exception& e) {
        return Result::Fail(ToErr(FetchError::ArchiveCorrupt), std::string("Decoder init failed: ") + e.what());
    }
    return extractor.ExtractTarStream(*decoded, output_dir, tag);
}

} // namespace

Fetcher::Fetcher(std::shared_ptr<IHttpClient> http) : Fetcher(std::move(http), Options{}) {}

Fetcher::Fetcher(std::shared_ptr<IHttpClient> http, Options opt)
    : http_(std::move(http)), opt_(opt) {}

Result Fetcher::Fetch(const std::string& url,
                      const std::string& file_name,
                      const std::string& output_dir,
                      bool uncompress,
                      std::string& out_path) const {
    const std::string full_path = (fs::path(output_dir) / file_name).string();

    std::error_code ec;
    if (fs::exists(full_path, ec)) {
        LogInfo("Using cached file: %s", full_path.c_str());
        out_path = full_path;
        return Result::Ok();
    }

    ArchiveKind kind = ArchiveKind::RawFile;
    if (uncompress) {
        auto parsed = ArchiveKindFromFileName(file_name);
        if (!parsed) return Result::Fail(ToErr(FetchError::UnsupportedExtension), parsed.error());
        kind = *parsed;
    }

    if (!fs::exists(output_dir, ec)) {
        LogInfo("Creating directory: %s", output_dir.c_str());
        fs::create_directories(output_dir, ec);
        if (ec) {
            return Result::Fail(ToErr(FetchError::DirectoryCreate),
                                "Creating directory " + output_dir + " failed: " + ec.message());
        }
    }

    if (!http_) return Result::Fail(ToErr(FetchError::Network), "No HTTP client configured");

    LogInfo("Downloading file %s from %s", file_name.c_str(), url.c_str());
    std::unique_ptr<IReader> body;
    auto get_res = http_->Get(url, body);
    if (!get_res.is_ok()) {
        return Result::Fail(ToErr(FetchError::Network), "GET " + url + ": " + get_res.msg);
    }
    if (!body) return Result::Fail(ToErr(FetchError::Network), "GET " + url + ": empty response stream");

    auto res = Materialize(kind, std::move(body), full_path, output_dir, file_name);
    if (!res.is_ok()) return res;

    out_path = full_path;
    return Result::Ok();
}

Result Fetcher::Materialize(ArchiveKind kind,
                            std::unique_ptr<IReader> body,
                            const std::string& full_path,
                            const std::string& output_dir,
                            std::string_view tag) const {
    std::unique_ptr<IReader> source = std::make_unique<ProgressReader>(std::move(body), opt_.progress_sink, tag);

    ArchiveExtractor::Options xopt;
    xopt.safe_paths_only = opt_.safe_paths_only;
    const ArchiveExtractor extractor(xopt);

    switch (kind) {
        case ArchiveKind::RawFile: {
            LogInfo("Creating file: %s", full_path.c_str());
            auto res = WriteStreamToFile(*source, full_path);
            if (!res.is_ok()) {
                LogWarn("Partial download left at %s; remove it before retrying", full_path.c_str());
            }
            return res;
        }
        case ArchiveKind::Zip: {
            // Zip is read through its central directory, so spool the body first.
            TempFile spool;
            auto tmp_res = TempFile::Create(output_dir, ".espkit-zip-", spool);
            if (!tmp_res.is_ok()) return Result::Fail(ToErr(FetchError::Io), tmp_res.msg);
            spool.Close();

            auto write_res = WriteStreamToFile(*source, spool.Path());
            if (!write_res.is_ok()) return write_res;

            LogInfo("Uncompressing zip file to %s", output_dir.c_str());
            return extractor.ExtractZipFile(spool.Path(), output_dir, tag);
        }
        case ArchiveKind::GzTar:
            LogInfo("Uncompressing tar.gz file to %s", output_dir.c_str());
            return ExtractCompressedTar<GzipReader>(extractor, std::move(source), output_dir, tag);
        case ArchiveKind::XzTar:
            LogInfo("Uncompressing tar.xz file to %s", output_dir.c_str());
            return ExtractCompressedTar<XzReader>(extractor, std::move(source), output_dir, tag);
    }
    return Result::Fail(ToErr(FetchError::UnsupportedExtension), std::string("Unhandled archive kind: ") + ToString(kind));
}

Result Fetcher::ExtractFile(const std::string& archive_path, const std::string& output_dir) const {
    auto parsed = ArchiveKindFromFileName(archive_path);
    if (!parsed) return Result::Fail(ToErr(FetchError::UnsupportedExtension), parsed.error());

    std::error_code ec;
    fs::create_directories(output_dir, ec);
    if (ec) {
        return Result::Fail(ToErr(FetchError::DirectoryCreate),
                            "Creating directory " + output_dir + " failed: " + ec.message());
    }

    ArchiveExtractor::Options xopt;
    xopt.safe_paths_only = opt_.safe_paths_only;
    const ArchiveExtractor extractor(xopt);
    const std::string tag = fs::path(archive_path).filename().string();

    if (*parsed == ArchiveKind::Zip) {
        return extractor.ExtractZipFile(archive_path, output_dir, tag);
    }

    auto file = std::make_unique<FileReader>();
    auto open_res = FileReader::Open(archive_path, *file);
    if (!open_res.is_ok()) return Result::Fail(ToErr(FetchError::Io), open_res.msg);

    if (*parsed == ArchiveKind::GzTar) {
        return ExtractCompressedTar<GzipReader>(extractor, std::move(file), output_dir, tag);
    }
    return ExtractCompressedTar<XzReader>(extractor, std::move(file), output_dir, tag);
}

} // namespace espkit
