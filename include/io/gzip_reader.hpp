#pragma once

#include "io/io.hpp"

#include <memory>
#include <vector>
#include <zlib.h>

namespace espkit {

// Streaming gzip decoder over another reader. Throws std::runtime_error
// from the constructor if zlib cannot be initialized.
class GzipReader final : public IReader {
  public:
    explicit GzipReader(std::unique_ptr<IReader> source);
    ~GzipReader() override;

    GzipReader(const GzipReader&) = delete;
    GzipReader& operator=(const GzipReader&) = delete;

    ssize_t Read(std::span<std::uint8_t> out) override;
    std::optional<std::uint64_t> TotalSize() const override { return std::nullopt; }

  private:
    std::unique_ptr<IReader> source_;
    z_stream strm_{};
    std::vector<std::uint8_t> in_buffer_;
    bool source_drained_ = false;
    bool eof_reached_ = false;
};

} // namespace espkit
