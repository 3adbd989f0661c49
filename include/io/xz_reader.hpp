#pragma once

#include "io/io.hpp"

#include <lzma.h>
#include <memory>
#include <vector>

namespace espkit {

// Streaming xz/LZMA2 decoder over another reader. Throws std::runtime_error
// from the constructor if liblzma cannot be initialized.
class XzReader final : public IReader {
  public:
    explicit XzReader(std::unique_ptr<IReader> source);
    ~XzReader() override;

    XzReader(const XzReader&) = delete;
    XzReader& operator=(const XzReader&) = delete;

    ssize_t Read(std::span<std::uint8_t> out) override;
    std::optional<std::uint64_t> TotalSize() const override { return std::nullopt; }

  private:
    std::unique_ptr<IReader> source_;
    lzma_stream strm_ = LZMA_STREAM_INIT;
    std::vector<std::uint8_t> in_buffer_;
    bool source_drained_ = false;
    bool eof_reached_ = false;
};

} // namespace espkit
