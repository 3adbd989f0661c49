#pragma once

#include "util/result.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <sys/types.h>

namespace espkit {

// Pull-style byte source. Read() returns bytes produced, 0 at end of
// stream, -1 on error.
class IReader {
public:
    virtual ~IReader() = default;
    virtual ssize_t Read(std::span<std::uint8_t> out) = 0;
    virtual std::optional<std::uint64_t> TotalSize() const { return std::nullopt; }
};

class IWriter {
public:
    virtual ~IWriter() = default;
    virtual Result WriteAll(std::span<const std::uint8_t> in) = 0;
    virtual Result FsyncNow() = 0;
};

// Copies until end of stream. Returns the number of bytes copied in out_copied.
Result CopyReaderToWriter(IReader& r, IWriter& w, std::uint64_t* out_copied = nullptr);

} // namespace espkit
