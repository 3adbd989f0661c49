#include "io/xz_reader.hpp"

#include <stdexcept>
#include <string>

namespace espkit {

XzReader::XzReader(std::unique_ptr<IReader> source)
    : source_(std::move(source)), in_buffer_(64 * 1024) {
    const lzma_ret rc = lzma_stream_decoder(&strm_, UINT64_MAX, LZMA_CONCATENATED);
    if (rc != LZMA_OK) {
        throw std::runtime_error("Failed to initialize lzma decoder (code " +
                                 std::to_string(static_cast<int>(rc)) + ")");
    }
}

XzReader::~XzReader() {
    lzma_end(&strm_);
}

ssize_t XzReader::Read(std::span<std::uint8_t> out) {
    if (eof_reached_ || out.empty()) return 0;

    strm_.next_out = out.data();
    strm_.avail_out = out.size();

    while (strm_.avail_out > 0) {
        lzma_action action = LZMA_RUN;
        if (strm_.avail_in == 0 && !source_drained_) {
            const ssize_t n = source_->Read(in_buffer_);
            if (n < 0) return -1;
            if (n == 0) {
                source_drained_ = true;
            } else {
                strm_.next_in = in_buffer_.data();
                strm_.avail_in = static_cast<size_t>(n);
            }
        }
        // LZMA_CONCATENATED needs LZMA_FINISH to report the end of the last stream.
        if (source_drained_) action = LZMA_FINISH;

        const lzma_ret rc = lzma_code(&strm_, action);
        if (rc == LZMA_STREAM_END) {
            eof_reached_ = true;
            break;
        }
        // LZMA_BUF_ERROR after LZMA_FINISH means the input ended mid-stream.
        if (rc != LZMA_OK) {
            return -1;
        }
    }

    return static_cast<ssize_t>(out.size() - strm_.avail_out);
}

} // namespace espkit
