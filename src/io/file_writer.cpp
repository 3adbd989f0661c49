// file_writer.cpp - Writer for regular files in the tools tree.

#include "io/file_writer.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>
#include <vector>

namespace espkit {

Result FileWriter::Open(std::string path, FileWriter& out) {
    out.path_ = std::move(path);

    int fd = ::open(out.path_.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) {
        return Result::Fail(
            errno, "Failed to open output: " + out.path_ + " (" + std::strerror(errno) + ")");
    }
    out.fd_.Reset(fd);
    return Result::Ok();
}

Result FileWriter::WriteAll(std::span<const std::uint8_t> in) {
    size_t rem = in.size();
    const std::uint8_t* p = in.data();

    while (rem > 0) {
        ssize_t n = ::write(fd_.Get(), p, rem);
        if (n > 0) {
            p += static_cast<size_t>(n);
            rem -= static_cast<size_t>(n);
            continue;
        }
        if (n == -1 && errno == EINTR) {
            continue;
        }
        return Result::Fail(errno, "Write failed: " + path_ + " (" + std::strerror(errno) + ")");
    }

    return Result::Ok();
}

Result FileWriter::FsyncNow() {
    if (::fsync(fd_.Get()) == -1) {
        return Result::Fail(errno, "fsync failed: " + path_ + " (" + std::strerror(errno) + ")");
    }
    return Result::Ok();
}

Result FileWriter::Close() {
    if (!fd_.Valid()) return Result::Ok();
    const int fd = fd_.Release();
    if (::close(fd) == -1) {
        return Result::Fail(errno, "close failed: " + path_ + " (" + std::strerror(errno) + ")");
    }
    return Result::Ok();
}

Result CopyReaderToWriter(IReader& r, IWriter& w, std::uint64_t* out_copied) {
    std::vector<std::uint8_t> buffer(256 * 1024);
    std::uint64_t copied = 0;

    while (true) {
        const ssize_t n = r.Read(std::span<std::uint8_t>(buffer.data(), buffer.size()));
        if (n == 0) break;
        if (n < 0) return Result::Fail(errno ? errno : -1, "Read failed during copy");

        auto res = w.WriteAll({buffer.data(), static_cast<size_t>(n)});
        if (!res.is_ok()) return res;
        copied += static_cast<std::uint64_t>(n);
    }

    if (out_copied) *out_copied = copied;
    return Result::Ok();
}

} // namespace espkit
