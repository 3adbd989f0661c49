#include "io/temp_file.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <unistd.h>
#include <vector>

namespace espkit {

Result TempFile::Create(const std::string& dir, const std::string& prefix, TempFile& out) {
    std::string base = dir;
    if (base.empty()) {
        const char* env = std::getenv("TMPDIR");
        base = (env && *env) ? env : "/tmp";
    }
    std::string tmpl = base + "/" + prefix + "XXXXXX";
    std::vector<char> buf(tmpl.begin(), tmpl.end());
    buf.push_back('\0');

    const int fd = ::mkstemp(buf.data());
    if (fd < 0) {
        return Result::Fail(errno, "mkstemp failed in " + base + " (" + std::strerror(errno) + ")");
    }
    out = TempFile();
    out.fd_.Reset(fd);
    out.path_ = buf.data();
    return Result::Ok();
}

TempFile::TempFile() = default;
TempFile::TempFile(TempFile&& other) noexcept { *this = std::move(other); }
TempFile& TempFile::operator=(TempFile&& other) noexcept {
    if (this != &other) {
        Cleanup();
        fd_ = std::move(other.fd_);
        path_ = std::move(other.path_);
        other.path_.clear();
    }
    return *this;
}
TempFile::~TempFile() { Cleanup(); }

int TempFile::GetFd() const { return fd_.Get(); }
const std::string& TempFile::Path() const { return path_; }

void TempFile::Close() { fd_.Close(); }

void TempFile::Cleanup() {
    Close();
    if (!path_.empty()) {
        ::unlink(path_.c_str());
        path_.clear();
    }
}

} // namespace espkit
