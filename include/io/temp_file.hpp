#pragma once

#include "io/fd.hpp"
#include "util/result.hpp"

#include <string>

namespace espkit {

// mkstemp()-backed file that is unlinked when the object goes away.
class TempFile {
public:
    // Creates "<dir>/<prefix>XXXXXX". An empty dir means $TMPDIR or /tmp.
    static Result Create(const std::string& dir, const std::string& prefix, TempFile& out);

    TempFile();
    TempFile(const TempFile&) = delete;
    TempFile& operator=(const TempFile&) = delete;
    TempFile(TempFile&& other) noexcept;
    TempFile& operator=(TempFile&& other) noexcept;
    ~TempFile();

    int GetFd() const;
    const std::string& Path() const;
    void Close();

private:
    void Cleanup();

    Fd fd_;
    std::string path_;
};

} // namespace espkit
