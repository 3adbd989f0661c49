#pragma once

namespace espkit {

// Carried in Result::err by the fetch pipeline.
enum class FetchError : int {
    DirectoryCreate = 1001,
    Network = 1002,
    UnsupportedExtension = 1003,
    ArchiveCorrupt = 1004,
    Io = 1005,
};

constexpr int ToErr(FetchError e) { return static_cast<int>(e); }

} // namespace espkit
