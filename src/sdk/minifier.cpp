#include "sdk/minifier.hpp"

#include "util/logger.hpp"

#include <cerrno>

namespace fs = std::filesystem;

namespace espkit {

Result MinifySdk(const fs::path& sdk_dir) {
    for (const auto sub : kMinifiedSubtrees) {
        const fs::path target = sdk_dir / sub;

        std::error_code ec;
        if (!fs::exists(target, ec)) {
            return Result::Fail(ENOENT, "Cannot minify, missing directory: " + target.string());
        }

        LogDebug("Removing %s", target.c_str());
        fs::remove_all(target, ec);
        if (ec) {
            return Result::Fail(ec.value(), "Removing " + target.string() + " failed: " + ec.message());
        }
    }
    return Result::Ok();
}

} // namespace espkit
