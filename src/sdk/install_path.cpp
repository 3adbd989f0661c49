#include "sdk/install_path.hpp"

#include "util/hash.hpp"
#include "util/path_utils.hpp"

namespace espkit {

std::filesystem::path DeriveInstallPath(const std::filesystem::path& base,
                                        std::string_view source_url,
                                        const RemoteRef& ref) {
    const std::string source_dir = std::string(kSdkDirPrefix) + "-" + Fnv1a64Hex(source_url);
    return base / source_dir / SanitizeRefName(RefName(ref));
}

} // namespace espkit
