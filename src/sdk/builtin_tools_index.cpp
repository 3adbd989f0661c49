#include "sdk/builtin_tools_index.hpp"

namespace espkit {

namespace {

constexpr std::string_view kBuiltinIndex = R"({
  "version": 1,
  "tools": [
    {
      "name": "cmake",
      "versions": [
        {
          "name": "3.20.3",
          "status": "recommended",
          "linux-amd64": {
            "url": "https://github.com/Kitware/CMake/releases/download/v3.20.3/cmake-3.20.3-linux-x86_64.tar.gz",
            "sha256_list_url": "https://github.com/Kitware/CMake/releases/download/v3.20.3/cmake-3.20.3-SHA-256.txt"
          },
          "linux-arm64": {
            "url": "https://github.com/Kitware/CMake/releases/download/v3.20.3/cmake-3.20.3-linux-aarch64.tar.gz",
            "sha256_list_url": "https://github.com/Kitware/CMake/releases/download/v3.20.3/cmake-3.20.3-SHA-256.txt"
          },
          "macos": {
            "url": "https://github.com/Kitware/CMake/releases/download/v3.20.3/cmake-3.20.3-macos-universal.tar.gz",
            "sha256_list_url": "https://github.com/Kitware/CMake/releases/download/v3.20.3/cmake-3.20.3-SHA-256.txt"
          },
          "win64": {
            "url": "https://github.com/Kitware/CMake/releases/download/v3.20.3/cmake-3.20.3-windows-x86_64.zip",
            "sha256_list_url": "https://github.com/Kitware/CMake/releases/download/v3.20.3/cmake-3.20.3-SHA-256.txt"
          }
        }
      ]
    }
  ]
})";

} // namespace

std::string_view BuiltinToolsIndexJson() { return kBuiltinIndex; }

} // namespace espkit
