#pragma once

#include "io/io.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <span>
#include <string>

namespace espkit {

// Lowercase hex digests. An empty string means the digest failed.
std::string Sha256Hex(std::span<const std::uint8_t> data);
std::string Sha256Hex(IReader& reader);
Result Sha256HexFile(const std::string& path, std::string& out_hex);

// Case-insensitive comparison of two hex digests.
bool Sha256Equal(const std::string& lhs, const std::string& rhs);

} // namespace espkit
