#pragma once

#include <array>
#include <filesystem>
#include <string>
#include <vector>

namespace rtpack {

using sha256_t = std::array<unsigned char, 32>;

sha256_t sha256(std::filesystem::path const &file_path);

sha256_t sha256(std::vector<unsigned char> const &bytes);

// Lowercase hex digest, the form written to .sha256 sidecars.
std::string sha256_hex(sha256_t const &digest);

}  // namespace rtpack
