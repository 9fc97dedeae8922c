#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace rtpack {

// Sentinel mtime for every member: 2024-01-01T00:00:00Z.
inline constexpr std::int64_t kNormalizedMtime{ 1704067200 };
inline constexpr char const *kNormalizedOwner{ "root" };

struct normalize_options {
  std::string metadata_member{ "python/PYTHON.json" };  // always the first member
};

// Rewrites an uncompressed tar stream into canonical form: directories dropped,
// members sorted by path (metadata member first), extended metadata cleared,
// fixed mtime and ownership, group permissions widened. Output is restricted
// pax. Idempotent. Throws integrity_error if `tar` cannot be decoded.
std::vector<unsigned char> normalize_tar(std::vector<unsigned char> const &tar,
                                         normalize_options const &options = {});

// Member paths in archive order. Throws integrity_error.
std::vector<std::string> tar_member_paths(std::vector<unsigned char> const &tar);

}  // namespace rtpack
