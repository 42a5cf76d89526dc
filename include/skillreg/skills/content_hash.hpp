#pragma once

#include "skillreg/common/result.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace skillreg::skills {

inline constexpr const char *CONTENT_HASH_ALGORITHM = "sha256";

struct HashedFile {
  std::string relative_path; // always `/`-separated
  std::filesystem::path path;
};

struct ContentFingerprint {
  std::string value; // "sha256:<hex>"
  std::uint64_t files = 0;
  std::uint64_t bytes = 0;
};

/// Files of a package tree in hashing order: grouped by containing directory, directories
/// ordered by their relative path (root first), files by name. Byte-wise comparisons
/// throughout. Symlinked directories are not descended into.
[[nodiscard]] common::Result<std::vector<HashedFile>>
list_hashed_files(const std::filesystem::path &package_dir);

/// SHA-256 over `relative_path || content` for every file in list_hashed_files() order.
[[nodiscard]] common::Result<ContentFingerprint>
compute_content_hash(const std::filesystem::path &package_dir);

} // namespace skillreg::skills
