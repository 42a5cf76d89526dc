#pragma once

#include "skillreg/common/result.hpp"
#include <filesystem>
#include <string>

namespace skillreg::common {

[[nodiscard]] std::string trim(const std::string &input);
[[nodiscard]] bool starts_with(const std::string &value, const std::string &prefix);
[[nodiscard]] std::string to_lower(std::string value);
[[nodiscard]] Result<std::filesystem::path> home_dir();
[[nodiscard]] std::string expand_path(std::string value);
[[nodiscard]] bool is_subpath(const std::filesystem::path &candidate,
                             const std::filesystem::path &parent);

/// Read a whole file as raw bytes.
[[nodiscard]] Result<std::string> read_file(const std::filesystem::path &path);

/// Write content to `<path>.tmp` and rename it over `path`. Parent directories are created.
[[nodiscard]] Status write_file_atomic(const std::filesystem::path &path, const std::string &content);

/// `/`-separated relative path, independent of the host separator.
[[nodiscard]] std::string portable_relative(const std::filesystem::path &path,
                                            const std::filesystem::path &base);

} // namespace skillreg::common
