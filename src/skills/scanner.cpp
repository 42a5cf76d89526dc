#include "skillreg/skills/scanner.hpp"

#include <algorithm>

namespace skillreg::skills {

common::Result<std::vector<PackageDirectory>>
DirectoryScanner::scan(const std::filesystem::path &root) {
  using ScanResult = common::Result<std::vector<PackageDirectory>>;

  std::error_code ec;
  if (!std::filesystem::is_directory(root, ec)) {
    return ScanResult::failure("Skills directory not found: " + root.string());
  }

  std::vector<PackageDirectory> out;
  std::filesystem::directory_iterator it(root, ec);
  if (ec) {
    return ScanResult::failure("failed to list " + root.string() + ": " + ec.message());
  }
  for (; it != std::filesystem::directory_iterator(); it.increment(ec)) {
    if (ec) {
      break;
    }
    std::error_code entry_ec;
    // follows symlinks: a link to a directory is a package, a dangling link is not
    if (!it->is_directory(entry_ec)) {
      continue;
    }
    out.push_back({.name = it->path().filename().string(), .path = it->path()});
  }
  if (ec) {
    return ScanResult::failure("failed to list " + root.string() + ": " + ec.message());
  }

  std::sort(out.begin(), out.end(), [](const PackageDirectory &a, const PackageDirectory &b) {
    return a.name < b.name;
  });
  return ScanResult::success(std::move(out));
}

} // namespace skillreg::skills
