#include "skillreg/skills/content_hash.hpp"

#include "skillreg/common/fs.hpp"
#include "skillreg/common/sha256.hpp"

#include <algorithm>
#include <array>
#include <fstream>
#include <tuple>

namespace skillreg::skills {

namespace {

constexpr std::size_t READ_CHUNK = 64 * 1024;

struct TreeEntry {
  std::string dir;
  std::string name;
  std::filesystem::path path;
};

common::Status hash_file(const std::filesystem::path &path, common::Sha256 &hasher,
                         std::uint64_t &bytes) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    return common::Status::error("not a readable regular file: " + path.string());
  }

  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return common::Status::error("failed to open " + path.string());
  }

  std::array<char, READ_CHUNK> buffer{};
  while (in) {
    in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    const auto count = in.gcount();
    if (count <= 0) {
      break;
    }
    if (auto st = hasher.update(buffer.data(), static_cast<std::size_t>(count)); !st.ok()) {
      return st;
    }
    bytes += static_cast<std::uint64_t>(count);
  }
  if (in.bad()) {
    return common::Status::error("I/O error while reading " + path.string());
  }
  return common::Status::success();
}

} // namespace

common::Result<std::vector<HashedFile>>
list_hashed_files(const std::filesystem::path &package_dir) {
  using ListResult = common::Result<std::vector<HashedFile>>;

  std::error_code ec;
  std::filesystem::recursive_directory_iterator it(package_dir, ec);
  if (ec) {
    return ListResult::failure("failed to walk " + package_dir.string() + ": " + ec.message());
  }

  std::vector<TreeEntry> entries;
  for (; it != std::filesystem::recursive_directory_iterator(); it.increment(ec)) {
    if (ec) {
      break;
    }
    std::error_code entry_ec;
    // the iterator descends into real directories only; a link to a directory is skipped
    if (it->is_directory(entry_ec)) {
      continue;
    }

    const std::string rel = common::portable_relative(it->path(), package_dir);
    const auto slash = rel.rfind('/');
    TreeEntry entry;
    entry.dir = slash == std::string::npos ? std::string() : rel.substr(0, slash);
    entry.name = slash == std::string::npos ? rel : rel.substr(slash + 1);
    entry.path = it->path();
    entries.push_back(std::move(entry));
  }
  if (ec) {
    return ListResult::failure("failed to walk " + package_dir.string() + ": " + ec.message());
  }

  std::sort(entries.begin(), entries.end(), [](const TreeEntry &a, const TreeEntry &b) {
    return std::tie(a.dir, a.name) < std::tie(b.dir, b.name);
  });

  std::vector<HashedFile> out;
  out.reserve(entries.size());
  for (auto &entry : entries) {
    out.push_back({.relative_path = entry.dir.empty() ? entry.name : entry.dir + "/" + entry.name,
                   .path = std::move(entry.path)});
  }
  return ListResult::success(std::move(out));
}

common::Result<ContentFingerprint>
compute_content_hash(const std::filesystem::path &package_dir) {
  using HashResult = common::Result<ContentFingerprint>;

  auto files = list_hashed_files(package_dir);
  if (!files.ok()) {
    return HashResult::failure(files.error());
  }

  common::Sha256 hasher;
  ContentFingerprint fingerprint;
  for (const auto &file : files.value()) {
    if (auto st = hasher.update(file.relative_path); !st.ok()) {
      return HashResult::failure(st.error());
    }
    if (auto st = hash_file(file.path, hasher, fingerprint.bytes); !st.ok()) {
      return HashResult::failure(st.error());
    }
    ++fingerprint.files;
  }

  auto digest = hasher.finish_hex();
  if (!digest.ok()) {
    return HashResult::failure(digest.error());
  }
  fingerprint.value = std::string(CONTENT_HASH_ALGORITHM) + ":" + digest.value();
  return HashResult::success(std::move(fingerprint));
}

} // namespace skillreg::skills
