#include "bench_common.hpp"

#include "skillreg/common/fs.hpp"
#include "skillreg/common/sha256.hpp"
#include "skillreg/skills/content_hash.hpp"

#include <filesystem>
#include <iostream>
#include <string>

void run_hash_benchmarks() {
  const std::string block(1 << 20, 'x');
  skillreg::bench::run_bench(
      "sha256_1mb", 50, [&block] { (void)skillreg::common::sha256_hex(block); }, block.size());

  const auto root = std::filesystem::temp_directory_path() / "skillreg-bench-hash";
  std::error_code ec;
  std::filesystem::remove_all(root, ec);
  for (int dir = 0; dir < 8; ++dir) {
    for (int file = 0; file < 16; ++file) {
      const auto path = root / ("d" + std::to_string(dir)) / ("f" + std::to_string(file) + ".txt");
      const auto written =
          skillreg::common::write_file_atomic(path, std::string(4096, static_cast<char>('a' + dir)));
      if (!written.ok()) {
        std::cerr << "content_hash_128_files: setup failed: " << written.error() << "\n";
        std::filesystem::remove_all(root, ec);
        return;
      }
    }
  }

  skillreg::bench::run_bench(
      "content_hash_128_files", 200,
      [&root] { (void)skillreg::skills::compute_content_hash(root); }, 8 * 16 * 4096);
  std::filesystem::remove_all(root, ec);
}
