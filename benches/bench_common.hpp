#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <iostream>
#include <string>

namespace skillreg::bench {

/// Runs `fn` `iterations` times and prints the average. With `bytes_per_iteration` set, also
/// prints throughput in MiB/s.
inline void run_bench(const std::string &name, int iterations, const std::function<void()> &fn,
                      std::uint64_t bytes_per_iteration = 0) {
  const auto start = std::chrono::steady_clock::now();
  for (int i = 0; i < iterations; ++i) {
    fn();
  }
  const auto total = std::chrono::duration_cast<std::chrono::microseconds>(
                         std::chrono::steady_clock::now() - start)
                         .count();
  const double avg = static_cast<double>(total) / static_cast<double>(iterations);
  std::cout << name << ": iterations=" << iterations << " total_us=" << total << " avg_us=" << avg;
  if (bytes_per_iteration > 0 && total > 0) {
    const double mib = static_cast<double>(bytes_per_iteration) * iterations / (1024.0 * 1024.0);
    std::cout << " mib_per_s=" << mib / (static_cast<double>(total) / 1e6);
  }
  std::cout << "\n";
}

} // namespace skillreg::bench
