#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <iostream>
#include <string>

namespace tunnelshare::bench {

// bytes_per_iteration > 0 adds a mb_per_s column for byte-oriented work.
inline void run_bench(const std::string &name, int iterations, const std::function<void()> &fn,
                      std::uint64_t bytes_per_iteration = 0) {
  const auto start = std::chrono::steady_clock::now();
  for (int i = 0; i < iterations; ++i) {
    fn();
  }
  const auto total = std::chrono::duration_cast<std::chrono::microseconds>(
                         std::chrono::steady_clock::now() - start)
                         .count();
  std::cout << name << ": iterations=" << iterations << " total_us=" << total
            << " avg_us=" << static_cast<double>(total) / static_cast<double>(iterations);
  if (bytes_per_iteration > 0 && total > 0) {
    const double bytes = static_cast<double>(bytes_per_iteration) * iterations;
    std::cout << " mb_per_s=" << bytes / static_cast<double>(total);
  }
  std::cout << "\n";
}

} // namespace tunnelshare::bench
