#pragma once

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <functional>
#include <iostream>
#include <string>
#include <vector>

namespace prdguard::bench {

/// Times each iteration separately so tail latency shows up next to the mean.
inline void run_bench(const std::string &name, int iterations,
                      const std::function<void()> &fn) {
  if (iterations <= 0) {
    return;
  }
  fn(); // warm caches and lazily compiled patterns

  std::vector<std::int64_t> samples;
  samples.reserve(static_cast<std::size_t>(iterations));
  std::int64_t total = 0;
  for (int i = 0; i < iterations; ++i) {
    const auto start = std::chrono::steady_clock::now();
    fn();
    const auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
                             std::chrono::steady_clock::now() - start)
                             .count();
    samples.push_back(elapsed);
    total += elapsed;
  }
  std::sort(samples.begin(), samples.end());

  const auto percentile = [&samples](const double p) {
    const auto index = static_cast<std::size_t>(p * static_cast<double>(samples.size() - 1));
    return samples[index];
  };
  const double avg = static_cast<double>(total) / static_cast<double>(iterations);
  const double ops_per_sec = total > 0 ? 1e6 * iterations / static_cast<double>(total) : 0.0;
  std::cout << name << ": iterations=" << iterations << " avg_us=" << avg
            << " p50_us=" << percentile(0.50) << " p99_us=" << percentile(0.99)
            << " ops_per_sec=" << static_cast<std::int64_t>(ops_per_sec) << "\n";
}

} // namespace prdguard::bench
