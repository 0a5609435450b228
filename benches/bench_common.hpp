#pragma once

#include <chrono>
#include <filesystem>
#include <functional>
#include <iostream>
#include <random>
#include <string>
#include <thread>
#include <vector>

namespace sos::bench {

inline void run_bench(const std::string &name, int iterations,
                      const std::function<void()> &fn) {
  const auto start = std::chrono::steady_clock::now();
  for (int i = 0; i < iterations; ++i) {
    fn();
  }
  const auto end = std::chrono::steady_clock::now();
  const auto total =
      std::chrono::duration_cast<std::chrono::microseconds>(end - start).count();
  const double avg = static_cast<double>(total) / static_cast<double>(iterations);
  std::cout << name << ": iterations=" << iterations << " total_us=" << total
            << " avg_us=" << avg << "\n";
}

/// Runs `fn(thread_index)` `iterations` times on each of `threads` threads and
/// reports the wall time per operation across all of them.
inline void run_concurrent_bench(const std::string &name, int threads, int iterations,
                                 const std::function<void(int)> &fn) {
  const auto start = std::chrono::steady_clock::now();
  std::vector<std::thread> workers;
  for (int t = 0; t < threads; ++t) {
    workers.emplace_back([&fn, t, iterations] {
      for (int i = 0; i < iterations; ++i) {
        fn(t);
      }
    });
  }
  for (auto &worker : workers) {
    worker.join();
  }
  const auto total = std::chrono::duration_cast<std::chrono::microseconds>(
                         std::chrono::steady_clock::now() - start)
                         .count();
  const int ops = threads * iterations;
  std::cout << name << ": threads=" << threads << " ops=" << ops << " total_us=" << total
            << " avg_us=" << static_cast<double>(total) / static_cast<double>(ops) << "\n";
}

inline std::filesystem::path make_temp_dir(const std::string &label) {
  static std::mt19937_64 rng{std::random_device{}()};
  const auto base =
      std::filesystem::temp_directory_path() / ("sos-" + label + "-" + std::to_string(rng()));
  std::filesystem::create_directories(base);
  return base;
}

} // namespace sos::bench
