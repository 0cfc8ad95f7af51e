#pragma once

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <functional>
#include <iostream>
#include <string>
#include <vector>

namespace mnemobox::bench {

/// Times every iteration separately. Gate checks sit on the hot path of each
/// brokered call, so the tail matters as much as the mean.
inline void run_bench(const std::string &name, int iterations,
                      const std::function<void()> &fn) {
  std::vector<double> samples;
  samples.reserve(static_cast<std::size_t>(std::max(iterations, 1)));
  for (int i = 0; i < iterations; ++i) {
    const auto start = std::chrono::steady_clock::now();
    fn();
    const auto elapsed = std::chrono::steady_clock::now() - start;
    samples.push_back(std::chrono::duration<double, std::micro>(elapsed).count());
  }
  if (samples.empty()) {
    std::cout << name << ": no iterations\n";
    return;
  }

  std::sort(samples.begin(), samples.end());
  const auto at = [&samples](double fraction) {
    const auto index = static_cast<std::size_t>(fraction * static_cast<double>(samples.size() - 1));
    return samples[index];
  };
  double total = 0.0;
  for (const double sample : samples) {
    total += sample;
  }
  std::cout << name << ": iterations=" << samples.size()
            << " avg_us=" << total / static_cast<double>(samples.size()) << " p50_us=" << at(0.5)
            << " p99_us=" << at(0.99) << " max_us=" << samples.back() << "\n";
}

} // namespace mnemobox::bench
