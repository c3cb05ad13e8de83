// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * timer.hpp
 *
 * Simple timer utility for examples and benchmarks.
 */

#ifndef EXAMPLES_COMMON_TIMER_HPP
#define EXAMPLES_COMMON_TIMER_HPP

#include <chrono>
#include <iostream>
#include <string>

namespace examples {

class Timer {
 public:
  using Clock = std::chrono::steady_clock;

  void start() { start_ = Clock::now(); }

  double elapsedMs() const {
    return std::chrono::duration<double, std::milli>(Clock::now() - start_)
        .count();
  }

  /// Print the elapsed time, optionally as a per-operation average.
  void printElapsed(const std::string& label, size_t operations = 1) const {
    const double ms = elapsedMs();
    std::cout << "[" << label << "] " << ms << " ms";
    if (operations > 1) {
      std::cout << " (" << ms * 1000.0 / static_cast<double>(operations)
                << " us/op)";
    }
    std::cout << std::endl;
  }

 private:
  Clock::time_point start_;
};

}  // namespace examples

#endif  // EXAMPLES_COMMON_TIMER_HPP
