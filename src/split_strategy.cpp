// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#include "kdsearch/tree/split_strategy.hpp"

#include <limits>

namespace kdsearch::tree {

double computeSplitValue(double lower, double upper) {
  // Halve before adding: no overflow for finite bounds
  const double mid = 0.5 * lower + 0.5 * upper;
  if (std::isnan(mid)) return 0.0;  // [-inf, inf]
  if (mid == -std::numeric_limits<double>::infinity()) {
    return std::numeric_limits<double>::lowest();
  }
  // Rounding (adjacent doubles) or [x, inf]
  if (mid >= upper) return lower;
  return mid;
}

}  // namespace kdsearch::tree
