// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * split_strategy.hpp
 *
 * Split axis and split value selection for overflowing buckets.
 *
 * The axis is the one with the widest (weighted) bounds; the value is the
 * midpoint of the bounds along that axis. Points with coordinate > value
 * go right, all others (including NaN) go left.
 */

#ifndef KDSEARCH_TREE_SPLIT_STRATEGY_HPP
#define KDSEARCH_TREE_SPLIT_STRATEGY_HPP

#include <cmath>
#include <vector>

namespace kdsearch::tree {

/**
 * @brief Find the axis with the widest spread.
 *
 * NaN spreads count as zero. Returns -1 when no axis has a positive spread
 * (a singularity: the bounds cannot be split).
 *
 * @param lower Per-axis lower bounds
 * @param upper Per-axis upper bounds
 * @param dimensions Number of axes
 * @param weights Per-axis weights (empty = unweighted)
 */
template <typename T>
int findWidestAxis(const T* lower, const T* upper, int dimensions,
                   const std::vector<double>& weights) {
  int widest = -1;
  double width = 0.0;
  for (int i = 0; i < dimensions; ++i) {
    double w = static_cast<double>(upper[i]) - static_cast<double>(lower[i]);
    if (!weights.empty()) w *= weights[static_cast<size_t>(i)];
    if (w > width) {
      widest = i;
      width = w;
    }
  }
  return widest;
}

/**
 * @brief Split value for the bounds [lower, upper] with lower < upper.
 *
 * The result v satisfies lower <= v < upper, so at least the points at
 * upper move right and the points at lower stay left. Infinite bounds are
 * handled: [-inf, inf] splits at 0, [-inf, x] at the lowest finite double,
 * [x, inf] at x.
 */
double computeSplitValue(double lower, double upper);

}  // namespace kdsearch::tree

#endif  // KDSEARCH_TREE_SPLIT_STRATEGY_HPP
