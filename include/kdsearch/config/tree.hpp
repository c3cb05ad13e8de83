// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * tree.hpp
 *
 * Tree construction parameters: bucket capacity and split-axis weighting.
 */

#ifndef KDSEARCH_CONFIG_TREE_HPP
#define KDSEARCH_CONFIG_TREE_HPP

#include <vector>

namespace kdsearch::config {

/**
 * @brief Tree construction parameters.
 *
 * A bucket is split once it holds bucket_capacity points. Buckets that
 * cannot be split (all points coincident along every axis) double their
 * capacity instead.
 */
struct Tree {
  static constexpr int kDefaultBucketCapacity = 24;

  int bucket_capacity = kDefaultBucketCapacity;

  /// Per-axis weights applied to the bucket spread when choosing the split
  /// axis. Empty means every axis has weight 1.
  std::vector<double> dimension_weights;
};

}  // namespace kdsearch::config

#endif  // KDSEARCH_CONFIG_TREE_HPP
