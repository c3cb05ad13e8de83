// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * kdsearch.hpp
 *
 * kdsearch: bucket KD-tree and partial selection for nearest-neighbour
 * queries over D-dimensional points.
 *
 *  Created on: Oct 2026
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#ifndef KDSEARCH_KDSEARCH_HPP
#define KDSEARCH_KDSEARCH_HPP

// Configs
#include "kdsearch/config/kdsearch.hpp"

// Data types
#include "kdsearch/point_types.hpp"

// Core objects
#include "kdsearch/distance/distance_function.hpp"
#include "kdsearch/selection/bounded_candidate_set.hpp"
#include "kdsearch/selection/partial_sort.hpp"
#include "kdsearch/tree/kd_tree.hpp"

namespace kdsearch {

/**
 * @brief Create an empty tree.
 *
 * @throws std::invalid_argument if dimensions <= 0 or bucket_capacity <= 0
 */
template <typename T, typename Item>
KdTree<T, Item> newIndex(
    int dimensions, int bucket_capacity = config::Tree::kDefaultBucketCapacity) {
  return KdTree<T, Item>(dimensions, bucket_capacity);
}

/// Create an empty tree from a parsed configuration.
template <typename T, typename Item>
KdTree<T, Item> newIndex(const Config& cfg) {
  return KdTree<T, Item>(cfg.dimensions, cfg.tree);
}

}  // namespace kdsearch

#endif  // KDSEARCH_KDSEARCH_HPP
