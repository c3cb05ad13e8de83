// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#ifndef KDSEARCH_TREE_IMPL_KD_TREE_IMPL_HPP
#define KDSEARCH_TREE_IMPL_KD_TREE_IMPL_HPP

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

#include "kdsearch/tree/split_strategy.hpp"

namespace kdsearch {

// ── Construction ────────────────────────────────────────────────────────────

template <typename T, typename Item>
KdTree<T, Item>::KdTree(int dimensions, int bucket_capacity)
    : dims_(dimensions), capacity_(bucket_capacity) {
  if (dimensions <= 0) {
    throw std::invalid_argument("KdTree dimensions (" +
                                std::to_string(dimensions) + ") must be > 0");
  }
  if (bucket_capacity <= 0) {
    throw std::invalid_argument("KdTree bucket capacity (" +
                                std::to_string(bucket_capacity) +
                                ") must be > 0");
  }
  NodeT root;
  BucketT bucket;
  bucket.capacity = static_cast<size_t>(capacity_);
  root.kind = std::move(bucket);
  nodes_.push_back(std::move(root));
  bounds_.resize(2 * static_cast<size_t>(dims_));
}

template <typename T, typename Item>
KdTree<T, Item>::KdTree(int dimensions, const config::Tree& cfg)
    : KdTree(dimensions, cfg.bucket_capacity) {
  if (!cfg.dimension_weights.empty() &&
      cfg.dimension_weights.size() != static_cast<size_t>(dimensions)) {
    throw std::invalid_argument(
        "KdTree dimension_weights size (" +
        std::to_string(cfg.dimension_weights.size()) +
        ") must match dimensions (" + std::to_string(dimensions) + ")");
  }
  weights_ = cfg.dimension_weights;
}

// ── Mutation ────────────────────────────────────────────────────────────────

template <typename T, typename Item>
void KdTree<T, Item>::add(const PointRef<T>& point, const Item& item) {
  insert(point, item, false);
}

template <typename T, typename Item>
bool KdTree<T, Item>::addIfAbsent(const PointRef<T>& point, const Item& item) {
  return insert(point, item, true);
}

template <typename T, typename Item>
bool KdTree<T, Item>::insert(const PointRef<T>& point, const Item& item,
                             bool unique) {
  checkPoint(point.size());
  const T* p = point.data();
  const size_t d = static_cast<size_t>(dims_);

  // Descend to the terminal bucket, remembering the path
  std::vector<NodeIndex> path;
  path.reserve(static_cast<size_t>(depth_));
  NodeIndex idx = kRoot;
  while (const auto* split = std::get_if<tree::Split>(&nodes_[idx].kind)) {
    path.push_back(idx);
    idx = p[split->axis] > split->value ? split->right : split->left;
  }
  path.push_back(idx);

  auto& bucket = std::get<BucketT>(nodes_[idx].kind);
  if (unique) {
    // Equal points always route to the same bucket
    for (size_t i = 0; i < bucket.size(); ++i) {
      const T* q = bucket.coordinates.data() + i * d;
      if (std::equal(p, p + d, q)) return false;
    }
  }
  bucket.coordinates.insert(bucket.coordinates.end(), p, p + d);
  bucket.items.push_back(item);
  const bool overflow = bucket.size() > bucket.capacity;

  for (NodeIndex n : path) extendBounds(n, p);
  if (overflow) splitBucket(idx);
  return true;
}

template <typename T, typename Item>
void KdTree<T, Item>::extendBounds(NodeIndex node, const T* point) {
  T* lo = lower(node);
  T* hi = upper(node);
  if (nodes_[node].count++ == 0) {
    std::copy(point, point + dims_, lo);
    std::copy(point, point + dims_, hi);
    return;
  }
  for (int i = 0; i < dims_; ++i) {
    const T v = point[i];
    if (std::isnan(v)) {
      // A NaN coordinate makes the axis unsplittable for good
      lo[i] = hi[i] = std::numeric_limits<T>::quiet_NaN();
    } else if (v < lo[i]) {
      lo[i] = v;
    } else if (v > hi[i]) {
      hi[i] = v;
    }
  }
}

template <typename T, typename Item>
void KdTree<T, Item>::resetBounds(NodeIndex node, const BucketT& bucket) {
  nodes_[node].count = 0;
  for (size_t i = 0; i < bucket.size(); ++i) {
    extendBounds(node, bucket.coordinates.data() + i * dims_);
  }
}

template <typename T, typename Item>
void KdTree<T, Item>::splitBucket(NodeIndex node) {
  auto& bucket = std::get<BucketT>(nodes_[node].kind);
  const size_t d = static_cast<size_t>(dims_);
  const size_t n = bucket.size();

  const int axis = tree::findWidestAxis(lower(node), upper(node), dims_,
                                        weights_);
  double value = 0.0;
  size_t right_count = 0;
  if (axis >= 0) {
    value = tree::computeSplitValue(static_cast<double>(lower(node)[axis]),
                                    static_cast<double>(upper(node)[axis]));
    for (size_t i = 0; i < n; ++i) {
      if (bucket.coordinates[i * d + axis] > value) ++right_count;
    }
  }
  if (axis < 0 || right_count == 0 || right_count == n) {
    bucket.capacity *= 2;
    spdlog::debug("[KdTree] Bucket {} cannot be split ({} points), capacity -> {}",
                  node, n, bucket.capacity);
    return;
  }

  if (nodes_.size() + 2 > std::numeric_limits<NodeIndex>::max()) {
    throw std::length_error("KdTree node count exceeds index range");
  }

  BucketT left, right;
  left.coordinates.reserve((n - right_count) * d);
  left.items.reserve(n - right_count);
  right.coordinates.reserve(right_count * d);
  right.items.reserve(right_count);
  for (size_t i = 0; i < n; ++i) {
    const T* p = bucket.coordinates.data() + i * d;
    BucketT& dst = p[axis] > value ? right : left;
    dst.coordinates.insert(dst.coordinates.end(), p, p + d);
    dst.items.push_back(std::move(bucket.items[i]));
  }
  // A previously doubled bucket may hand more than capacity_ to one side
  left.capacity = std::max(static_cast<size_t>(capacity_), left.size());
  right.capacity = std::max(static_cast<size_t>(capacity_), right.size());

  const int child_depth = nodes_[node].depth + 1;
  const NodeIndex left_idx = static_cast<NodeIndex>(nodes_.size());
  const NodeIndex right_idx = left_idx + 1;

  // Destroys `bucket`
  tree::Split split;
  split.axis = axis;
  split.value = value;
  split.left = left_idx;
  split.right = right_idx;
  nodes_[node].kind = split;

  nodes_.resize(nodes_.size() + 2);
  bounds_.resize(nodes_.size() * 2 * d);
  nodes_[left_idx].depth = child_depth;
  nodes_[right_idx].depth = child_depth;
  resetBounds(left_idx, left);
  resetBounds(right_idx, right);
  nodes_[left_idx].kind = std::move(left);
  nodes_[right_idx].kind = std::move(right);

  depth_ = std::max(depth_, child_depth);
}

template <typename T, typename Item>
template <typename Visitor>
void KdTree<T, Item>::forEach(Visitor&& visitor) const {
  for (const auto& node : nodes_) {
    const auto* bucket = std::get_if<BucketT>(&node.kind);
    if (bucket == nullptr) continue;
    for (size_t i = 0; i < bucket->size(); ++i) {
      const PointMap<T> point(bucket->coordinates.data() + i * dims_, dims_);
      visitor(point, bucket->items[i]);
    }
  }
}

// ── Queries ─────────────────────────────────────────────────────────────────

template <typename T, typename Item>
double KdTree<T, Item>::nearestNeighbour(const Query& query,
                                         const DistanceFunction<T>& distance,
                                         const Consumer& consumer) const {
  return nearestNeighbour(query, distance, Predicate(), consumer);
}

template <typename T, typename Item>
double KdTree<T, Item>::nearestNeighbour(const Query& query,
                                         const DistanceFunction<T>& distance,
                                         const Predicate& filter,
                                         const Consumer& consumer) const {
  checkQuery(query, distance);
  if (empty()) return std::numeric_limits<double>::quiet_NaN();

  const double* q = query.data();
  double best = std::numeric_limits<double>::infinity();
  const Item* best_item = nullptr;

  search(
      q, distance, [&best]() { return best; },
      [&](const BucketT& bucket) {
        for (size_t i = 0; i < bucket.size(); ++i) {
          const double dist =
              distance.distance(q, bucket.coordinates.data() + i * dims_);
          if (dist <= best && (!filter || filter(bucket.items[i]))) {
            best = dist;
            best_item = &bucket.items[i];
          }
        }
      });

  if (best_item == nullptr) return std::numeric_limits<double>::quiet_NaN();
  if (consumer) consumer(*best_item, best);
  return best;
}

template <typename T, typename Item>
bool KdTree<T, Item>::nearestNeighbours(const Query& query, int k, bool sorted,
                                        const DistanceFunction<T>& distance,
                                        const Consumer& consumer) const {
  return nearestNeighbours(query, k, sorted, distance, Predicate(), consumer);
}

template <typename T, typename Item>
bool KdTree<T, Item>::nearestNeighbours(const Query& query, int k, bool sorted,
                                        const DistanceFunction<T>& distance,
                                        const Predicate& filter,
                                        const Consumer& consumer) const {
  checkQuery(query, distance);
  if (empty() || k <= 0) return false;

  const int capacity = static_cast<int>(
      std::min(static_cast<size_t>(k), size()));
  BoundedCandidateSet<Item> candidates(capacity);
  if (!nearestNeighbours(query, distance, candidates, filter)) return false;

  if (!consumer) return true;
  if (sorted) {
    candidates.drainSorted(consumer);
  } else {
    candidates.forEachUnsorted(consumer);
  }
  return true;
}

template <typename T, typename Item>
bool KdTree<T, Item>::nearestNeighbours(const Query& query,
                                        const DistanceFunction<T>& distance,
                                        BoundedCandidateSet<Item>& candidates,
                                        const Predicate& filter) const {
  checkQuery(query, distance);
  candidates.clear();
  if (empty()) return false;

  const double* q = query.data();
  search(
      q, distance, [&candidates]() { return candidates.threshold(); },
      [&](const BucketT& bucket) {
        for (size_t i = 0; i < bucket.size(); ++i) {
          const double dist =
              distance.distance(q, bucket.coordinates.data() + i * dims_);
          // Cheap threshold test before the predicate
          if (!(dist <= candidates.threshold())) continue;
          if (filter && !filter(bucket.items[i])) continue;
          candidates.offer(dist, bucket.items[i]);
        }
      });
  return !candidates.empty();
}

template <typename T, typename Item>
bool KdTree<T, Item>::findNeighbours(const Query& query, double radius,
                                     const DistanceFunction<T>& distance,
                                     const Consumer& consumer) const {
  checkQuery(query, distance);
  if (empty()) return false;

  const double* q = query.data();
  bool found = false;
  search(
      q, distance, [radius]() { return radius; },
      [&](const BucketT& bucket) {
        for (size_t i = 0; i < bucket.size(); ++i) {
          const double dist =
              distance.distance(q, bucket.coordinates.data() + i * dims_);
          if (dist <= radius) {
            found = true;
            if (consumer) consumer(bucket.items[i], dist);
          }
        }
      });
  return found;
}

template <typename T, typename Item>
template <typename Bound, typename Visit>
void KdTree<T, Item>::search(const double* query,
                             const DistanceFunction<T>& distance,
                             Bound&& bound, Visit&& visit) const {
  std::vector<NodeIndex> stack;
  stack.reserve(static_cast<size_t>(depth_) + 1);
  stack.push_back(kRoot);

  while (!stack.empty()) {
    const NodeIndex idx = stack.back();
    stack.pop_back();
    // The bound only tightens, so re-test on pop
    if (distance.distanceToRectangle(query, lower(idx), upper(idx)) > bound()) {
      continue;
    }
    const auto& kind = nodes_[idx].kind;
    if (const auto* split = std::get_if<tree::Split>(&kind)) {
      const bool go_right = query[split->axis] > split->value;
      stack.push_back(go_right ? split->left : split->right);
      stack.push_back(go_right ? split->right : split->left);
    } else {
      visit(std::get<BucketT>(kind));
    }
  }
}

// ── Checks ──────────────────────────────────────────────────────────────────

template <typename T, typename Item>
void KdTree<T, Item>::checkPoint(Eigen::Index size) const {
  if (size != dims_) {
    throw std::invalid_argument("KdTree point size (" + std::to_string(size) +
                                ") must match dimensions (" +
                                std::to_string(dims_) + ")");
  }
}

template <typename T, typename Item>
void KdTree<T, Item>::checkQuery(const Query& query,
                                 const DistanceFunction<T>& distance) const {
  if (query.size() != dims_) {
    throw std::invalid_argument("KdTree query size (" +
                                std::to_string(query.size()) +
                                ") must match dimensions (" +
                                std::to_string(dims_) + ")");
  }
  if (distance.dimensions() != dims_) {
    throw std::invalid_argument("DistanceFunction dimensions (" +
                                std::to_string(distance.dimensions()) +
                                ") must match tree dimensions (" +
                                std::to_string(dims_) + ")");
  }
}

}  // namespace kdsearch

#endif  // KDSEARCH_TREE_IMPL_KD_TREE_IMPL_HPP
