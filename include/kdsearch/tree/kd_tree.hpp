// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * kd_tree.hpp
 *
 * Incrementally built bucket KD-tree for nearest-neighbour search.
 *
 * Points are D-dimensional (float or double) and carry an opaque item.
 * Leaves (buckets) hold up to `bucket_capacity` points and are scanned
 * linearly; a full bucket is split at the midpoint of its widest axis.
 *
 * Thread-safety: add()/addIfAbsent() must be serialised by the caller.
 * All const members may run concurrently while no writer is active.
 */

#ifndef KDSEARCH_TREE_KD_TREE_HPP
#define KDSEARCH_TREE_KD_TREE_HPP

#include <cstddef>
#include <functional>
#include <vector>

#include "kdsearch/config/tree.hpp"
#include "kdsearch/distance/distance_function.hpp"
#include "kdsearch/point_types.hpp"
#include "kdsearch/selection/bounded_candidate_set.hpp"
#include "kdsearch/tree/node.hpp"

namespace kdsearch {

/**
 * @brief Bucket KD-tree mapping D-dimensional points to items.
 *
 * Query distances are whatever the supplied DistanceFunction returns; the
 * built-in metrics report squared Euclidean distance.
 *
 * Usage:
 * @code
 *   KdTree<double, int> tree(2);
 *   tree.add(Eigen::Vector2d(0, 0), 0);
 *   tree.add(Eigen::Vector2d(1, 1), 1);
 *
 *   auto metric = createSquaredEuclidean<double>(2);
 *   tree.nearestNeighbours(Eigen::Vector2d(0.2, 0.1), 2, true, *metric,
 *                          [](const int& item, double d) { ... });
 * @endcode
 *
 * @tparam T Coordinate type of stored points (float or double)
 * @tparam Item Payload type (copyable)
 */
template <typename T, typename Item>
class KdTree {
 public:
  /// Receives a result item and its distance.
  using Consumer = std::function<void(const Item&, double)>;
  /// Returns true for items eligible as results.
  using Predicate = std::function<bool(const Item&)>;

  /// @throws std::invalid_argument if dimensions <= 0 or bucket_capacity <= 0
  explicit KdTree(int dimensions,
                  int bucket_capacity = config::Tree::kDefaultBucketCapacity);

  /// @throws std::invalid_argument if dimensions <= 0, the capacity is <= 0,
  /// or a non-empty weight list does not have `dimensions` entries
  KdTree(int dimensions, const config::Tree& cfg);

  int dimensions() const noexcept { return dims_; }
  size_t size() const noexcept { return nodes_[kRoot].count; }
  bool empty() const noexcept { return size() == 0; }
  int bucketCapacity() const noexcept { return capacity_; }

  /// Maximum node depth (a single bucket is depth 1).
  int depth() const noexcept { return depth_; }

  // ========== Mutation ==========

  /// Insert a point unconditionally (duplicates allowed).
  /// @throws std::invalid_argument if point.size() != dimensions()
  void add(const PointRef<T>& point, const Item& item);

  /**
   * @brief Insert unless a coordinate-equal point is already stored.
   *
   * Coordinates compare with ==, so -0.0 equals 0.0 and a point holding NaN
   * is never equal to anything.
   *
   * @return true if inserted
   * @throws std::invalid_argument if point.size() != dimensions()
   */
  bool addIfAbsent(const PointRef<T>& point, const Item& item);

  /// Visit every (point, item) once. visitor(const PointMap<T>&, const Item&)
  template <typename Visitor>
  void forEach(Visitor&& visitor) const;

  // ========== Queries ==========

  /**
   * @brief Distance to the nearest point.
   *
   * @param consumer Receives the closest item (may be empty)
   * @return The minimum distance, or NaN if the tree is empty or no point
   *         has a valid distance to the query
   * @throws std::invalid_argument on query or metric dimension mismatch
   */
  double nearestNeighbour(const Query& query,
                          const DistanceFunction<T>& distance,
                          const Consumer& consumer = {}) const;

  /// Nearest point whose item passes `filter`.
  double nearestNeighbour(const Query& query,
                          const DistanceFunction<T>& distance,
                          const Predicate& filter,
                          const Consumer& consumer) const;

  /**
   * @brief The k nearest points.
   *
   * Delivers min(k, valid points) results. With `sorted` the delivery is in
   * ascending distance order, otherwise in heap order.
   *
   * @return false (nothing delivered) if the tree is empty, k <= 0, or no
   *         point has a valid distance to the query
   */
  bool nearestNeighbours(const Query& query, int k, bool sorted,
                         const DistanceFunction<T>& distance,
                         const Consumer& consumer) const;

  /// k nearest points whose items pass `filter`. Filtered items never take
  /// a slot in the result.
  bool nearestNeighbours(const Query& query, int k, bool sorted,
                         const DistanceFunction<T>& distance,
                         const Predicate& filter,
                         const Consumer& consumer) const;

  /**
   * @brief Fill a caller-owned candidate set with the nearest points.
   *
   * The set is cleared first; its capacity is k. Reusing one set across
   * queries avoids a heap allocation per query.
   *
   * @return true if at least one candidate was found
   */
  bool nearestNeighbours(const Query& query,
                         const DistanceFunction<T>& distance,
                         BoundedCandidateSet<Item>& candidates,
                         const Predicate& filter = {}) const;

  /**
   * @brief All points within `radius` (distance <= radius), any order.
   *
   * @return true if at least one point was delivered
   */
  bool findNeighbours(const Query& query, double radius,
                      const DistanceFunction<T>& distance,
                      const Consumer& consumer) const;

 private:
  using BucketT = tree::Bucket<T, Item>;
  using NodeT = tree::Node<T, Item>;
  using NodeIndex = tree::NodeIndex;

  static constexpr NodeIndex kRoot = 0;

  bool insert(const PointRef<T>& point, const Item& item, bool unique);
  void extendBounds(NodeIndex node, const T* point);
  void resetBounds(NodeIndex node, const BucketT& bucket);
  void splitBucket(NodeIndex node);

  const T* lower(NodeIndex node) const {
    return bounds_.data() + static_cast<size_t>(node) * 2 * dims_;
  }
  const T* upper(NodeIndex node) const { return lower(node) + dims_; }
  T* lower(NodeIndex node) {
    return bounds_.data() + static_cast<size_t>(node) * 2 * dims_;
  }
  T* upper(NodeIndex node) { return lower(node) + dims_; }

  void checkPoint(Eigen::Index size) const;
  void checkQuery(const Query& query, const DistanceFunction<T>& distance) const;

  /// Depth-first search, nearer child first. Subtrees whose rectangle
  /// distance is greater than bound() are skipped; a NaN comparison never
  /// skips. visit(const BucketT&) scans a leaf.
  template <typename Bound, typename Visit>
  void search(const double* query, const DistanceFunction<T>& distance,
              Bound&& bound, Visit&& visit) const;

  int dims_;
  int capacity_;
  int depth_ = 1;
  std::vector<double> weights_;
  std::vector<NodeT> nodes_;
  std::vector<T> bounds_;  ///< Per node: D lower then D upper bounds
};

/// Common instantiations.
using IntFloatKdTree = KdTree<float, int>;
using IntDoubleKdTree = KdTree<double, int>;
template <typename Item>
using FloatKdTree = KdTree<float, Item>;
template <typename Item>
using DoubleKdTree = KdTree<double, Item>;

}  // namespace kdsearch

#include "kdsearch/tree/impl/kd_tree_impl.hpp"

#endif  // KDSEARCH_TREE_KD_TREE_HPP
