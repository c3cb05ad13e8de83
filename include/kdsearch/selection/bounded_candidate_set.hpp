// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * bounded_candidate_set.hpp
 *
 * Fixed-capacity max-heap retaining the k smallest (distance, item) pairs.
 */

#ifndef KDSEARCH_SELECTION_BOUNDED_CANDIDATE_SET_HPP
#define KDSEARCH_SELECTION_BOUNDED_CANDIDATE_SET_HPP

#include <cmath>
#include <cstddef>
#include <limits>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace kdsearch {

/**
 * @brief Bounded set of the k best (smallest distance) candidates.
 *
 * The worst retained candidate sits at the root of a binary max-heap, so
 * offer() is O(log k) and threshold() is O(1). NaN distances are rejected.
 *
 * The set can be reused across queries: clear() keeps the allocation and a
 * cleared set behaves exactly like a new one.
 *
 * Usage:
 * @code
 *   BoundedCandidateSet<int> best(5);
 *   for (...) best.offer(distance, item);
 *   best.drainSorted([](const int& item, double d) { ... });  // ascending
 * @endcode
 *
 * Not thread-safe; use one instance per worker.
 */
template <typename Item>
class BoundedCandidateSet {
 public:
  /// @throws std::invalid_argument if capacity < 1
  explicit BoundedCandidateSet(int capacity) : capacity_(capacity) {
    if (capacity < 1) {
      throw std::invalid_argument("Candidate set capacity (" +
                                  std::to_string(capacity) +
                                  ") must be > 0");
    }
    entries_.reserve(static_cast<size_t>(capacity));
  }

  /// Offer a candidate. Kept if the set is not full or it beats the worst.
  void offer(double distance, const Item& item) {
    if (std::isnan(distance)) return;
    if (entries_.size() < static_cast<size_t>(capacity_)) {
      entries_.emplace_back(distance, item);
      siftUp(entries_.size() - 1);
    } else if (distance < entries_.front().first) {
      entries_.front().first = distance;
      entries_.front().second = item;
      siftDown(0, entries_.size());
    }
  }

  /// Worst retained distance once full, +inf before that.
  /// Candidates at a larger distance cannot enter the set.
  double threshold() const noexcept {
    return full() ? entries_.front().first
                  : std::numeric_limits<double>::infinity();
  }

  int capacity() const noexcept { return capacity_; }
  int size() const noexcept { return static_cast<int>(entries_.size()); }
  bool empty() const noexcept { return entries_.empty(); }
  bool full() const noexcept {
    return entries_.size() == static_cast<size_t>(capacity_);
  }

  void clear() noexcept { entries_.clear(); }

  /// Distance of the i-th entry in heap order (entry 0 is the worst).
  double distance(int i) const { return entries_[static_cast<size_t>(i)].first; }
  const Item& item(int i) const { return entries_[static_cast<size_t>(i)].second; }

  /// Visit entries in heap order. fn(const Item&, double)
  template <typename F>
  void forEachUnsorted(F&& fn) const {
    for (const auto& [d, item] : entries_) fn(item, d);
  }

  /// Visit entries in ascending distance order and empty the set.
  /// fn(const Item&, double)
  template <typename F>
  void drainSorted(F&& fn) {
    // In-place heap sort: the max is moved behind the shrinking heap
    for (size_t end = entries_.size(); end > 1; --end) {
      std::swap(entries_[0], entries_[end - 1]);
      siftDown(0, end - 1);
    }
    for (const auto& [d, item] : entries_) fn(item, d);
    entries_.clear();
  }

 private:
  void siftUp(size_t child) {
    while (child > 0) {
      const size_t parent = (child - 1) / 2;
      if (entries_[parent].first < entries_[child].first) {
        std::swap(entries_[parent], entries_[child]);
        child = parent;
      } else {
        break;
      }
    }
  }

  void siftDown(size_t parent, size_t size) {
    for (size_t child = parent * 2 + 1; child < size;
         parent = child, child = parent * 2 + 1) {
      if (child + 1 < size && entries_[child].first < entries_[child + 1].first)
        ++child;
      if (entries_[parent].first < entries_[child].first) {
        std::swap(entries_[parent], entries_[child]);
      } else {
        break;
      }
    }
  }

  int capacity_;
  std::vector<std::pair<double, Item>> entries_;
};

}  // namespace kdsearch

#endif  // KDSEARCH_SELECTION_BOUNDED_CANDIDATE_SET_HPP
