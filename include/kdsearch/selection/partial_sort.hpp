// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * partial_sort.hpp
 *
 * Top-N / bottom-N selection over arrays without sorting the remainder.
 *
 * Two selectors share one contract:
 *   - SelectionHeap: bounded heap scan, O(M log N). Best for N << M.
 *   - Selector:      quickselect (nth_element), O(M). Best for larger N.
 *
 * NaN values are never selected and never count toward N. If fewer than N
 * valid values exist, all of them are returned.
 */

#ifndef KDSEARCH_SELECTION_PARTIAL_SORT_HPP
#define KDSEARCH_SELECTION_PARTIAL_SORT_HPP

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <functional>
#include <stdexcept>
#include <string>
#include <vector>

namespace kdsearch {

/// Output options for selection (bit flags).
enum SelectOption : unsigned {
  kNone = 0x00,
  /// Sort the result in the selection direction (ascending for bottom,
  /// descending for top). Takes precedence over kHeadFirst.
  kSort = 0x01,
  /// Place the N-th best value (the selection boundary) at index 0. The
  /// rest of the result is unordered.
  kHeadFirst = 0x04,
};

namespace detail {

inline void checkSelectCount(int n) {
  if (n < 1) {
    throw std::invalid_argument("Selection count N (" + std::to_string(n) +
                                ") must be > 0");
  }
}

/// Apply output options. `before(a, b)` is true when a ranks ahead of b.
template <typename T, typename Before>
std::vector<T> finish(const std::vector<T>& selected, unsigned options,
                      Before before) {
  std::vector<T> out(selected);
  if (options & kSort) {
    std::sort(out.begin(), out.end(), before);
  } else if ((options & kHeadFirst) && !out.empty()) {
    std::iter_swap(out.begin(), std::max_element(out.begin(), out.end(), before));
  }
  return out;
}

}  // namespace detail

/**
 * @brief Bounded-heap selector of the N best values.
 *
 * The working heap is allocated once and reused across calls.
 */
template <typename T>
class SelectionHeap {
 public:
  /// @throws std::invalid_argument if n < 1
  explicit SelectionHeap(int n) : n_(n) {
    detail::checkSelectCount(n);
    heap_.reserve(static_cast<size_t>(n));
  }

  int count() const noexcept { return n_; }

  /// N smallest of values[0, size).
  std::vector<T> bottom(const T* values, size_t size, unsigned options = kSort) {
    return select(values, size, options, std::less<T>());
  }
  std::vector<T> bottom(const std::vector<T>& values, unsigned options = kSort) {
    return bottom(values.data(), values.size(), options);
  }

  /// N largest of values[0, size).
  std::vector<T> top(const T* values, size_t size, unsigned options = kSort) {
    return select(values, size, options, std::greater<T>());
  }
  std::vector<T> top(const std::vector<T>& values, unsigned options = kSort) {
    return top(values.data(), values.size(), options);
  }

 private:
  template <typename Before>
  std::vector<T> select(const T* values, size_t size, unsigned options,
                        Before before) {
    heap_.clear();
    const size_t n = static_cast<size_t>(n_);
    for (size_t i = 0; i < size; ++i) {
      const T v = values[i];
      if (std::isnan(v)) continue;
      if (heap_.size() < n) {
        heap_.push_back(v);
        std::push_heap(heap_.begin(), heap_.end(), before);
      } else if (before(v, heap_.front())) {
        // Root is the current boundary; replace it
        std::pop_heap(heap_.begin(), heap_.end(), before);
        heap_.back() = v;
        std::push_heap(heap_.begin(), heap_.end(), before);
      }
    }
    return detail::finish(heap_, options, before);
  }

  int n_;
  std::vector<T> heap_;
};

/**
 * @brief Quickselect-based selector of the N best values.
 *
 * Copies the valid values into a reused buffer and partitions it with
 * std::nth_element so the boundary value lands at index N-1.
 */
template <typename T>
class Selector {
 public:
  /// @throws std::invalid_argument if n < 1
  explicit Selector(int n) : n_(n) { detail::checkSelectCount(n); }

  int count() const noexcept { return n_; }

  std::vector<T> bottom(const T* values, size_t size, unsigned options = kSort) {
    return select(values, size, options, std::less<T>());
  }
  std::vector<T> bottom(const std::vector<T>& values, unsigned options = kSort) {
    return bottom(values.data(), values.size(), options);
  }

  std::vector<T> top(const T* values, size_t size, unsigned options = kSort) {
    return select(values, size, options, std::greater<T>());
  }
  std::vector<T> top(const std::vector<T>& values, unsigned options = kSort) {
    return top(values.data(), values.size(), options);
  }

 private:
  template <typename Before>
  std::vector<T> select(const T* values, size_t size, unsigned options,
                        Before before) {
    buffer_.clear();
    for (size_t i = 0; i < size; ++i) {
      if (!std::isnan(values[i])) buffer_.push_back(values[i]);
    }
    const size_t n = static_cast<size_t>(n_);
    if (buffer_.size() > n) {
      std::nth_element(buffer_.begin(), buffer_.begin() + (n - 1),
                       buffer_.end(), before);
      buffer_.resize(n);
      if (!(options & kSort) && (options & kHeadFirst)) {
        std::iter_swap(buffer_.begin(), buffer_.begin() + (n - 1));
        options &= ~static_cast<unsigned>(kHeadFirst);
      }
    }
    return detail::finish(buffer_, options, before);
  }

  int n_;
  std::vector<T> buffer_;
};

/**
 * @brief Select the N smallest of values[0, size).
 *
 * Returns an empty result for null/empty input or n < 1.
 */
template <typename T>
std::vector<T> bottom(unsigned options, const T* values, size_t size, int n);

/// Select the N largest of values[0, size).
template <typename T>
std::vector<T> top(unsigned options, const T* values, size_t size, int n);

/// N smallest values, sorted ascending.
template <typename T>
std::vector<T> bottom(const std::vector<T>& values, int n) {
  return bottom(kSort, values.data(), values.size(), n);
}

/// N largest values, sorted descending.
template <typename T>
std::vector<T> top(const std::vector<T>& values, int n) {
  return top(kSort, values.data(), values.size(), n);
}

/// N smallest values with the N-th smallest at index 0 (rest unordered).
template <typename T>
std::vector<T> bottomHeadFirst(const std::vector<T>& values, int n) {
  return bottom(kHeadFirst, values.data(), values.size(), n);
}

/// N largest values with the N-th largest at index 0 (rest unordered).
template <typename T>
std::vector<T> topHeadFirst(const std::vector<T>& values, int n) {
  return top(kHeadFirst, values.data(), values.size(), n);
}

extern template class SelectionHeap<float>;
extern template class SelectionHeap<double>;
extern template class Selector<float>;
extern template class Selector<double>;
extern template std::vector<float> bottom<float>(unsigned, const float*,
                                                 size_t, int);
extern template std::vector<double> bottom<double>(unsigned, const double*,
                                                   size_t, int);
extern template std::vector<float> top<float>(unsigned, const float*, size_t,
                                              int);
extern template std::vector<double> top<double>(unsigned, const double*,
                                                size_t, int);

}  // namespace kdsearch

#endif  // KDSEARCH_SELECTION_PARTIAL_SORT_HPP
