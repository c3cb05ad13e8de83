// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#include "kdsearch/selection/partial_sort.hpp"

namespace kdsearch {
namespace {

// The heap wins while N is a small fraction of M; beyond that the linear
// quickselect is cheaper.
bool preferHeap(size_t size, int n) {
  return static_cast<size_t>(n) * 4 < size;
}

}  // namespace

template <typename T>
std::vector<T> bottom(unsigned options, const T* values, size_t size, int n) {
  if (values == nullptr || size == 0 || n < 1) return {};
  if (preferHeap(size, n)) return SelectionHeap<T>(n).bottom(values, size, options);
  return Selector<T>(n).bottom(values, size, options);
}

template <typename T>
std::vector<T> top(unsigned options, const T* values, size_t size, int n) {
  if (values == nullptr || size == 0 || n < 1) return {};
  if (preferHeap(size, n)) return SelectionHeap<T>(n).top(values, size, options);
  return Selector<T>(n).top(values, size, options);
}

template class SelectionHeap<float>;
template class SelectionHeap<double>;
template class Selector<float>;
template class Selector<double>;
template std::vector<float> bottom<float>(unsigned, const float*, size_t, int);
template std::vector<double> bottom<double>(unsigned, const double*, size_t,
                                            int);
template std::vector<float> top<float>(unsigned, const float*, size_t, int);
template std::vector<double> top<double>(unsigned, const double*, size_t, int);

}  // namespace kdsearch
