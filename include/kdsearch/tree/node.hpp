// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * node.hpp
 *
 * Tree node storage. Nodes live in a flat arena owned by the tree and
 * reference their children by index.
 */

#ifndef KDSEARCH_TREE_NODE_HPP
#define KDSEARCH_TREE_NODE_HPP

#include <cstddef>
#include <cstdint>
#include <variant>
#include <vector>

namespace kdsearch::tree {

using NodeIndex = std::uint32_t;

/// Leaf holding points (row-major, `dimensions` values each) and items.
template <typename T, typename Item>
struct Bucket {
  std::vector<T> coordinates;
  std::vector<Item> items;
  size_t capacity = 0;

  size_t size() const noexcept { return items.size(); }
  bool full() const noexcept { return items.size() >= capacity; }
};

/// Internal node routing `coordinate > value` right, everything else left.
struct Split {
  int axis = 0;
  double value = 0.0;
  NodeIndex left = 0;
  NodeIndex right = 0;
};

template <typename T, typename Item>
struct Node {
  std::variant<Bucket<T, Item>, Split> kind;
  size_t count = 0;  ///< Points in this subtree
  int depth = 1;     ///< Root is depth 1
};

}  // namespace kdsearch::tree

#endif  // KDSEARCH_TREE_NODE_HPP
