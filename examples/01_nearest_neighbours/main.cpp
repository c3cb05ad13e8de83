// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * 01_nearest_neighbours - kdsearch basic usage
 *
 * Demonstrates:
 * - Building a tree point by point
 * - Nearest, k-nearest and radius queries
 * - Excluding items with a predicate
 */

#include <kdsearch/kdsearch.hpp>

#include <iostream>

#include "../common/point_generator.hpp"
#include "../common/timer.hpp"

using namespace kdsearch;

int main() {
  std::cout << "=== 01_nearest_neighbours ===\n" << std::endl;

  // 1. Build a 3D tree over random points (item = point index)
  auto points = examples::generateUniformPoints<float>(100000, 3, 50.0f);
  auto tree = newIndex<float, int>(3);

  examples::Timer timer;
  timer.start();
  for (size_t i = 0; i < points.size(); ++i) {
    tree.add(points[i], static_cast<int>(i));
  }
  timer.printElapsed("Build", points.size());
  std::cout << "Size: " << tree.size() << ", depth: " << tree.depth()
            << std::endl;

  // 2. Queries use squared Euclidean distance
  auto metric = createSquaredEuclidean<float>(3);
  const Eigen::Vector3d query(1.0, -2.0, 0.5);

  int nearest = -1;
  double d2 = tree.nearestNeighbour(
      query, *metric, [&nearest](const int& item, double) { nearest = item; });
  std::cout << "\nNearest: item " << nearest << " at squared distance " << d2
            << std::endl;

  // 3. Second nearest: exclude the first
  tree.nearestNeighbour(
      query, *metric, [nearest](const int& item) { return item != nearest; },
      [](const int& item, double d) {
        std::cout << "Second nearest: item " << item << " at " << d
                  << std::endl;
      });

  // 4. k nearest, ascending
  std::cout << "\n5 nearest:" << std::endl;
  tree.nearestNeighbours(query, 5, true, *metric,
                         [](const int& item, double d) {
                           std::cout << "  item " << item << "  d2=" << d
                                     << std::endl;
                         });

  // 5. Everything within radius 2 (squared radius 4)
  size_t in_range = 0;
  tree.findNeighbours(query, 4.0, *metric,
                      [&in_range](const int&, double) { ++in_range; });
  std::cout << "\nPoints within radius 2: " << in_range << std::endl;

  // 6. Query throughput with a reused candidate set
  auto queries = examples::generateUniformPoints<double>(10000, 3, 50.0, 7);
  BoundedCandidateSet<int> candidates(10);
  timer.start();
  for (const auto& q : queries) {
    tree.nearestNeighbours(q, *metric, candidates);
  }
  timer.printElapsed("10-NN queries", queries.size());

  return 0;
}
