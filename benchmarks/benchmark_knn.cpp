// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>
//
// Benchmark: k-nearest-neighbour search
//
// Compares tree queries against an exhaustive scan with partial selection,
// over several bucket capacities.
//
// Build:
//   cmake .. -DKDSEARCH_BUILD_BENCHMARKS=ON -DCMAKE_BUILD_TYPE=Release && make -j

#include <iostream>
#include <string>
#include <vector>

#include "../examples/common/point_generator.hpp"
#include "../examples/common/timer.hpp"
#include "kdsearch/kdsearch.hpp"

using namespace kdsearch;

namespace {

constexpr int kDims = 3;
constexpr int kNeighbours = 10;
constexpr size_t kPoints = 200000;
constexpr size_t kQueries = 2000;

// ============================================================================
// Exhaustive reference
// ============================================================================

double bruteForceKthDistance(const std::vector<Eigen::VectorXf>& points,
                             const Eigen::VectorXd& query,
                             const DistanceFunction<float>& metric,
                             std::vector<double>& scratch) {
  scratch.resize(points.size());
  for (size_t i = 0; i < points.size(); ++i) {
    scratch[i] = metric.distance(query.data(), points[i].data());
  }
  // Boundary value only
  auto best = bottom(kHeadFirst, scratch.data(), scratch.size(), kNeighbours);
  return best.empty() ? 0.0 : best.front();
}

}  // namespace

// ============================================================================
// Main
// ============================================================================

int main() {
  const auto points =
      examples::generateUniformPoints<float>(kPoints, kDims, 100.0f);
  const auto queries =
      examples::generateUniformPoints<double>(kQueries, kDims, 100.0, 7);
  auto metric = createSquaredEuclidean<float>(kDims);

  std::cout << "=== benchmark_knn: " << kPoints << " points, " << kQueries
            << " queries, k=" << kNeighbours << " ===\n"
            << std::endl;

  examples::Timer timer;
  double checksum_brute = 0.0;
  {
    std::vector<double> scratch;
    timer.start();
    for (const auto& q : queries) {
      checksum_brute += bruteForceKthDistance(points, q, *metric, scratch);
    }
    timer.printElapsed("Brute force", queries.size());
  }

  for (int capacity : {8, 24, 64, 256}) {
    auto tree = newIndex<float, int>(kDims, capacity);
    timer.start();
    for (size_t i = 0; i < points.size(); ++i) {
      tree.add(points[i], static_cast<int>(i));
    }
    timer.printElapsed("Build (bucket " + std::to_string(capacity) + ")",
                       points.size());

    BoundedCandidateSet<int> candidates(kNeighbours);
    double checksum_tree = 0.0;
    timer.start();
    for (const auto& q : queries) {
      if (tree.nearestNeighbours(q, *metric, candidates)) {
        checksum_tree += candidates.threshold();
      }
    }
    timer.printElapsed("Tree k-NN (bucket " + std::to_string(capacity) + ")",
                       queries.size());

    if (checksum_tree != checksum_brute) {
      std::cout << "  MISMATCH: tree " << checksum_tree << " vs brute "
                << checksum_brute << std::endl;
      return 1;
    }
    std::cout << "  depth " << tree.depth() << ", results match" << std::endl;
  }

  return 0;
}
