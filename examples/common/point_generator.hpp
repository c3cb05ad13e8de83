// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * point_generator.hpp
 *
 * Synthetic point sets for examples and benchmarks.
 */

#ifndef EXAMPLES_COMMON_POINT_GENERATOR_HPP
#define EXAMPLES_COMMON_POINT_GENERATOR_HPP

#include <Eigen/Core>
#include <random>
#include <vector>

namespace examples {

/// Uniform points in the cube [-extent, extent]^dimensions.
template <typename T>
std::vector<Eigen::Matrix<T, Eigen::Dynamic, 1>> generateUniformPoints(
    size_t count, int dimensions, T extent, unsigned seed = 42) {
  std::mt19937 rng(seed);
  std::uniform_real_distribution<T> coord(-extent, extent);

  std::vector<Eigen::Matrix<T, Eigen::Dynamic, 1>> points;
  points.reserve(count);
  for (size_t i = 0; i < count; ++i) {
    Eigen::Matrix<T, Eigen::Dynamic, 1> p(dimensions);
    for (int d = 0; d < dimensions; ++d) p(d) = coord(rng);
    points.push_back(p);
  }
  return points;
}

/// Clustered points: Gaussian blobs around `clusters` random centres.
template <typename T>
std::vector<Eigen::Matrix<T, Eigen::Dynamic, 1>> generateClusteredPoints(
    size_t count, int dimensions, int clusters, T extent, T sigma,
    unsigned seed = 42) {
  std::mt19937 rng(seed);
  const auto centres = generateUniformPoints<T>(
      static_cast<size_t>(clusters), dimensions, extent, seed + 1);
  std::normal_distribution<T> noise(T(0), sigma);
  std::uniform_int_distribution<int> pick(0, clusters - 1);

  std::vector<Eigen::Matrix<T, Eigen::Dynamic, 1>> points;
  points.reserve(count);
  for (size_t i = 0; i < count; ++i) {
    Eigen::Matrix<T, Eigen::Dynamic, 1> p = centres[pick(rng)];
    for (int d = 0; d < dimensions; ++d) p(d) += noise(rng);
    points.push_back(p);
  }
  return points;
}

}  // namespace examples

#endif  // EXAMPLES_COMMON_POINT_GENERATOR_HPP
