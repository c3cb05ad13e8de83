// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * distance_function.hpp
 *
 * Distance metrics used by tree queries.
 *
 * All built-in metrics return the SQUARED Euclidean distance. Radii passed
 * to findNeighbours() and distances delivered to consumers are therefore
 * squared as well (the distance between (0,0) and (1,1) is 2).
 */

#ifndef KDSEARCH_DISTANCE_DISTANCE_FUNCTION_HPP
#define KDSEARCH_DISTANCE_DISTANCE_FUNCTION_HPP

#include <Eigen/Core>
#include <memory>

#include "kdsearch/point_types.hpp"

namespace kdsearch {

/**
 * @brief Abstract base class for distance metrics.
 *
 * A metric scores a double-precision query against a stored point of
 * scalar type T, and bounds from below the score of any point inside an
 * axis-aligned rectangle. The rectangle bound is what the tree prunes on,
 * so it must never exceed the true distance to a contained point.
 *
 * NaN coordinates in the query or the rectangle must yield a bound that
 * does not prune (a NaN or a value no larger than the true distance).
 *
 * Implementations are stateless apart from the dimension count and are safe
 * to share between threads.
 */
template <typename T>
class DistanceFunction {
 public:
  virtual ~DistanceFunction() = default;

  /// Number of coordinates read from each point.
  virtual int dimensions() const noexcept = 0;

  /**
   * @brief Distance between a query and a stored point.
   *
   * @param query Query coordinates (dimensions() values)
   * @param point Stored point coordinates (dimensions() values)
   */
  virtual double distance(const double* query, const T* point) const = 0;

  /**
   * @brief Lower bound of the distance from a query to any point in the
   * rectangle [lower, upper].
   */
  virtual double distanceToRectangle(const double* query, const T* lower,
                                     const T* upper) const = 0;
};

namespace detail {

/// Gap between a query coordinate and the interval [lower, upper].
/// NaN on either side compares false and gives 0.
template <typename T>
inline double axisGap(double query, T lower, T upper) {
  if (query > upper) return query - static_cast<double>(upper);
  if (query < lower) return static_cast<double>(lower) - query;
  return 0.0;
}

}  // namespace detail

/// Squared Euclidean distance in N dimensions.
template <typename T>
class SquaredEuclidean : public DistanceFunction<T> {
 public:
  explicit SquaredEuclidean(int dimensions) : dimensions_(dimensions) {}

  int dimensions() const noexcept override { return dimensions_; }

  double distance(const double* query, const T* point) const override {
    const Eigen::Map<const Eigen::VectorXd> q(query, dimensions_);
    const PointMap<T> p(point, dimensions_);
    return (q - p.template cast<double>()).squaredNorm();
  }

  double distanceToRectangle(const double* query, const T* lower,
                             const T* upper) const override {
    double sum = 0.0;
    for (int i = 0; i < dimensions_; ++i) {
      const double gap = detail::axisGap(query[i], lower[i], upper[i]);
      sum += gap * gap;
    }
    return sum;
  }

 private:
  int dimensions_;
};

/// Squared Euclidean distance specialised for 2D points.
template <typename T>
class SquaredEuclidean2D : public DistanceFunction<T> {
 public:
  int dimensions() const noexcept override { return 2; }

  double distance(const double* query, const T* point) const override {
    const double dx = query[0] - static_cast<double>(point[0]);
    const double dy = query[1] - static_cast<double>(point[1]);
    return dx * dx + dy * dy;
  }

  double distanceToRectangle(const double* query, const T* lower,
                             const T* upper) const override {
    const double dx = detail::axisGap(query[0], lower[0], upper[0]);
    const double dy = detail::axisGap(query[1], lower[1], upper[1]);
    return dx * dx + dy * dy;
  }
};

/// Squared Euclidean distance specialised for 3D points.
template <typename T>
class SquaredEuclidean3D : public DistanceFunction<T> {
 public:
  int dimensions() const noexcept override { return 3; }

  double distance(const double* query, const T* point) const override {
    const Eigen::Map<const Eigen::Vector3d> q(query);
    const Eigen::Map<const Eigen::Matrix<T, 3, 1>> p(point);
    return (q - p.template cast<double>()).squaredNorm();
  }

  double distanceToRectangle(const double* query, const T* lower,
                             const T* upper) const override {
    const double dx = detail::axisGap(query[0], lower[0], upper[0]);
    const double dy = detail::axisGap(query[1], lower[1], upper[1]);
    const double dz = detail::axisGap(query[2], lower[2], upper[2]);
    return dx * dx + dy * dy + dz * dz;
  }
};

/// Factory: squared Euclidean metric for the given dimension count.
/// Returns the 2D/3D specialisation where one exists.
/// @throws std::invalid_argument if dimensions <= 0
template <typename T>
std::unique_ptr<DistanceFunction<T>> createSquaredEuclidean(int dimensions);

extern template std::unique_ptr<DistanceFunction<float>>
createSquaredEuclidean<float>(int);
extern template std::unique_ptr<DistanceFunction<double>>
createSquaredEuclidean<double>(int);

}  // namespace kdsearch

#endif  // KDSEARCH_DISTANCE_DISTANCE_FUNCTION_HPP
