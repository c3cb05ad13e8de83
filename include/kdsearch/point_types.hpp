// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * point_types.hpp
 *
 * Point and query vector aliases for kdsearch.
 */

#ifndef KDSEARCH_POINT_TYPES_HPP
#define KDSEARCH_POINT_TYPES_HPP

#include <Eigen/Core>

namespace kdsearch {

/// Dynamic-size coordinate vector (float or double).
template <typename T>
using Vector = Eigen::Matrix<T, Eigen::Dynamic, 1>;

/// Point argument accepted by the tree. Binds to any contiguous column
/// vector (VectorXf, Vector2f, Map over a std::vector, ...).
template <typename T>
using PointRef = Eigen::Ref<const Vector<T>>;

/// Read-only view of a stored point.
template <typename T>
using PointMap = Eigen::Map<const Vector<T>>;

/// Query points are always double precision.
using Query = Eigen::Ref<const Eigen::VectorXd>;

}  // namespace kdsearch

#endif  // KDSEARCH_POINT_TYPES_HPP
