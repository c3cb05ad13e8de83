// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#include "kdsearch/distance/distance_function.hpp"

#include <stdexcept>
#include <string>

namespace kdsearch {

template <typename T>
std::unique_ptr<DistanceFunction<T>> createSquaredEuclidean(int dimensions) {
  switch (dimensions) {
    case 2:
      return std::make_unique<SquaredEuclidean2D<T>>();
    case 3:
      return std::make_unique<SquaredEuclidean3D<T>>();
    default:
      break;
  }
  if (dimensions <= 0) {
    throw std::invalid_argument("Distance function dimensions (" +
                                std::to_string(dimensions) +
                                ") must be > 0");
  }
  return std::make_unique<SquaredEuclidean<T>>(dimensions);
}

template std::unique_ptr<DistanceFunction<float>>
createSquaredEuclidean<float>(int);
template std::unique_ptr<DistanceFunction<double>>
createSquaredEuclidean<double>(int);

}  // namespace kdsearch
