// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * test_distance_functions.cpp
 *
 * Tests for squared Euclidean metrics and their rectangle lower bounds.
 */

#include <gtest/gtest.h>

#include <algorithm>
#include <cmath>
#include <limits>
#include <random>

#include "kdsearch/distance/distance_function.hpp"

using namespace kdsearch;

namespace {
constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();
}  // namespace

// ─── Factory ─────────────────────────────────────────────────────────────────

TEST(DistanceFactoryTest, ReportsDimensions) {
  for (int d : {1, 2, 3, 4, 7}) {
    EXPECT_EQ(createSquaredEuclidean<double>(d)->dimensions(), d);
    EXPECT_EQ(createSquaredEuclidean<float>(d)->dimensions(), d);
  }
}

TEST(DistanceFactoryTest, Specialises2DAnd3D) {
  auto d2 = createSquaredEuclidean<double>(2);
  auto d3 = createSquaredEuclidean<float>(3);
  EXPECT_NE(dynamic_cast<SquaredEuclidean2D<double>*>(d2.get()), nullptr);
  EXPECT_NE(dynamic_cast<SquaredEuclidean3D<float>*>(d3.get()), nullptr);
}

TEST(DistanceFactoryTest, InvalidDimensionsThrow) {
  EXPECT_THROW(createSquaredEuclidean<double>(0), std::invalid_argument);
  EXPECT_THROW(createSquaredEuclidean<float>(-3), std::invalid_argument);
}

// ─── Point Distance ──────────────────────────────────────────────────────────

TEST(SquaredEuclideanTest, DistanceIsSquared) {
  auto metric = createSquaredEuclidean<double>(2);
  const double q[] = {0.0, 0.0};
  const double p[] = {1.0, 1.0};
  EXPECT_DOUBLE_EQ(metric->distance(q, p), 2.0);
}

TEST(SquaredEuclideanTest, SpecialisationsMatchGeneric) {
  std::mt19937 rng(42);
  std::uniform_real_distribution<double> coord(-10.0, 10.0);

  for (int d : {2, 3}) {
    auto specialised = createSquaredEuclidean<double>(d);
    SquaredEuclidean<double> generic(d);
    for (int trial = 0; trial < 50; ++trial) {
      double q[3], p[3];
      for (int i = 0; i < d; ++i) {
        q[i] = coord(rng);
        p[i] = coord(rng);
      }
      EXPECT_NEAR(specialised->distance(q, p), generic.distance(q, p), 1e-9);
    }
  }
}

TEST(SquaredEuclideanTest, FloatPointsDoubleQuery) {
  SquaredEuclidean<float> metric(4);
  const double q[] = {1.0, 2.0, 3.0, 4.0};
  const float p[] = {1.0f, 2.0f, 3.0f, 6.0f};
  EXPECT_DOUBLE_EQ(metric.distance(q, p), 4.0);
}

TEST(SquaredEuclideanTest, NaNCoordinateGivesNaN) {
  auto metric = createSquaredEuclidean<double>(2);
  const double q[] = {2.0, kNaN};
  const double p[] = {5.0, 4.0};
  EXPECT_TRUE(std::isnan(metric->distance(q, p)));
}

// ─── Rectangle Bound ─────────────────────────────────────────────────────────

TEST(RectangleDistanceTest, InsideIsZero) {
  auto metric = createSquaredEuclidean<double>(3);
  const double q[] = {0.5, 0.5, 0.5};
  const double lo[] = {0.0, 0.0, 0.0};
  const double hi[] = {1.0, 1.0, 1.0};
  EXPECT_DOUBLE_EQ(metric->distanceToRectangle(q, lo, hi), 0.0);
}

TEST(RectangleDistanceTest, OutsideMeasuresGapPerAxis) {
  auto metric = createSquaredEuclidean<double>(2);
  const double q[] = {-1.0, 3.0};
  const double lo[] = {0.0, 0.0};
  const double hi[] = {1.0, 1.0};
  // gaps 1 and 2
  EXPECT_DOUBLE_EQ(metric->distanceToRectangle(q, lo, hi), 5.0);
}

TEST(RectangleDistanceTest, NeverExceedsDistanceToContainedPoint) {
  std::mt19937 rng(42);
  std::uniform_real_distribution<double> coord(-5.0, 5.0);
  SquaredEuclidean<double> metric(5);

  for (int trial = 0; trial < 200; ++trial) {
    double q[5], lo[5], hi[5], p[5];
    for (int i = 0; i < 5; ++i) {
      double a = coord(rng), b = coord(rng);
      lo[i] = std::min(a, b);
      hi[i] = std::max(a, b);
      std::uniform_real_distribution<double> inside(lo[i], hi[i]);
      p[i] = inside(rng);
      q[i] = coord(rng);
    }
    EXPECT_LE(metric.distanceToRectangle(q, lo, hi),
              metric.distance(q, p) + 1e-12);
  }
}

TEST(RectangleDistanceTest, NaNBoundsDoNotPrune) {
  auto metric = createSquaredEuclidean<double>(2);
  const double q[] = {100.0, 0.0};
  const double lo[] = {kNaN, 0.0};
  const double hi[] = {kNaN, 1.0};
  // NaN axis contributes nothing
  EXPECT_DOUBLE_EQ(metric->distanceToRectangle(q, lo, hi), 0.0);

  const double nan_query[] = {kNaN, 5.0};
  const double lo2[] = {0.0, 0.0};
  const double hi2[] = {1.0, 1.0};
  EXPECT_DOUBLE_EQ(metric->distanceToRectangle(nan_query, lo2, hi2), 16.0);
}
