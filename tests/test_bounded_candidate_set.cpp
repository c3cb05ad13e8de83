// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#include <gtest/gtest.h>

#include <algorithm>
#include <cmath>
#include <limits>
#include <random>
#include <vector>

#include "kdsearch/selection/bounded_candidate_set.hpp"

using namespace kdsearch;

namespace {

std::vector<double> drain(BoundedCandidateSet<int>& set) {
  std::vector<double> out;
  set.drainSorted([&out](const int&, double d) { out.push_back(d); });
  return out;
}

}  // namespace

class BoundedCandidateSetTest : public ::testing::Test {
 protected:
  BoundedCandidateSet<int> set{3};
};

// ─── Basic Behaviour ─────────────────────────────────────────────────────────

TEST_F(BoundedCandidateSetTest, StartsEmptyWithInfiniteThreshold) {
  EXPECT_TRUE(set.empty());
  EXPECT_FALSE(set.full());
  EXPECT_EQ(set.capacity(), 3);
  EXPECT_EQ(set.threshold(), std::numeric_limits<double>::infinity());
}

TEST_F(BoundedCandidateSetTest, ThresholdIsWorstOnceFull) {
  set.offer(5.0, 0);
  set.offer(1.0, 1);
  EXPECT_EQ(set.threshold(), std::numeric_limits<double>::infinity());
  set.offer(3.0, 2);
  EXPECT_TRUE(set.full());
  EXPECT_DOUBLE_EQ(set.threshold(), 5.0);
}

TEST_F(BoundedCandidateSetTest, KeepsSmallest) {
  for (int i = 10; i >= 0; --i) set.offer(static_cast<double>(i), i);
  EXPECT_EQ(set.size(), 3);
  EXPECT_EQ(drain(set), (std::vector<double>{0.0, 1.0, 2.0}));
}

TEST_F(BoundedCandidateSetTest, WorseCandidateRejectedWhenFull) {
  set.offer(1.0, 1);
  set.offer(2.0, 2);
  set.offer(3.0, 3);
  set.offer(4.0, 4);
  set.offer(3.0, 5);  // tie with worst does not replace

  std::vector<int> items;
  set.forEachUnsorted([&items](const int& item, double) { items.push_back(item); });
  std::sort(items.begin(), items.end());
  EXPECT_EQ(items, (std::vector<int>{1, 2, 3}));
}

TEST_F(BoundedCandidateSetTest, NaNIgnored) {
  set.offer(std::numeric_limits<double>::quiet_NaN(), 0);
  EXPECT_TRUE(set.empty());
  set.offer(1.0, 1);
  set.offer(std::numeric_limits<double>::quiet_NaN(), 2);
  EXPECT_EQ(set.size(), 1);
}

TEST_F(BoundedCandidateSetTest, DrainEmptiesSet) {
  set.offer(2.0, 0);
  set.offer(1.0, 1);
  EXPECT_EQ(drain(set), (std::vector<double>{1.0, 2.0}));
  EXPECT_TRUE(set.empty());
}

TEST(BoundedCandidateSetConstructTest, InvalidCapacityThrows) {
  EXPECT_THROW(BoundedCandidateSet<int>(0), std::invalid_argument);
  EXPECT_THROW(BoundedCandidateSet<int>(-1), std::invalid_argument);
}

// ─── Random Comparison ───────────────────────────────────────────────────────

TEST(BoundedCandidateSetRandomTest, MatchesSortedPrefix) {
  std::mt19937 rng(42);
  std::uniform_real_distribution<double> dist(0.0, 100.0);

  for (int k : {1, 2, 5, 17}) {
    BoundedCandidateSet<int> set(k);
    for (int trial = 0; trial < 5; ++trial) {
      std::vector<double> values(60);
      for (auto& v : values) v = dist(rng);

      set.clear();  // reuse must match a fresh set
      for (size_t i = 0; i < values.size(); ++i) {
        set.offer(values[i], static_cast<int>(i));
      }
      std::sort(values.begin(), values.end());
      values.resize(static_cast<size_t>(k));
      EXPECT_EQ(drain(set), values) << "k=" << k;
    }
  }
}

TEST(BoundedCandidateSetRandomTest, ItemsFollowDistances) {
  std::mt19937 rng(7);
  std::uniform_real_distribution<double> dist(0.0, 1.0);
  std::vector<double> values(40);
  for (auto& v : values) v = dist(rng);

  BoundedCandidateSet<int> set(8);
  for (size_t i = 0; i < values.size(); ++i) {
    set.offer(values[i], static_cast<int>(i));
  }
  set.drainSorted([&values](const int& item, double d) {
    EXPECT_EQ(values[static_cast<size_t>(item)], d);
  });
}
