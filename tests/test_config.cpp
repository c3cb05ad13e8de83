// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * test_config.cpp
 *
 * Tests for YAML configuration loading and validation.
 */

#include <gtest/gtest.h>
#include <yaml-cpp/yaml.h>

#include <fstream>

#include "kdsearch/kdsearch.hpp"

using namespace kdsearch;

// ─── Helpers ─────────────────────────────────────────────────────────────────

namespace {

/// Write a temporary YAML file and return its path.
std::string writeTempYaml(const std::string& content,
                          const std::string& name = "kdsearch_test_config.yaml") {
  std::string path = "/tmp/" + name;
  std::ofstream fs(path);
  fs << content;
  return path;
}

}  // namespace

// ─── Loading Tests ───────────────────────────────────────────────────────────

TEST(ConfigLoadTest, LoadDefaultYaml) {
  auto cfg = loadConfig(KDSEARCH_CONFIG_DIR "/default.yaml");

  EXPECT_EQ(cfg.dimensions, 2);
  EXPECT_EQ(cfg.tree.bucket_capacity, 24);
  EXPECT_TRUE(cfg.tree.dimension_weights.empty());
}

TEST(ConfigLoadTest, LoadWeightedPreset) {
  auto cfg = loadConfig(KDSEARCH_CONFIG_DIR "/weighted_3d.yaml");

  EXPECT_EQ(cfg.dimensions, 3);
  EXPECT_EQ(cfg.tree.bucket_capacity, 16);
  ASSERT_EQ(cfg.tree.dimension_weights.size(), 3u);
  EXPECT_DOUBLE_EQ(cfg.tree.dimension_weights[2], 0.25);
}

TEST(ConfigLoadTest, NonexistentFileThrows) {
  EXPECT_THROW(loadConfig("/nonexistent/path.yaml"), std::runtime_error);
}

TEST(ConfigLoadTest, MalformedYamlThrows) {
  auto path = writeTempYaml("tree: [unclosed\n", "kdsearch_malformed.yaml");
  EXPECT_THROW(loadConfig(path), std::runtime_error);
}

TEST(ConfigLoadTest, EmptyYamlUsesDefaults) {
  auto path = writeTempYaml("# empty config\n", "kdsearch_empty.yaml");
  auto cfg = loadConfig(path);

  Config defaults;
  EXPECT_EQ(cfg.dimensions, defaults.dimensions);
  EXPECT_EQ(cfg.tree.bucket_capacity, defaults.tree.bucket_capacity);
  EXPECT_TRUE(cfg.tree.dimension_weights.empty());
}

TEST(ConfigLoadTest, PartialYamlPreservesDefaults) {
  auto path = writeTempYaml(
      "tree:\n"
      "  bucket_capacity: 8\n"
      "unknown_section:\n"
      "  ignored: true\n",
      "kdsearch_partial.yaml");
  auto cfg = loadConfig(path);

  EXPECT_EQ(cfg.tree.bucket_capacity, 8);
  EXPECT_EQ(cfg.dimensions, Config().dimensions);
}

TEST(ConfigLoadTest, ParseFromNode) {
  auto cfg = parseConfig(YAML::Load(
      "dimensions: 4\n"
      "tree:\n"
      "  dimension_weights: [1, 2, 3, 4]\n"));
  EXPECT_EQ(cfg.dimensions, 4);
  EXPECT_EQ(cfg.tree.dimension_weights,
            (std::vector<double>{1.0, 2.0, 3.0, 4.0}));
}

// ─── Validation: Fatal Errors ────────────────────────────────────────────────

TEST(ConfigValidationTest, NonPositiveDimensionsThrows) {
  EXPECT_THROW(parseConfig(YAML::Load("dimensions: 0\n")),
               std::invalid_argument);
  EXPECT_THROW(loadConfig(writeTempYaml("dimensions: -2\n",
                                        "kdsearch_neg_dims.yaml")),
               std::invalid_argument);
}

TEST(ConfigValidationTest, WeightCountMismatchThrows) {
  auto path = writeTempYaml(
      "dimensions: 3\n"
      "tree:\n"
      "  dimension_weights: [1.0, 1.0]\n",
      "kdsearch_weight_count.yaml");
  EXPECT_THROW(loadConfig(path), std::invalid_argument);
}

TEST(ConfigValidationTest, NonPositiveWeightThrows) {
  EXPECT_THROW(parseConfig(YAML::Load(
                   "dimensions: 2\n"
                   "tree:\n"
                   "  dimension_weights: [1.0, 0.0]\n")),
               std::invalid_argument);
  EXPECT_THROW(parseConfig(YAML::Load(
                   "dimensions: 2\n"
                   "tree:\n"
                   "  dimension_weights: [-1.0, 1.0]\n")),
               std::invalid_argument);
  EXPECT_THROW(parseConfig(YAML::Load(
                   "dimensions: 2\n"
                   "tree:\n"
                   "  dimension_weights: [.inf, 1.0]\n")),
               std::invalid_argument);
}

// ─── Validation: Non-Fatal Clamping ──────────────────────────────────────────

TEST(ConfigValidationTest, NonPositiveBucketCapacityClamped) {
  auto path = writeTempYaml(
      "tree:\n"
      "  bucket_capacity: 0\n",
      "kdsearch_zero_bucket.yaml");
  auto cfg = loadConfig(path);
  EXPECT_EQ(cfg.tree.bucket_capacity, config::Tree::kDefaultBucketCapacity);

  auto negative = parseConfig(YAML::Load("tree:\n  bucket_capacity: -5\n"));
  EXPECT_EQ(negative.tree.bucket_capacity,
            config::Tree::kDefaultBucketCapacity);
}

// ─── Config To Tree ──────────────────────────────────────────────────────────

TEST(ConfigTreeTest, LoadedConfigBuildsTree) {
  auto cfg = loadConfig(KDSEARCH_CONFIG_DIR "/weighted_3d.yaml");
  auto tree = newIndex<double, int>(cfg);
  EXPECT_EQ(tree.dimensions(), 3);
  EXPECT_EQ(tree.bucketCapacity(), 16);

  for (int i = 0; i < 100; ++i) {
    tree.add(Eigen::Vector3d(i, -i, 0.5 * i), i);
  }
  auto metric = createSquaredEuclidean<double>(3);
  int item = -1;
  EXPECT_EQ(tree.nearestNeighbour(Eigen::Vector3d(42, -42, 21), *metric,
                                  [&item](const int& i, double) { item = i; }),
            0.0);
  EXPECT_EQ(item, 42);
}
