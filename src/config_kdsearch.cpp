// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * config_kdsearch.cpp
 *
 * YAML configuration loading.
 */

#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

#include <cmath>
#include <stdexcept>

#include "kdsearch/config/kdsearch.hpp"

namespace kdsearch {
namespace detail {

template <typename T>
void load(const YAML::Node& node, const std::string& key, T& value) {
  if (node[key]) {
    value = node[key].as<T>();
  }
}

Config parse(const YAML::Node& root) {
  Config cfg;

  load(root, "dimensions", cfg.dimensions);

  if (auto n = root["tree"]) {
    load(n, "bucket_capacity", cfg.tree.bucket_capacity);
    load(n, "dimension_weights", cfg.tree.dimension_weights);
  }

  return cfg;
}

void validate(Config& cfg) {
  // --- Fatal: values the tree cannot be built with ---
  if (cfg.dimensions <= 0) {
    throw std::invalid_argument("dimensions (" +
                                std::to_string(cfg.dimensions) +
                                ") must be > 0");
  }

  const auto& weights = cfg.tree.dimension_weights;
  if (!weights.empty()) {
    if (weights.size() != static_cast<size_t>(cfg.dimensions)) {
      throw std::invalid_argument(
          "tree.dimension_weights: expected " +
          std::to_string(cfg.dimensions) + " weights, got " +
          std::to_string(weights.size()));
    }
    for (size_t i = 0; i < weights.size(); ++i) {
      if (!std::isfinite(weights[i]) || weights[i] <= 0.0) {
        throw std::invalid_argument("tree.dimension_weights[" +
                                    std::to_string(i) + "] (" +
                                    std::to_string(weights[i]) +
                                    ") must be finite and > 0");
      }
    }
  }

  // --- Non-fatal: warn and clamp ---
  if (cfg.tree.bucket_capacity < 1) {
    spdlog::warn("[Config] tree.bucket_capacity ({}) must be >= 1, "
                 "clamping to {}",
                 cfg.tree.bucket_capacity,
                 config::Tree::kDefaultBucketCapacity);
    cfg.tree.bucket_capacity = config::Tree::kDefaultBucketCapacity;
  }
}

}  // namespace detail

Config parseConfig(const YAML::Node& root) {
  auto cfg = detail::parse(root);
  detail::validate(cfg);
  return cfg;
}

Config loadConfig(const std::string& path) {
  try {
    return parseConfig(YAML::LoadFile(path));
  } catch (const YAML::Exception& e) {
    throw std::runtime_error("Failed to load config: " + path + " - " +
                             e.what());
  }
}

}  // namespace kdsearch
