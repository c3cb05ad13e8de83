// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * 02_config_loading - YAML configuration loading
 *
 * Demonstrates:
 * - Loading tree presets from YAML config files
 * - Creating trees from loaded configs
 * - Effect of split-axis weights on tree shape
 */

#include <kdsearch/kdsearch.hpp>

#include <iostream>

#include "../common/point_generator.hpp"
#include "../common/timer.hpp"

using namespace kdsearch;

int main() {
  std::cout << "=== 02_config_loading ===\n" << std::endl;

  // 1. Load configs from YAML presets
  auto config_default = loadConfig(EXAMPLE_CONFIG_DIR "/default.yaml");
  auto config_weighted = loadConfig(EXAMPLE_CONFIG_DIR "/weighted_3d.yaml");

  std::cout << "Loaded default.yaml: " << config_default.dimensions
            << "D, bucket " << config_default.tree.bucket_capacity
            << std::endl;
  std::cout << "Loaded weighted_3d.yaml: " << config_weighted.dimensions
            << "D, bucket " << config_weighted.tree.bucket_capacity << "\n"
            << std::endl;

  // 2. A weighted and an unweighted tree over the same 3D cloud
  Config config_unweighted = config_weighted;
  config_unweighted.tree.dimension_weights.clear();

  auto weighted = newIndex<float, int>(config_weighted);
  auto unweighted = newIndex<float, int>(config_unweighted);

  auto cloud = examples::generateClusteredPoints<float>(50000, 3, 20, 40.0f,
                                                        1.5f);
  examples::Timer timer;

  timer.start();
  for (size_t i = 0; i < cloud.size(); ++i) {
    weighted.add(cloud[i], static_cast<int>(i));
  }
  timer.printElapsed("Weighted build", cloud.size());

  timer.start();
  for (size_t i = 0; i < cloud.size(); ++i) {
    unweighted.add(cloud[i], static_cast<int>(i));
  }
  timer.printElapsed("Unweighted build", cloud.size());

  std::cout << "\nDepth (weighted):   " << weighted.depth() << std::endl;
  std::cout << "Depth (unweighted): " << unweighted.depth() << std::endl;

  // 3. Same answers either way
  auto metric = createSquaredEuclidean<float>(3);
  const Eigen::Vector3d query(0.0, 0.0, 0.0);
  std::cout << "\nNearest squared distance (weighted):   "
            << weighted.nearestNeighbour(query, *metric) << std::endl;
  std::cout << "Nearest squared distance (unweighted): "
            << unweighted.nearestNeighbour(query, *metric) << std::endl;

  return 0;
}
