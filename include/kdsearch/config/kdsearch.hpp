// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#ifndef KDSEARCH_CONFIG_KDSEARCH_HPP
#define KDSEARCH_CONFIG_KDSEARCH_HPP

#include <string>

namespace YAML {
class Node;
}

#include "kdsearch/config/tree.hpp"

namespace kdsearch {

/// Index configuration.
struct Config {
  int dimensions = 2;
  config::Tree tree;
};

Config parseConfig(const YAML::Node& root);
Config loadConfig(const std::string& path);

}  // namespace kdsearch

#endif  // KDSEARCH_CONFIG_KDSEARCH_HPP
