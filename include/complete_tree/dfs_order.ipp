// Copyright (c) 2025 Bryan Kressler
//
// SPDX-License-Identifier: BSD-3-Clause

// dfs_order.ipp - Implementation details for dfs_order containers
// This file is included at the end of dfs_order.hpp
// DO NOT include this file directly

namespace kressler::complete_tree::dfs_order {

template <typename T, OrderPolicy Order>
complete_tree_container<T, Order>::complete_tree_container(
    std::vector<T> nodes, Order order)
    : nodes_(std::move(nodes)),
      height_(validate_complete_tree_size(nodes_.size())),
      order_(order) {}

template <typename T, OrderPolicy Order>
template <typename Generator>
complete_tree_container<T, Order>
complete_tree_container<T, Order>::from_generator(size_type height,
                                                  Generator&& gen) {
  const size_type num_nodes = validate_height(height);
  std::vector<T> nodes;
  nodes.reserve(num_nodes);
  for (size_type i = 0; i < num_nodes; ++i) {
    nodes.push_back(gen());
  }
  return complete_tree_container(std::move(nodes));
}

}  // namespace kressler::complete_tree::dfs_order
