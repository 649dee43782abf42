// Copyright (c) 2025 Bryan Kressler
//
// SPDX-License-Identifier: BSD-3-Clause

// bfs_order.ipp - Implementation details for bfs_order containers
// This file is included at the end of bfs_order.hpp
// DO NOT include this file directly

namespace kressler::complete_tree::bfs_order {

template <typename T>
visit_result<T&, visitor<T>> visitor<T>::next() && {
  T& item = base_[index_];
  if (depth_ + 1 == height_) {
    return {item, std::nullopt};
  }
  // Both children share base_. Their indices differ from each other and from
  // index_, and this visitor is consumed here (see the class comment).
  const std::size_t left = 2 * index_ + 1;
  const std::size_t right = 2 * index_ + 2;
  return {item, std::pair<visitor, visitor>{
                    visitor(base_, left, depth_ + 1, height_),
                    visitor(base_, right, depth_ + 1, height_)}};
}

template <typename T>
complete_tree_container<T>::complete_tree_container(std::vector<T> nodes)
    : nodes_(std::move(nodes)),
      height_(validate_complete_tree_size(nodes_.size())) {}

template <typename T>
template <typename Generator>
complete_tree_container<T> complete_tree_container<T>::from_generator(
    size_type height, Generator&& gen) {
  const size_type num_nodes = validate_height(height);
  std::vector<T> nodes;
  nodes.reserve(num_nodes);
  for (size_type i = 0; i < num_nodes; ++i) {
    nodes.push_back(gen());
  }
  return complete_tree_container(std::move(nodes));
}

template <typename T>
template <typename F>
void complete_tree_container<T>::bfs(F&& func) const {
  for (const T& node : nodes_) {
    func(node);
  }
}

template <typename T>
template <typename F>
void complete_tree_container<T>::bfs_mut(F&& func) {
  for (T& node : nodes_) {
    func(node);
  }
}

}  // namespace kressler::complete_tree::bfs_order
