// Copyright (c) 2025 Bryan Kressler
//
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include <cstddef>
#include <optional>
#include <span>
#include <type_traits>
#include <utility>
#include <vector>

#include "tree_size.hpp"
#include "visitor.hpp"

namespace kressler::complete_tree::bfs_order {

template <typename T>
class complete_tree_container;

/**
 * Visitor over a tree stored in breadth-first order.
 *
 * Holds the base of the node buffer plus the current node's flat index; the
 * children of node i are at 2i + 1 and 2i + 2. T may be const-qualified for a
 * read-only walk.
 *
 * ## Aliasing
 *
 * Two sibling visitors produced by a mutable split both hold the same base
 * pointer, and each hands out a T& into the same buffer. This is sound
 * because of the following invariant:
 *
 * - A container hands out at most one root visitor (index 0) per borrow.
 * - next() consumes its visitor, so a visitor at index i is replaced by
 *   visitors at 2i + 1 and 2i + 2 and is never used again.
 * - Every index is reachable from 0 by exactly one sequence of left/right
 *   steps, so no two live visitors ever hold the same index, and the set of
 *   indices reachable from a visitor (its subtree) is disjoint from that of
 *   any other live visitor.
 *
 * Hence the two children of a split (and every visitor derived from either)
 * touch disjoint slots and may be used concurrently from different threads
 * without synchronization. The invariant holds only while the container's
 * buffer is neither resized nor accessed through other paths.
 */
template <typename T>
class visitor : public visitor_interface<visitor<T>> {
 public:
  using item_type = T&;

  static constexpr bool is_exact_depth = true;

  visitor(const visitor&) = delete;
  visitor& operator=(const visitor&) = delete;
  visitor(visitor&&) noexcept = default;
  visitor& operator=(visitor&&) noexcept = default;

  /**
   * Yields the current node, and its two children unless it is a leaf.
   * Leaf iff depth == height - 1.
   */
  visit_result<T&, visitor> next() &&;

  /**
   * Levels left including this one (always exact).
   */
  level_hint level_remaining_hint() const {
    const std::size_t levels = height_ - depth_;
    return {levels, levels};
  }

  /**
   * A second visitor over the same subtree. This visitor must not be used
   * while the returned one (or anything derived from it) is still alive.
   */
  visitor borrow() & { return visitor(base_, index_, depth_, height_); }

  [[nodiscard]] std::size_t index() const { return index_; }
  [[nodiscard]] std::size_t depth() const { return depth_; }

 private:
  template <typename U>
  friend class complete_tree_container;

  visitor(T* base, std::size_t index, std::size_t depth, std::size_t height)
      : base_(base), index_(index), depth_(depth), height_(height) {}

  T* base_;
  std::size_t index_;
  std::size_t depth_;
  std::size_t height_;
};

/**
 * A complete binary tree stored as one std::vector in breadth-first order.
 *
 * The tree always holds 2^h - 1 nodes for height h >= 1. The size is checked
 * once at construction; the container never grows or shrinks.
 *
 * @tparam T Node type
 *
 * Example:
 * @code
 * //       0
 * //   1       2
 * // 3   4   5   6
 * complete_tree_container<int> tree({0, 1, 2, 3, 4, 5, 6});
 * auto [root, children] = tree.root_visitor_mut().next();
 * auto& [left, right] = *children;
 * // left and right may now be handed to two different threads
 * @endcode
 */
template <typename T>
class complete_tree_container {
 public:
  using value_type = T;
  using size_type = std::size_t;

  /**
   * Wraps a buffer already laid out in breadth-first order.
   *
   * @throws not_complete_tree_size if nodes.size() + 1 is not a power of two
   */
  explicit complete_tree_container(std::vector<T> nodes);

  /**
   * Builds a tree of the given height, calling gen() once per node in
   * breadth-first order.
   *
   * @throws not_complete_tree_size if height is 0 or too large
   */
  template <typename Generator>
  static complete_tree_container from_generator(size_type height,
                                                Generator&& gen);

  [[nodiscard]] size_type height() const { return height_; }
  [[nodiscard]] size_type size() const { return nodes_.size(); }

  /**
   * The nodes in storage (breadth-first) order.
   */
  std::span<const T> nodes() const { return nodes_; }

  std::vector<T> into_nodes() && { return std::move(nodes_); }

  /**
   * Visits every node in breadth-first order. Since that is the storage
   * order this is a flat loop.
   */
  template <typename F>
  void bfs(F&& func) const;

  template <typename F>
  void bfs_mut(F&& func);

  visitor<const T> root_visitor() const {
    return visitor<const T>(nodes_.data(), 0, 0, height_);
  }

  visitor<T> root_visitor_mut() {
    return visitor<T>(nodes_.data(), 0, 0, height_);
  }

 private:
  std::vector<T> nodes_;
  size_type height_;
};

}  // namespace kressler::complete_tree::bfs_order

#include "bfs_order.ipp"
