// Copyright (c) 2025 Bryan Kressler
//
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include <concepts>
#include <cstddef>
#include <optional>
#include <span>
#include <type_traits>
#include <utility>
#include <vector>

#include "tree_size.hpp"
#include "visitor.hpp"

namespace kressler::complete_tree::dfs_order {

/**
 * A contiguous subtree split into its root and its two child subtrees.
 */
template <typename T>
struct span_split {
  T& current;
  std::span<T> left;
  std::span<T> right;
};

/**
 * Root first, then the left subtree, then the right subtree.
 */
struct pre_order {
  template <typename T>
  static span_split<T> split(std::span<T> span) {
    const std::size_t half = (span.size() - 1) / 2;
    std::span<T> rest = span.subspan(1);
    return {span.front(), rest.first(half), rest.subspan(half)};
  }
};

/**
 * Left subtree, root, right subtree. Sorted input gives a search tree.
 */
struct in_order {
  template <typename T>
  static span_split<T> split(std::span<T> span) {
    const std::size_t mid = span.size() / 2;
    return {span[mid], span.first(mid), span.subspan(mid + 1)};
  }
};

/**
 * Left subtree, right subtree, then the root.
 */
struct post_order {
  template <typename T>
  static span_split<T> split(std::span<T> span) {
    const std::size_t half = (span.size() - 1) / 2;
    std::span<T> rest = span.first(span.size() - 1);
    return {span.back(), rest.first(half), rest.subspan(half)};
  }
};

// Concept for the zero-sized tags that place a node within its subtree's span
template <typename Order>
concept OrderPolicy =
    std::is_empty_v<Order> && std::default_initializable<Order> &&
    requires(std::span<int> span) {
      { Order::split(span) } -> std::same_as<span_split<int>>;
    };

template <typename T, OrderPolicy Order>
class complete_tree_container;

/**
 * Visitor over a tree stored in depth-first order.
 *
 * The visitor owns a view of exactly its subtree's contiguous span. Splitting
 * cuts that span into three non-overlapping pieces with subspan(), so the two
 * children can never observe each other's nodes. Because a subtree is
 * contiguous, locality improves as a recursion descends.
 *
 * @tparam T Node type (const-qualified for a read-only walk)
 * @tparam Order pre_order, in_order or post_order
 */
template <typename T, OrderPolicy Order>
class visitor : public visitor_interface<visitor<T, Order>> {
 public:
  using item_type = T&;

  static constexpr bool is_exact_depth = true;

  visitor(const visitor&) = delete;
  visitor& operator=(const visitor&) = delete;
  visitor(visitor&&) noexcept = default;
  visitor& operator=(visitor&&) noexcept = default;

  /**
   * A span of length 1 is a leaf; otherwise it is split per Order.
   */
  visit_result<T&, visitor> next() && {
    if (remaining_.size() == 1) {
      return {remaining_.front(), std::nullopt};
    }
    auto [current, left, right] = Order::split(remaining_);
    return {current,
            std::pair<visitor, visitor>{visitor(left), visitor(right)}};
  }

  level_hint level_remaining_hint() const {
    const std::size_t levels = compute_height(remaining_.size());
    return {levels, levels};
  }

  /**
   * A second visitor over the same subtree. This visitor must not be used
   * while the returned one (or anything derived from it) is still alive.
   */
  visitor borrow() & { return visitor(remaining_); }

  /**
   * The subtree this visitor covers, in storage order.
   */
  std::span<T> remaining() const { return remaining_; }

 private:
  template <typename U, OrderPolicy O>
  friend class complete_tree_container;

  explicit visitor(std::span<T> remaining) : remaining_(remaining) {}

  std::span<T> remaining_;
};

/**
 * A complete binary tree stored as one std::vector in depth-first order, so
 * that every subtree occupies one contiguous run of the buffer.
 *
 * Prefer this over bfs_order for divide-and-conquer work: deep in the
 * recursion a subtree's nodes are adjacent, whereas in breadth-first order the
 * children of deep nodes are far apart.
 *
 * @tparam T Node type
 * @tparam Order Where a node sits relative to its subtrees (defaults to
 *         in_order)
 */
template <typename T, OrderPolicy Order = in_order>
class complete_tree_container {
 public:
  using value_type = T;
  using size_type = std::size_t;
  using order_type = Order;

  /**
   * Wraps a buffer already laid out in Order.
   *
   * @throws not_complete_tree_size if nodes.size() + 1 is not a power of two
   */
  explicit complete_tree_container(std::vector<T> nodes, Order order = {});

  /**
   * Builds a tree of the given height, calling gen() once per node in
   * storage order.
   *
   * @throws not_complete_tree_size if height is 0 or too large
   */
  template <typename Generator>
  static complete_tree_container from_generator(size_type height,
                                                Generator&& gen);

  [[nodiscard]] size_type height() const { return height_; }
  [[nodiscard]] size_type size() const { return nodes_.size(); }

  /**
   * The nodes in storage order.
   */
  std::span<const T> nodes() const { return nodes_; }

  /**
   * Mutable view of the nodes in storage order, for flat loops that do not
   * need the tree structure.
   */
  std::span<T> nodes_mut() { return nodes_; }

  std::vector<T> into_nodes() && { return std::move(nodes_); }

  visitor<const T, Order> root_visitor() const {
    return visitor<const T, Order>(std::span<const T>(nodes_));
  }

  visitor<T, Order> root_visitor_mut() {
    return visitor<T, Order>(std::span<T>(nodes_));
  }

 private:
  std::vector<T> nodes_;
  size_type height_;
  [[no_unique_address]] Order order_;
};

template <typename T, OrderPolicy Order>
complete_tree_container(std::vector<T>, Order)
    -> complete_tree_container<T, Order>;

/**
 * Convenience factories naming the layout of an existing buffer.
 *
 * @throws not_complete_tree_size if nodes.size() + 1 is not a power of two
 */
template <typename T>
complete_tree_container<T, pre_order> from_preorder(std::vector<T> nodes) {
  return complete_tree_container<T, pre_order>(std::move(nodes));
}

template <typename T>
complete_tree_container<T, in_order> from_inorder(std::vector<T> nodes) {
  return complete_tree_container<T, in_order>(std::move(nodes));
}

template <typename T>
complete_tree_container<T, post_order> from_postorder(std::vector<T> nodes) {
  return complete_tree_container<T, post_order>(std::move(nodes));
}

}  // namespace kressler::complete_tree::dfs_order

#include "dfs_order.ipp"
