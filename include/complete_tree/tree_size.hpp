// Copyright (c) 2025 Bryan Kressler
//
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include <bit>
#include <cstddef>
#include <limits>
#include <stdexcept>
#include <string>

namespace kressler::complete_tree {

/**
 * Thrown when a buffer or height cannot describe a complete binary tree.
 *
 * This is the only error the library reports: every traversal step is total
 * once a container has been built, so construction is the single place a
 * caller has to handle failure.
 */
class not_complete_tree_size : public std::invalid_argument {
 public:
  explicit not_complete_tree_size(std::size_t length)
      : std::invalid_argument("Length " + std::to_string(length) +
                              " is not the size of a complete binary tree "
                              "(length + 1 must be a power of two)"),
        length_(length) {}

  not_complete_tree_size(std::size_t length, const std::string& what)
      : std::invalid_argument(what), length_(length) {}

  /**
   * The rejected node count.
   */
  [[nodiscard]] std::size_t length() const { return length_; }

 private:
  std::size_t length_;
};

/**
 * Number of nodes in a complete binary tree of the given height.
 * Caller is responsible for height < bit width of size_t.
 */
constexpr std::size_t compute_num_nodes(std::size_t height) {
  return (static_cast<std::size_t>(1) << height) - 1;
}

/**
 * Height of a complete binary tree with num_nodes nodes.
 * Exact only when is_complete_tree_size(num_nodes).
 */
constexpr std::size_t compute_height(std::size_t num_nodes) {
  return static_cast<std::size_t>(std::bit_width(num_nodes));
}

/**
 * True iff length > 0 and length + 1 is a power of two.
 *
 * SIZE_MAX itself is a complete size (2^64 - 1) but can never be allocated,
 * so the overflowing length + 1 is treated as rejected.
 */
constexpr bool is_complete_tree_size(std::size_t length) {
  if (length == 0 || length == std::numeric_limits<std::size_t>::max()) {
    return false;
  }
  return std::has_single_bit(length + 1);
}

/**
 * Validates a buffer length and returns the height it implies.
 *
 * @throws not_complete_tree_size if the length is not 2^h - 1 for h >= 1
 */
inline std::size_t validate_complete_tree_size(std::size_t length) {
  if (!is_complete_tree_size(length)) {
    throw not_complete_tree_size(length);
  }
  return compute_height(length);
}

/**
 * Validates a height for generator-based construction and returns the node
 * count it implies.
 *
 * @throws not_complete_tree_size if height is 0 or 2^height - 1 overflows
 */
inline std::size_t validate_height(std::size_t height) {
  if (height == 0) {
    throw not_complete_tree_size(0, "Height must be at least 1");
  }
  if (height >= std::numeric_limits<std::size_t>::digits) {
    throw not_complete_tree_size(
        0, "Height " + std::to_string(height) + " overflows the node count");
  }
  return compute_num_nodes(height);
}

}  // namespace kressler::complete_tree
