// Copyright (c) 2025 Bryan Kressler
//
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include <algorithm>
#include <cassert>
#include <concepts>
#include <cstddef>
#include <deque>
#include <functional>
#include <iterator>
#include <optional>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>

#include "tree_size.hpp"

namespace kressler::complete_tree {

/**
 * Estimate of the number of levels left below (and including) a visitor's
 * current node. max is empty when no upper bound is known.
 */
struct level_hint {
  std::size_t min{0};
  std::optional<std::size_t> max;

  friend bool operator==(const level_hint&, const level_hint&) = default;
};

/**
 * Bounds on the number of items a pull range has left to yield.
 */
struct size_bounds {
  std::size_t lower{0};
  std::optional<std::size_t> upper;

  friend bool operator==(const size_bounds&, const size_bounds&) = default;
};

/**
 * What a visitor produces when it is consumed: the current node's item and,
 * unless the node is a leaf, visitors for its left and right children.
 */
template <typename Item, typename V>
struct visit_result {
  Item item;
  std::optional<std::pair<V, V>> children;
};

/**
 * A single-use cursor over one node of a complete binary tree.
 *
 * next() is rvalue-qualified: calling std::move(v).next() hands the right to
 * act on the subtree over to the returned children, and v must not be used
 * again. The two children of one split never refer to the same storage.
 */
template <typename V>
concept Visitor = std::move_constructible<V> && requires(V v, const V& cv) {
  typename V::item_type;
  {
    std::move(v).next()
  } -> std::same_as<visit_result<typename V::item_type, V>>;
  { cv.level_remaining_hint() } -> std::same_as<level_hint>;
};

/**
 * A visitor whose level_remaining_hint() is always exact (min == max).
 * Pull ranges over such visitors can report an exact remaining size().
 */
template <typename V>
concept ExactDepthVisitor = Visitor<V> && V::is_exact_depth;

template <typename V>
class dfs_preorder_range;
template <typename V>
class dfs_inorder_range;
template <typename V>
class bfs_range;
template <typename A, typename B>
class zip_visitor;
template <typename V, typename F>
class map_visitor;
template <typename V>
class depth_visitor;
template <typename V>
class flip_visitor;
template <typename V>
class take_visitor;

/**
 * CRTP base providing every traversal and adapter in terms of the derived
 * visitor's next().
 *
 * Derived classes must declare item_type and next() &&, and should hide
 * level_remaining_hint() and is_exact_depth when they know their shape.
 * Every operation here consumes the visitor.
 *
 * Example:
 * @code
 * auto tree = bfs_order::complete_tree_container<int>::from_generator(
 *     4, [] { return 0; });
 * for (auto [depth, value] : tree.root_visitor_mut().with_depth(0).bfs_iter())
 * {
 *   value = static_cast<int>(depth);
 * }
 * @endcode
 */
template <typename Derived>
class visitor_interface {
 public:
  static constexpr bool is_exact_depth = false;

  /**
   * Uninformative default. Concrete layouts override with the exact value.
   */
  level_hint level_remaining_hint() const { return {}; }

  /**
   * Recursive walks. func is called once per node with the node's item.
   * Recursion depth is bounded by the tree height.
   */
  template <typename F>
  void dfs_preorder(F&& func) &&;

  template <typename F>
  void dfs_inorder(F&& func) &&;

  // Left subtree, right subtree, then the node itself.
  template <typename F>
  void dfs_postorder(F&& func) &&;

  /**
   * Pull ranges backed by an explicit stack or queue.
   */
  dfs_preorder_range<Derived> dfs_preorder_iter() &&;
  dfs_inorder_range<Derived> dfs_inorder_iter() &&;
  bfs_range<Derived> bfs_iter() &&;

  /**
   * Walks two visitors in lockstep, yielding pairs of items.
   * Both sides must have the same shape; see zip_visitor.
   */
  template <Visitor Other>
  zip_visitor<Derived, Other> zip(Other other) &&;

  /**
   * Transforms every item with func. func is copied into both children.
   */
  template <typename F>
  map_visitor<Derived, std::decay_t<F>> map(F&& func) &&;

  /**
   * Items become (depth, item) pairs, with the current node at start.
   */
  depth_visitor<Derived> with_depth(std::size_t start) &&;

  flip_visitor<Derived> flip() &&;

  /**
   * Descends at most levels further levels; take(0) yields only this node.
   */
  take_visitor<Derived> take(std::size_t levels) &&;

 private:
  Derived&& self() { return static_cast<Derived&&>(*this); }
};

// ============================================================================
// Adapters
// ============================================================================

/**
 * Visitor over two trees at once.
 *
 * Children are produced only while both sides have them, so if the shapes
 * differ the zipped tree is truncated to the common prefix. For exact-depth
 * inputs a level count mismatch is a precondition violation and is asserted
 * at construction.
 */
template <typename A, typename B>
class zip_visitor : public visitor_interface<zip_visitor<A, B>> {
 public:
  using item_type = std::pair<typename A::item_type, typename B::item_type>;

  static constexpr bool is_exact_depth =
      ExactDepthVisitor<A> && ExactDepthVisitor<B>;

  zip_visitor(A a, B b) : a_(std::move(a)), b_(std::move(b)) {
    assert((!is_exact_depth ||
            a_.level_remaining_hint() == b_.level_remaining_hint()) &&
           "Zipped visitors must have the same number of levels");
  }

  visit_result<item_type, zip_visitor> next() && {
    auto [a_item, a_children] = std::move(a_).next();
    auto [b_item, b_children] = std::move(b_).next();
    item_type item(std::forward<decltype(a_item)>(a_item),
                   std::forward<decltype(b_item)>(b_item));
    if (!a_children || !b_children) {
      return {std::forward<item_type>(item), std::nullopt};
    }
    return {std::forward<item_type>(item),
            std::pair<zip_visitor, zip_visitor>{
                zip_visitor(std::move(a_children->first),
                            std::move(b_children->first)),
                zip_visitor(std::move(a_children->second),
                            std::move(b_children->second))}};
  }

  level_hint level_remaining_hint() const {
    const level_hint a = a_.level_remaining_hint();
    const level_hint b = b_.level_remaining_hint();
    level_hint result{std::min(a.min, b.min), std::nullopt};
    if (a.max && b.max) {
      result.max = std::min(*a.max, *b.max);
    } else if (a.max) {
      result.max = a.max;
    } else {
      result.max = b.max;
    }
    return result;
  }

 private:
  A a_;
  B b_;
};

template <typename V, typename F>
class map_visitor : public visitor_interface<map_visitor<V, F>> {
 public:
  using item_type = std::invoke_result_t<F&, typename V::item_type>;

  static constexpr bool is_exact_depth = ExactDepthVisitor<V>;

  static_assert(std::copy_constructible<F>,
                "map() needs a copyable function: it is passed to both "
                "children");

  map_visitor(V inner, F func)
      : inner_(std::move(inner)), func_(std::move(func)) {}

  visit_result<item_type, map_visitor> next() && {
    auto [item, children] = std::move(inner_).next();
    item_type mapped = std::invoke(func_, std::forward<decltype(item)>(item));
    if (!children) {
      return {std::forward<item_type>(mapped), std::nullopt};
    }
    map_visitor left(std::move(children->first), func_);
    map_visitor right(std::move(children->second), std::move(func_));
    return {std::forward<item_type>(mapped),
            std::pair<map_visitor, map_visitor>{std::move(left),
                                                std::move(right)}};
  }

  level_hint level_remaining_hint() const {
    return inner_.level_remaining_hint();
  }

 private:
  V inner_;
  F func_;
};

template <typename V>
class depth_visitor : public visitor_interface<depth_visitor<V>> {
 public:
  using item_type = std::pair<std::size_t, typename V::item_type>;

  static constexpr bool is_exact_depth = ExactDepthVisitor<V>;

  depth_visitor(V inner, std::size_t depth)
      : inner_(std::move(inner)), depth_(depth) {}

  visit_result<item_type, depth_visitor> next() && {
    auto [item, children] = std::move(inner_).next();
    item_type tagged(depth_, std::forward<decltype(item)>(item));
    if (!children) {
      return {std::forward<item_type>(tagged), std::nullopt};
    }
    return {std::forward<item_type>(tagged),
            std::pair<depth_visitor, depth_visitor>{
                depth_visitor(std::move(children->first), depth_ + 1),
                depth_visitor(std::move(children->second), depth_ + 1)}};
  }

  level_hint level_remaining_hint() const {
    return inner_.level_remaining_hint();
  }

 private:
  V inner_;
  std::size_t depth_;
};

template <typename V>
class flip_visitor : public visitor_interface<flip_visitor<V>> {
 public:
  using item_type = typename V::item_type;

  static constexpr bool is_exact_depth = ExactDepthVisitor<V>;

  explicit flip_visitor(V inner) : inner_(std::move(inner)) {}

  visit_result<item_type, flip_visitor> next() && {
    auto [item, children] = std::move(inner_).next();
    if (!children) {
      return {std::forward<decltype(item)>(item), std::nullopt};
    }
    return {std::forward<decltype(item)>(item),
            std::pair<flip_visitor, flip_visitor>{
                flip_visitor(std::move(children->second)),
                flip_visitor(std::move(children->first))}};
  }

  level_hint level_remaining_hint() const {
    return inner_.level_remaining_hint();
  }

 private:
  V inner_;
};

template <typename V>
class take_visitor : public visitor_interface<take_visitor<V>> {
 public:
  using item_type = typename V::item_type;

  static constexpr bool is_exact_depth = ExactDepthVisitor<V>;

  take_visitor(V inner, std::size_t levels)
      : inner_(std::move(inner)), levels_(levels) {}

  visit_result<item_type, take_visitor> next() && {
    auto [item, children] = std::move(inner_).next();
    if (!children || levels_ == 0) {
      return {std::forward<decltype(item)>(item), std::nullopt};
    }
    return {std::forward<decltype(item)>(item),
            std::pair<take_visitor, take_visitor>{
                take_visitor(std::move(children->first), levels_ - 1),
                take_visitor(std::move(children->second), levels_ - 1)}};
  }

  level_hint level_remaining_hint() const {
    const level_hint inner = inner_.level_remaining_hint();
    const std::size_t cap = levels_ + 1;
    return {std::min(inner.min, cap),
            inner.max ? std::min(*inner.max, cap) : cap};
  }

 private:
  V inner_;
  std::size_t levels_;
};

// ============================================================================
// Pull ranges
// ============================================================================

namespace detail {

// Items may be references, so they are held in a one-element tuple and
// always replaced with emplace (tuple assignment would write through).
template <typename Item>
using item_slot = std::optional<std::tuple<Item>>;

template <typename V>
size_bounds subtree_size_bounds(const V& visitor) {
  const level_hint hint = visitor.level_remaining_hint();
  size_bounds result{compute_num_nodes(hint.min), std::nullopt};
  if (hint.max) {
    result.upper = compute_num_nodes(*hint.max);
  }
  return result;
}

inline void accumulate(size_bounds& total, const size_bounds& part) {
  total.lower += part.lower;
  if (total.upper && part.upper) {
    *total.upper += *part.upper;
  } else {
    total.upper.reset();
  }
}

/**
 * Input iterator shared by the pull ranges. Range must provide current(),
 * advance() and done().
 */
template <typename Range, typename Item>
class pull_iterator {
 public:
  using iterator_concept = std::input_iterator_tag;
  using difference_type = std::ptrdiff_t;
  using value_type = std::remove_cvref_t<Item>;
  using reference = Item&;

  pull_iterator() : range_(nullptr) {}
  explicit pull_iterator(Range* range) : range_(range) {}

  reference operator*() const {
    assert(range_ != nullptr && "Dereferencing end iterator");
    return range_->current();
  }

  pull_iterator& operator++() {
    assert(range_ != nullptr && "Incrementing end iterator");
    range_->advance();
    return *this;
  }

  void operator++(int) { ++(*this); }

  [[nodiscard]] bool at_end() const {
    return range_ == nullptr || range_->done();
  }

  friend bool operator==(const pull_iterator& it, std::default_sentinel_t) {
    return it.at_end();
  }

 private:
  Range* range_;
};

}  // namespace detail

/**
 * Depth-first preorder over a visitor using an explicit stack.
 *
 * The range is single-pass: begin() may be called once, and iterators refer
 * back into the range object, so it must outlive them.
 */
template <typename V>
class dfs_preorder_range {
 public:
  using item_type = typename V::item_type;
  using iterator = detail::pull_iterator<dfs_preorder_range, item_type>;

  explicit dfs_preorder_range(V root) {
    stack_.reserve(root.level_remaining_hint().min);
    stack_.push_back(std::move(root));
    advance();
  }

  iterator begin() { return iterator(this); }
  std::default_sentinel_t end() const { return {}; }

  /**
   * Bounds on the items not yet consumed, including the one at begin().
   */
  size_bounds size_hint() const {
    size_bounds total{current_ ? 1u : 0u, current_ ? 1u : 0u};
    for (const V& pending : stack_) {
      detail::accumulate(total, detail::subtree_size_bounds(pending));
    }
    return total;
  }

  std::size_t size() const
    requires ExactDepthVisitor<V>
  {
    return size_hint().lower;
  }

 private:
  friend iterator;

  item_type& current() { return std::get<0>(*current_); }
  bool done() const { return !current_.has_value(); }

  void advance() {
    if (stack_.empty()) {
      current_.reset();
      return;
    }
    V top = std::move(stack_.back());
    stack_.pop_back();
    auto [item, children] = std::move(top).next();
    if (children) {
      // Right first so the left child is popped next
      stack_.push_back(std::move(children->second));
      stack_.push_back(std::move(children->first));
    }
    current_.emplace(std::forward<decltype(item)>(item));
  }

  std::vector<V> stack_;
  detail::item_slot<item_type> current_;
};

/**
 * Depth-first in-order over a visitor using an explicit stack.
 *
 * Each stack entry is a node whose item is ready to be yielded together with
 * its not yet visited right subtree. Pushing a visitor walks down its left
 * spine so the top of the stack is always the next node in order.
 */
template <typename V>
class dfs_inorder_range {
 public:
  using item_type = typename V::item_type;
  using iterator = detail::pull_iterator<dfs_inorder_range, item_type>;

  explicit dfs_inorder_range(V root) {
    stack_.reserve(root.level_remaining_hint().min);
    push_left_spine(std::move(root));
    advance();
  }

  iterator begin() { return iterator(this); }
  std::default_sentinel_t end() const { return {}; }

  size_bounds size_hint() const {
    size_bounds total{current_ ? 1u : 0u, current_ ? 1u : 0u};
    for (const entry& pending : stack_) {
      detail::accumulate(total, size_bounds{1, 1});
      if (pending.right) {
        detail::accumulate(total, detail::subtree_size_bounds(*pending.right));
      }
    }
    return total;
  }

  std::size_t size() const
    requires ExactDepthVisitor<V>
  {
    return size_hint().lower;
  }

 private:
  friend iterator;

  struct entry {
    std::tuple<item_type> item;
    std::optional<V> right;
  };

  item_type& current() { return std::get<0>(*current_); }
  bool done() const { return !current_.has_value(); }

  void push_left_spine(V root) {
    std::optional<V> node(std::move(root));
    while (true) {
      auto [item, children] = std::move(*node).next();
      if (!children) {
        stack_.push_back(
            entry{std::tuple<item_type>(std::forward<decltype(item)>(item)),
                  std::nullopt});
        return;
      }
      stack_.push_back(
          entry{std::tuple<item_type>(std::forward<decltype(item)>(item)),
                std::optional<V>(std::move(children->second))});
      node.emplace(std::move(children->first));
    }
  }

  void advance() {
    if (stack_.empty()) {
      current_.reset();
      return;
    }
    entry top = std::move(stack_.back());
    stack_.pop_back();
    current_.emplace(std::move(top.item));
    if (top.right) {
      push_left_spine(std::move(*top.right));
    }
  }

  std::vector<entry> stack_;
  detail::item_slot<item_type> current_;
};

/**
 * Breadth-first (level order) traversal using a FIFO queue.
 */
template <typename V>
class bfs_range {
 public:
  using item_type = typename V::item_type;
  using iterator = detail::pull_iterator<bfs_range, item_type>;

  explicit bfs_range(V root) {
    queue_.push_back(std::move(root));
    advance();
  }

  iterator begin() { return iterator(this); }
  std::default_sentinel_t end() const { return {}; }

  size_bounds size_hint() const {
    size_bounds total{current_ ? 1u : 0u, current_ ? 1u : 0u};
    for (const V& pending : queue_) {
      detail::accumulate(total, detail::subtree_size_bounds(pending));
    }
    return total;
  }

  std::size_t size() const
    requires ExactDepthVisitor<V>
  {
    return size_hint().lower;
  }

 private:
  friend iterator;

  item_type& current() { return std::get<0>(*current_); }
  bool done() const { return !current_.has_value(); }

  void advance() {
    if (queue_.empty()) {
      current_.reset();
      return;
    }
    V front = std::move(queue_.front());
    queue_.pop_front();
    auto [item, children] = std::move(front).next();
    if (children) {
      queue_.push_back(std::move(children->first));
      queue_.push_back(std::move(children->second));
    }
    current_.emplace(std::forward<decltype(item)>(item));
  }

  std::deque<V> queue_;
  detail::item_slot<item_type> current_;
};

}  // namespace kressler::complete_tree

#include "visitor.ipp"
