// Copyright (c) 2025 Bryan Kressler
//
// SPDX-License-Identifier: BSD-3-Clause

// visitor.ipp - Implementation details for visitor_interface
// This file is included at the end of visitor.hpp
// DO NOT include this file directly

namespace kressler::complete_tree {

namespace detail {

template <typename V, typename F>
void dfs_preorder_impl(V visitor, F& func) {
  auto [item, children] = std::move(visitor).next();
  func(std::forward<decltype(item)>(item));
  if (children) {
    dfs_preorder_impl(std::move(children->first), func);
    dfs_preorder_impl(std::move(children->second), func);
  }
}

template <typename V, typename F>
void dfs_inorder_impl(V visitor, F& func) {
  auto [item, children] = std::move(visitor).next();
  if (children) {
    dfs_inorder_impl(std::move(children->first), func);
    func(std::forward<decltype(item)>(item));
    dfs_inorder_impl(std::move(children->second), func);
  } else {
    func(std::forward<decltype(item)>(item));
  }
}

template <typename V, typename F>
void dfs_postorder_impl(V visitor, F& func) {
  auto [item, children] = std::move(visitor).next();
  if (children) {
    dfs_postorder_impl(std::move(children->first), func);
    dfs_postorder_impl(std::move(children->second), func);
  }
  func(std::forward<decltype(item)>(item));
}

}  // namespace detail

// ============================================================================
// Recursive walks
// ============================================================================

template <typename Derived>
template <typename F>
void visitor_interface<Derived>::dfs_preorder(F&& func) && {
  detail::dfs_preorder_impl(self(), func);
}

template <typename Derived>
template <typename F>
void visitor_interface<Derived>::dfs_inorder(F&& func) && {
  detail::dfs_inorder_impl(self(), func);
}

template <typename Derived>
template <typename F>
void visitor_interface<Derived>::dfs_postorder(F&& func) && {
  detail::dfs_postorder_impl(self(), func);
}

// ============================================================================
// Pull ranges
// ============================================================================

template <typename Derived>
dfs_preorder_range<Derived> visitor_interface<Derived>::dfs_preorder_iter() && {
  return dfs_preorder_range<Derived>(self());
}

template <typename Derived>
dfs_inorder_range<Derived> visitor_interface<Derived>::dfs_inorder_iter() && {
  return dfs_inorder_range<Derived>(self());
}

template <typename Derived>
bfs_range<Derived> visitor_interface<Derived>::bfs_iter() && {
  return bfs_range<Derived>(self());
}

// ============================================================================
// Adapters
// ============================================================================

template <typename Derived>
template <Visitor Other>
zip_visitor<Derived, Other> visitor_interface<Derived>::zip(Other other) && {
  return zip_visitor<Derived, Other>(self(), std::move(other));
}

template <typename Derived>
template <typename F>
map_visitor<Derived, std::decay_t<F>> visitor_interface<Derived>::map(
    F&& func) && {
  return map_visitor<Derived, std::decay_t<F>>(self(),
                                               std::forward<F>(func));
}

template <typename Derived>
depth_visitor<Derived> visitor_interface<Derived>::with_depth(
    std::size_t start) && {
  return depth_visitor<Derived>(self(), start);
}

template <typename Derived>
flip_visitor<Derived> visitor_interface<Derived>::flip() && {
  return flip_visitor<Derived>(self());
}

template <typename Derived>
take_visitor<Derived> visitor_interface<Derived>::take(std::size_t levels) && {
  return take_visitor<Derived>(self(), levels);
}

}  // namespace kressler::complete_tree
