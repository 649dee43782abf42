// Copyright (c) 2025 Bryan Kressler
//
// SPDX-License-Identifier: BSD-3-Clause

#include <catch2/catch_template_test_macros.hpp>
#include <catch2/catch_test_macros.hpp>
#include <complete_tree/dfs_order.hpp>
#include <numeric>
#include <span>
#include <vector>

using namespace kressler::complete_tree;
using namespace kressler::complete_tree::dfs_order;

static_assert(OrderPolicy<pre_order>);
static_assert(OrderPolicy<in_order>);
static_assert(OrderPolicy<post_order>);
static_assert(ExactDepthVisitor<dfs_order::visitor<int, in_order>>);
static_assert(ExactDepthVisitor<dfs_order::visitor<const int, post_order>>);
static_assert(sizeof(dfs_order::visitor<int, pre_order>) ==
              sizeof(std::span<int>));

namespace {

std::vector<int> iota_vector(std::size_t n) {
  std::vector<int> result(n);
  std::iota(result.begin(), result.end(), 0);
  return result;
}

}  // namespace

TEST_CASE("Order policies split a span into root and halves",
          "[dfs_order][policy]") {
  std::vector<int> values = iota_vector(7);
  std::span<int> span(values);

  SECTION("in_order puts the root in the middle") {
    auto split = in_order::split(span);
    REQUIRE(split.current == 3);
    REQUIRE(split.left.size() == 3);
    REQUIRE(split.left.front() == 0);
    REQUIRE(split.right.size() == 3);
    REQUIRE(split.right.front() == 4);
  }

  SECTION("pre_order puts the root first") {
    auto split = pre_order::split(span);
    REQUIRE(split.current == 0);
    REQUIRE(split.left.front() == 1);
    REQUIRE(split.left.size() == 3);
    REQUIRE(split.right.front() == 4);
    REQUIRE(split.right.size() == 3);
  }

  SECTION("post_order puts the root last") {
    auto split = post_order::split(span);
    REQUIRE(split.current == 6);
    REQUIRE(split.left.front() == 0);
    REQUIRE(split.left.size() == 3);
    REQUIRE(split.right.front() == 3);
    REQUIRE(split.right.size() == 3);
  }

  SECTION("The three pieces never overlap") {
    auto split = in_order::split(span);
    REQUIRE(split.left.data() + split.left.size() == &split.current);
    REQUIRE(&split.current + 1 == split.right.data());
  }
}

TEST_CASE("dfs_order construction", "[dfs_order][constructor]") {
  SECTION("From a buffer") {
    complete_tree_container<int> tree(iota_vector(7));
    REQUIRE(tree.height() == 3);
    REQUIRE(tree.size() == 7);
  }

  SECTION("Invalid buffer sizes throw") {
    for (std::size_t length : {0, 2, 6, 8}) {
      REQUIRE_THROWS_AS(complete_tree_container<int>(std::vector<int>(length)),
                        not_complete_tree_size);
      REQUIRE_THROWS_AS(from_preorder(std::vector<int>(length)),
                        not_complete_tree_size);
      REQUIRE_THROWS_AS(from_postorder(std::vector<int>(length)),
                        not_complete_tree_size);
    }
  }

  SECTION("From a generator in storage order") {
    int counter = 0;
    auto tree = complete_tree_container<int, post_order>::from_generator(
        5, [&counter] { return counter++; });
    REQUIRE(tree.size() == 31);
    REQUIRE(tree.height() == 5);
    REQUIRE(std::vector<int>(tree.nodes().begin(), tree.nodes().end()) ==
            iota_vector(31));
  }

  SECTION("Generator height 0 throws") {
    REQUIRE_THROWS_AS(
        complete_tree_container<int>::from_generator(0, [] { return 0; }),
        not_complete_tree_size);
  }

  SECTION("Factories and deduction pick the order") {
    auto pre = from_preorder(iota_vector(3));
    STATIC_REQUIRE(std::is_same_v<decltype(pre)::order_type, pre_order>);
    auto in = from_inorder(iota_vector(3));
    STATIC_REQUIRE(std::is_same_v<decltype(in)::order_type, in_order>);
    complete_tree_container deduced(iota_vector(3), post_order{});
    STATIC_REQUIRE(
        std::is_same_v<decltype(deduced)::order_type, post_order>);
  }
}

TEST_CASE("dfs_order in-order layout traversals", "[dfs_order][traversal]") {
  //       3
  //   1       5
  // 0   2   4   6
  auto tree = from_inorder(iota_vector(7));

  SECTION("In-order iteration reproduces storage") {
    std::vector<int> result;
    for (const int& value : tree.root_visitor().dfs_inorder_iter()) {
      result.push_back(value);
    }
    REQUIRE(result == iota_vector(7));
  }

  SECTION("Preorder iteration") {
    std::vector<int> result;
    for (int& value : tree.root_visitor_mut().dfs_preorder_iter()) {
      result.push_back(value);
    }
    REQUIRE(result == std::vector<int>{3, 1, 0, 2, 5, 4, 6});
  }

  SECTION("Preorder recursion") {
    std::vector<int> result;
    tree.root_visitor().dfs_preorder([&](const int& a) { result.push_back(a); });
    REQUIRE(result == std::vector<int>{3, 1, 0, 2, 5, 4, 6});
  }

  SECTION("Breadth-first iteration") {
    std::vector<int> result;
    for (const int& value : tree.root_visitor().bfs_iter()) {
      result.push_back(value);
    }
    REQUIRE(result == std::vector<int>{3, 1, 5, 0, 2, 4, 6});
  }

  SECTION("Root level hint") {
    REQUIRE(tree.root_visitor().level_remaining_hint() == level_hint{3, 3});
  }
}

TEST_CASE("dfs_order in-order iteration preserves arbitrary storage",
          "[dfs_order][traversal]") {
  complete_tree_container<int> tree(std::vector<int>{3, 1, 2, 0, 4, 5, 6});

  std::vector<int> iterated;
  for (int& value : tree.root_visitor_mut().dfs_inorder_iter()) {
    iterated.push_back(value);
  }
  REQUIRE(iterated == std::vector<int>{3, 1, 2, 0, 4, 5, 6});

  std::vector<int> recursed;
  tree.root_visitor_mut().dfs_inorder([&](int& a) { recursed.push_back(a); });
  REQUIRE(recursed == iterated);
}

TEST_CASE("dfs_order pre-order layout", "[dfs_order][traversal]") {
  //       0
  //   1       4
  // 2   3   5   6
  auto tree = from_preorder(iota_vector(7));

  std::vector<int> preorder;
  tree.root_visitor().dfs_preorder([&](const int& a) { preorder.push_back(a); });
  REQUIRE(preorder == iota_vector(7));

  std::vector<int> inorder;
  tree.root_visitor().dfs_inorder([&](const int& a) { inorder.push_back(a); });
  REQUIRE(inorder == std::vector<int>{2, 1, 3, 0, 5, 4, 6});

  std::vector<int> bfs;
  for (const int& value : tree.root_visitor().bfs_iter()) {
    bfs.push_back(value);
  }
  REQUIRE(bfs == std::vector<int>{0, 1, 4, 2, 3, 5, 6});
}

TEST_CASE("dfs_order post-order layout", "[dfs_order][traversal]") {
  //       6
  //   2       5
  // 0   1   3   4
  auto tree = from_postorder(iota_vector(7));

  std::vector<int> postorder;
  tree.root_visitor().dfs_postorder(
      [&](const int& a) { postorder.push_back(a); });
  REQUIRE(postorder == iota_vector(7));

  std::vector<int> preorder;
  for (const int& value : tree.root_visitor().dfs_preorder_iter()) {
    preorder.push_back(value);
  }
  REQUIRE(preorder == std::vector<int>{6, 2, 0, 1, 5, 3, 4});
}

struct PreOrderLayout {
  using order = pre_order;
};
struct InOrderLayout {
  using order = in_order;
};
struct PostOrderLayout {
  using order = post_order;
};

TEMPLATE_TEST_CASE("dfs_order subtrees are contiguous spans",
                   "[dfs_order][visitor]", PreOrderLayout, InOrderLayout,
                   PostOrderLayout) {
  using Order = typename TestType::order;
  auto tree =
      complete_tree_container<int, Order>::from_generator(4, [] { return 0; });

  auto [root, children] = tree.root_visitor_mut().next();
  auto& [left, right] = *children;

  REQUIRE(left.remaining().size() == 7);
  REQUIRE(right.remaining().size() == 7);
  REQUIRE((left.level_remaining_hint() == level_hint{3, 3}));

  // The root and the two child spans partition the buffer
  const int* begin = tree.nodes().data();
  const int* end = begin + tree.size();
  const int* left_begin = left.remaining().data();
  const int* right_begin = right.remaining().data();
  REQUIRE(left_begin + 7 <= right_begin);
  REQUIRE(left_begin >= begin);
  REQUIRE(right_begin + 7 <= end);
  REQUIRE((&root < left_begin || &root >= left_begin + 7));
  REQUIRE((&root < right_begin || &root >= right_begin + 7));
}

TEMPLATE_TEST_CASE("dfs_order leaves are single-element spans",
                   "[dfs_order][visitor]", PreOrderLayout, InOrderLayout,
                   PostOrderLayout) {
  using Order = typename TestType::order;
  complete_tree_container<int, Order> tree(std::vector<int>{42});

  auto root = tree.root_visitor();
  REQUIRE((root.level_remaining_hint() == level_hint{1, 1}));
  auto [item, children] = std::move(root).next();
  REQUIRE(item == 42);
  REQUIRE_FALSE(children.has_value());
}

TEST_CASE("dfs_order borrow walks a subtree twice", "[dfs_order][visitor]") {
  auto tree = from_inorder(iota_vector(7));

  auto root = tree.root_visitor_mut();
  root.borrow().dfs_inorder([](int& a) { a += 100; });

  std::vector<int> result;
  for (int& value : std::move(root).dfs_inorder_iter()) {
    result.push_back(value);
  }
  REQUIRE(result == std::vector<int>{100, 101, 102, 103, 104, 105, 106});
}

TEST_CASE("dfs_order nodes_mut writes in storage order", "[dfs_order]") {
  //       3
  //   1       5
  // 0   2   4   6
  auto tree = from_inorder(std::vector<int>(7, 0));

  int next = 0;
  for (int& node : tree.nodes_mut()) {
    node = next++;
  }
  REQUIRE(tree.nodes_mut().size() == tree.size());

  std::vector<int> preorder;
  tree.root_visitor().dfs_preorder([&](const int& a) { preorder.push_back(a); });
  REQUIRE(preorder == std::vector<int>{3, 1, 0, 2, 5, 4, 6});
}
