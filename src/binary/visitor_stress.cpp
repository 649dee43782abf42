// Copyright (c) 2025 Bryan Kressler
//
// SPDX-License-Identifier: BSD-3-Clause

#include <chrono>
#include <complete_tree/bfs_order.hpp>
#include <complete_tree/dfs_order.hpp>
#include <complete_tree/tree_timer.hpp>
#include <complete_tree/visitor.hpp>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <lyra/lyra.hpp>
#include <print>
#include <random>
#include <string>
#include <thread>
#include <vector>

using namespace kressler::complete_tree;

namespace {

// Breadth-first indices of a complete tree of n nodes, in each depth-first
// order, computed directly from the 2i + 1 / 2i + 2 rule.
struct reference_orders {
  std::vector<std::size_t> preorder;
  std::vector<std::size_t> inorder;
  std::vector<std::size_t> postorder;

  explicit reference_orders(std::size_t n) { walk(0, n); }

 private:
  void walk(std::size_t index, std::size_t n) {
    if (index >= n) {
      return;
    }
    preorder.push_back(index);
    walk(2 * index + 1, n);
    inorder.push_back(index);
    walk(2 * index + 2, n);
    postorder.push_back(index);
  }
};

std::vector<int> permute(const std::vector<int>& bfs_values,
                         const std::vector<std::size_t>& order) {
  std::vector<int> result;
  result.reserve(order.size());
  for (std::size_t index : order) {
    result.push_back(bfs_values[index]);
  }
  return result;
}

struct expected_traversals {
  std::vector<int> preorder;
  std::vector<int> inorder;
  std::vector<int> postorder;
  std::vector<int> bfs;
};

template <typename Container>
bool check_tree(const Container& tree, const expected_traversals& expected,
                const std::string& name) {
  bool ok = true;
  auto report = [&](const char* traversal, const std::vector<int>& actual,
                    const std::vector<int>& wanted) {
    if (actual != wanted) {
      std::cerr << name << ": " << traversal << " mismatch" << std::endl;
      ok = false;
    }
  };

  std::vector<int> actual;
  tree.root_visitor().dfs_preorder([&](const int& a) { actual.push_back(a); });
  report("dfs_preorder", actual, expected.preorder);

  actual.clear();
  tree.root_visitor().dfs_inorder([&](const int& a) { actual.push_back(a); });
  report("dfs_inorder", actual, expected.inorder);

  actual.clear();
  tree.root_visitor().dfs_postorder([&](const int& a) { actual.push_back(a); });
  report("dfs_postorder", actual, expected.postorder);

  actual.clear();
  for (const int& a : tree.root_visitor().dfs_preorder_iter()) {
    actual.push_back(a);
  }
  report("dfs_preorder_iter", actual, expected.preorder);

  actual.clear();
  for (const int& a : tree.root_visitor().dfs_inorder_iter()) {
    actual.push_back(a);
  }
  report("dfs_inorder_iter", actual, expected.inorder);

  actual.clear();
  for (const int& a : tree.root_visitor().bfs_iter()) {
    actual.push_back(a);
  }
  report("bfs_iter", actual, expected.bfs);

  return ok;
}

// Adds delta to every node, splitting the first levels across threads.
template <Visitor V>
void parallel_add(V visitor, int delta, std::size_t fork_depth) {
  if (fork_depth == 0) {
    std::move(visitor).dfs_preorder([delta](int& a) { a += delta; });
    return;
  }
  auto [item, children] = std::move(visitor).next();
  item += delta;
  if (!children) {
    return;
  }
  std::thread right([&children, delta, fork_depth] {
    parallel_add(std::move(children->second), delta, fork_depth - 1);
  });
  parallel_add(std::move(children->first), delta, fork_depth - 1);
  right.join();
}

template <TreeTimer Timer, Visitor V>
typename Timer::bag_type timed_sum(Timer timer, V visitor, std::int64_t& sum) {
  timer.start();
  auto [item, children] = std::move(visitor).next();
  sum += item;
  if (!children) {
    return std::move(timer).leaf_finish();
  }
  auto [left_timer, right_timer] = std::move(timer).next();
  auto left = timed_sum(std::move(left_timer), std::move(children->first), sum);
  auto right =
      timed_sum(std::move(right_timer), std::move(children->second), sum);
  return Timer::combine(std::move(left), std::move(right));
}

}  // namespace

int main(int argc, char** argv) {
  bool show_help = false;
  bool show_timing = false;
  uint64_t seed = static_cast<uint64_t>(
      std::chrono::steady_clock::now().time_since_epoch().count());
  size_t target_iterations = 100;
  size_t min_height = 1;
  size_t max_height = 16;
  size_t fork_depth = 2;

  // Define command line interface
  auto cli =
      lyra::cli() | lyra::help(show_help) |
      lyra::opt(seed, "seed")["-d"]["--seed"](
          "Random seed (defaults to time since epoch)") |
      lyra::opt(target_iterations,
                "iterations")["-i"]["--iterations"]("Iterations to run") |
      lyra::opt(min_height, "min_height")["--min-height"]("Minimum tree height") |
      lyra::opt(max_height, "max_height")["--max-height"]("Maximum tree height") |
      lyra::opt(fork_depth, "fork_depth")["-f"]["--fork-depth"](
          "Levels to split across threads") |
      lyra::opt(show_timing)["-t"]["--timing"]("Print per-level timings");

  // Parse command line
  auto result = cli.parse({argc, argv});
  if (!result) {
    std::cerr << "Error in command line: " << result.message() << std::endl;
    exit(1);
  }

  // Show help if requested
  if (show_help) {
    std::cout << cli << std::endl;
    return 0;
  }

  if (min_height == 0 || min_height > max_height || max_height > 24) {
    std::cerr << "Heights must satisfy 1 <= min-height <= max-height <= 24"
              << std::endl;
    exit(1);
  }

  std::uniform_int_distribution<size_t> height_dist(min_height, max_height);
  for (size_t iter = 0; iter < target_iterations; ++iter) {
    std::mt19937 rng(iter + seed);
    std::uniform_int_distribution<int> value_dist(-1000000, 1000000);

    const size_t height = height_dist(rng);
    const size_t n = compute_num_nodes(height);
    std::cout << "Iteration " << iter << " using height " << height
              << ", seed " << iter + seed << std::endl;

    std::vector<int> bfs_values(n);
    for (int& value : bfs_values) {
      value = value_dist(rng);
    }

    const reference_orders orders(n);
    expected_traversals expected{permute(bfs_values, orders.preorder),
                                 permute(bfs_values, orders.inorder),
                                 permute(bfs_values, orders.postorder),
                                 bfs_values};

    bfs_order::complete_tree_container<int> bfs_tree(bfs_values);
    auto pre_tree = dfs_order::from_preorder(expected.preorder);
    auto in_tree = dfs_order::from_inorder(expected.inorder);
    auto post_tree = dfs_order::from_postorder(expected.postorder);

    bool ok = check_tree(bfs_tree, expected, "bfs_order");
    ok &= check_tree(pre_tree, expected, "dfs_order pre_order");
    ok &= check_tree(in_tree, expected, "dfs_order in_order");
    ok &= check_tree(post_tree, expected, "dfs_order post_order");

    // Structural equality across layouts through zip
    in_tree.root_visitor().zip(bfs_tree.root_visitor()).dfs_preorder(
        [&ok](std::pair<const int&, const int&> pair) {
          if (pair.first != pair.second) {
            ok = false;
          }
        });

    // Concurrent writes to disjoint subtrees
    parallel_add(bfs_tree.root_visitor_mut(), 1, fork_depth);
    parallel_add(in_tree.root_visitor_mut(), 1, fork_depth);
    for (auto& values : {&expected.preorder, &expected.inorder,
                         &expected.postorder, &expected.bfs}) {
      for (int& value : *values) {
        value += 1;
      }
    }
    ok &= check_tree(bfs_tree, expected, "bfs_order after parallel_add");
    ok &= check_tree(in_tree, expected, "dfs_order in_order after parallel_add");

    if (!ok) {
      std::cerr << "Mismatch at iteration " << iter << ", seed " << iter + seed
                << std::endl;
      exit(1);
    }

    if (show_timing) {
      std::int64_t bfs_sum = 0;
      auto bfs_bag =
          timed_sum(level_timer(height), bfs_tree.root_visitor(), bfs_sum);
      std::int64_t dfs_sum = 0;
      auto dfs_bag =
          timed_sum(level_timer(height), in_tree.root_visitor(), dfs_sum);
      if (bfs_sum != dfs_sum) {
        std::cerr << "Sum mismatch: " << bfs_sum << " vs " << dfs_sum
                  << std::endl;
        exit(1);
      }
      for (size_t level = 0; level < height; ++level) {
        std::println("  level {:2}: bfs_order {:10.6f}s  dfs_order {:10.6f}s",
                     level, bfs_bag.seconds_per_level()[level],
                     dfs_bag.seconds_per_level()[level]);
      }
    }
  }

  std::cout << "All " << target_iterations << " iterations passed" << std::endl;
  return 0;
}
