// Copyright (c) 2025 Bryan Kressler
//
// SPDX-License-Identifier: BSD-3-Clause

#include <benchmark/benchmark.h>

#include <complete_tree/bfs_order.hpp>
#include <complete_tree/dfs_order.hpp>
#include <cstdint>

using namespace kressler::complete_tree;

namespace {

template <typename Container>
Container make_tree(std::size_t height) {
  std::uint64_t counter = 0;
  return Container::from_generator(height, [&counter] { return counter++; });
}

using bfs_tree = bfs_order::complete_tree_container<std::uint64_t>;
using dfs_in_tree =
    dfs_order::complete_tree_container<std::uint64_t, dfs_order::in_order>;
using dfs_pre_tree =
    dfs_order::complete_tree_container<std::uint64_t, dfs_order::pre_order>;

}  // namespace

// Pull-based preorder walk over the whole tree
template <typename Container>
static void BM_PreorderIter(benchmark::State& state) {
  auto tree = make_tree<Container>(static_cast<std::size_t>(state.range(0)));
  for (auto _ : state) {
    std::uint64_t sum = 0;
    for (const std::uint64_t& value : tree.root_visitor().dfs_preorder_iter()) {
      sum += value;
    }
    benchmark::DoNotOptimize(sum);
  }
  state.SetItemsProcessed(state.iterations() *
                          static_cast<int64_t>(tree.size()));
}
BENCHMARK(BM_PreorderIter<bfs_tree>)->DenseRange(10, 20, 5);
BENCHMARK(BM_PreorderIter<dfs_in_tree>)->DenseRange(10, 20, 5);
BENCHMARK(BM_PreorderIter<dfs_pre_tree>)->DenseRange(10, 20, 5);

// Recursive preorder walk
template <typename Container>
static void BM_PreorderRecursive(benchmark::State& state) {
  auto tree = make_tree<Container>(static_cast<std::size_t>(state.range(0)));
  for (auto _ : state) {
    std::uint64_t sum = 0;
    tree.root_visitor().dfs_preorder(
        [&sum](const std::uint64_t& value) { sum += value; });
    benchmark::DoNotOptimize(sum);
  }
  state.SetItemsProcessed(state.iterations() *
                          static_cast<int64_t>(tree.size()));
}
BENCHMARK(BM_PreorderRecursive<bfs_tree>)->DenseRange(10, 20, 5);
BENCHMARK(BM_PreorderRecursive<dfs_in_tree>)->DenseRange(10, 20, 5);
BENCHMARK(BM_PreorderRecursive<dfs_pre_tree>)->DenseRange(10, 20, 5);

// Breadth-first pull iteration
template <typename Container>
static void BM_BfsIter(benchmark::State& state) {
  auto tree = make_tree<Container>(static_cast<std::size_t>(state.range(0)));
  for (auto _ : state) {
    std::uint64_t sum = 0;
    for (const std::uint64_t& value : tree.root_visitor().bfs_iter()) {
      sum += value;
    }
    benchmark::DoNotOptimize(sum);
  }
  state.SetItemsProcessed(state.iterations() *
                          static_cast<int64_t>(tree.size()));
}
BENCHMARK(BM_BfsIter<bfs_tree>)->DenseRange(10, 20, 5);
BENCHMARK(BM_BfsIter<dfs_in_tree>)->DenseRange(10, 20, 5);

// Flat storage loop, for reference
static void BM_FlatLoop(benchmark::State& state) {
  auto tree = make_tree<bfs_tree>(static_cast<std::size_t>(state.range(0)));
  for (auto _ : state) {
    std::uint64_t sum = 0;
    tree.bfs([&sum](const std::uint64_t& value) { sum += value; });
    benchmark::DoNotOptimize(sum);
  }
  state.SetItemsProcessed(state.iterations() *
                          static_cast<int64_t>(tree.size()));
}
BENCHMARK(BM_FlatLoop)->DenseRange(10, 20, 5);

BENCHMARK_MAIN();
