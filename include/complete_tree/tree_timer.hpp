// Copyright (c) 2025 Bryan Kressler
//
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include <chrono>
#include <concepts>
#include <cstddef>
#include <optional>
#include <stdexcept>
#include <utility>
#include <vector>

namespace kressler::complete_tree {

/**
 * Per-level timing hooks for a caller's own recursive traversal.
 *
 * A recursion calls start() on entry, next() when it splits into two
 * branches (recording time spent at this level and producing one timer per
 * branch), leaf_finish() when it bottoms out, and combine() to merge the
 * records returned by the two branches. Timers never look at the tree.
 *
 * Example:
 * @code
 * template <TreeTimer Timer, Visitor V>
 * typename Timer::bag_type walk(Timer timer, V visitor) {
 *   timer.start();
 *   auto [item, children] = std::move(visitor).next();
 *   process(item);
 *   if (!children) {
 *     return std::move(timer).leaf_finish();
 *   }
 *   auto [left_timer, right_timer] = std::move(timer).next();
 *   return Timer::combine(walk(std::move(left_timer), std::move(children->first)),
 *                         walk(std::move(right_timer), std::move(children->second)));
 * }
 * @endcode
 */
template <typename Timer>
concept TreeTimer =
    std::move_constructible<Timer> &&
    requires(Timer timer, typename Timer::bag_type a,
             typename Timer::bag_type b) {
      { timer.start() };
      { std::move(timer).next() } -> std::same_as<std::pair<Timer, Timer>>;
      {
        std::move(timer).leaf_finish()
      } -> std::same_as<typename Timer::bag_type>;
      {
        Timer::combine(std::move(a), std::move(b))
      } -> std::same_as<typename Timer::bag_type>;
    };

/**
 * Timer that records nothing, for opting out at zero cost.
 */
class empty_tree_timer {
 public:
  struct bag_type {};

  void start() {}
  std::pair<empty_tree_timer, empty_tree_timer> next() && { return {}; }
  bag_type leaf_finish() && { return {}; }
  static bag_type combine(bag_type, bag_type) { return {}; }
};

/**
 * Accumulates wall time spent at each level of a recursion.
 *
 * The left branch of a split inherits the parent's record; the right branch
 * starts a fresh one. combine() adds records level by level, so the final
 * record holds the total time per level, root first.
 */
class level_timer {
 public:
  using clock = std::chrono::steady_clock;

  class bag_type {
   public:
    /**
     * Seconds spent per level, from the root level to the leaf level.
     */
    [[nodiscard]] const std::vector<double>& seconds_per_level() const {
      return seconds_;
    }

    [[nodiscard]] double total_seconds() const {
      double total = 0.0;
      for (double level : seconds_) {
        total += level;
      }
      return total;
    }

   private:
    friend class level_timer;

    explicit bag_type(std::vector<double> seconds)
        : seconds_(std::move(seconds)) {}

    std::vector<double> seconds_;
  };

  /**
   * @param height Number of levels to track (the tree's height)
   */
  explicit level_timer(std::size_t height)
      : seconds_(height, 0.0), level_(0) {}

  void start() { started_ = clock::now(); }

  /**
   * Charges the time since start() to the current level and returns timers
   * for the left and right branches one level down.
   *
   * @throws std::out_of_range if called at the last tracked level; the
   *         record is left unchanged
   */
  std::pair<level_timer, level_timer> next() && {
    const std::size_t child_level = level_ + 1;
    if (child_level >= seconds_.size()) {
      throw std::out_of_range("level_timer split below the last tracked level");
    }
    seconds_[level_] += elapsed();
    level_timer right(std::vector<double>(seconds_.size(), 0.0), child_level);
    level_timer left(std::move(seconds_), child_level);
    return {std::move(left), std::move(right)};
  }

  /**
   * Charges the time since start() to the current level and closes the
   * record. May be called above the leaf level when a recursion stops early.
   */
  bag_type leaf_finish() && {
    seconds_.at(level_) += elapsed();
    return bag_type(std::move(seconds_));
  }

  static bag_type combine(bag_type a, bag_type b) {
    for (std::size_t i = 0; i < a.seconds_.size() && i < b.seconds_.size();
         ++i) {
      a.seconds_[i] += b.seconds_[i];
    }
    return a;
  }

 private:
  level_timer(std::vector<double> seconds, std::size_t level)
      : seconds_(std::move(seconds)), level_(level) {}

  // Zero if start() was never called at this level.
  double elapsed() const {
    if (!started_) {
      return 0.0;
    }
    return std::chrono::duration<double>(clock::now() - *started_).count();
  }

  std::vector<double> seconds_;
  std::size_t level_;
  std::optional<clock::time_point> started_;
};

}  // namespace kressler::complete_tree
