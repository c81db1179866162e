// Repository: ReelSync
// Component: Deterministic Sleep Strategy (test only)
// Purpose: Records virtual elapsed time instead of blocking. No wall clock.
// Copyright (c) 2025 ReelSync

#ifndef REELSYNC_TESTS_SUPPORT_DETERMINISTIC_SLEEP_STRATEGY_HPP_
#define REELSYNC_TESTS_SUPPORT_DETERMINISTIC_SLEEP_STRATEGY_HPP_

#include <chrono>
#include <vector>

#include "reelsync/time/ISleepStrategy.hpp"

namespace reelsync::testing {

class DeterministicSleepStrategy : public time::ISleepStrategy {
 public:
  void SleepFor(std::chrono::milliseconds duration) override {
    elapsed_ += duration;
    sleeps_.push_back(duration);
  }

  std::chrono::milliseconds elapsed() const { return elapsed_; }
  const std::vector<std::chrono::milliseconds>& sleeps() const { return sleeps_; }

 private:
  std::chrono::milliseconds elapsed_{0};
  std::vector<std::chrono::milliseconds> sleeps_;
};

}  // namespace reelsync::testing

#endif  // REELSYNC_TESTS_SUPPORT_DETERMINISTIC_SLEEP_STRATEGY_HPP_
