// Repository: ReelSync
// Component: Sleep Strategy Interface
// Purpose: Decouple blocking waits from the poll loop and stage cooldowns.
//          Production: RealtimeSleepStrategy blocks the calling thread.
//          Tests: DeterministicSleepStrategy (records virtual time, no sleep).
// Copyright (c) 2025 ReelSync

#ifndef REELSYNC_TIME_ISLEEP_STRATEGY_HPP_
#define REELSYNC_TIME_ISLEEP_STRATEGY_HPP_

#include <chrono>
#include <thread>

namespace reelsync::time {

class ISleepStrategy {
 public:
  virtual void SleepFor(std::chrono::milliseconds duration) = 0;
  virtual ~ISleepStrategy() = default;
};

class RealtimeSleepStrategy : public ISleepStrategy {
 public:
  void SleepFor(std::chrono::milliseconds duration) override {
    if (duration.count() <= 0) return;
    std::this_thread::sleep_for(duration);
  }
};

}  // namespace reelsync::time

#endif  // REELSYNC_TIME_ISLEEP_STRATEGY_HPP_
