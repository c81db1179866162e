// Repository: ReelSync
// Component: Render Job Client
// Purpose: Submit one render job, poll its history until terminal, and
//          resolve the produced artifact's locator.
// Copyright (c) 2025 ReelSync

#ifndef REELSYNC_RENDER_RENDER_JOB_CLIENT_HPP_
#define REELSYNC_RENDER_RENDER_JOB_CLIENT_HPP_

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

#include "reelsync/render/IRenderBackend.hpp"
#include "reelsync/render/JobTemplate.hpp"
#include "reelsync/render/OutputLocatorResolver.hpp"
#include "reelsync/render/RenderJobTypes.hpp"
#include "reelsync/time/ISleepStrategy.hpp"

namespace reelsync::render {

struct RenderJobClientConfig {
  StageIds stage_ids;
  std::chrono::milliseconds poll_interval{10'000};
  int32_t max_poll_attempts = 360;
  int32_t status_log_every = 6;  // log backend status every N polls
};

// Result of one job run. `locator` is set only for kSuccess.
struct RenderJobOutcome {
  ClipJobStatus status = ClipJobStatus::kSubmitted;
  std::string job_handle;
  std::optional<OutputLocator> locator;
  int32_t poll_attempts = 0;
  uint32_t seed = 0;
  std::string detail;
};

using SeedSource = std::function<uint32_t()>;
using TransitionObserver = std::function<void(ClipJobStatus)>;

// RenderJobClient
//
// State machine:
//   SUBMITTED → BACKEND_MISCONFIGURED   template lacks a configured stage id
//   SUBMITTED → QUEUE_FAILED            no job handle returned
//   SUBMITTED → QUEUED → POLLING
//   POLLING   → POLLING                 no finished history entry yet
//   POLLING   → TIMEOUT                 max_poll_attempts exhausted
//   POLLING   → SUCCESS                 output stage present, locator resolved
//   POLLING   → NO_OUTPUT               output stage absent or unresolvable
//
// Every poll iteration sleeps poll_interval through the injected
// ISleepStrategy before querying history, so the worst-case wall-clock time
// per job is max_poll_attempts * poll_interval plus request time.
// Run() never throws for backend behavior; every outcome is a status.
class RenderJobClient {
 public:
  // `seed_source` defaults to a uniform draw over [0, 2^32-1].
  RenderJobClient(IRenderBackend& backend,
                  const JobTemplate& job_template,
                  RenderJobClientConfig config,
                  time::ISleepStrategy& sleeper,
                  SeedSource seed_source = nullptr);

  // Runs one job to a terminal status. overrides.seed is replaced with a
  // fresh value from the seed source.
  RenderJobOutcome Run(JobOverrides overrides);

  // Test hook: called on every state change, in order.
  void SetTransitionObserver(TransitionObserver observer) {
    observer_ = std::move(observer);
  }

  const RenderJobClientConfig& config() const { return config_; }

 private:
  void Transition(RenderJobOutcome& outcome, ClipJobStatus next) const;
  void Poll(RenderJobOutcome& outcome);

  IRenderBackend& backend_;
  const JobTemplate& template_;
  RenderJobClientConfig config_;
  time::ISleepStrategy& sleeper_;
  SeedSource seed_source_;
  OutputLocatorResolver resolver_;
  TransitionObserver observer_;
};

}  // namespace reelsync::render

#endif  // REELSYNC_RENDER_RENDER_JOB_CLIENT_HPP_
