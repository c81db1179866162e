// Repository: ReelSync
// Component: Render Job Client Implementation
// Copyright (c) 2025 ReelSync

#include "reelsync/render/RenderJobClient.hpp"

#include <limits>
#include <memory>
#include <random>
#include <sstream>

#include "reelsync/util/JsonFile.hpp"
#include "reelsync/util/Logger.hpp"

namespace reelsync::render {

namespace {

SeedSource MakeRandomSeedSource() {
  auto gen = std::make_shared<std::mt19937>(std::random_device{}());
  return [gen]() {
    std::uniform_int_distribution<uint32_t> dist(0, std::numeric_limits<uint32_t>::max());
    return dist(*gen);
  };
}

std::string Join(const std::vector<std::string>& parts) {
  std::string out;
  for (const auto& p : parts) {
    if (!out.empty()) out += ", ";
    out += "'" + p + "'";
  }
  return out;
}

}  // namespace

RenderJobClient::RenderJobClient(IRenderBackend& backend,
                                 const JobTemplate& job_template,
                                 RenderJobClientConfig config,
                                 time::ISleepStrategy& sleeper,
                                 SeedSource seed_source)
    : backend_(backend),
      template_(job_template),
      config_(std::move(config)),
      sleeper_(sleeper),
      seed_source_(seed_source ? std::move(seed_source) : MakeRandomSeedSource()) {}

void RenderJobClient::Transition(RenderJobOutcome& outcome, ClipJobStatus next) const {
  outcome.status = next;
  if (observer_) observer_(next);
}

RenderJobOutcome RenderJobClient::Run(JobOverrides overrides) {
  RenderJobOutcome outcome;
  Transition(outcome, ClipJobStatus::kSubmitted);

  overrides.seed = seed_source_();
  outcome.seed = overrides.seed;

  auto spec = template_.BuildJobSpec(config_.stage_ids, overrides);
  if (!spec) {
    outcome.detail = "workflow template lacks stage id(s) " +
                     Join(template_.MissingStages(config_.stage_ids));
    util::Logger::Error("[RenderJobClient] " + outcome.detail);
    Transition(outcome, ClipJobStatus::kBackendMisconfigured);
    return outcome;
  }

  SubmitResponse submitted = backend_.Submit(*spec);
  if (!submitted.ok) {
    outcome.detail = submitted.error;
    util::Logger::Warn("[RenderJobClient] Queue failed: " + submitted.error);
    Transition(outcome, ClipJobStatus::kQueueFailed);
    return outcome;
  }
  outcome.job_handle = submitted.job_handle;
  Transition(outcome, ClipJobStatus::kQueued);

  const auto interval_s = config_.poll_interval.count() / 1000.0;
  std::ostringstream msg;
  msg << "[RenderJobClient] Job queued (ID: " << outcome.job_handle << ", seed "
      << outcome.seed << "). Polling every " << interval_s << "s for max "
      << interval_s * config_.max_poll_attempts << "s";
  util::Logger::Info(msg.str());

  Poll(outcome);
  return outcome;
}

void RenderJobClient::Poll(RenderJobOutcome& outcome) {
  Transition(outcome, ClipJobStatus::kPolling);
  const std::string& handle = outcome.job_handle;

  for (int32_t attempt = 0; attempt < config_.max_poll_attempts; ++attempt) {
    sleeper_.SleepFor(config_.poll_interval);
    outcome.poll_attempts = attempt + 1;

    HistoryResponse history = backend_.GetHistory(handle);
    if (!history.ok) {
      util::Logger::Debug("[RenderJobClient] History query failed (poll " +
                          std::to_string(attempt + 1) + "): " + history.error);
      continue;
    }

    const Json::Value entry =
        history.body.isObject() ? history.body.get(handle, Json::Value()) : Json::Value();
    if (!entry.isObject() || !entry.isMember("outputs")) {
      if (config_.status_log_every > 0 && attempt % config_.status_log_every == 0) {
        const Json::Value status = entry.isObject() ? entry["status"] : Json::Value();
        std::string status_str = "Polling...";
        int64_t queue_remaining = 0;
        if (status.isObject()) {
          if (status["status_str"].isString()) status_str = status["status_str"].asString();
          const Json::Value& exec_info = status["exec_info"];
          if (exec_info.isObject() && exec_info["queue_remaining"].isInt64()) {
            queue_remaining = exec_info["queue_remaining"].asInt64();
          }
        }
        std::ostringstream msg;
        msg << "[RenderJobClient] Backend status: " << status_str
            << ", Queue remaining: " << queue_remaining << " (Poll " << attempt + 1
            << "/" << config_.max_poll_attempts << ")";
        util::Logger::Info(msg.str());
      }
      continue;
    }

    const Json::Value& outputs = entry["outputs"];
    const std::string& output_id = config_.stage_ids.output;
    if (!outputs.isObject() || !outputs.isMember(output_id)) {
      outcome.detail = "output stage '" + output_id + "' not in history outputs";
      util::Logger::Warn("[RenderJobClient] " + outcome.detail);
      util::Logger::Debug("[RenderJobClient] outputs: " + util::ToCompactJson(outputs));
      Transition(outcome, ClipJobStatus::kNoOutput);
      return;
    }

    const Json::Value& stage_output = outputs[output_id];
    util::Logger::Debug("[RenderJobClient] output stage '" + output_id +
                        "': " + util::ToCompactJson(stage_output));
    outcome.locator = resolver_.Resolve(stage_output);
    if (!outcome.locator) {
      outcome.detail = "no usable file information in output stage '" + output_id + "'";
      util::Logger::Warn("[RenderJobClient] " + outcome.detail);
      Transition(outcome, ClipJobStatus::kNoOutput);
      return;
    }

    util::Logger::Info("[RenderJobClient] Job " + handle + " produced " +
                       outcome.locator->filename + " (subfolder '" +
                       outcome.locator->subfolder + "', type '" +
                       outcome.locator->type + "')");
    Transition(outcome, ClipJobStatus::kSuccess);
    return;
  }

  outcome.detail = "no output after " + std::to_string(config_.max_poll_attempts) + " polls";
  util::Logger::Warn("[RenderJobClient] Job " + handle + " timed out: " + outcome.detail);
  Transition(outcome, ClipJobStatus::kTimeout);
}

}  // namespace reelsync::render
