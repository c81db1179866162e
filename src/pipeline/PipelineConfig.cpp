// Repository: ReelSync
// Component: Pipeline Configuration Implementation
// Copyright (c) 2025 ReelSync

#include "reelsync/pipeline/PipelineConfig.hpp"

#include <cmath>
#include <limits>

#include "reelsync/pipeline/Manifest.hpp"
#include "reelsync/util/Errors.hpp"
#include "reelsync/util/JsonFile.hpp"

namespace reelsync::pipeline {

namespace {

// Typed readers: leave *out untouched when the key is absent or null.

void ReadString(const Json::Value& root, const char* key, std::string* out) {
  if (!root.isMember(key) || root[key].isNull()) return;
  if (!root[key].isString()) {
    throw util::ConfigurationError(std::string("config '") + key + "' must be a string");
  }
  *out = root[key].asString();
}

void ReadPath(const Json::Value& root, const char* key, std::filesystem::path* out) {
  std::string value = out->string();
  ReadString(root, key, &value);
  *out = value;
}

template <typename Int>
void ReadInt(const Json::Value& root, const char* key, Int* out) {
  if (!root.isMember(key) || root[key].isNull()) return;
  const Json::Value& v = root[key];
  if (!v.isInt64() || v.asInt64() < std::numeric_limits<Int>::min() ||
      v.asInt64() > std::numeric_limits<Int>::max()) {
    throw util::ConfigurationError(std::string("config '") + key + "' must be an integer");
  }
  *out = static_cast<Int>(v.asInt64());
}

void ReadDouble(const Json::Value& root, const char* key, double* out) {
  if (!root.isMember(key) || root[key].isNull()) return;
  if (!root[key].isNumeric()) {
    throw util::ConfigurationError(std::string("config '") + key + "' must be a number");
  }
  *out = root[key].asDouble();
}

void ReadSeconds(const Json::Value& root, const char* key, std::chrono::milliseconds* out) {
  double seconds = out->count() / 1000.0;
  ReadDouble(root, key, &seconds);
  *out = std::chrono::milliseconds(static_cast<int64_t>(std::llround(seconds * 1000.0)));
}

}  // namespace

const char* NarrationModeToString(NarrationMode mode) {
  switch (mode) {
    case NarrationMode::kPerClip: return "per_clip";
    case NarrationMode::kFull: return "full";
  }
  return "unknown";
}

std::optional<NarrationMode> NarrationModeFromString(const std::string& name) {
  if (name == "per_clip") return NarrationMode::kPerClip;
  if (name == "full") return NarrationMode::kFull;
  return std::nullopt;
}

const char* PipelineStageToString(PipelineStage stage) {
  switch (stage) {
    case PipelineStage::kRender: return "render";
    case PipelineStage::kNarrate: return "narrate";
    case PipelineStage::kAssemble: return "assemble";
  }
  return "unknown";
}

std::optional<PipelineStage> PipelineStageFromString(const std::string& name) {
  if (name == "render") return PipelineStage::kRender;
  if (name == "narrate") return PipelineStage::kNarrate;
  if (name == "assemble") return PipelineStage::kAssemble;
  return std::nullopt;
}

std::filesystem::path PipelineConfig::ManifestPath() const {
  return Resolve(logs_dir) / kManifestFilename;
}

bool PipelineConfig::IsValid(std::string* error) const {
  auto fail = [error](const std::string& message) {
    if (error != nullptr) *error = message;
    return false;
  };
  if (backend.server_url.empty()) return fail("server_url is empty");
  for (const std::string* id : {&stage_ids.prompt, &stage_ids.sampler, &stage_ids.latent,
                                &stage_ids.output}) {
    if (id->empty()) return fail("stage ids must be non-empty");
  }
  if (default_frames <= 0 || default_width <= 0 || default_height <= 0) {
    return fail("default frames / width / height must be positive");
  }
  if (poll_interval.count() < 0) return fail("poll_interval_s must be >= 0");
  if (max_poll_attempts <= 0) return fail("max_poll_attempts must be positive");
  if (status_log_every < 0) return fail("status_log_every must be >= 0");
  if (cooldown_after_render.count() < 0 || cooldown_after_narration.count() < 0) {
    return fail("cooldowns must be >= 0");
  }
  if (!std::isfinite(stretch_threshold_s) || stretch_threshold_s < 0.0) {
    return fail("stretch_threshold_s must be a non-negative number");
  }
  if (!std::isfinite(tail_padding_s) || tail_padding_s < 0.0) {
    return fail("tail_padding_s must be a non-negative number");
  }
  if (sample_rate <= 0) return fail("sample_rate must be positive");
  if (backend.request_timeout_s <= 0 || backend.download_timeout_s <= 0) {
    return fail("HTTP timeouts must be positive");
  }
  if (ffmpeg.ffmpeg_path.empty()) return fail("ffmpeg_path is empty");
  if (final_filename.empty() || concatenated_filename.empty() ||
      full_narration_filename.empty()) {
    return fail("output file names must be non-empty");
  }
  if (voice.audio.empty() != voice.transcript.empty()) {
    return fail("reference_audio and reference_transcript must be set together");
  }
  return true;
}

PipelineConfig PipelineConfig::FromJson(const Json::Value& root, PipelineConfig base) {
  if (!root.isObject()) {
    throw util::ConfigurationError("config must be a JSON object");
  }
  PipelineConfig c = std::move(base);

  ReadPath(root, "content_file", &c.content_file);
  ReadPath(root, "workflow_file", &c.workflow_file);
  ReadPath(root, "work_dir", &c.work_dir);
  ReadPath(root, "video_clips_dir", &c.video_clips_dir);
  ReadPath(root, "merged_clips_dir", &c.merged_clips_dir);
  ReadPath(root, "concatenated_dir", &c.concatenated_dir);
  ReadPath(root, "narration_dir", &c.narration_dir);
  ReadPath(root, "final_dir", &c.final_dir);
  ReadPath(root, "logs_dir", &c.logs_dir);
  ReadPath(root, "temp_dir", &c.temp_dir);
  ReadString(root, "final_filename", &c.final_filename);
  ReadString(root, "concatenated_filename", &c.concatenated_filename);
  ReadString(root, "full_narration_filename", &c.full_narration_filename);

  ReadString(root, "server_url", &c.backend.server_url);
  ReadString(root, "client_id", &c.backend.client_id);
  ReadInt(root, "request_timeout_s", &c.backend.request_timeout_s);
  ReadInt(root, "download_timeout_s", &c.backend.download_timeout_s);

  if (root.isMember("stage_ids") && !root["stage_ids"].isNull()) {
    const Json::Value& ids = root["stage_ids"];
    if (!ids.isObject()) throw util::ConfigurationError("config 'stage_ids' must be an object");
    ReadString(ids, "prompt", &c.stage_ids.prompt);
    ReadString(ids, "sampler", &c.stage_ids.sampler);
    ReadString(ids, "latent", &c.stage_ids.latent);
    ReadString(ids, "output", &c.stage_ids.output);
  }
  ReadInt(root, "frames", &c.default_frames);
  ReadInt(root, "width", &c.default_width);
  ReadInt(root, "height", &c.default_height);
  ReadSeconds(root, "poll_interval_s", &c.poll_interval);
  ReadInt(root, "max_poll_attempts", &c.max_poll_attempts);
  ReadInt(root, "status_log_every", &c.status_log_every);

  ReadSeconds(root, "cooldown_after_render_s", &c.cooldown_after_render);
  ReadSeconds(root, "cooldown_after_narration_s", &c.cooldown_after_narration);

  ReadDouble(root, "stretch_threshold_s", &c.stretch_threshold_s);
  ReadDouble(root, "tail_padding_s", &c.tail_padding_s);

  if (root.isMember("speech_command") && !root["speech_command"].isNull()) {
    const Json::Value& argv = root["speech_command"];
    if (!argv.isArray()) {
      throw util::ConfigurationError("config 'speech_command' must be an array of strings");
    }
    c.speech_command.clear();
    for (const auto& arg : argv) {
      if (!arg.isString()) {
        throw util::ConfigurationError("config 'speech_command' must be an array of strings");
      }
      c.speech_command.push_back(arg.asString());
    }
  }
  ReadInt(root, "sample_rate", &c.sample_rate);
  ReadPath(root, "reference_audio", &c.voice.audio);
  ReadString(root, "reference_transcript", &c.voice.transcript);
  if (root.isMember("speech_seed") && !root["speech_seed"].isNull()) {
    uint32_t seed = 0;
    ReadInt(root, "speech_seed", &seed);
    c.speech_seed = seed;
  }
  if (root.isMember("narration_mode") && !root["narration_mode"].isNull()) {
    std::string mode;
    ReadString(root, "narration_mode", &mode);
    auto parsed = NarrationModeFromString(mode);
    if (!parsed) {
      throw util::ConfigurationError("config 'narration_mode' must be per_clip or full");
    }
    c.narration_mode = *parsed;
  }

  ReadString(root, "ffmpeg_path", &c.ffmpeg.ffmpeg_path);
  ReadString(root, "video_codec", &c.ffmpeg.video_codec);
  ReadString(root, "audio_codec", &c.ffmpeg.audio_codec);
  return c;
}

PipelineConfig PipelineConfig::LoadFromFile(const std::filesystem::path& path,
                                            PipelineConfig base) {
  return FromJson(util::ReadJsonFileOrThrow(path, "config file"), std::move(base));
}

}  // namespace reelsync::pipeline
