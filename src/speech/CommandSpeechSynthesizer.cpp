// Repository: ReelSync
// Component: Command Speech Synthesizer Implementation
// Copyright (c) 2025 ReelSync

#include "reelsync/speech/CommandSpeechSynthesizer.hpp"

#include "reelsync/speech/WavFile.hpp"
#include "reelsync/util/Logger.hpp"

namespace reelsync::speech {

namespace {

void ReplaceAll(std::string& s, const std::string& from, const std::string& to) {
  size_t pos = 0;
  while ((pos = s.find(from, pos)) != std::string::npos) {
    s.replace(pos, from.size(), to);
    pos += to.size();
  }
}

bool IsFlag(const std::string& arg) { return arg.size() > 1 && arg[0] == '-'; }

std::string Tail(const std::string& text, size_t max_chars) {
  return text.size() <= max_chars ? text : "..." + text.substr(text.size() - max_chars);
}

}  // namespace

std::vector<std::string> ExpandSpeechCommand(const std::vector<std::string>& argv_template,
                                             const SpeechRequest& request,
                                             const std::filesystem::path& output) {
  std::vector<std::string> argv;
  for (const auto& arg : argv_template) {
    const bool needs_reference = arg.find("{reference_audio}") != std::string::npos;
    const bool needs_seed = arg.find("{seed}") != std::string::npos;
    if ((needs_reference && request.reference_audio.empty()) ||
        (needs_seed && !request.seed)) {
      if (!argv.empty() && IsFlag(argv.back()) && argv.size() > 1) argv.pop_back();
      continue;
    }
    std::string expanded = arg;
    ReplaceAll(expanded, "{text}", request.text);
    ReplaceAll(expanded, "{output}", output.string());
    ReplaceAll(expanded, "{reference_audio}", request.reference_audio.string());
    if (request.seed) ReplaceAll(expanded, "{seed}", std::to_string(*request.seed));
    argv.push_back(std::move(expanded));
  }
  return argv;
}

CommandSpeechSynthesizer::CommandSpeechSynthesizer(CommandSpeechSynthesizerConfig config,
                                                   media::IProcessRunner& runner)
    : config_(std::move(config)), runner_(runner) {}

SpeechResult CommandSpeechSynthesizer::Synthesize(const SpeechRequest& request) {
  if (config_.argv_template.empty()) {
    return SpeechResult::Failure("no speech command configured");
  }
  if (request.text.empty()) {
    return SpeechResult::Failure("empty text");
  }

  std::error_code ec;
  std::filesystem::create_directories(config_.scratch_dir, ec);
  if (ec) {
    return SpeechResult::Failure("cannot create " + config_.scratch_dir.string() + ": " +
                                 ec.message());
  }
  const std::filesystem::path output =
      config_.scratch_dir / ("speech_" + std::to_string(++counter_) + ".wav");
  std::filesystem::remove(output, ec);

  const auto argv = ExpandSpeechCommand(config_.argv_template, request, output);
  media::ProcessResult run = runner_.Run(argv);
  if (!run.launched) {
    return SpeechResult::Failure("speech engine did not start: " + run.error);
  }
  if (run.exit_code != 0) {
    util::Logger::Debug("[SpeechSynthesizer] engine output:\n" + run.output);
    return SpeechResult::Failure("speech engine exited with code " +
                                 std::to_string(run.exit_code) + ": " + Tail(run.output, 400));
  }

  Waveform wave;
  std::string error;
  const bool read_ok = ReadWav(output, &wave, &error);
  std::filesystem::remove(output, ec);
  if (!read_ok) {
    return SpeechResult::Failure("speech engine output unreadable: " + error);
  }
  if (wave.Empty()) {
    return SpeechResult::Failure("speech engine produced no samples");
  }
  return SpeechResult::Success(std::move(wave));
}

}  // namespace reelsync::speech
