// Repository: ReelSync
// Component: Command Speech Synthesizer
// Purpose: ISpeechSynthesizer backed by an external speech engine command
//          that writes a WAV file.
// Copyright (c) 2025 ReelSync

#ifndef REELSYNC_SPEECH_COMMAND_SPEECH_SYNTHESIZER_HPP_
#define REELSYNC_SPEECH_COMMAND_SPEECH_SYNTHESIZER_HPP_

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "reelsync/media/ProcessRunner.hpp"
#include "reelsync/speech/ISpeechSynthesizer.hpp"

namespace reelsync::speech {

struct CommandSpeechSynthesizerConfig {
  // argv template. Placeholders, substituted inside any argument:
  //   {text} {output} {reference_audio} {seed}
  // An argument whose placeholder has no value ({reference_audio} without a
  // reference, {seed} without a seed) is dropped together with a directly
  // preceding "-" / "--" flag.
  std::vector<std::string> argv_template;
  std::filesystem::path scratch_dir = "temp";
};

// Argument list after placeholder substitution.
std::vector<std::string> ExpandSpeechCommand(const std::vector<std::string>& argv_template,
                                             const SpeechRequest& request,
                                             const std::filesystem::path& output);

class CommandSpeechSynthesizer : public ISpeechSynthesizer {
 public:
  CommandSpeechSynthesizer(CommandSpeechSynthesizerConfig config,
                           media::IProcessRunner& runner);

  // Runs the engine, reads the produced WAV back and removes the scratch file.
  SpeechResult Synthesize(const SpeechRequest& request) override;

 private:
  CommandSpeechSynthesizerConfig config_;
  media::IProcessRunner& runner_;
  int64_t counter_ = 0;
};

}  // namespace reelsync::speech

#endif  // REELSYNC_SPEECH_COMMAND_SPEECH_SYNTHESIZER_HPP_
