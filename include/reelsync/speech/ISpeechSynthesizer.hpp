// Repository: ReelSync
// Component: Speech Synthesizer Interface
// Purpose: Black-box text-to-speech boundary used by the narration stage.
// Copyright (c) 2025 ReelSync

#ifndef REELSYNC_SPEECH_ISPEECH_SYNTHESIZER_HPP_
#define REELSYNC_SPEECH_ISPEECH_SYNTHESIZER_HPP_

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include "reelsync/speech/Waveform.hpp"

namespace reelsync::speech {

// Reference voice for cloning. Cloning is active only when both the audio
// path and its transcript are set.
struct VoiceReference {
  std::filesystem::path audio;
  std::string transcript;

  bool Enabled() const { return !audio.empty() && !transcript.empty(); }
};

struct SpeechRequest {
  std::string text;
  std::filesystem::path reference_audio;  // empty: engine default voice
  std::optional<uint32_t> seed;
};

struct SpeechResult {
  bool ok = false;
  Waveform waveform;
  std::string error;

  static SpeechResult Success(Waveform waveform) {
    return {true, std::move(waveform), ""};
  }
  static SpeechResult Failure(std::string error) {
    return {false, Waveform{}, std::move(error)};
  }
};

// With an enabled voice reference the text becomes
// "<transcript>\n<line>\n" and the reference audio is attached; the trailing
// newline marks end of speech for the engine.
SpeechRequest BuildSpeechRequest(const std::string& line,
                                 const VoiceReference& voice,
                                 std::optional<uint32_t> seed);

class ISpeechSynthesizer {
 public:
  virtual ~ISpeechSynthesizer() = default;

  // Engine failures are reported in the result; never throws.
  virtual SpeechResult Synthesize(const SpeechRequest& request) = 0;
};

}  // namespace reelsync::speech

#endif  // REELSYNC_SPEECH_ISPEECH_SYNTHESIZER_HPP_
