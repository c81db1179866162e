// Repository: ReelSync
// Component: Speech Request Composition
// Copyright (c) 2025 ReelSync

#include "reelsync/speech/ISpeechSynthesizer.hpp"

namespace reelsync::speech {

SpeechRequest BuildSpeechRequest(const std::string& line,
                                 const VoiceReference& voice,
                                 std::optional<uint32_t> seed) {
  SpeechRequest request;
  request.seed = seed;
  if (voice.Enabled()) {
    request.text = voice.transcript + "\n" + line + "\n";
    request.reference_audio = voice.audio;
  } else {
    request.text = line;
  }
  return request;
}

}  // namespace reelsync::speech
