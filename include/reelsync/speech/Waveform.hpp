// Repository: ReelSync
// Component: Waveform
// Purpose: Interleaved float audio produced by speech synthesis.
// Copyright (c) 2025 ReelSync

#ifndef REELSYNC_SPEECH_WAVEFORM_HPP_
#define REELSYNC_SPEECH_WAVEFORM_HPP_

#include <cstdint>
#include <vector>

namespace reelsync::speech {

inline constexpr int32_t kDefaultSampleRate = 24000;

// Interleaved samples in [-1, 1]. channels is 1 (mono) or 2 (stereo).
struct Waveform {
  std::vector<float> samples;
  int32_t channels = 1;
  int32_t sample_rate = kDefaultSampleRate;

  int64_t FrameCount() const {
    return channels > 0 ? static_cast<int64_t>(samples.size()) / channels : 0;
  }

  double DurationSeconds() const {
    return sample_rate > 0 ? static_cast<double>(FrameCount()) / sample_rate : 0.0;
  }

  bool Empty() const { return samples.empty(); }

  // Appends round(seconds * sample_rate) frames of silence. Non-positive
  // durations are a no-op. Returns the number of frames added.
  int64_t AppendSilence(double seconds);
};

}  // namespace reelsync::speech

#endif  // REELSYNC_SPEECH_WAVEFORM_HPP_
