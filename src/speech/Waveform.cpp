// Repository: ReelSync
// Component: Waveform Implementation
// Copyright (c) 2025 ReelSync

#include "reelsync/speech/Waveform.hpp"

#include <cmath>

namespace reelsync::speech {

int64_t Waveform::AppendSilence(double seconds) {
  if (!(seconds > 0.0) || sample_rate <= 0 || channels <= 0) return 0;
  const auto frames = static_cast<int64_t>(std::llround(seconds * sample_rate));
  samples.insert(samples.end(), static_cast<size_t>(frames * channels), 0.0F);
  return frames;
}

}  // namespace reelsync::speech
