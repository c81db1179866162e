// Repository: ReelSync
// Component: WAV File I/O
// Purpose: Read PCM / float WAV produced by the speech engine and write
//          32-bit float narration clips.
// Copyright (c) 2025 ReelSync

#ifndef REELSYNC_SPEECH_WAV_FILE_HPP_
#define REELSYNC_SPEECH_WAV_FILE_HPP_

#include <filesystem>
#include <string>

#include "reelsync/speech/Waveform.hpp"

namespace reelsync::speech {

// Accepts RIFF/WAVE with PCM 16/24/32-bit or IEEE float 32-bit samples,
// mono or stereo. Returns false and fills *error otherwise.
bool ReadWav(const std::filesystem::path& path, Waveform* out, std::string* error);

// Writes IEEE float 32-bit WAV, creating parent directories.
bool WriteWavFloat32(const std::filesystem::path& path, const Waveform& wave,
                     std::string* error);

}  // namespace reelsync::speech

#endif  // REELSYNC_SPEECH_WAV_FILE_HPP_
