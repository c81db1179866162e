// Repository: ReelSync
// Component: WAV File I/O Implementation
// Copyright (c) 2025 ReelSync

#include "reelsync/speech/WavFile.hpp"

#include <cstdint>
#include <cstring>
#include <fstream>
#include <iterator>
#include <vector>

namespace reelsync::speech {

namespace {

uint16_t ReadU16Le(const uint8_t* p) {
  return static_cast<uint16_t>(p[0] | (static_cast<uint16_t>(p[1]) << 8));
}

uint32_t ReadU32Le(const uint8_t* p) {
  return static_cast<uint32_t>(p[0]) | (static_cast<uint32_t>(p[1]) << 8) |
         (static_cast<uint32_t>(p[2]) << 16) | (static_cast<uint32_t>(p[3]) << 24);
}

int32_t ReadS24Le(const uint8_t* p) {
  int32_t value = static_cast<int32_t>(p[0]) | (static_cast<int32_t>(p[1]) << 8) |
                  (static_cast<int32_t>(p[2]) << 16);
  if ((value & 0x00800000) != 0) value |= static_cast<int32_t>(0xFF000000);
  return value;
}

void WriteU16(std::ofstream& out, uint16_t v) {
  out.put(static_cast<char>(v & 0xFF));
  out.put(static_cast<char>((v >> 8) & 0xFF));
}

void WriteU32(std::ofstream& out, uint32_t v) {
  out.put(static_cast<char>(v & 0xFF));
  out.put(static_cast<char>((v >> 8) & 0xFF));
  out.put(static_cast<char>((v >> 16) & 0xFF));
  out.put(static_cast<char>((v >> 24) & 0xFF));
}

bool Fail(std::string* error, const std::string& message) {
  if (error != nullptr) *error = message;
  return false;
}

}  // namespace

bool ReadWav(const std::filesystem::path& path, Waveform* out, std::string* error) {
  std::ifstream in(path, std::ios::binary);
  if (!in.is_open()) return Fail(error, "cannot open WAV file: " + path.string());

  std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(in)),
                             std::istreambuf_iterator<char>());
  if (bytes.size() < 44) return Fail(error, "WAV file too small: " + path.string());
  if (std::memcmp(bytes.data(), "RIFF", 4) != 0 ||
      std::memcmp(bytes.data() + 8, "WAVE", 4) != 0) {
    return Fail(error, "not a RIFF/WAVE file: " + path.string());
  }

  uint16_t format = 0;
  uint16_t channels = 0;
  uint32_t rate = 0;
  uint16_t bits = 0;
  const uint8_t* data = nullptr;
  uint32_t data_size = 0;

  size_t cursor = 12;
  while (cursor + 8 <= bytes.size()) {
    const char* chunk_id = reinterpret_cast<const char*>(bytes.data() + cursor);
    uint32_t chunk_size = ReadU32Le(bytes.data() + cursor + 4);
    const size_t body = cursor + 8;
    if (std::memcmp(chunk_id, "data", 4) == 0 && body + chunk_size > bytes.size()) {
      // Streaming writers leave the size field unset; take what is there.
      chunk_size = static_cast<uint32_t>(bytes.size() - body);
    }
    if (body + chunk_size > bytes.size()) break;
    if (std::memcmp(chunk_id, "fmt ", 4) == 0 && chunk_size >= 16) {
      format = ReadU16Le(bytes.data() + body);
      channels = ReadU16Le(bytes.data() + body + 2);
      rate = ReadU32Le(bytes.data() + body + 4);
      bits = ReadU16Le(bytes.data() + body + 14);
      if (format == 0xFFFE && chunk_size >= 26) {
        format = ReadU16Le(bytes.data() + body + 24);  // WAVE_FORMAT_EXTENSIBLE
      }
    } else if (std::memcmp(chunk_id, "data", 4) == 0) {
      data = bytes.data() + body;
      data_size = chunk_size;
    }
    cursor = body + chunk_size + (chunk_size % 2U);
  }

  if (data == nullptr || channels == 0 || rate == 0 || bits == 0) {
    return Fail(error, "malformed WAV file (missing fmt or data chunk): " + path.string());
  }
  if (channels > 2) return Fail(error, "only mono/stereo WAV is supported: " + path.string());

  const uint32_t bytes_per_sample = bits / 8;
  if (bytes_per_sample == 0) return Fail(error, "unsupported WAV bit depth: " + path.string());
  const uint32_t frame_bytes = bytes_per_sample * channels;
  data_size -= data_size % frame_bytes;

  const size_t count = data_size / bytes_per_sample;
  std::vector<float> samples(count, 0.0F);
  for (size_t i = 0; i < count; ++i) {
    const uint8_t* p = data + i * bytes_per_sample;
    if (format == 1 && bits == 16) {
      samples[i] = static_cast<float>(static_cast<int16_t>(ReadU16Le(p)) / 32768.0);
    } else if (format == 1 && bits == 24) {
      samples[i] = static_cast<float>(ReadS24Le(p) / 8388608.0);
    } else if (format == 1 && bits == 32) {
      samples[i] = static_cast<float>(static_cast<int32_t>(ReadU32Le(p)) / 2147483648.0);
    } else if (format == 3 && bits == 32) {
      std::memcpy(&samples[i], p, sizeof(float));
    } else {
      return Fail(error, "unsupported WAV encoding (format " + std::to_string(format) +
                             ", " + std::to_string(bits) + " bits): " + path.string());
    }
  }

  out->samples = std::move(samples);
  out->channels = channels;
  out->sample_rate = static_cast<int32_t>(rate);
  return true;
}

bool WriteWavFloat32(const std::filesystem::path& path, const Waveform& wave,
                     std::string* error) {
  if (wave.channels < 1 || wave.channels > 2) {
    return Fail(error, "only mono/stereo waveforms are supported");
  }
  if (wave.sample_rate <= 0) return Fail(error, "invalid sample rate");

  std::error_code ec;
  if (path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path(), ec);
    if (ec) return Fail(error, "cannot create " + path.parent_path().string() + ": " + ec.message());
  }
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out.is_open()) return Fail(error, "cannot open WAV file for writing: " + path.string());

  const uint16_t channels = static_cast<uint16_t>(wave.channels);
  const uint16_t bits = 32;
  const uint16_t block_align = static_cast<uint16_t>(channels * (bits / 8));
  const uint32_t frames = static_cast<uint32_t>(wave.FrameCount());
  const uint32_t data_bytes = frames * block_align;
  const uint32_t rate = static_cast<uint32_t>(wave.sample_rate);

  out.write("RIFF", 4);
  WriteU32(out, 4 + (8 + 16) + (8 + data_bytes));
  out.write("WAVE", 4);
  out.write("fmt ", 4);
  WriteU32(out, 16);
  WriteU16(out, 3);  // IEEE float
  WriteU16(out, channels);
  WriteU32(out, rate);
  WriteU32(out, rate * block_align);
  WriteU16(out, block_align);
  WriteU16(out, bits);
  out.write("data", 4);
  WriteU32(out, data_bytes);
  out.write(reinterpret_cast<const char*>(wave.samples.data()),
            static_cast<std::streamsize>(data_bytes));

  if (!out.good()) return Fail(error, "write failed: " + path.string());
  return true;
}

}  // namespace reelsync::speech
