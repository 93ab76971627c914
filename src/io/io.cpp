// src/io/io.cpp
// Decode a whole audio file with miniaudio's decoder.
// The implementation of miniaudio lives in audio/miniaudio_engine.cpp; this
// translation unit only needs the declarations.

#include "io/io.hpp"

#include "miniaudio.h"

#include <filesystem>
#include <stdexcept>

namespace io {

std::shared_ptr<const audio::PcmBuffer>
load_pcm(const std::string &path, unsigned sampleRate, unsigned channels) {
  if (!std::filesystem::is_regular_file(path)) {
    throw std::runtime_error("Could not open file: " + path);
  }

  ma_decoder_config config =
      ma_decoder_config_init(ma_format_f32, channels, sampleRate);
  ma_uint64 frameCount = 0;
  void *frames = nullptr;
  if (ma_decode_file(path.c_str(), &config, &frameCount, &frames) !=
      MA_SUCCESS) {
    throw std::runtime_error("Could not decode audio file: " + path);
  }

  auto pcm = std::make_shared<audio::PcmBuffer>();
  pcm->channels = channels;
  pcm->sampleRate = sampleRate;
  const float *first = static_cast<const float *>(frames);
  pcm->samples.assign(first, first + frameCount * channels);
  ma_free(frames, nullptr);

  if (pcm->empty()) {
    throw std::runtime_error("Audio file has no frames: " + path);
  }
  return pcm;
}

} // namespace io
