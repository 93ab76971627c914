// src/audio/pcm.hpp
// Decoded audio, as the engine consumes it.
// Keep this header light: a plain struct shared read-only between the loader,
// the players and the audio thread (via std::shared_ptr<const PcmBuffer>).

#pragma once
#include <cstddef>
#include <vector>

namespace audio {

struct PcmBuffer {
  std::vector<float> samples; // interleaved, `channels` per frame
  unsigned channels = 2;      // >= 1
  unsigned sampleRate = 48000;

  std::size_t frames() const {
    return channels == 0 ? 0 : samples.size() / channels;
  }
  bool empty() const { return frames() == 0; }
  double seconds() const {
    return sampleRate == 0 ? 0.0
                           : static_cast<double>(frames()) / sampleRate;
  }
};

} // namespace audio
