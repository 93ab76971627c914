// src/io/io.hpp
// Thin I/O façade for getting loops off disk and into memory.
//
// Usage:
//   auto pcm = io::load_pcm(path, engine.sample_rate(), engine.channels());
//
// Decoding itself is miniaudio's (WAV, FLAC, MP3); we only ask for float
// frames at the rate and channel count the output device runs at, so the
// audio thread never has to convert.
//
// Throws std::runtime_error on errors (missing file, undecodable data,
// empty result).

#pragma once
#include <filesystem>
#include <memory>
#include <string>

#include "audio/pcm.hpp"

namespace io {

std::shared_ptr<const audio::PcmBuffer>
load_pcm(const std::string &path, unsigned sampleRate, unsigned channels);

// Overload: std::filesystem::path
inline std::shared_ptr<const audio::PcmBuffer>
load_pcm(const std::filesystem::path &p, unsigned sampleRate,
         unsigned channels) {
  return load_pcm(p.string(), sampleRate, channels);
}

} // namespace io
