// src/audio/engine.hpp
// What a player needs from the playback engine.
//
// A voice is one engine-side slot bound to a buffer. The control thread
// attaches a voice, then starts, halts and retunes it; the engine's audio
// thread does the rendering. All calls here are control-path only.
//
//  - start_at(voice, t): begin rendering the buffer (looping) exactly at the
//    real-time instant t. A start already pending or running is replaced.
//    If t is already in the past the voice starts at once, at the position it
//    would have reached had it started at t.
//  - halt(voice): silence now and drop any pending start.
//  - set_rate(voice, r): playback speed multiplier (1 = authored tempo).
//  - set_master_gain(g): output gain over the whole mix, [0,1].
//  - playhead(voice): source frames advanced since the voice began sounding,
//    as heard now, or nullopt when it is not sounding (or the engine cannot
//    tell). A start or halt invalidates the previous playhead at once.
//
// Failures throw EngineError. Nothing here retries.

#pragma once
#include <cstddef>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

#include "audio/pcm.hpp"
#include "timing/clock.hpp"

namespace audio {

using VoiceId = std::size_t;

struct EngineError : std::runtime_error {
  explicit EngineError(const std::string &what) : std::runtime_error(what) {}
};

class Engine {
public:
  virtual ~Engine() = default;

  virtual VoiceId attach(std::shared_ptr<const PcmBuffer> buffer) = 0;
  virtual void detach(VoiceId voice) = 0;

  virtual void start_at(VoiceId voice, timing::RealTime when) = 0;
  virtual void halt(VoiceId voice) = 0;

  virtual void set_rate(VoiceId voice, double rate) = 0;
  virtual void set_gain(VoiceId voice, float gain) = 0;
  virtual void set_master_gain(float gain) = 0;

  virtual std::optional<double> playhead(VoiceId voice) const = 0;
};

} // namespace audio
