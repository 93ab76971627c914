// src/audio/miniaudio_engine.hpp
// The playback engine on a real output device (miniaudio).
//
// Usage:
//   audio::MiniaudioEngine engine(48000, 2);
//   engine.start();
//   auto v = engine.attach(buffer);
//   engine.start_at(v, clock.time_for_beat(4.0));
//
// Design notes:
// - miniaudio stays behind this interface; only the .cpp includes it, and
//   that .cpp also carries the single-header implementation.
// - Real time maps to output frames through the instant the device was
//   started: frame = (t - epoch) * sampleRate. The data callback hands the
//   absolute frame index of each block to the VoiceMixer, which starts voices
//   on their exact frame.
// - playhead() is projected onto the frame that belongs to the current
//   time, not the last frame rendered, so the device's buffered lead does not
//   show up as drift.
// - Device failures throw EngineError; so does start_at() while stopped.

#pragma once
#include <atomic>
#include <cstdint>
#include <memory>

#include "audio/engine.hpp"
#include "audio/voice_mixer.hpp"

namespace audio {

class MiniaudioEngine final : public Engine {
public:
  explicit MiniaudioEngine(unsigned sampleRate = 48000, unsigned channels = 2);
  ~MiniaudioEngine() override;

  MiniaudioEngine(const MiniaudioEngine &) = delete;
  MiniaudioEngine &operator=(const MiniaudioEngine &) = delete;

  void start();
  void stop();
  bool running() const { return running_.load(); }

  unsigned sample_rate() const { return sampleRate_; }
  unsigned channels() const { return channels_; }
  std::int64_t frames_rendered() const { return framesRendered_.load(); }

  // Absolute output frame at which real time `t` is heard.
  std::int64_t frame_for_time(timing::RealTime t) const;

  // --- Engine ---
  VoiceId attach(std::shared_ptr<const PcmBuffer> buffer) override;
  void detach(VoiceId voice) override;
  void start_at(VoiceId voice, timing::RealTime when) override;
  void halt(VoiceId voice) override;
  void set_rate(VoiceId voice, double rate) override;
  void set_gain(VoiceId voice, float gain) override;
  void set_master_gain(float gain) override;
  std::optional<double> playhead(VoiceId voice) const override;

private:
  struct Device; // wraps ma_device; defined in the .cpp

  void render(float *out, std::uint32_t frameCount);

  unsigned sampleRate_;
  unsigned channels_;
  std::unique_ptr<Device> device_;
  std::unique_ptr<VoiceMixer> mixer_;
  std::atomic<bool> running_{false};
  std::atomic<std::int64_t> framesRendered_{0};
  std::atomic<timing::RealClock::rep> epochTicks_{0};
};

} // namespace audio
