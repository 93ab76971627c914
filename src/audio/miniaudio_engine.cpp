// src/audio/miniaudio_engine.cpp
// miniaudio device + VoiceMixer = the engine players talk to.

#define MINIAUDIO_IMPLEMENTATION
#include "miniaudio.h"

#include "audio/miniaudio_engine.hpp"
#include "common/log.hpp"

#include <cmath>

namespace audio {

struct MiniaudioEngine::Device {
  ma_device device{};

  // Real-time callback: one block of interleaved f32 for the mixer to fill.
  static void data_callback(ma_device *device, void *pOutput,
                            const void * /*pInput*/, ma_uint32 frameCount) {
    auto *engine = reinterpret_cast<MiniaudioEngine *>(device->pUserData);
    engine->render(reinterpret_cast<float *>(pOutput), frameCount);
  }
};

MiniaudioEngine::MiniaudioEngine(unsigned sampleRate, unsigned channels)
    : sampleRate_(sampleRate), channels_(channels),
      device_(std::make_unique<Device>()) {
  if (sampleRate == 0 || channels == 0)
    throw EngineError("Playback device needs a sample rate and channels");

  ma_device_config config = ma_device_config_init(ma_device_type_playback);
  config.playback.format = ma_format_f32; // matches VoiceMixer::render
  config.playback.channels = channels;
  config.sampleRate = sampleRate;
  config.dataCallback = &Device::data_callback;
  config.pUserData = this;

  if (ma_device_init(nullptr, &config, &device_->device) != MA_SUCCESS)
    throw EngineError("Failed to open playback device");

  // miniaudio converts to the hardware format, so what we asked for is what
  // the callback sees.
  sampleRate_ = device_->device.sampleRate;
  channels_ = device_->device.playback.channels;
  mixer_ = std::make_unique<VoiceMixer>(sampleRate_);

  logging::debug() << "Playback device: " << device_->device.playback.name
                   << " (" << sampleRate_ << " Hz, " << channels_ << " ch)";
}

MiniaudioEngine::~MiniaudioEngine() {
  // Uninit stops the device and joins its thread before the mixer goes away.
  ma_device_uninit(&device_->device);
}

void MiniaudioEngine::start() {
  if (running_.load())
    return;
  framesRendered_.store(0);
  epochTicks_.store(timing::RealClock::now().time_since_epoch().count());
  if (ma_device_start(&device_->device) != MA_SUCCESS)
    throw EngineError("Failed to start playback device");
  running_.store(true);
  logging::info() << "Playback device started";
}

void MiniaudioEngine::stop() {
  if (!running_.exchange(false))
    return;
  if (ma_device_stop(&device_->device) != MA_SUCCESS)
    throw EngineError("Failed to stop playback device");
  logging::info() << "Playback device stopped";
}

std::int64_t MiniaudioEngine::frame_for_time(timing::RealTime t) const {
  const timing::RealTime epoch{timing::RealClock::duration(epochTicks_.load())};
  const double seconds = timing::Seconds(t - epoch).count();
  return static_cast<std::int64_t>(std::llround(seconds * sampleRate_));
}

void MiniaudioEngine::render(float *out, std::uint32_t frameCount) {
  const std::int64_t first = framesRendered_.load(std::memory_order_relaxed);
  mixer_->render(out, frameCount, channels_, first);
  framesRendered_.store(first + frameCount, std::memory_order_relaxed);
}

VoiceId MiniaudioEngine::attach(std::shared_ptr<const PcmBuffer> buffer) {
  return mixer_->attach(std::move(buffer));
}

void MiniaudioEngine::detach(VoiceId voice) { mixer_->detach(voice); }

void MiniaudioEngine::start_at(VoiceId voice, timing::RealTime when) {
  if (!running_.load())
    throw EngineError("Playback device is not running");
  mixer_->schedule(voice, frame_for_time(when));
}

void MiniaudioEngine::halt(VoiceId voice) { mixer_->halt(voice); }

void MiniaudioEngine::set_rate(VoiceId voice, double rate) {
  mixer_->set_rate(voice, rate);
}

void MiniaudioEngine::set_gain(VoiceId voice, float gain) {
  mixer_->set_gain(voice, gain);
}

void MiniaudioEngine::set_master_gain(float gain) {
  mixer_->set_master_gain(gain);
}

// The callback renders ahead of the wall clock by whatever the device has
// buffered, so the last rendered block's playhead is projected back onto the
// frame that belongs to now.
std::optional<double> MiniaudioEngine::playhead(VoiceId voice) const {
  if (!running_.load())
    return mixer_->playhead(voice);
  return mixer_->playhead_at(voice, frame_for_time(timing::RealClock::now()));
}

} // namespace audio
