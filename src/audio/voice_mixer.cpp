// src/audio/voice_mixer.cpp

#include "audio/voice_mixer.hpp"

#include <algorithm>
#include <cmath>
#include <string>
#include <thread>

namespace audio {

VoiceMixer::VoiceMixer(unsigned outputRate) : outputRate_(outputRate) {
  if (outputRate == 0)
    throw EngineError("VoiceMixer: output rate must be > 0");
}

void VoiceMixer::check_voice(VoiceId voice) const {
  if (voice >= kMaxVoices || !owners_[voice])
    throw EngineError("Unknown voice " + std::to_string(voice));
}

// Publish a command: the value first, then the generation the audio thread
// watches. Acquire on the audio side pairs with the release here.
void VoiceMixer::post(Slot &slot, std::int64_t command) {
  slot.command.store(command, std::memory_order_relaxed);
  slot.generation.fetch_add(1, std::memory_order_release);
}

// Returns once no render pass that might have seen the old slot contents is
// still running. Sequentially consistent on purpose: either render() saw the
// cleared buffer pointer, or we see rendering_ set and wait for that pass.
void VoiceMixer::wait_for_render_pass() const {
  const std::uint64_t seen = passes_.load();
  while (rendering_.load() && passes_.load() == seen)
    std::this_thread::yield();
}

VoiceId VoiceMixer::attach(std::shared_ptr<const PcmBuffer> buffer) {
  if (!buffer || buffer->empty())
    throw EngineError("Cannot attach an empty buffer");
  if (buffer->sampleRate == 0)
    throw EngineError("Cannot attach a buffer without a sample rate");

  std::lock_guard<std::mutex> lock(control_);
  for (VoiceId v = 0; v < kMaxVoices; ++v) {
    if (owners_[v])
      continue;
    Slot &slot = slots_[v];
    slot.rate.store(1.0, std::memory_order_relaxed);
    slot.gain.store(1.0f, std::memory_order_relaxed);
    slot.sounding.store(false, std::memory_order_relaxed);
    post(slot, kIdle);
    slot.buffer.store(buffer.get());
    owners_[v] = std::move(buffer);
    return v;
  }
  throw EngineError("All " + std::to_string(kMaxVoices) +
                    " voices are in use");
}

void VoiceMixer::detach(VoiceId voice) {
  std::lock_guard<std::mutex> lock(control_);
  check_voice(voice);
  Slot &slot = slots_[voice];
  post(slot, kIdle);
  slot.buffer.store(nullptr);
  slot.sounding.store(false, std::memory_order_relaxed);
  wait_for_render_pass();
  owners_[voice].reset();
}

void VoiceMixer::schedule(VoiceId voice, std::int64_t startFrame) {
  std::lock_guard<std::mutex> lock(control_);
  check_voice(voice);
  if (startFrame == kIdle)
    throw EngineError("Start frame out of range");
  post(slots_[voice], startFrame);
  slots_[voice].sounding.store(false, std::memory_order_relaxed);
}

void VoiceMixer::halt(VoiceId voice) {
  std::lock_guard<std::mutex> lock(control_);
  check_voice(voice);
  post(slots_[voice], kIdle);
  slots_[voice].sounding.store(false, std::memory_order_relaxed);
}

void VoiceMixer::set_rate(VoiceId voice, double rate) {
  if (!(rate > 0.0) || !std::isfinite(rate))
    throw EngineError("Playback rate must be > 0");
  std::lock_guard<std::mutex> lock(control_);
  check_voice(voice);
  slots_[voice].rate.store(rate, std::memory_order_relaxed);
}

void VoiceMixer::set_gain(VoiceId voice, float gain) {
  std::lock_guard<std::mutex> lock(control_);
  check_voice(voice);
  slots_[voice].gain.store(std::clamp(gain, 0.0f, 1.0f),
                           std::memory_order_relaxed);
}

void VoiceMixer::set_master_gain(float gain) {
  masterGain_.store(std::clamp(gain, 0.0f, 1.0f), std::memory_order_relaxed);
}

// Readers retry while the audio thread is publishing. A head rendered under
// an older generation belongs to a command that has since been replaced.
std::optional<VoiceMixer::Head>
VoiceMixer::current_head(const Slot &slot) const {
  if (!slot.sounding.load(std::memory_order_acquire))
    return std::nullopt;
  Head h;
  for (;;) {
    const std::uint32_t before = slot.headSeq.load(std::memory_order_acquire);
    if (before & 1u)
      continue;
    h.frames = slot.headFrames.load(std::memory_order_relaxed);
    h.endFrame = slot.headEnd.load(std::memory_order_relaxed);
    h.generation = slot.headGeneration.load(std::memory_order_relaxed);
    h.step = slot.headStep.load(std::memory_order_relaxed);
    std::atomic_thread_fence(std::memory_order_acquire);
    if (slot.headSeq.load(std::memory_order_relaxed) == before)
      break;
  }
  if (h.generation != slot.generation.load(std::memory_order_acquire))
    return std::nullopt;
  return h;
}

std::optional<double> VoiceMixer::playhead(VoiceId voice) const {
  std::lock_guard<std::mutex> lock(control_);
  check_voice(voice);
  const auto head = current_head(slots_[voice]);
  if (!head)
    return std::nullopt;
  return head->frames;
}

std::optional<double> VoiceMixer::playhead_at(VoiceId voice,
                                              std::int64_t frame) const {
  std::lock_guard<std::mutex> lock(control_);
  check_voice(voice);
  const auto head = current_head(slots_[voice]);
  if (!head)
    return std::nullopt;
  const double at =
      head->frames - static_cast<double>(head->endFrame - frame) * head->step;
  if (at < 0.0)
    return std::nullopt;
  return at;
}

std::size_t VoiceMixer::voices_in_use() const {
  std::lock_guard<std::mutex> lock(control_);
  return static_cast<std::size_t>(
      std::count_if(owners_.begin(), owners_.end(),
                    [](const auto &owner) { return owner != nullptr; }));
}

// Real-time path from here down.

void VoiceMixer::publish_head(Slot &slot, const Head &head) {
  const std::uint32_t s = slot.headSeq.load(std::memory_order_relaxed);
  slot.headSeq.store(s + 1, std::memory_order_relaxed);
  std::atomic_thread_fence(std::memory_order_release);
  slot.headFrames.store(head.frames, std::memory_order_relaxed);
  slot.headEnd.store(head.endFrame, std::memory_order_relaxed);
  slot.headGeneration.store(head.generation, std::memory_order_relaxed);
  slot.headStep.store(head.step, std::memory_order_relaxed);
  slot.headSeq.store(s + 2, std::memory_order_release);
}

void VoiceMixer::render(float *out, std::size_t frames, unsigned channels,
                        std::int64_t firstFrame) {
  rendering_.store(true);
  std::fill(out, out + frames * channels, 0.0f);

  for (Slot &slot : slots_) {
    const std::uint32_t gen = slot.generation.load(std::memory_order_acquire);
    if (gen != slot.seenGeneration) {
      slot.seenGeneration = gen;
      const std::int64_t cmd = slot.command.load(std::memory_order_relaxed);
      if (cmd == kIdle) {
        slot.state = State::Idle;
      } else {
        slot.state = State::Pending;
        slot.startFrame = cmd;
      }
      slot.sounding.store(false, std::memory_order_release);
    }

    const PcmBuffer *buf = slot.buffer.load();
    if (buf == nullptr) {
      slot.state = State::Idle;
      continue;
    }
    if (slot.state != State::Idle)
      render_voice(slot, *buf, out, frames, channels, firstFrame);
  }

  const float master = masterGain_.load(std::memory_order_relaxed);
  if (master != 1.0f)
    for (std::size_t i = 0; i < frames * channels; ++i)
      out[i] *= master;

  passes_.fetch_add(1);
  rendering_.store(false);
}

void VoiceMixer::render_voice(Slot &slot, const PcmBuffer &buf, float *out,
                              std::size_t frames, unsigned channels,
                              std::int64_t firstFrame) {
  const std::size_t srcFrames = buf.frames();
  const double step = slot.rate.load(std::memory_order_relaxed) *
                      static_cast<double>(buf.sampleRate) / outputRate_;
  std::size_t offset = 0;

  if (slot.state == State::Pending) {
    const std::int64_t blockEnd =
        firstFrame + static_cast<std::int64_t>(frames);
    if (slot.startFrame >= blockEnd)
      return; // not yet
    if (slot.startFrame >= firstFrame) {
      offset = static_cast<std::size_t>(slot.startFrame - firstFrame);
      slot.sourceFrames = 0.0;
    } else {
      // Late: pick up where an on-time start would be by now.
      slot.sourceFrames = static_cast<double>(firstFrame - slot.startFrame) *
                          step;
    }
    slot.position = std::fmod(slot.sourceFrames, static_cast<double>(srcFrames));
    slot.state = State::Playing;
  }

  const float gain = slot.gain.load(std::memory_order_relaxed);
  const double end = static_cast<double>(srcFrames);
  for (std::size_t i = offset; i < frames; ++i) {
    const std::size_t i0 = static_cast<std::size_t>(slot.position);
    const std::size_t i1 = (i0 + 1 < srcFrames) ? i0 + 1 : 0;
    const float frac = static_cast<float>(slot.position - i0);
    for (unsigned c = 0; c < channels; ++c) {
      const unsigned sc = std::min(c, buf.channels - 1);
      const float s0 = buf.samples[i0 * buf.channels + sc];
      const float s1 = buf.samples[i1 * buf.channels + sc];
      out[i * channels + c] += gain * (s0 + frac * (s1 - s0));
    }
    slot.position += step;
    slot.sourceFrames += step;
    while (slot.position >= end)
      slot.position -= end;
  }

  publish_head(slot, Head{slot.sourceFrames,
                          firstFrame + static_cast<std::int64_t>(frames),
                          slot.seenGeneration, step});
  slot.sounding.store(true, std::memory_order_release);
}

} // namespace audio
