// src/audio/voice_mixer.hpp
// Fixed-size voice table shared by the control thread and the audio thread.
//
// Control side (any thread, serialized internally): attach/detach buffers,
// post start/halt commands, set rate and gain, read playheads.
// Audio side (one thread): render() a block of interleaved float output.
//
// A start command carries an absolute output frame. render() begins the voice
// exactly on that frame inside the block it falls in, so every voice posted
// with the same frame starts in unison no matter when its command arrived.
// A command whose frame has already passed starts the voice at once, at the
// position it would have reached by now.
//
// Commands travel through atomics plus a per-slot generation counter; a
// halt bumps the generation, so a start that has not yet reached its frame is
// dropped and can never sound later. The playhead is tagged with the
// generation it was rendered under, so it reads as nullopt from the moment a
// new command is posted until the audio thread has rendered that command.
//
// Playheads are published per block with the block's end frame, through a
// small sequence lock; playhead_at() projects one onto any output frame.
//
// render() never locks, allocates or frees. Buffers are kept alive on the
// control side; detach() waits for an in-flight render pass before releasing
// one.

#pragma once
#include <array>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <memory>
#include <mutex>
#include <optional>

#include "audio/engine.hpp"
#include "audio/pcm.hpp"

namespace audio {

class VoiceMixer {
public:
  static constexpr std::size_t kMaxVoices = 32;

  explicit VoiceMixer(unsigned outputRate);

  VoiceMixer(const VoiceMixer &) = delete;
  VoiceMixer &operator=(const VoiceMixer &) = delete;

  // --- control side ---
  VoiceId attach(std::shared_ptr<const PcmBuffer> buffer);
  void detach(VoiceId voice);
  void schedule(VoiceId voice, std::int64_t startFrame);
  void halt(VoiceId voice);
  void set_rate(VoiceId voice, double rate);
  void set_gain(VoiceId voice, float gain);
  std::optional<double> playhead(VoiceId voice) const;
  // Source frames the voice has advanced by output frame `frame`, projected
  // from the last rendered block. nullopt when not sounding or not started
  // by then.
  std::optional<double> playhead_at(VoiceId voice, std::int64_t frame) const;
  void set_master_gain(float gain);
  float master_gain() const { return masterGain_.load(); }
  std::size_t voices_in_use() const;

  unsigned output_rate() const { return outputRate_; }

  // --- audio side ---
  // Overwrites out[0 .. frames*channels) with the mix of every sounding voice.
  // `firstFrame` is the absolute index of out's first frame.
  void render(float *out, std::size_t frames, unsigned channels,
              std::int64_t firstFrame);

private:
  static constexpr std::int64_t kIdle = std::numeric_limits<std::int64_t>::min();

  enum class State { Idle, Pending, Playing };

  struct Head {
    double frames = 0.0;         // source frames since start
    std::int64_t endFrame = 0;   // output frame just after the block
    std::uint32_t generation = 0;
    double step = 1.0;           // source frames per output frame
  };

  struct Slot {
    // written by control, read by audio
    std::atomic<const PcmBuffer *> buffer{nullptr};
    std::atomic<std::int64_t> command{kIdle};
    std::atomic<std::uint32_t> generation{0};
    std::atomic<double> rate{1.0};
    std::atomic<float> gain{1.0f};

    // written by audio, read by control
    std::atomic<bool> sounding{false};
    std::atomic<std::uint32_t> headSeq{0};
    std::atomic<double> headFrames{0.0};
    std::atomic<std::int64_t> headEnd{0};
    std::atomic<std::uint32_t> headGeneration{0};
    std::atomic<double> headStep{1.0};

    // audio thread only
    std::uint32_t seenGeneration = 0;
    State state = State::Idle;
    std::int64_t startFrame = 0;
    double position = 0.0;    // source frame, wraps at the buffer end
    double sourceFrames = 0.0; // source frames since start, never wraps
  };

  void check_voice(VoiceId voice) const;
  void post(Slot &slot, std::int64_t command);
  void wait_for_render_pass() const;
  std::optional<Head> current_head(const Slot &slot) const;
  static void publish_head(Slot &slot, const Head &head);
  void render_voice(Slot &slot, const PcmBuffer &buf, float *out,
                    std::size_t frames, unsigned channels,
                    std::int64_t firstFrame);

  const unsigned outputRate_;
  std::array<Slot, kMaxVoices> slots_;

  // control side only, guarded by control_
  mutable std::mutex control_;
  std::array<std::shared_ptr<const PcmBuffer>, kMaxVoices> owners_;

  std::atomic<float> masterGain_{1.0f};
  std::atomic<bool> rendering_{false};
  std::atomic<std::uint64_t> passes_{0};
};

} // namespace audio
