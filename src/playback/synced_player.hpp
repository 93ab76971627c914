// src/playback/synced_player.hpp
// One loop in the mix, kept in phase with the shared beat clock.
//
// The player owns one engine voice for its buffer (attached on construction,
// detached on destruction) and holds a read-only reference to the clock. It
// never changes the clock and never subscribes to it: whoever changes the
// tempo calls adjust_playback_rate() on every live player afterwards.
//
// States: Stopped -> Playing -> Stopped. schedule_start() while Playing just
// re-anchors the loop to the new beat.
//
// Threading: schedule_start()/stop()/correct_drift_if_needed() run on the
// control path only. is_playing(), start_beat(), current_phase() and
// calculate_drift() may be polled from another non-audio thread.

#pragma once
#include <atomic>
#include <memory>
#include <optional>
#include <string>

#include "audio/engine.hpp"
#include "audio/pcm.hpp"
#include "timing/clock.hpp"

namespace playback {

// Drift beyond this many seconds triggers a hard resync.
constexpr double kDefaultDriftThreshold = 0.015;

struct PlayerStatus {
  int sampleId = 0;
  std::string sampleName;
  bool playing = false;
  double originalBpm = 0.0;
  double clockBpm = 0.0;
  double rate = 1.0;
  double phase = 0.0;
  double driftMs = 0.0;
  std::optional<double> measuredDriftMs;
  double startBeat = 0.0;
  float volume = 1.0f;
  bool muted = false;
};

class SyncedPlayer {
public:
  // Throws std::invalid_argument for originalBpm <= 0 or a null buffer,
  // audio::EngineError when the engine has no voice for it.
  SyncedPlayer(audio::Engine &engine,
               std::shared_ptr<const audio::PcmBuffer> buffer,
               const timing::Clock &clock, double originalBpm, int sampleId,
               std::string sampleName);
  ~SyncedPlayer();

  SyncedPlayer(const SyncedPlayer &) = delete;
  SyncedPlayer &operator=(const SyncedPlayer &) = delete;

  // Rate multiplier = clock.bpm / originalBpm, pushed to the engine voice.
  void adjust_playback_rate();

  // Anchor the loop at `beat` and have the engine start the buffer exactly at
  // clock.time_for_beat(beat). On audio::EngineError the player is left
  // Stopped and the error propagates; there is no retry.
  void schedule_start(double beat);

  // schedule_start(ceil(clock.current_beat())); returns the beat used.
  double schedule_start_at_next_beat();

  // Silence now; a start that has not been reached yet never happens.
  void stop();

  // Re-anchor to the nearest whole beat, if playing.
  void resync_to_nearest_beat();

  // Position inside the loop since start_beat(), [0,1). 0 when stopped.
  double current_phase() const;

  // Shortest distance, in seconds, between the player's nominal loop
  // position (clock beat minus start_beat(), assumed perfectly linear) and
  // the clock's loop position. 0 when stopped, and 0 whenever the player was
  // anchored on a loop boundary.
  double calculate_drift() const;

  // The same distance, with the player's position taken from the engine
  // playhead instead. Diagnostic only; nullopt when stopped or when the
  // engine reports no playhead (start not reached yet).
  std::optional<double> measured_drift() const;

  // Hard resync to the clock's current beat when calculate_drift() exceeds
  // the threshold. Returns true when a resync was attempted; a failed one is
  // logged and leaves the player Stopped.
  bool correct_drift_if_needed(double thresholdSeconds = kDefaultDriftThreshold);

  // Gain forwarded to the engine voice, clamped to [0,1]. A muted player
  // keeps its volume and sounds at gain 0 until unmuted.
  void set_volume(float volume);
  void set_muted(bool muted);
  PlayerStatus status() const;

  bool is_playing() const { return playing_.load(); }
  double start_beat() const { return startBeat_.load(); }
  double rate_multiplier() const { return rate_.load(); }
  float volume() const { return volume_.load(); }
  bool is_muted() const { return muted_.load(); }
  double original_bpm() const { return originalBpm_; }
  int sample_id() const { return sampleId_; }
  const std::string &sample_name() const { return sampleName_; }

private:
  std::optional<std::string> start_voice(double beat);
  std::optional<double> measured_beat() const;
  double loop_distance(double clockBeat, double playerBeat) const;
  void apply_gain();

  audio::Engine &engine_;
  std::shared_ptr<const audio::PcmBuffer> buffer_;
  const timing::Clock &clock_;
  const double originalBpm_;
  const int sampleId_;
  const std::string sampleName_;
  audio::VoiceId voice_ = 0;

  std::atomic<bool> playing_{false};
  std::atomic<double> startBeat_{0.0};
  std::atomic<double> rate_{1.0};
  std::atomic<float> volume_{1.0f};
  std::atomic<bool> muted_{false};
};

} // namespace playback
