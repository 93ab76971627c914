// src/playback/orchestrator.hpp
// Owns the mix: the set of SyncedPlayers sharing one clock.
//
// Contract with the players:
//  - play() hands every player the same target beat, so all of them start
//    on one beat-grid instant.
//  - set_bpm() publishes the tempo on the clock, then calls
//    adjust_playback_rate() on every live player. It does not re-anchor
//    them; check_and_correct_drift() is the safety net.
//  - check_and_correct_drift() is meant for a low-frequency timer
//    (config().checkInterval), never per audio buffer.
//  - A player whose start fails stays stopped and is reported back; siblings
//    are unaffected and nothing is retried.
//
// Single-threaded: call everything from the control thread.

#pragma once
#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "audio/engine.hpp"
#include "playback/drift_log.hpp"
#include "playback/synced_player.hpp"
#include "timing/clock.hpp"

namespace playback {

// Which beat play() aims every player at.
enum class StartAlignment {
  Immediate, // the clock's current beat
  NextBeat,  // the next whole beat
  NextLoop,  // the next loop boundary
};

struct OrchestratorConfig {
  double driftThresholdSeconds = kDefaultDriftThreshold;
  std::chrono::milliseconds checkInterval{2000};
  StartAlignment alignment = StartAlignment::NextLoop;
  bool logDrift = true;
  std::size_t driftLogCapacity = 4096;
};

class Orchestrator {
public:
  Orchestrator(audio::Engine &engine, timing::MutableClock &clock,
               OrchestratorConfig config = {});
  ~Orchestrator();

  Orchestrator(const Orchestrator &) = delete;
  Orchestrator &operator=(const Orchestrator &) = delete;

  // Adds a track and returns its id. While playing, the new track joins at
  // the next loop boundary.
  int add(int sampleId, std::string name, double originalBpm,
          std::shared_ptr<const audio::PcmBuffer> buffer);
  bool remove(int trackId);
  void remove_all();
  std::optional<int> find_by_sample(int sampleId) const;

  // Starts every track on one shared beat. Returns the ids that failed.
  std::vector<int> play();
  void stop();
  bool is_playing() const { return playing_; }

  void set_bpm(double bpm);
  double bpm() const { return clock_.bpm(); }

  // Measures every playing track and hard-resyncs those past the threshold.
  // Returns how many were resynced.
  std::size_t check_and_correct_drift();

  // The beat play() would use right now.
  double target_beat() const;

  // Per-track gain and mute. Unknown track ids throw std::out_of_range.
  void set_volume(int trackId, float volume);
  void set_muted(int trackId, bool muted);

  // Output gain over the whole mix, clamped to [0,1].
  void set_master_volume(float volume);
  float master_volume() const { return masterVolume_; }

  double phase(int trackId) const;
  std::vector<PlayerStatus> status() const;

  DriftStatistics drift_statistics() const;
  void clear_drift_log() { driftLog_.clear(); }

  std::size_t size() const { return tracks_.size(); }
  const OrchestratorConfig &config() const { return config_; }
  const SyncedPlayer *player(int trackId) const;

private:
  struct Track {
    int id;
    std::unique_ptr<SyncedPlayer> player;
  };

  Track *find(int trackId);
  Track &require(int trackId);
  const Track *find(int trackId) const;
  double next_loop_boundary() const;
  bool start_track(Track &track, double beat);

  audio::Engine &engine_;
  timing::MutableClock &clock_;
  OrchestratorConfig config_;
  std::vector<Track> tracks_;
  int nextId_ = 1;
  float masterVolume_ = 1.0f;
  bool playing_ = false;
  DriftLog driftLog_;
};

} // namespace playback
