// src/playback/orchestrator.cpp

#include "playback/orchestrator.hpp"

#include "common/log.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

namespace playback {

Orchestrator::Orchestrator(audio::Engine &engine, timing::MutableClock &clock,
                           OrchestratorConfig config)
    : engine_(engine), clock_(clock), config_(config),
      driftLog_(config.driftLogCapacity) {
  if (!(config_.driftThresholdSeconds > 0.0))
    throw std::invalid_argument("Drift threshold must be > 0");
  if (config_.checkInterval.count() <= 0)
    throw std::invalid_argument("Drift check interval must be > 0");
}

Orchestrator::~Orchestrator() {
  // Players halt and release their voices as they are destroyed.
  tracks_.clear();
}

Orchestrator::Track *Orchestrator::find(int trackId) {
  for (auto &t : tracks_)
    if (t.id == trackId)
      return &t;
  return nullptr;
}

const Orchestrator::Track *Orchestrator::find(int trackId) const {
  for (const auto &t : tracks_)
    if (t.id == trackId)
      return &t;
  return nullptr;
}

Orchestrator::Track &Orchestrator::require(int trackId) {
  Track *t = find(trackId);
  if (t == nullptr)
    throw std::out_of_range("Unknown track " + std::to_string(trackId));
  return *t;
}

const SyncedPlayer *Orchestrator::player(int trackId) const {
  const Track *t = find(trackId);
  return t ? t->player.get() : nullptr;
}

double Orchestrator::next_loop_boundary() const {
  const double loopBeats = timing::beats_per_loop(clock_);
  return std::ceil(clock_.current_beat() / loopBeats) * loopBeats;
}

double Orchestrator::target_beat() const {
  switch (config_.alignment) {
  case StartAlignment::NextBeat:
    return std::ceil(clock_.current_beat());
  case StartAlignment::NextLoop:
    return next_loop_boundary();
  case StartAlignment::Immediate:
    break;
  }
  return clock_.current_beat();
}

// A failed start is already logged by the player; here we only report it.
bool Orchestrator::start_track(Track &track, double beat) {
  try {
    track.player->schedule_start(beat);
    return true;
  } catch (const audio::EngineError &e) {
    logging::warn() << "Track " << track.id << " ("
                    << track.player->sample_name()
                    << ") not started: " << e.what();
    return false;
  }
}

int Orchestrator::add(int sampleId, std::string name, double originalBpm,
                      std::shared_ptr<const audio::PcmBuffer> buffer) {
  auto player = std::make_unique<SyncedPlayer>(
      engine_, std::move(buffer), clock_, originalBpm, sampleId,
      std::move(name));
  tracks_.push_back(Track{nextId_++, std::move(player)});
  Track &track = tracks_.back();

  logging::info() << "Added track " << track.id << ": "
                  << track.player->sample_name() << " (" << originalBpm
                  << " BPM)";

  if (playing_) {
    const double beat = next_loop_boundary();
    if (start_track(track, beat))
      logging::info() << "Scheduled " << track.player->sample_name()
                      << " to join at beat " << beat;
  }
  return track.id;
}

bool Orchestrator::remove(int trackId) {
  auto it = std::find_if(tracks_.begin(), tracks_.end(),
                         [trackId](const Track &t) { return t.id == trackId; });
  if (it == tracks_.end())
    return false;
  logging::info() << "Removed track " << trackId << ": "
                  << it->player->sample_name();
  tracks_.erase(it);
  return true;
}

void Orchestrator::remove_all() {
  tracks_.clear();
  logging::info() << "Removed all tracks";
}

std::optional<int> Orchestrator::find_by_sample(int sampleId) const {
  for (const auto &t : tracks_)
    if (t.player->sample_id() == sampleId)
      return t.id;
  return std::nullopt;
}

std::vector<int> Orchestrator::play() {
  std::vector<int> failed;
  if (playing_)
    return failed;

  // One beat for everyone, taken once.
  const double beat = target_beat();
  for (auto &t : tracks_)
    if (!start_track(t, beat))
      failed.push_back(t.id);

  playing_ = true;
  logging::info() << "Started playback at beat " << beat << " ("
                  << tracks_.size() - failed.size() << "/" << tracks_.size()
                  << " tracks)";
  return failed;
}

void Orchestrator::stop() {
  if (!playing_)
    return;
  for (auto &t : tracks_)
    t.player->stop();
  playing_ = false;
  logging::info() << "Stopped playback";
}

void Orchestrator::set_bpm(double bpm) {
  clock_.set_bpm(bpm);
  for (auto &t : tracks_)
    t.player->adjust_playback_rate();
  logging::info() << "Tempo set to " << bpm << " BPM";
}

std::size_t Orchestrator::check_and_correct_drift() {
  std::size_t corrected = 0;
  const timing::RealTime now = timing::RealClock::now();
  for (auto &t : tracks_) {
    if (!t.player->is_playing())
      continue;
    const double drift = t.player->calculate_drift();
    if (config_.logDrift)
      driftLog_.record(t.id, drift * 1000.0, now);
    if (t.player->correct_drift_if_needed(config_.driftThresholdSeconds))
      ++corrected;
  }
  if (corrected > 0)
    logging::debug() << "Drift check resynced " << corrected << " track(s)";
  return corrected;
}

void Orchestrator::set_volume(int trackId, float volume) {
  require(trackId).player->set_volume(volume);
}

void Orchestrator::set_muted(int trackId, bool muted) {
  require(trackId).player->set_muted(muted);
}

void Orchestrator::set_master_volume(float volume) {
  const float v = std::clamp(volume, 0.0f, 1.0f);
  engine_.set_master_gain(v);
  masterVolume_ = v;
  logging::debug() << "Master volume " << v;
}

double Orchestrator::phase(int trackId) const {
  const Track *t = find(trackId);
  return t ? t->player->current_phase() : 0.0;
}

std::vector<PlayerStatus> Orchestrator::status() const {
  std::vector<PlayerStatus> out;
  out.reserve(tracks_.size());
  for (const auto &t : tracks_)
    out.push_back(t.player->status());
  return out;
}

DriftStatistics Orchestrator::drift_statistics() const {
  DriftStatistics stats;
  stats.overall = driftLog_.summary();
  stats.byTrack = driftLog_.by_track();
  stats.thresholdMs = config_.driftThresholdSeconds * 1000.0;
  return stats;
}

} // namespace playback
