// src/playback/synced_player.cpp

#include "playback/synced_player.hpp"

#include "common/log.hpp"

#include <algorithm>
#include <cmath>
#include <optional>
#include <stdexcept>
#include <string>

namespace playback {

namespace {

std::shared_ptr<const audio::PcmBuffer>
checked(std::shared_ptr<const audio::PcmBuffer> buffer) {
  if (!buffer)
    throw std::invalid_argument("SyncedPlayer: buffer must not be null");
  return buffer;
}

} // namespace

SyncedPlayer::SyncedPlayer(audio::Engine &engine,
                           std::shared_ptr<const audio::PcmBuffer> buffer,
                           const timing::Clock &clock, double originalBpm,
                           int sampleId, std::string sampleName)
    : engine_(engine), buffer_(checked(std::move(buffer))), clock_(clock),
      originalBpm_(originalBpm), sampleId_(sampleId),
      sampleName_(std::move(sampleName)) {
  if (!std::isfinite(originalBpm) || originalBpm <= 0.0)
    throw std::invalid_argument("SyncedPlayer: original BPM must be > 0 (" +
                                sampleName_ + ")");

  voice_ = engine_.attach(buffer_);
  try {
    adjust_playback_rate();
  } catch (const audio::EngineError &) {
    engine_.detach(voice_);
    throw;
  }

  logging::debug() << "SyncedPlayer initialized: " << sampleName_
                   << " (ID: " << sampleId_ << ", BPM: " << originalBpm_
                   << ")";
}

SyncedPlayer::~SyncedPlayer() {
  try {
    engine_.halt(voice_);
  } catch (const audio::EngineError &e) {
    logging::warn() << "Halting " << sampleName_ << ": " << e.what();
  }
  try {
    engine_.detach(voice_);
  } catch (const audio::EngineError &e) {
    logging::warn() << "Releasing voice for " << sampleName_ << ": "
                    << e.what();
  }
}

void SyncedPlayer::adjust_playback_rate() {
  const double clockBpm = clock_.bpm();
  const double rate = clockBpm / originalBpm_;
  engine_.set_rate(voice_, rate);
  rate_.store(rate);

  logging::debug() << "Adjusted rate for " << sampleName_ << ": " << rate
                   << " (original " << originalBpm_ << " BPM, clock "
                   << clockBpm << " BPM)";
}

// Returns the engine's error message when the start could not be placed;
// the player is Stopped in that case.
std::optional<std::string> SyncedPlayer::start_voice(double beat) {
  startBeat_.store(beat);
  const timing::RealTime when = clock_.time_for_beat(beat);
  try {
    engine_.start_at(voice_, when);
  } catch (const audio::EngineError &e) {
    playing_.store(false);
    logging::error() << "Could not schedule " << sampleName_ << " (ID: "
                     << sampleId_ << ") at beat " << beat << ": " << e.what();
    return std::string(e.what());
  }
  playing_.store(true);

  logging::debug() << "Scheduled " << sampleName_ << " (ID: " << sampleId_
                   << ") to start at beat " << beat;
  return std::nullopt;
}

void SyncedPlayer::schedule_start(double beat) {
  if (const auto error = start_voice(beat))
    throw audio::EngineError(*error);
}

double SyncedPlayer::schedule_start_at_next_beat() {
  const double beat = std::ceil(clock_.current_beat());
  schedule_start(beat);
  return beat;
}

void SyncedPlayer::stop() {
  playing_.store(false);
  engine_.halt(voice_);
  logging::debug() << "Stopped " << sampleName_ << " (ID: " << sampleId_
                   << ")";
}

void SyncedPlayer::resync_to_nearest_beat() {
  if (!is_playing())
    return;
  const double beat = clock_.current_beat();
  const double nearest = std::round(beat);
  logging::info() << "Resyncing " << sampleName_ << " from beat " << beat
                  << " to " << nearest;
  schedule_start(nearest);
}

double SyncedPlayer::current_phase() const {
  if (!is_playing())
    return 0.0;
  const double elapsed = clock_.current_beat() - start_beat();
  return timing::loop_phase(elapsed, timing::beats_per_loop(clock_));
}

// Shortest way around the loop between two beat positions, in seconds at
// the clock tempo.
double SyncedPlayer::loop_distance(double clockBeat, double playerBeat) const {
  const double loopBeats = timing::beats_per_loop(clock_);
  const double clockPos = timing::loop_position(clockBeat, loopBeats);
  const double playerPos = timing::loop_position(playerBeat, loopBeats);

  double diff = std::abs(playerPos - clockPos);
  if (diff > loopBeats / 2.0)
    diff = loopBeats - diff;
  return diff * timing::seconds_per_beat(clock_.bpm());
}

double SyncedPlayer::calculate_drift() const {
  if (!is_playing())
    return 0.0;
  const double clockBeat = clock_.current_beat();
  return loop_distance(clockBeat, clockBeat - start_beat());
}

// Beats of content the engine has played since the start, at the authored
// tempo: frames / sampleRate / secondsPerBeat(originalBpm).
std::optional<double> SyncedPlayer::measured_beat() const {
  const std::optional<double> frames = engine_.playhead(voice_);
  if (!frames)
    return std::nullopt;
  const double contentSeconds = *frames / buffer_->sampleRate;
  return contentSeconds / timing::seconds_per_beat(originalBpm_);
}

std::optional<double> SyncedPlayer::measured_drift() const {
  if (!is_playing())
    return std::nullopt;
  const std::optional<double> played = measured_beat();
  if (!played)
    return std::nullopt;
  const double clockBeat = clock_.current_beat();
  return loop_distance(clockBeat - start_beat(), *played);
}

bool SyncedPlayer::correct_drift_if_needed(double thresholdSeconds) {
  const double drift = calculate_drift();
  if (!(drift > thresholdSeconds))
    return false;

  const double beat = clock_.current_beat();
  logging::info() << "Drift detected for " << sampleName_ << " (ID: "
                  << sampleId_ << "): " << drift * 1000.0
                  << " ms, resyncing at beat " << beat;
  // True means a resync was attempted. A failed one leaves the player
  // Stopped; restarting it is the owner's call.
  if (start_voice(beat))
    logging::warn() << sampleName_ << " stays stopped until restarted";
  return true;
}

void SyncedPlayer::apply_gain() {
  engine_.set_gain(voice_, muted_.load() ? 0.0f : volume_.load());
}

void SyncedPlayer::set_volume(float volume) {
  volume_.store(std::clamp(volume, 0.0f, 1.0f));
  apply_gain();
}

void SyncedPlayer::set_muted(bool muted) {
  muted_.store(muted);
  apply_gain();
  logging::debug() << (muted ? "Muted " : "Unmuted ") << sampleName_;
}

PlayerStatus SyncedPlayer::status() const {
  PlayerStatus s;
  s.sampleId = sampleId_;
  s.sampleName = sampleName_;
  s.playing = is_playing();
  s.originalBpm = originalBpm_;
  s.clockBpm = clock_.bpm();
  s.rate = rate_multiplier();
  s.phase = current_phase();
  s.driftMs = calculate_drift() * 1000.0;
  if (const auto measured = measured_drift())
    s.measuredDriftMs = *measured * 1000.0;
  s.startBeat = start_beat();
  s.volume = volume();
  s.muted = is_muted();
  return s;
}

} // namespace playback
