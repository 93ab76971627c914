// src/timing/manual_clock.cpp

#include "timing/manual_clock.hpp"

#include <stdexcept>

namespace timing {

namespace {

// Far enough from the steady_clock epoch that beats before 0 still map to a
// representable instant.
const RealTime kSyntheticEpoch =
    RealTime{} + std::chrono::duration_cast<RealClock::duration>(
                     std::chrono::hours(24));

RealClock::duration to_duration(double seconds) {
  return std::chrono::duration_cast<RealClock::duration>(Seconds(seconds));
}

} // namespace

ManualClock::ManualClock(double bpm, int beatsPerBar, int barsPerLoop)
    : bpm_(bpm), beatsPerBar_(beatsPerBar), barsPerLoop_(barsPerLoop),
      now_(kSyntheticEpoch) {
  if (!(bpm > 0.0))
    throw std::invalid_argument("ManualClock: bpm must be > 0");
  if (beatsPerBar < 1 || barsPerLoop < 1)
    throw std::invalid_argument("ManualClock: loop must be at least 1 beat");
}

double ManualClock::current_phase() const {
  return loop_phase(beat_, beats_per_loop(*this));
}

RealTime ManualClock::time_for_beat(double beat) const {
  return now_ + to_duration((beat - beat_) * seconds_per_beat(bpm_));
}

void ManualClock::set_bpm(double bpm) {
  if (!(bpm > 0.0))
    throw std::invalid_argument("ManualClock: bpm must be > 0");
  // (now_, beat_) is already the anchor; only the slope changes.
  bpm_ = bpm;
}

void ManualClock::set_current_beat(double beat) {
  now_ = time_for_beat(beat);
  beat_ = beat;
}

void ManualClock::advance(double beats) { set_current_beat(beat_ + beats); }

void ManualClock::advance_time(Seconds dt) {
  beat_ += dt.count() / seconds_per_beat(bpm_);
  now_ += to_duration(dt.count());
}

} // namespace timing
