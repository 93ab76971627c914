// src/timing/manual_clock.hpp
// A deterministic clock that only moves when told to.
//
// It keeps its own notion of "now" (starting at a fixed synthetic instant)
// and the beat reached at that instant. advance()/advance_time() move both
// together along the current slope; set_current_beat() moves them to an
// arbitrary beat. time_for_beat() is the exact inverse around (now, beat),
// so scheduling code sees the same arithmetic a real clock gives it.
//
// Intended for tests and offline runs on one thread; it is not synchronized.

#pragma once
#include "timing/clock.hpp"

namespace timing {

class ManualClock final : public MutableClock {
public:
  explicit ManualClock(double bpm, int beatsPerBar = 4, int barsPerLoop = 4);

  double current_beat() const override { return beat_; }
  double current_phase() const override;
  RealTime time_for_beat(double beat) const override;
  double bpm() const override { return bpm_; }
  int beats_per_bar() const override { return beatsPerBar_; }
  int bars_per_loop() const override { return barsPerLoop_; }

  void set_bpm(double bpm) override;

  void set_current_beat(double beat);
  void advance(double beats);
  void advance_time(Seconds dt);

  RealTime now() const { return now_; }

private:
  double bpm_;
  int beatsPerBar_;
  int barsPerLoop_;
  double beat_ = 0.0;
  RealTime now_;
};

} // namespace timing
