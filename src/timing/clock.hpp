// src/timing/clock.hpp
// The beat clock capability shared by every player.
//
// Contract:
//  - current_beat(): fractional beats since the clock's reference instant.
//    Never wraps; loop-relative interpretation belongs to the caller.
//  - current_phase(): position inside one loop (beats_per_loop beats), [0,1).
//  - time_for_beat(b): the real-time instant (past or future) at which
//    current_beat() reads b under the current tempo.
//  - bpm(), beats_per_bar(), bars_per_loop(): the grid the beats live on.
//
// The read side must be safe from the audio thread: implementations keep
// these calls lock-free and allocation-free.
//
// Players only ever see `const Clock &`. Tempo changes go through
// MutableClock, which the owner of the session holds.

#pragma once
#include <chrono>
#include <cmath>

namespace timing {

using RealClock = std::chrono::steady_clock;
using RealTime = RealClock::time_point;
using Seconds = std::chrono::duration<double>;

class Clock {
public:
  virtual ~Clock() = default;

  virtual double current_beat() const = 0;
  virtual double current_phase() const = 0;
  virtual RealTime time_for_beat(double beat) const = 0;

  virtual double bpm() const = 0;
  virtual int beats_per_bar() const = 0;
  virtual int bars_per_loop() const = 0;
};

class MutableClock : public Clock {
public:
  // Install a new tempo without a jump in current_beat(); only the slope
  // changes from now on. Throws std::invalid_argument when bpm <= 0.
  virtual void set_bpm(double bpm) = 0;
};

// --- Helpers shared by clocks and players ---

inline double seconds_per_beat(double bpm) { return 60.0 / bpm; }

inline double beats_per_loop(const Clock &clock) {
  return static_cast<double>(clock.beats_per_bar() * clock.bars_per_loop());
}

// Position of `beat` inside a loop of `loopBeats` beats, in [0, loopBeats).
inline double loop_position(double beat, double loopBeats) {
  double pos = std::fmod(beat, loopBeats);
  if (pos < 0.0)
    pos += loopBeats;
  // fmod of a tiny negative value can round up to exactly loopBeats
  if (pos >= loopBeats)
    pos = 0.0;
  return pos;
}

// Phase in [0,1) of `beat` inside a loop of `loopBeats` beats.
inline double loop_phase(double beat, double loopBeats) {
  return loop_position(beat, loopBeats) / loopBeats;
}

} // namespace timing
