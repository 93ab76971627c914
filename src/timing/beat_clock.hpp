// src/timing/beat_clock.hpp
// The session's timing authority: real time in, beats out.
//
// Mapping (for the current tempo):
//   beat(t) = origin.beat + (t - origin.time) / secondsPerBeat
//
// set_bpm() re-anchors the origin to (now, beat(now)) under the old slope and
// then installs the new slope, so current_beat() never jumps; only its rate
// of change does. The triple {origin.time, origin.beat, bpm} is published
// through a sequence lock: readers (audio thread, UI poller) never block and
// never allocate, and always see one complete mapping, old or new.
//
// Both sides read the time inside the lock window: the writer's anchor time
// is taken after the sequence goes odd, a reader's "now" before it checks the
// sequence again. So a reader that used the old mapping read a time at or
// before the new origin, and current_beat() is non-decreasing across readers
// even while the tempo changes.
//
// Construction validates everything up front; bad values throw
// std::invalid_argument instead of being clamped.

#pragma once
#include <atomic>
#include <cstdint>
#include <mutex>

#include "timing/clock.hpp"

namespace timing {

class BeatClock final : public MutableClock {
public:
  BeatClock(double sampleRate, double bpm, int beatsPerBar = 4,
            int barsPerLoop = 4);

  BeatClock(const BeatClock &) = delete;
  BeatClock &operator=(const BeatClock &) = delete;

  // --- Clock ---
  double current_beat() const override;
  double current_phase() const override;
  RealTime time_for_beat(double beat) const override;
  double bpm() const override;
  int beats_per_bar() const override { return beatsPerBar_; }
  int bars_per_loop() const override { return barsPerLoop_; }

  // --- MutableClock ---
  void set_bpm(double bpm) override;

  double sample_rate() const { return sampleRate_; }

  // Beat position within the loop, [0, beats_per_loop).
  double current_loop_beat() const;

  // Sample offset of `beat` from beat 0 at the current tempo.
  std::int64_t sample_for_beat(double beat) const;

  // First beat-grid line (multiples of `division` beats) at or after now.
  double next_beat_boundary(double division = 1.0) const;

  // Seconds from now until next_beat_boundary(division).
  double time_until_next_beat_boundary(double division = 1.0) const;

private:
  struct Mapping {
    RealClock::rep originTicks; // RealClock::duration ticks since its epoch
    double originBeat;
    double bpm;
  };

  // When `now` is given it is filled with the time read inside the window.
  Mapping snapshot(RealTime *now = nullptr) const;
  std::uint32_t begin_write();
  void store(const Mapping &m);
  void end_write(std::uint32_t begun);
  static double beat_at(const Mapping &m, RealTime t);

  const double sampleRate_;
  const int beatsPerBar_;
  const int barsPerLoop_;

  // Sequence lock: odd while a writer is mid-publish.
  std::atomic<std::uint32_t> seq_{0};
  std::atomic<RealClock::rep> originTicks_{0};
  std::atomic<double> originBeat_{0.0};
  std::atomic<double> bpm_{0.0};

  // Serializes writers; readers never touch it.
  std::mutex writeMutex_;
};

} // namespace timing
