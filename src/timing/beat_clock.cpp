// src/timing/beat_clock.cpp

#include "timing/beat_clock.hpp"

#include "common/log.hpp"

#include <cmath>
#include <stdexcept>
#include <string>

namespace timing {

namespace {

void require(bool cond, const std::string &msg) {
  if (!cond)
    throw std::invalid_argument(msg);
}

} // namespace

BeatClock::BeatClock(double sampleRate, double bpm, int beatsPerBar,
                     int barsPerLoop)
    : sampleRate_(sampleRate), beatsPerBar_(beatsPerBar),
      barsPerLoop_(barsPerLoop) {
  require(std::isfinite(sampleRate) && sampleRate > 0.0,
          "BeatClock: sample rate must be > 0");
  require(std::isfinite(bpm) && bpm > 0.0, "BeatClock: bpm must be > 0");
  require(beatsPerBar >= 1, "BeatClock: beats per bar must be >= 1");
  require(barsPerLoop >= 1, "BeatClock: bars per loop must be >= 1");

  const std::uint32_t begun = begin_write();
  store(Mapping{RealClock::now().time_since_epoch().count(), 0.0, bpm});
  end_write(begun);

  logging::debug() << "BeatClock initialized: " << bpm << " BPM, "
                   << sampleRate << " Hz, " << beatsPerBar << "x"
                   << barsPerLoop << " loop";
}

// Readers retry while a publish is in flight or raced them. The writer's
// window is three relaxed stores, so the loop almost never spins.
BeatClock::Mapping BeatClock::snapshot(RealTime *now) const {
  Mapping m{};
  for (;;) {
    const std::uint32_t before = seq_.load(std::memory_order_acquire);
    if (before & 1u)
      continue;
    m.originTicks = originTicks_.load(std::memory_order_relaxed);
    m.originBeat = originBeat_.load(std::memory_order_relaxed);
    m.bpm = bpm_.load(std::memory_order_relaxed);
    if (now != nullptr) {
      *now = RealClock::now();
      std::atomic_thread_fence(std::memory_order_seq_cst);
    } else {
      std::atomic_thread_fence(std::memory_order_acquire);
    }
    if (seq_.load(std::memory_order_relaxed) == before)
      return m;
  }
}

// Writers hold writeMutex_ (or are the constructor).
std::uint32_t BeatClock::begin_write() {
  const std::uint32_t s = seq_.load(std::memory_order_relaxed);
  seq_.store(s + 1, std::memory_order_relaxed);
  std::atomic_thread_fence(std::memory_order_seq_cst);
  return s;
}

void BeatClock::store(const Mapping &m) {
  originTicks_.store(m.originTicks, std::memory_order_relaxed);
  originBeat_.store(m.originBeat, std::memory_order_relaxed);
  bpm_.store(m.bpm, std::memory_order_relaxed);
}

void BeatClock::end_write(std::uint32_t begun) {
  seq_.store(begun + 2, std::memory_order_release);
}

double BeatClock::beat_at(const Mapping &m, RealTime t) {
  const RealTime origin{RealClock::duration(m.originTicks)};
  const double elapsed = Seconds(t - origin).count();
  return m.originBeat + elapsed / seconds_per_beat(m.bpm);
}

double BeatClock::current_beat() const {
  RealTime now;
  const Mapping m = snapshot(&now);
  return beat_at(m, now);
}

double BeatClock::current_phase() const {
  return loop_phase(current_beat(), beats_per_loop(*this));
}

RealTime BeatClock::time_for_beat(double beat) const {
  const Mapping m = snapshot();
  const RealTime origin{RealClock::duration(m.originTicks)};
  const Seconds offset((beat - m.originBeat) * seconds_per_beat(m.bpm));
  return origin + std::chrono::duration_cast<RealClock::duration>(offset);
}

double BeatClock::bpm() const { return snapshot().bpm; }

void BeatClock::set_bpm(double bpm) {
  require(std::isfinite(bpm) && bpm > 0.0, "BeatClock: bpm must be > 0");

  std::lock_guard<std::mutex> lock(writeMutex_);
  const std::uint32_t begun = begin_write();
  const RealTime now = RealClock::now();
  // The only writer, so the current mapping can be read directly.
  const Mapping old{originTicks_.load(std::memory_order_relaxed),
                    originBeat_.load(std::memory_order_relaxed),
                    bpm_.load(std::memory_order_relaxed)};
  const double beatNow = beat_at(old, now);
  store(Mapping{now.time_since_epoch().count(), beatNow, bpm});
  end_write(begun);

  logging::debug() << "BeatClock tempo " << old.bpm << " -> " << bpm
                   << " BPM at beat " << beatNow;
}

double BeatClock::current_loop_beat() const {
  return loop_position(current_beat(), beats_per_loop(*this));
}

std::int64_t BeatClock::sample_for_beat(double beat) const {
  const double seconds = beat * seconds_per_beat(bpm());
  return static_cast<std::int64_t>(std::llround(seconds * sampleRate_));
}

double BeatClock::next_beat_boundary(double division) const {
  require(division > 0.0, "BeatClock: beat division must be > 0");
  return std::ceil(current_beat() / division) * division;
}

double BeatClock::time_until_next_beat_boundary(double division) const {
  require(division > 0.0, "BeatClock: beat division must be > 0");
  RealTime now;
  const Mapping m = snapshot(&now);
  const double beat = beat_at(m, now);
  const double next = std::ceil(beat / division) * division;
  return (next - beat) * seconds_per_beat(m.bpm);
}

} // namespace timing
