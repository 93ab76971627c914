// tests/clock_tests.cpp

#include <catch2/catch.hpp>

#include <algorithm>
#include <atomic>
#include <cmath>
#include <functional>
#include <stdexcept>
#include <thread>
#include <vector>

#include "timing/beat_clock.hpp"
#include "timing/manual_clock.hpp"

using timing::BeatClock;
using timing::ManualClock;
using timing::Seconds;

TEST_CASE("BeatClock advances monotonically", "[timing]") {
  BeatClock clock(48000.0, 120.0);
  double last = clock.current_beat();
  for (int i = 0; i < 1000; ++i) {
    const double b = clock.current_beat();
    REQUIRE(b >= last);
    last = b;
  }
  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  REQUIRE(clock.current_beat() > 0.0);
}

TEST_CASE("BeatClock tempo change keeps the beat continuous", "[timing]") {
  BeatClock clock(48000.0, 84.0);
  std::this_thread::sleep_for(std::chrono::milliseconds(50));

  const double before = clock.current_beat();
  clock.set_bpm(168.0);
  const double after = clock.current_beat();

  REQUIRE(clock.bpm() == 168.0);
  REQUIRE(after >= before);
  REQUIRE(after - before < 0.05);
}

TEST_CASE("BeatClock maps beats to time under the current tempo", "[timing]") {
  BeatClock clock(48000.0, 120.0);
  const auto now = timing::RealClock::now();
  const double beat = clock.current_beat();

  // Two beats at 120 BPM are one second away.
  const auto target = clock.time_for_beat(beat + 2.0);
  REQUIRE(Seconds(target - now).count() == Approx(1.0).margin(0.05));

  // A beat already passed maps into the past.
  REQUIRE(clock.time_for_beat(beat - 1.0) < now);
}

TEST_CASE("BeatClock time for the current beat is now", "[timing]") {
  BeatClock clock(48000.0, 84.0);
  std::this_thread::sleep_for(std::chrono::milliseconds(10));
  clock.set_bpm(97.0);

  const auto before = timing::RealClock::now();
  const auto t = clock.time_for_beat(clock.current_beat());
  const auto after = timing::RealClock::now();

  // Only rounding to the clock tick separates the two.
  const auto tick = timing::RealClock::duration(1);
  REQUIRE(t >= before - tick);
  REQUIRE(t <= after + tick);
}

// Readers race a writer that flips the tempo. Between any two reads the beat
// must have advanced by an amount some tempo in [84, 168] explains for the
// real time that passed; a reader that saw half of an update would not.
TEST_CASE("BeatClock readers never see a half-published tempo", "[timing]") {
  constexpr double kSlow = 84.0, kFast = 168.0, kEps = 1e-6;
  BeatClock clock(48000.0, kSlow);
  std::atomic<bool> done{false};

  std::thread writer([&] {
    bool fast = false;
    while (!done.load()) {
      fast = !fast;
      clock.set_bpm(fast ? kFast : kSlow);
    }
  });

  struct Sample {
    timing::RealTime before, after;
    double beat;
  };
  auto read_many = [&clock](std::vector<Sample> &out) {
    for (auto &s : out) {
      s.before = timing::RealClock::now();
      s.beat = clock.current_beat();
      s.after = timing::RealClock::now();
    }
  };

  std::vector<std::vector<Sample>> runs(3, std::vector<Sample>(20000));
  std::vector<std::thread> readers;
  for (auto &run : runs)
    readers.emplace_back(read_many, std::ref(run));
  for (auto &r : readers)
    r.join();
  done.store(true);
  writer.join();

  for (const auto &run : runs) {
    for (std::size_t i = 1; i < run.size(); ++i) {
      const Sample &a = run[i - 1];
      const Sample &b = run[i];
      const double advanced = b.beat - a.beat;
      const double minSec = std::max(0.0, Seconds(b.before - a.after).count());
      const double maxSec = Seconds(b.after - a.before).count();
      REQUIRE(advanced >= minSec * kSlow / 60.0 - kEps);
      REQUIRE(advanced <= maxSec * kFast / 60.0 + kEps);
    }
  }
}

TEST_CASE("BeatClock sample positions", "[timing]") {
  BeatClock clock(48000.0, 120.0);
  REQUIRE(clock.sample_for_beat(1.0) == 24000);
  REQUIRE(clock.sample_for_beat(4.0) == 96000);
  REQUIRE(clock.sample_rate() == 48000.0);
}

TEST_CASE("BeatClock beat-grid boundaries", "[timing]") {
  BeatClock clock(48000.0, 120.0);
  const double next = clock.next_beat_boundary();
  REQUIRE(next >= clock.current_beat() - 1e-9);
  REQUIRE(next == Approx(std::ceil(next)));

  const double barLine = clock.next_beat_boundary(4.0);
  REQUIRE(std::fmod(barLine, 4.0) == Approx(0.0));

  const double wait = clock.time_until_next_beat_boundary();
  REQUIRE(wait >= 0.0);
  REQUIRE(wait <= 0.5 + 1e-9);

  REQUIRE_THROWS_AS(clock.next_beat_boundary(0.0), std::invalid_argument);
}

TEST_CASE("BeatClock rejects a bad grid or tempo", "[timing]") {
  REQUIRE_THROWS_AS((BeatClock(48000.0, 0.0)), std::invalid_argument);
  REQUIRE_THROWS_AS((BeatClock(48000.0, -10.0)), std::invalid_argument);
  REQUIRE_THROWS_AS((BeatClock(0.0, 120.0)), std::invalid_argument);
  REQUIRE_THROWS_AS((BeatClock(48000.0, 120.0, 0, 4)), std::invalid_argument);

  BeatClock clock(48000.0, 120.0);
  REQUIRE_THROWS_AS(clock.set_bpm(0.0), std::invalid_argument);
  REQUIRE(clock.bpm() == 120.0);
}

TEST_CASE("ManualClock only moves when told to", "[timing]") {
  ManualClock clock(120.0);
  REQUIRE(clock.current_beat() == 0.0);

  clock.advance_time(Seconds(1.0));
  REQUIRE(clock.current_beat() == Approx(2.0));

  clock.set_current_beat(18.0);
  REQUIRE(clock.current_phase() == Approx(2.0 / 16.0));
  REQUIRE(clock.time_for_beat(18.0) == clock.now());
}

TEST_CASE("ManualClock time mapping follows the tempo", "[timing]") {
  ManualClock clock(60.0);
  clock.set_current_beat(4.0);
  const auto at4 = clock.now();

  REQUIRE(Seconds(clock.time_for_beat(6.0) - at4).count() == Approx(2.0));

  clock.set_bpm(120.0);
  REQUIRE(clock.current_beat() == 4.0);
  REQUIRE(Seconds(clock.time_for_beat(6.0) - at4).count() == Approx(1.0));

  clock.advance(2.0);
  REQUIRE(Seconds(clock.now() - at4).count() == Approx(1.0));
}

TEST_CASE("ManualClock validation", "[timing]") {
  REQUIRE_THROWS_AS((ManualClock(0.0)), std::invalid_argument);
  REQUIRE_THROWS_AS((ManualClock(120.0, 4, 0)), std::invalid_argument);
  ManualClock clock(120.0);
  REQUIRE_THROWS_AS(clock.set_bpm(-1.0), std::invalid_argument);
}

TEST_CASE("Loop position wraps into the loop", "[timing]") {
  REQUIRE(timing::loop_position(17.0, 16.0) == Approx(1.0));
  REQUIRE(timing::loop_position(-1.0, 16.0) == Approx(15.0));
  REQUIRE(timing::loop_phase(8.0, 16.0) == Approx(0.5));
  REQUIRE(timing::seconds_per_beat(120.0) == Approx(0.5));
}
