// tests/drift_log_tests.cpp

#include <catch2/catch.hpp>

#include <stdexcept>

#include "playback/drift_log.hpp"

using playback::DriftLog;

TEST_CASE("Drift log summarizes measurements", "[drift]") {
  DriftLog log;
  const auto t = timing::RealClock::now();
  REQUIRE(log.summary().count == 0);

  log.record(1, 2.0, t);
  log.record(1, 6.0, t);
  log.record(2, 10.0, t);

  const auto s = log.summary();
  REQUIRE(s.count == 3);
  REQUIRE(s.maxMs == 10.0);
  REQUIRE(s.minMs == 2.0);
  REQUIRE(s.avgMs == Approx(6.0));

  const auto tracks = log.by_track();
  REQUIRE(tracks.size() == 2);
  REQUIRE(tracks.at(1).avgMs == Approx(4.0));
  REQUIRE(tracks.at(2).count == 1);

  log.clear();
  REQUIRE(log.empty());
}

TEST_CASE("Drift log drops the oldest entries past capacity", "[drift]") {
  DriftLog log(3);
  const auto t = timing::RealClock::now();
  for (int i = 1; i <= 5; ++i)
    log.record(i, i * 1.0, t);

  REQUIRE(log.size() == 3);
  REQUIRE(log.entries().front().trackId == 3);
  REQUIRE(log.summary().minMs == 3.0);

  REQUIRE_THROWS_AS(DriftLog(0), std::invalid_argument);
}
