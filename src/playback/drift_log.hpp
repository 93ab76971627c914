// src/playback/drift_log.hpp
// Rolling record of drift measurements, for diagnostics.
//
// The orchestrator appends one entry per playing track per drift check.
// Capacity is bounded; the oldest entries fall off first.

#pragma once
#include <cstddef>
#include <deque>
#include <map>

#include "timing/clock.hpp"

namespace playback {

struct DriftEntry {
  timing::RealTime time;
  int trackId = 0;
  double driftMs = 0.0;
};

struct DriftSummary {
  double maxMs = 0.0;
  double minMs = 0.0;
  double avgMs = 0.0;
  std::size_t count = 0;
};

struct DriftStatistics {
  DriftSummary overall;
  std::map<int, DriftSummary> byTrack; // keyed by track id
  double thresholdMs = 0.0;
};

class DriftLog {
public:
  explicit DriftLog(std::size_t capacity = 4096);

  void record(int trackId, double driftMs, timing::RealTime when);
  void clear() { entries_.clear(); }

  std::size_t size() const { return entries_.size(); }
  bool empty() const { return entries_.empty(); }
  const std::deque<DriftEntry> &entries() const { return entries_; }

  DriftSummary summary() const;
  std::map<int, DriftSummary> by_track() const;

private:
  std::size_t capacity_;
  std::deque<DriftEntry> entries_;
};

} // namespace playback
