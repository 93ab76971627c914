// src/playback/drift_log.cpp

#include "playback/drift_log.hpp"

#include <algorithm>
#include <stdexcept>

namespace playback {

namespace {

// Fold one measurement into a running summary (avgMs holds the sum until
// finish() divides it).
void accumulate(DriftSummary &s, double ms) {
  if (s.count == 0) {
    s.maxMs = ms;
    s.minMs = ms;
  } else {
    s.maxMs = std::max(s.maxMs, ms);
    s.minMs = std::min(s.minMs, ms);
  }
  s.avgMs += ms;
  ++s.count;
}

void finish(DriftSummary &s) {
  if (s.count > 0)
    s.avgMs /= static_cast<double>(s.count);
}

} // namespace

DriftLog::DriftLog(std::size_t capacity) : capacity_(capacity) {
  if (capacity == 0)
    throw std::invalid_argument("DriftLog: capacity must be > 0");
}

void DriftLog::record(int trackId, double driftMs, timing::RealTime when) {
  if (entries_.size() == capacity_)
    entries_.pop_front();
  entries_.push_back(DriftEntry{when, trackId, driftMs});
}

DriftSummary DriftLog::summary() const {
  DriftSummary s;
  for (const auto &e : entries_)
    accumulate(s, e.driftMs);
  finish(s);
  return s;
}

std::map<int, DriftSummary> DriftLog::by_track() const {
  std::map<int, DriftSummary> out;
  for (const auto &e : entries_)
    accumulate(out[e.trackId], e.driftMs);
  for (auto &kv : out)
    finish(kv.second);
  return out;
}

} // namespace playback
