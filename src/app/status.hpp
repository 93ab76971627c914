// src/app/status.hpp
// Compact console views of a running session.
// - print_status: one line per track (phase, drift, heard drift, rate)
// - print_drift_statistics: summary of the drift log on exit

#pragma once
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

#include "playback/drift_log.hpp"
#include "playback/synced_player.hpp"

namespace app {

inline void print_status(const std::vector<playback::PlayerStatus> &tracks,
                         double beat, double bpm,
                         std::ostream &out = std::cout) {
  out << std::fixed << std::setprecision(2) << "beat " << beat << " @ " << bpm
      << " BPM\n";
  for (const auto &t : tracks) {
    out << "  [" << t.sampleId << "] " << std::left << std::setw(24)
        << t.sampleName << std::right << (t.playing ? " play" : " stop")
        << (t.muted ? " mute" : "     ") << "  phase=" << std::setprecision(3)
        << t.phase << "  drift=" << std::setprecision(2) << t.driftMs << "ms";
    if (t.measuredDriftMs)
      out << " (heard " << *t.measuredDriftMs << "ms)";
    out << "  rate=" << std::setprecision(3) << t.rate << "\n";
  }
}

inline void print_summary_line(const char *label,
                               const playback::DriftSummary &s,
                               std::ostream &out) {
  out << "  " << std::left << std::setw(24) << label << std::right
      << std::fixed << std::setprecision(2) << " max=" << s.maxMs
      << " min=" << s.minMs << " avg=" << s.avgMs << " (n=" << s.count
      << ")\n";
}

inline void print_drift_statistics(const playback::DriftStatistics &stats,
                                   std::ostream &out = std::cout) {
  if (stats.overall.count == 0) {
    out << "No drift data available\n";
    return;
  }
  out << "Drift (ms), threshold " << std::fixed << std::setprecision(1)
      << stats.thresholdMs << "\n";
  print_summary_line("overall", stats.overall, out);
  for (const auto &kv : stats.byTrack) {
    const std::string label = "track " + std::to_string(kv.first);
    print_summary_line(label.c_str(), kv.second, out);
  }
}

} // namespace app
