// src/app/cli.hpp
// Minimal, robust CLI parsing for loopsync.
// Responsibilities:
//  - Extract the positional loops, each as <file>@<bpm>.
//  - Parse the session options (tempo, loop grid, drift policy, run length).
//  - Validate that every loop file exists (fail early with a clear error).
//
// Design notes:
//  * Header-only to keep wiring simple.
//  * We throw UsageError for anything the user typed wrong; main() catches,
//    prints and exits with 2.
//
// Usage from main.cpp:
//   app::Cli cli = app::parse_cli(argc, argv);
//   cli.loops        --> files with their authored tempo
//   cli.tempoChanges --> scheduled tempo changes, sorted by time

#pragma once
#include <algorithm>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

#include "common/log.hpp"
#include "playback/orchestrator.hpp"

namespace app {

struct UsageError : std::runtime_error {
  explicit UsageError(const std::string &what) : std::runtime_error(what) {}
};

struct LoopArg {
  std::filesystem::path path;
  double bpm = 0.0; // tempo the loop was recorded at
};

struct TempoChange {
  double atSeconds = 0.0; // since playback started
  double bpm = 0.0;
};

struct Cli {
  std::vector<LoopArg> loops;
  double bpm = 84.0;
  int beatsPerBar = 4;
  int barsPerLoop = 4;
  unsigned sampleRate = 48000;
  double thresholdMs = 15.0;
  int checkMs = 2000;
  double durationSec = 30.0;
  std::vector<TempoChange> tempoChanges;
  playback::StartAlignment align = playback::StartAlignment::NextLoop;
  float masterVolume = 1.0f;
  logging::Level logLevel = logging::Level::Info;
  bool showStatus = true;
};

inline std::string usage(const std::string &prog) {
  return "Usage:\n  " + prog +
         " [options] <file@bpm>...\n"
         "Options:\n"
         "  --bpm <n>             Master tempo (default 84)\n"
         "  --beats-per-bar <n>   Beats per bar (default 4)\n"
         "  --bars-per-loop <n>   Bars per loop (default 4)\n"
         "  --rate <hz>           Output sample rate (default 48000)\n"
         "  --threshold-ms <x>    Drift that triggers a resync (default 15)\n"
         "  --check-ms <n>        Drift check interval (default 2000)\n"
         "  --duration <s>        Seconds to play (default 30)\n"
         "  --tempo <sec>:<bpm>   Change tempo at a time (repeatable)\n"
         "  --align now|beat|loop Where playback starts (default loop)\n"
         "  --volume <0..1>       Master volume (default 1)\n"
         "  --verbose             Debug output\n"
         "  --quiet               Warnings only, no status table\n";
}

// Small helper: true if s looks like a flag (starts with '-' and not just "-")
inline bool is_flag_like(const std::string &s) {
  return !s.empty() && s[0] == '-' && s != "-";
}

// Parse a whole string as a double; anything left over is an error.
inline double parse_double(const std::string &flag, const std::string &text) {
  std::size_t used = 0;
  double v = 0.0;
  try {
    v = std::stod(text, &used);
  } catch (const std::exception &) {
    throw UsageError(flag + " expects a number, got '" + text + "'");
  }
  if (used != text.size())
    throw UsageError(flag + " expects a number, got '" + text + "'");
  return v;
}

inline int parse_int(const std::string &flag, const std::string &text) {
  std::size_t used = 0;
  int v = 0;
  try {
    v = std::stoi(text, &used);
  } catch (const std::exception &) {
    throw UsageError(flag + " expects an integer, got '" + text + "'");
  }
  if (used != text.size())
    throw UsageError(flag + " expects an integer, got '" + text + "'");
  return v;
}

// "<file>@<bpm>"; the last '@' splits, so paths may contain '@'.
inline LoopArg parse_loop(const std::string &arg) {
  const auto at = arg.rfind('@');
  if (at == std::string::npos || at == 0 || at + 1 == arg.size())
    throw UsageError("Loop must be given as <file>@<bpm>: " + arg);

  LoopArg loop;
  loop.path = arg.substr(0, at);
  loop.bpm = parse_double("loop tempo", arg.substr(at + 1));
  if (!(loop.bpm > 0.0))
    throw UsageError("Loop tempo must be > 0: " + arg);
  if (!std::filesystem::exists(loop.path) ||
      !std::filesystem::is_regular_file(loop.path))
    throw UsageError("Loop file not found: " + loop.path.string());
  return loop;
}

// "<sec>:<bpm>"
inline TempoChange parse_tempo_change(const std::string &arg) {
  const auto colon = arg.find(':');
  if (colon == std::string::npos)
    throw UsageError("--tempo expects <sec>:<bpm>, got '" + arg + "'");
  TempoChange tc;
  tc.atSeconds = parse_double("--tempo", arg.substr(0, colon));
  tc.bpm = parse_double("--tempo", arg.substr(colon + 1));
  if (tc.atSeconds < 0.0 || !(tc.bpm > 0.0))
    throw UsageError("--tempo needs a time >= 0 and a tempo > 0: " + arg);
  return tc;
}

inline playback::StartAlignment parse_align(const std::string &text) {
  if (text == "now")
    return playback::StartAlignment::Immediate;
  if (text == "beat")
    return playback::StartAlignment::NextBeat;
  if (text == "loop")
    return playback::StartAlignment::NextLoop;
  throw UsageError("--align expects now, beat or loop, got '" + text + "'");
}

// Parse argv into our Cli struct.
// Contract:
//  - At least one positional <file>@<bpm>.
//  - Options may appear anywhere.
//  - Throws UsageError on any invalid input (including --help).
inline Cli parse_cli(int argc, char **argv) {
  const std::string prog = argc > 0 ? argv[0] : "loopsync";
  Cli cli;

  // 1) Walk the arguments
  for (int i = 1; i < argc; ++i) {
    const std::string a = argv[i];
    auto value = [&]() -> std::string {
      if (i + 1 >= argc)
        throw UsageError(a + " requires a value");
      return argv[++i];
    };

    if (a == "--help" || a == "-h") {
      throw UsageError(usage(prog));
    } else if (a == "--bpm") {
      cli.bpm = parse_double(a, value());
    } else if (a == "--beats-per-bar") {
      cli.beatsPerBar = parse_int(a, value());
    } else if (a == "--bars-per-loop") {
      cli.barsPerLoop = parse_int(a, value());
    } else if (a == "--rate") {
      const int rate = parse_int(a, value());
      if (rate <= 0)
        throw UsageError("--rate must be > 0");
      cli.sampleRate = static_cast<unsigned>(rate);
    } else if (a == "--threshold-ms") {
      cli.thresholdMs = parse_double(a, value());
    } else if (a == "--check-ms") {
      cli.checkMs = parse_int(a, value());
    } else if (a == "--duration") {
      cli.durationSec = parse_double(a, value());
    } else if (a == "--tempo") {
      cli.tempoChanges.push_back(parse_tempo_change(value()));
    } else if (a == "--align") {
      cli.align = parse_align(value());
    } else if (a == "--volume") {
      const double v = parse_double(a, value());
      if (v < 0.0 || v > 1.0)
        throw UsageError("--volume must be between 0 and 1");
      cli.masterVolume = static_cast<float>(v);
    } else if (a == "--verbose") {
      cli.logLevel = logging::Level::Debug;
    } else if (a == "--quiet") {
      cli.logLevel = logging::Level::Warn;
      cli.showStatus = false;
    } else if (is_flag_like(a)) {
      // Unknown flags are errors, to avoid surprises.
      throw UsageError("Unknown option: " + a);
    } else {
      cli.loops.push_back(parse_loop(a));
    }
  }

  // 2) Cross-checks
  if (cli.loops.empty())
    throw UsageError(usage(prog));
  if (!(cli.bpm > 0.0))
    throw UsageError("--bpm must be > 0");
  if (cli.beatsPerBar < 1 || cli.barsPerLoop < 1)
    throw UsageError("--beats-per-bar and --bars-per-loop must be >= 1");
  if (!(cli.thresholdMs > 0.0))
    throw UsageError("--threshold-ms must be > 0");
  if (cli.checkMs <= 0)
    throw UsageError("--check-ms must be > 0");
  if (!(cli.durationSec > 0.0))
    throw UsageError("--duration must be > 0");

  std::stable_sort(cli.tempoChanges.begin(), cli.tempoChanges.end(),
                   [](const TempoChange &x, const TempoChange &y) {
                     return x.atSeconds < y.atSeconds;
                   });

  // 3) Return the parsed/validated CLI
  for (auto &loop : cli.loops)
    loop.path = std::filesystem::canonical(loop.path); // nice absolute path
  return cli;
}

} // namespace app
