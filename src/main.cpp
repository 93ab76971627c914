// src/main.cpp
// loopsync: play several loops in phase against one beat clock.
// Flow: parse CLI -> open the device -> load loops -> start on one beat ->
// poll (tempo changes, drift checks, status) -> stop and report drift.

#include "app/cli.hpp"
#include "app/status.hpp"
#include "audio/miniaudio_engine.hpp"
#include "common/log.hpp"
#include "io/io.hpp"
#include "playback/orchestrator.hpp"
#include "timing/beat_clock.hpp"

#include <chrono>
#include <iostream>
#include <stdexcept>
#include <thread>

namespace {

// Poll period of the control loop. Drift checks and status prints run on
// their own (coarser) schedules inside it.
constexpr std::chrono::milliseconds kPoll{30};
constexpr std::chrono::seconds kStatusEvery{1};

void run_session(const app::Cli &cli, playback::Orchestrator &mix,
                 const timing::BeatClock &clock) {
  using namespace std::chrono;
  const auto start = steady_clock::now();
  const auto checkEvery = mix.config().checkInterval;
  auto nextCheck = start + checkEvery;
  auto nextStatus = start + kStatusEvery;
  std::size_t nextChange = 0;

  while (true) {
    std::this_thread::sleep_for(kPoll);
    const auto now = steady_clock::now();
    const double elapsed = duration<double>(now - start).count();
    if (elapsed >= cli.durationSec)
      break;

    // Tempo changes are sorted by time; apply every one that is due.
    while (nextChange < cli.tempoChanges.size() &&
           cli.tempoChanges[nextChange].atSeconds <= elapsed) {
      mix.set_bpm(cli.tempoChanges[nextChange].bpm);
      ++nextChange;
    }

    if (now >= nextCheck) {
      mix.check_and_correct_drift();
      nextCheck += checkEvery;
    }

    if (cli.showStatus && now >= nextStatus) {
      app::print_status(mix.status(), clock.current_beat(), clock.bpm());
      nextStatus += kStatusEvery;
    }
  }
}

} // namespace

int main(int argc, char **argv) {
  try {
    const app::Cli cli = app::parse_cli(argc, argv);
    logging::set_level(cli.logLevel);

    // 1) Output device first: loops are decoded at its rate and layout.
    audio::MiniaudioEngine engine(cli.sampleRate, 2);
    engine.start();

    // 2) The shared clock and the mix
    timing::BeatClock clock(engine.sample_rate(), cli.bpm, cli.beatsPerBar,
                            cli.barsPerLoop);

    playback::OrchestratorConfig config;
    config.driftThresholdSeconds = cli.thresholdMs / 1000.0;
    config.checkInterval = std::chrono::milliseconds(cli.checkMs);
    config.alignment = cli.align;
    playback::Orchestrator mix(engine, clock, config);
    mix.set_master_volume(cli.masterVolume);

    // 3) Load every loop (sample ids follow command-line order)
    int sampleId = 1;
    for (const auto &loop : cli.loops) {
      auto pcm =
          io::load_pcm(loop.path, engine.sample_rate(), engine.channels());
      logging::debug() << "Decoded " << loop.path.string() << ": "
                       << pcm->frames() << " frames, " << pcm->seconds()
                       << " s";
      mix.add(sampleId++, loop.path.filename().string(), loop.bpm,
              std::move(pcm));
    }

    // 4) Start everything on one beat
    const auto failed = mix.play();
    if (failed.size() == mix.size())
      throw std::runtime_error("No loop could be started");

    run_session(cli, mix, clock);

    // 5) Wrap up
    mix.stop();
    engine.stop();
    app::print_drift_statistics(mix.drift_statistics());
    return 0;
  } catch (const app::UsageError &ex) {
    std::cerr << ex.what() << "\n";
    return 2;
  } catch (const std::exception &ex) {
    std::cerr << "error: " << ex.what() << "\n";
    return 1;
  }
}
