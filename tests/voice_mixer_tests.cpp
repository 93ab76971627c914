// tests/voice_mixer_tests.cpp

#include <catch2/catch.hpp>

#include <memory>
#include <vector>

#include "audio/voice_mixer.hpp"

using audio::EngineError;
using audio::PcmBuffer;
using audio::VoiceMixer;

namespace {

constexpr unsigned kRate = 48000;

// Mono buffer whose sample i holds i, so output values read as positions.
std::shared_ptr<const PcmBuffer> ramp(std::size_t frames) {
  auto buf = std::make_shared<PcmBuffer>();
  buf->channels = 1;
  buf->sampleRate = kRate;
  buf->samples.resize(frames);
  for (std::size_t i = 0; i < frames; ++i)
    buf->samples[i] = static_cast<float>(i);
  return buf;
}

std::shared_ptr<const PcmBuffer> constant(std::size_t frames, float value) {
  auto buf = std::make_shared<PcmBuffer>();
  buf->channels = 1;
  buf->sampleRate = kRate;
  buf->samples.assign(frames, value);
  return buf;
}

std::vector<float> render(VoiceMixer &mixer, std::size_t frames,
                          std::int64_t firstFrame) {
  std::vector<float> out(frames, -1.0f);
  mixer.render(out.data(), frames, 1, firstFrame);
  return out;
}

} // namespace

TEST_CASE("A voice starts on its exact frame", "[mixer]") {
  VoiceMixer mixer(kRate);
  const auto v = mixer.attach(constant(1000, 0.5f));
  mixer.schedule(v, 10);

  const auto out = render(mixer, 32, 0);
  for (std::size_t i = 0; i < 10; ++i)
    REQUIRE(out[i] == 0.0f);
  for (std::size_t i = 10; i < 32; ++i)
    REQUIRE(out[i] == Approx(0.5f));
}

TEST_CASE("A start in a later block waits for it", "[mixer]") {
  VoiceMixer mixer(kRate);
  const auto v = mixer.attach(constant(1000, 0.5f));
  mixer.schedule(v, 40);

  const auto first = render(mixer, 32, 0);
  for (float s : first)
    REQUIRE(s == 0.0f);
  REQUIRE_FALSE(mixer.playhead(v).has_value());

  const auto second = render(mixer, 32, 32);
  REQUIRE(second[7] == 0.0f);
  REQUIRE(second[8] == Approx(0.5f));
  REQUIRE(mixer.playhead(v).value() == Approx(24.0));
}

TEST_CASE("Halt cancels a pending start", "[mixer]") {
  VoiceMixer mixer(kRate);
  const auto v = mixer.attach(constant(1000, 0.5f));
  mixer.schedule(v, 100);

  render(mixer, 32, 0);
  mixer.halt(v);
  const auto out = render(mixer, 256, 32);
  for (float s : out)
    REQUIRE(s == 0.0f);
  REQUIRE_FALSE(mixer.playhead(v).has_value());
}

TEST_CASE("A late start picks up where it would be by now", "[mixer]") {
  VoiceMixer mixer(kRate);
  const auto v = mixer.attach(ramp(1000));
  mixer.schedule(v, 0);

  const auto out = render(mixer, 16, 100);
  REQUIRE(out[0] == Approx(100.0f));
  REQUIRE(out[15] == Approx(115.0f));
  REQUIRE(mixer.playhead(v).value() == Approx(116.0));
}

TEST_CASE("Rate scales the source step", "[mixer]") {
  VoiceMixer mixer(kRate);
  const auto v = mixer.attach(ramp(1000));
  mixer.set_rate(v, 2.0);
  mixer.schedule(v, 0);

  const auto out = render(mixer, 8, 0);
  for (std::size_t i = 0; i < 8; ++i)
    REQUIRE(out[i] == Approx(2.0f * i));
  REQUIRE(mixer.playhead(v).value() == Approx(16.0));

  REQUIRE_THROWS_AS(mixer.set_rate(v, 0.0), EngineError);
}

TEST_CASE("Playback loops at the buffer end", "[mixer]") {
  VoiceMixer mixer(kRate);
  const auto v = mixer.attach(ramp(8));
  mixer.schedule(v, 0);

  const auto out = render(mixer, 12, 0);
  REQUIRE(out[8] == Approx(0.0f));
  REQUIRE(out[11] == Approx(3.0f));
  // The playhead keeps counting past the wrap.
  REQUIRE(mixer.playhead(v).value() == Approx(12.0));
}

TEST_CASE("Gain scales and clamps", "[mixer]") {
  VoiceMixer mixer(kRate);
  const auto v = mixer.attach(constant(100, 0.5f));
  mixer.set_gain(v, 0.5f);
  mixer.schedule(v, 0);
  REQUIRE(render(mixer, 4, 0)[0] == Approx(0.25f));

  mixer.set_gain(v, 3.0f);
  REQUIRE(render(mixer, 4, 4)[0] == Approx(0.5f));
}

TEST_CASE("Voices are mixed by summing", "[mixer]") {
  VoiceMixer mixer(kRate);
  const auto a = mixer.attach(constant(100, 0.25f));
  const auto b = mixer.attach(constant(100, 0.5f));
  mixer.schedule(a, 0);
  mixer.schedule(b, 2);

  const auto out = render(mixer, 4, 0);
  REQUIRE(out[1] == Approx(0.25f));
  REQUIRE(out[2] == Approx(0.75f));
}

TEST_CASE("Voice table bookkeeping", "[mixer]") {
  VoiceMixer mixer(kRate);

  REQUIRE_THROWS_AS(mixer.attach(nullptr), EngineError);
  REQUIRE_THROWS_AS(mixer.attach(std::make_shared<PcmBuffer>()), EngineError);
  REQUIRE_THROWS_AS(mixer.schedule(3, 0), EngineError);

  std::vector<audio::VoiceId> ids;
  for (std::size_t i = 0; i < VoiceMixer::kMaxVoices; ++i)
    ids.push_back(mixer.attach(constant(10, 0.1f)));
  REQUIRE(mixer.voices_in_use() == VoiceMixer::kMaxVoices);
  REQUIRE_THROWS_AS(mixer.attach(constant(10, 0.1f)), EngineError);

  mixer.detach(ids[5]);
  REQUIRE(mixer.voices_in_use() == VoiceMixer::kMaxVoices - 1);
  REQUIRE_THROWS_AS(mixer.halt(ids[5]), EngineError);
  REQUIRE(mixer.attach(constant(10, 0.1f)) == ids[5]);
}

TEST_CASE("A detached voice goes silent", "[mixer]") {
  VoiceMixer mixer(kRate);
  const auto v = mixer.attach(constant(100, 0.5f));
  mixer.schedule(v, 0);
  render(mixer, 4, 0);

  mixer.detach(v);
  for (float s : render(mixer, 4, 4))
    REQUIRE(s == 0.0f);
}

TEST_CASE("A new start invalidates the old playhead", "[mixer]") {
  VoiceMixer mixer(kRate);
  const auto v = mixer.attach(constant(48000, 0.5f));
  mixer.schedule(v, 0);
  for (int block = 0; block < 10; ++block)
    render(mixer, 512, block * 512);
  REQUIRE(mixer.playhead(v).value() == Approx(5120.0));

  mixer.schedule(v, 10240);
  REQUIRE_FALSE(mixer.playhead(v).has_value());

  // Still pending after the next block; the old position never comes back.
  render(mixer, 512, 5120);
  REQUIRE_FALSE(mixer.playhead(v).has_value());
}

TEST_CASE("Playhead projects onto any output frame", "[mixer]") {
  VoiceMixer mixer(kRate);
  const auto v = mixer.attach(ramp(1000));
  mixer.set_rate(v, 2.0);
  mixer.schedule(v, 8);

  REQUIRE_FALSE(mixer.playhead_at(v, 20).has_value()); // nothing rendered

  render(mixer, 32, 0);
  REQUIRE(mixer.playhead(v).value() == Approx(48.0));
  REQUIRE(mixer.playhead_at(v, 32).value() == Approx(48.0));
  REQUIRE(mixer.playhead_at(v, 20).value() == Approx(24.0));
  REQUIRE(mixer.playhead_at(v, 40).value() == Approx(64.0));
  REQUIRE_FALSE(mixer.playhead_at(v, 4).has_value()); // before the start
}

TEST_CASE("Master gain scales the whole mix", "[mixer]") {
  VoiceMixer mixer(kRate);
  const auto a = mixer.attach(constant(100, 0.25f));
  const auto b = mixer.attach(constant(100, 0.5f));
  mixer.schedule(a, 0);
  mixer.schedule(b, 0);

  mixer.set_master_gain(0.5f);
  REQUIRE(render(mixer, 4, 0)[0] == Approx(0.375f));

  mixer.set_master_gain(2.0f);
  REQUIRE(mixer.master_gain() == 1.0f);
  REQUIRE(render(mixer, 4, 4)[0] == Approx(0.75f));
}
