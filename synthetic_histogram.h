#pragma once

#include <cstdint>
#include <memory>
#include <random>

#include "histogram.h"

namespace pixscope {

// Offset advance per synthetic tick.
static constexpr double kSyntheticStep = 0.05;

// Jitter source for simulated data. next() returns a value in [0,1).
class NoiseSource {
public:
  virtual ~NoiseSource() {}
  virtual float next() = 0;
};

class Mt19937Noise : public NoiseSource {
public:
  explicit Mt19937Noise(uint32_t seed) : rng(seed), dist(0.0f, 1.0f) {}
  float next() override;

private:
  std::mt19937 rng;
  std::uniform_real_distribution<float> dist;
};

// No jitter: generate() then yields only the deterministic shape.
class SilentNoise : public NoiseSource {
public:
  float next() override { return 0.0f; }
};

// Deterministic parts of the simulation, exposed for tests.
double synthetic_bell(double offset, double phase, int bin);
double synthetic_wave(double offset, int col);

/**
    Produces plausible moving histogram/waveform data when no real frame exists.

    Channels are bell curves whose centre drifts with sin(0.5*offset + phase)
    (phases 0, 2, 4 for R, G, B) and whose spread breathes with sin(2*offset).
    The waveform is a travelling sine around a midline of 100 on the 0..255 scale.
    Only the NoiseSource contributes non-determinism.
*/
class SyntheticGenerator {
public:
  explicit SyntheticGenerator(std::unique_ptr<NoiseSource> noise);

  SyntheticGenerator(const SyntheticGenerator&) = delete;
  SyntheticGenerator& operator=(const SyntheticGenerator&) = delete;

  histogram_snapshot generate(double offset);

  void set_noise(std::unique_ptr<NoiseSource> n);

private:
  std::unique_ptr<NoiseSource> noise;
};

}  // namespace pixscope
