#include "synthetic_histogram.h"

#include <algorithm>
#include <cmath>

namespace pixscope {

static constexpr double kChannelPhase[3] = { 0.0, 2.0, 4.0 };

float Mt19937Noise::next() {
  return dist(rng);
}

double synthetic_bell(double offset, double phase, int bin) {
  const double center = 128.0 + std::sin(offset * 0.5 + phase) * 50.0;
  const double dist = std::fabs((double)bin - center);
  const double spread = 2000.0 + std::sin(offset * 2.0) * 500.0;
  return std::exp(-(dist * dist) / spread);
}

double synthetic_wave(double offset, int col) {
  return 100.0 + std::sin((double)col * 0.2 + offset) * 50.0;
}

SyntheticGenerator::SyntheticGenerator(std::unique_ptr<NoiseSource> n) : noise(std::move(n)) {
  if (!noise) noise.reset(new SilentNoise());
}

void SyntheticGenerator::set_noise(std::unique_ptr<NoiseSource> n) {
  noise = n ? std::move(n) : std::unique_ptr<NoiseSource>(new SilentNoise());
}

histogram_snapshot SyntheticGenerator::generate(double offset) {
  histogram_snapshot s;
  std::array<float, kHistogramBins> *chans[3] = { &s.r, &s.g, &s.b };

  for (int c=0; c<3; c++) {
    std::array<float, kHistogramBins> &out = *chans[c];
    for (int i=0; i<kHistogramBins; i++) {
      const double v = synthetic_bell(offset, kChannelPhase[c], i) * (0.5 + (double)noise->next() * 0.1);
      out[i] = (float)std::clamp(v, 0.0, 1.0);
    }
  }

  for (int i=0; i<kWaveformColumns; i++) {
    s.luma[i] = (float)(synthetic_wave(offset, i) + (double)noise->next() * 20.0);
  }

  s.synthetic = true;
  return s;
}

}  // namespace pixscope
