#include <gtest/gtest.h>

#include <cmath>
#include <memory>

#include "synthetic_histogram.h"

using namespace pixscope;

namespace {

// Always returns the same draw; lets tests pin the jitter.
class ConstantNoise : public NoiseSource {
public:
  explicit ConstantNoise(float v) : v(v) {}
  float next() override { calls++; return v; }
  float v;
  int calls = 0;
};

}  // namespace

TEST(Synthetic, SilentNoiseIsDeterministic) {
  SyntheticGenerator a(std::unique_ptr<NoiseSource>(new SilentNoise()));
  SyntheticGenerator b(nullptr);

  histogram_snapshot sa = a.generate(1.25);
  histogram_snapshot sb = b.generate(1.25);
  EXPECT_EQ(sa.r, sb.r);
  EXPECT_EQ(sa.g, sb.g);
  EXPECT_EQ(sa.b, sb.b);
  EXPECT_EQ(sa.luma, sb.luma);
  EXPECT_TRUE(sa.synthetic);
}

TEST(Synthetic, ShapeAtOffsetZero) {
  SyntheticGenerator gen(nullptr);
  histogram_snapshot s = gen.generate(0.0);

  // Red centre = 128 + sin(0)*50 = 128, scaled by 0.5 with no jitter.
  EXPECT_NEAR(s.r[128], 0.5f, 1e-6);
  EXPECT_NEAR(s.r[0], 0.5 * std::exp(-(128.0 * 128.0) / 2000.0), 1e-6);

  // Green centre = 128 + sin(2)*50.
  const int g_peak = (int)std::lround(128.0 + std::sin(2.0) * 50.0);
  for (int i=0; i<kHistogramBins; i++) EXPECT_LE(s.g[i], s.g[g_peak] + 1e-6f);

  EXPECT_NEAR(s.luma[0], 100.0f, 1e-4);
  EXPECT_NEAR(s.luma[1], 100.0 + std::sin(0.2) * 50.0, 1e-4);
}

TEST(Synthetic, ValuesStayInRange) {
  SyntheticGenerator gen(std::unique_ptr<NoiseSource>(new Mt19937Noise(42)));
  for (int k=0; k<200; k++) {
    histogram_snapshot s = gen.generate(k * kSyntheticStep);
    for (int i=0; i<kHistogramBins; i++) {
      ASSERT_GE(s.r[i], 0.0f); ASSERT_LE(s.r[i], 1.0f);
      ASSERT_GE(s.g[i], 0.0f); ASSERT_LE(s.g[i], 1.0f);
      ASSERT_GE(s.b[i], 0.0f); ASSERT_LE(s.b[i], 1.0f);
    }
    for (int c=0; c<kWaveformColumns; c++) {
      ASSERT_GE(s.luma[c], 50.0f - 1e-3f);
      ASSERT_LE(s.luma[c], 170.0f + 1e-3f);
    }
  }
}

TEST(Synthetic, JitterOnlyScalesTheShape) {
  ConstantNoise *n = new ConstantNoise(1.0f);
  SyntheticGenerator gen{std::unique_ptr<NoiseSource>(n)};
  histogram_snapshot s = gen.generate(0.0);

  EXPECT_EQ(n->calls, 3 * kHistogramBins + kWaveformColumns);
  EXPECT_NEAR(s.r[128], 0.6f, 1e-6);
  EXPECT_NEAR(s.luma[0], 120.0f, 1e-4);
}

TEST(Synthetic, SameSeedSameOutput) {
  SyntheticGenerator a(std::unique_ptr<NoiseSource>(new Mt19937Noise(7)));
  SyntheticGenerator b(std::unique_ptr<NoiseSource>(new Mt19937Noise(7)));
  EXPECT_EQ(a.generate(3.0).r, b.generate(3.0).r);
}

TEST(Synthetic, ShapeMovesWithOffset) {
  SyntheticGenerator gen(nullptr);
  histogram_snapshot s0 = gen.generate(0.0);
  histogram_snapshot s1 = gen.generate(1.0);
  EXPECT_NE(s0.r, s1.r);
  EXPECT_NE(s0.luma, s1.luma);
}

TEST(Synthetic, BellAndWaveHelpers) {
  EXPECT_DOUBLE_EQ(synthetic_bell(0.0, 0.0, 128), 1.0);
  EXPECT_LT(synthetic_bell(0.0, 0.0, 0), 1e-3);
  EXPECT_DOUBLE_EQ(synthetic_wave(0.0, 0), 100.0);
}
