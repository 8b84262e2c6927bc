#include <gtest/gtest.h>

#include "histogram_render.h"
#include "pixel_xrgb.h"

using namespace pixscope;

TEST(Render, EmptySnapshotIsBlackWithWaveOnBottomRow) {
  scope_canvas c;
  c.resize(kDefaultRenderW, kDefaultRenderH);
  histogram_snapshot s;
  histogram_render(s, c);

  // Channels at zero draw nothing; a zero waveform hugs the bottom row.
  EXPECT_EQ(c.at(10, 10), 0xFF000000u);
  EXPECT_EQ(c.at(150, 0), 0xFF000000u);
  const uint32_t wave = c.at(0, kDefaultRenderH - 1);
  EXPECT_EQ(xrgb_r(wave), xrgb_g(wave));
  EXPECT_GT(xrgb_r(wave), 0);
}

TEST(Render, FullRedBinFillsColumn) {
  scope_canvas c;
  c.resize(256, 64);
  histogram_snapshot s;
  s.r[100] = 1.0f;
  s.luma.fill(255.0f);
  histogram_render(s, c);

  // Bin 100 sits at x=100 on a 256-wide canvas; red screen-blended at 60%.
  const uint32_t mid = c.at(100, 32);
  EXPECT_EQ(xrgb_r(mid), (255u * 153u + 127u) / 255u);
  EXPECT_EQ(xrgb_g(mid), (50u * 153u + 127u) / 255u);
  EXPECT_EQ(c.at(100, 63), mid);

  // Far from the bin nothing is filled.
  EXPECT_EQ(c.at(10, 32), 0xFF000000u);
}

TEST(Render, OverlappingChannelsBrighten) {
  scope_canvas c;
  c.resize(256, 16);
  histogram_snapshot s;
  s.r[50] = 1.0f;
  s.g[50] = 1.0f;
  s.b[50] = 1.0f;
  s.luma.fill(255.0f);
  histogram_render(s, c);

  const uint32_t p = c.at(50, 8);
  EXPECT_GT(xrgb_r(p), (255u * 153u + 127u) / 255u);
  EXPECT_GT(xrgb_g(p), (255u * 153u + 127u) / 255u);
  EXPECT_GT(xrgb_b(p), (255u * 153u + 127u) / 255u);
}

TEST(Render, OutOfRangeValuesAreClamped) {
  scope_canvas c;
  c.resize(64, 32);
  histogram_snapshot s;
  s.r.fill(7.0f);
  s.luma.fill(-100.0f);
  histogram_render(s, c);

  EXPECT_NE(c.at(0, 0), 0xFF000000u);
  EXPECT_NE(c.at(0, 31), 0xFF000000u);
}

TEST(Render, ZeroSizedCanvasIsNoop) {
  scope_canvas c;
  histogram_snapshot s;
  histogram_render(s, c);
  EXPECT_TRUE(c.px.empty());
}
