#include "histogram_render.h"

#include <algorithm>
#include <cmath>
#include <cstdlib>

#include "pixel_xrgb.h"

namespace pixscope {

static const uint32_t kBackground = 0xFF000000u;
static const uint8_t kChannelAlpha = 153;   // 0.6
static const uint8_t kWaveAlpha = 77;       // 0.3

// Curve height (0..1) at canvas column x. Bin i sits at x = i*w/256; past the
// last bin the outline runs down to the bottom-right corner.
static float channel_height_at(const std::array<float, kHistogramBins> &v, uint32_t x, uint32_t w) {
  const float f = (float)x * (float)kHistogramBins / (float)w;
  const int i = (int)f;
  const float t = f - (float)i;
  const float a = std::clamp(v[std::min(i, kHistogramBins - 1)], 0.0f, 1.0f);
  const float b = (i + 1 < kHistogramBins) ? std::clamp(v[i + 1], 0.0f, 1.0f) : 0.0f;
  return a + (b - a) * t;
}

static void fill_channel(scope_canvas &c, const std::array<float, kHistogramBins> &v, uint32_t color) {
  for (uint32_t x=0; x<c.w; x++) {
    const float hgt = channel_height_at(v, x, c.w);
    int top = (int)std::ceil((float)c.h - hgt * (float)c.h);
    if (top < 0) top = 0;
    for (uint32_t y=(uint32_t)top; y<c.h; y++) {
      uint32_t &p = c.px[(size_t)y * (size_t)c.w + x];
      p = blend_screen_xrgb(p, color, kChannelAlpha);
    }
  }
}

static void plot(scope_canvas &c, int x, int y, uint32_t color, uint8_t a) {
  if (x < 0 || y < 0 || x >= (int)c.w || y >= (int)c.h) return;
  uint32_t &p = c.px[(size_t)y * (size_t)c.w + (size_t)x];
  p = blend_over_xrgb(p, color, a);
}

static void draw_line(scope_canvas &c, int x0, int y0, int x1, int y1, uint32_t color, uint8_t a) {
  int dx = std::abs(x1 - x0), sx = x0 < x1 ? 1 : -1;
  int dy = -std::abs(y1 - y0), sy = y0 < y1 ? 1 : -1;
  int err = dx + dy;
  for (;;) {
    // Skip the shared end point so joints are not blended twice.
    if (x0 == x1 && y0 == y1) break;
    plot(c, x0, y0, color, a);
    int e2 = 2 * err;
    if (e2 >= dy) { err += dy; x0 += sx; }
    if (e2 <= dx) { err += dx; y0 += sy; }
  }
}

static int luma_to_y(float luma, uint32_t h) {
  float y = (float)h - (luma / 255.0f) * (float)h;
  y = std::clamp(y, 0.0f, (float)h - 1.0f);
  return (int)std::lround(y);
}

void histogram_render(const histogram_snapshot &s, scope_canvas &c) {
  if (c.w == 0 || c.h == 0) return;
  std::fill(c.px.begin(), c.px.end(), kBackground);

  fill_channel(c, s.r, pack_xrgb8888(255, 50, 50));
  fill_channel(c, s.g, pack_xrgb8888(50, 255, 50));
  fill_channel(c, s.b, pack_xrgb8888(50, 50, 255));

  const uint32_t white = pack_xrgb8888(255, 255, 255);
  const float step = (float)c.w / (float)kWaveformColumns;
  int px0 = 0, py0 = luma_to_y(s.luma[0], c.h);
  for (int i=1; i<kWaveformColumns; i++) {
    int px1 = (int)std::lround((float)i * step);
    int py1 = luma_to_y(s.luma[i], c.h);
    draw_line(c, px0, py0, px1, py1, white, kWaveAlpha);
    px0 = px1; py0 = py1;
  }
  plot(c, px0, py0, white, kWaveAlpha);
}

}  // namespace pixscope
