#include "histogram.h"

#include <algorithm>

#include "frame_buffer.h"
#include "pixel_xrgb.h"

namespace pixscope {

void histogram_compute_xrgb(const uint32_t *px, uint32_t w, uint32_t h, raw_histogram &out) {
  out = raw_histogram{};
  if (!px || w == 0 || h == 0 || w > kMaxCaptureW) return;

  // Column index per x; the waveform split is identical on every row.
  std::array<uint8_t, kMaxCaptureW> col_of_x;
  for (uint32_t x=0; x<w; x++) col_of_x[x] = (uint8_t)waveform_column_for_x(x, w);

  uint32_t max_count = 0;
  for (uint32_t y=0; y<h; y++) {
    const uint32_t *row = px + (size_t)y * (size_t)w;
    for (uint32_t x=0; x<w; x++) {
      const uint32_t p = row[x];
      const uint8_t r = xrgb_r(p), g = xrgb_g(p), b = xrgb_b(p);

      const uint32_t cr = ++out.r_counts[r];
      const uint32_t cg = ++out.g_counts[g];
      const uint32_t cb = ++out.b_counts[b];
      max_count = std::max(max_count, std::max(cr, std::max(cg, cb)));

      const int col = col_of_x[x];
      out.luma_sums[col] += (double)luma709(r, g, b);
      out.luma_pixels[col]++;
    }
  }
  out.max_count = max_count;
  out.pixel_count = w * h;
}

raw_histogram histogram_compute(const FrameBuffer &buf) {
  raw_histogram out;
  histogram_compute_xrgb(buf.pixels(), buf.width(), buf.height(), out);
  return out;
}

histogram_snapshot histogram_normalize(const raw_histogram &raw) {
  histogram_snapshot s;
  const float denom = (float)std::max<uint32_t>(raw.max_count, 1u);
  for (int i=0; i<kHistogramBins; i++) {
    s.r[i] = std::min(1.0f, (float)raw.r_counts[i] / denom);
    s.g[i] = std::min(1.0f, (float)raw.g_counts[i] / denom);
    s.b[i] = std::min(1.0f, (float)raw.b_counts[i] / denom);
  }
  for (int c=0; c<kWaveformColumns; c++) {
    s.luma[c] = raw.luma_pixels[c] ? (float)(raw.luma_sums[c] / (double)raw.luma_pixels[c]) : 0.0f;
  }
  s.synthetic = false;
  return s;
}

}  // namespace pixscope
