#pragma once

#include <array>
#include <cstdint>

namespace pixscope {

class FrameBuffer;

static constexpr int kHistogramBins = 256;
static constexpr int kWaveformColumns = 50;

// Raw single-pass counts over one FrameBuffer.
struct raw_histogram {
  std::array<uint32_t, kHistogramBins> r_counts{};
  std::array<uint32_t, kHistogramBins> g_counts{};
  std::array<uint32_t, kHistogramBins> b_counts{};

  // Per-column luma sums (0..255 scale per pixel) and the pixels that fell in each column.
  std::array<double, kWaveformColumns> luma_sums{};
  std::array<uint32_t, kWaveformColumns> luma_pixels{};

  // Largest single bin across R, G and B.
  uint32_t max_count = 0;
  uint32_t pixel_count = 0;
};

/**
    Presentation-ready statistics for one tick.
    r/g/b are in [0,1]; luma stays on the 0..255 scale the renderer draws against.
*/
struct histogram_snapshot {
  std::array<float, kHistogramBins> r{};
  std::array<float, kHistogramBins> g{};
  std::array<float, kHistogramBins> b{};
  std::array<float, kWaveformColumns> luma{};

  bool synthetic = false;
  // Assigned by SnapshotChannel on publish; 0 = never published.
  uint64_t seq = 0;
};

// One linear scan: channel histograms and column luma sums together.
raw_histogram histogram_compute(const FrameBuffer &buf);

// Same scan over a bare XRGB8888 raster (tight rows, w <= kMaxCaptureW).
void histogram_compute_xrgb(const uint32_t *px, uint32_t w, uint32_t h, raw_histogram &out);

histogram_snapshot histogram_normalize(const raw_histogram &raw);

// Waveform column for pixel column x of a w-wide raster.
static inline int waveform_column_for_x(uint32_t x, uint32_t w) {
  return (int)(((uint64_t)x * (uint64_t)kWaveformColumns) / (uint64_t)w);
}

}  // namespace pixscope
