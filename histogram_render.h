#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>

#include "histogram.h"

namespace pixscope {

static constexpr uint32_t kDefaultRenderW = 300;
static constexpr uint32_t kDefaultRenderH = 64;

struct scope_canvas {
  uint32_t w = 0, h = 0;
  std::vector<uint32_t> px;

  void resize(uint32_t W, uint32_t H) {
    w = W; h = H;
    px.resize((size_t)w * (size_t)h);
  }
  uint32_t at(uint32_t x, uint32_t y) const { return px[(size_t)y * (size_t)w + x]; }
};

// Draws R/G/B as filled curves (screen-blended, 60% alpha) and the luma
// waveform as a 30% white polyline. Channel values are read as [0,1] heights,
// luma as 0..255. Out-of-range inputs are clamped to the canvas.
void histogram_render(const histogram_snapshot &s, scope_canvas &c);

}  // namespace pixscope
