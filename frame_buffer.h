#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "frame_source.h"

namespace pixscope {

static constexpr uint32_t kDefaultCaptureW = 160;
static constexpr uint32_t kDefaultCaptureH = 90;
static constexpr uint32_t kMaxCaptureW = 1920;
static constexpr uint32_t kMaxCaptureH = 1080;

// Fixed-resolution XRGB8888 scratch raster. The current frame of a source is
// resampled into it every tick; storage is sized once in init() and reused.
class FrameBuffer {
public:
  FrameBuffer() {}

  FrameBuffer(const FrameBuffer&) = delete;
  FrameBuffer& operator=(const FrameBuffer&) = delete;

  // Sizes the raster. Dimensions must be 1..kMaxCaptureW x 1..kMaxCaptureH.
  bool init(uint32_t w, uint32_t h, std::string *err);

  bool is_initialized() const { return !px.empty(); }

  // Copies the source's current frame into the raster (nearest-neighbour).
  // On anything but CAPTURE_OK the previous contents are invalidated.
  capture_status capture(FrameSource &src);

  // Drops the held frame; the allocation is kept for the next activation.
  void release();

  uint32_t width() const { return w; }
  uint32_t height() const { return h; }
  size_t pixel_count() const { return (size_t)w * (size_t)h; }
  bool holds_frame() const { return valid; }

  const uint32_t *pixels() const { return px.data(); }
  const uint32_t *row(uint32_t y) const { return px.data() + (size_t)y * (size_t)w; }

  // Text of the last CAPTURE_READ_FAILED, empty otherwise.
  const std::string &last_error() const { return err_text; }

  // Direct raster edits; fill() makes the buffer hold a solid-colour frame.
  void set_pixel(uint32_t x, uint32_t y, uint32_t xrgb);
  void fill(uint32_t xrgb);

private:
  void rebuild_luts(uint32_t src_w, uint32_t src_h);

  uint32_t w=0, h=0;
  std::vector<uint32_t> px;
  bool valid=false;

  // Source column / row for each destination column / row, rebuilt only when
  // the source geometry changes.
  std::vector<uint32_t> lut_x;
  std::vector<uint32_t> lut_y;
  uint32_t lut_src_w=0, lut_src_h=0;

  std::string err_text;
};

}  // namespace pixscope
