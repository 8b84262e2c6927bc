#include "frame_buffer.h"

#include <algorithm>
#include <exception>
#include <string.h>

namespace pixscope {

const char *capture_status_to_string(capture_status s) {
  switch (s) {
    case CAPTURE_OK:          return "ok";
    case CAPTURE_UNAVAILABLE: return "unavailable";
    case CAPTURE_READ_FAILED: return "readFailed";
    default:                  return "unknown";
  }
}

bool FrameBuffer::init(uint32_t W, uint32_t H, std::string *err) {
  if (W == 0 || H == 0 || W > kMaxCaptureW || H > kMaxCaptureH) {
    if (err) *err = "invalid capture size " + std::to_string(W) + "x" + std::to_string(H);
    return false;
  }
  w = W; h = H;
  px.assign((size_t)w * (size_t)h, 0xFF000000u);
  lut_x.assign(w, 0);
  lut_y.assign(h, 0);
  lut_src_w = lut_src_h = 0;
  valid = false;
  err_text.clear();
  return true;
}

void FrameBuffer::rebuild_luts(uint32_t src_w, uint32_t src_h) {
  // Sample at destination pixel centres.
  for (uint32_t x=0; x<w; x++) {
    uint64_t sx = ((uint64_t)(2*x + 1) * src_w) / (2ull * w);
    lut_x[x] = (uint32_t)std::min<uint64_t>(sx, src_w - 1);
  }
  for (uint32_t y=0; y<h; y++) {
    uint64_t sy = ((uint64_t)(2*y + 1) * src_h) / (2ull * h);
    lut_y[y] = (uint32_t)std::min<uint64_t>(sy, src_h - 1);
  }
  lut_src_w = src_w;
  lut_src_h = src_h;
}

capture_status FrameBuffer::capture(FrameSource &src) {
  valid = false;
  if (!is_initialized()) return CAPTURE_UNAVAILABLE;

  frame_view fv;
  try {
    if (!src.frame_ready()) {
      err_text.clear();
      return CAPTURE_UNAVAILABLE;
    }
    std::string e;
    const capture_status rs = src.read_frame(fv, &e);
    if (rs == CAPTURE_UNAVAILABLE) {
      err_text.clear();
      return CAPTURE_UNAVAILABLE;
    }
    if (rs != CAPTURE_OK) {
      err_text = e.empty() ? "read_frame failed" : e;
      return CAPTURE_READ_FAILED;
    }
  } catch (const std::exception &ex) {
    err_text = std::string("source threw: ") + ex.what();
    return CAPTURE_READ_FAILED;
  }

  if (!fv.valid()) {
    err_text = "source returned an invalid frame view";
    return CAPTURE_READ_FAILED;
  }

  if (fv.w != lut_src_w || fv.h != lut_src_h) rebuild_luts(fv.w, fv.h);

  const uint8_t *base = (const uint8_t*)fv.ptr_xrgb;
  for (uint32_t y=0; y<h; y++) {
    const uint32_t *s = (const uint32_t*)(base + (uint64_t)lut_y[y] * fv.stride_bytes);
    uint32_t *d = px.data() + (size_t)y * (size_t)w;
    if (fv.w == w) {
      memcpy(d, s, (size_t)w * 4);
      continue;
    }
    for (uint32_t x=0; x<w; x++) d[x] = s[lut_x[x]];
  }

  err_text.clear();
  valid = true;
  return CAPTURE_OK;
}

void FrameBuffer::release() {
  valid = false;
  err_text.clear();
  lut_src_w = lut_src_h = 0;
}

void FrameBuffer::set_pixel(uint32_t x, uint32_t y, uint32_t xrgb) {
  if (x >= w || y >= h) return;
  px[(size_t)y * (size_t)w + x] = xrgb;
}

void FrameBuffer::fill(uint32_t xrgb) {
  std::fill(px.begin(), px.end(), xrgb);
  valid = is_initialized();
}

}  // namespace pixscope
