#include "pushed_frame_source.h"

#include "jpeg_codec.h"
#include "mono_clock.h"

namespace pixscope {

static uint64_t default_clock() { return monotonic_ms(); }

PushedFrameSource::PushedFrameSource(uint32_t stale_ms, uint64_t (*now_ms)())
  : clock(now_ms ? now_ms : &default_clock), stale(stale_ms) {}

void PushedFrameSource::set_stale_ms(uint32_t ms) {
  std::lock_guard<std::mutex> lk(mtx);
  stale = ms;
}

void PushedFrameSource::push_frame(std::vector<uint32_t> &&xrgb, uint32_t w, uint32_t h, bool pinned) {
  if (w == 0 || h == 0 || xrgb.size() < (size_t)w * (size_t)h) return;
  uint64_t now = clock();
  std::lock_guard<std::mutex> lk(mtx);
  incoming = std::move(xrgb);
  in_w = w; in_h = h;
  in_ms = now;
  in_pinned = pinned;
  in_seq++;
}

bool PushedFrameSource::push_jpeg(const uint8_t *jpeg, size_t len, bool pinned, std::string *err) {
  std::vector<uint32_t> px;
  uint32_t w=0, h=0;
  if (!jpeg_decode_xrgb(jpeg, len, kMaxPushedW, kMaxPushedH, px, w, h, err)) return false;
  push_frame(std::move(px), w, h, pinned);
  return true;
}

void PushedFrameSource::clear() {
  std::lock_guard<std::mutex> lk(mtx);
  in_w = in_h = 0;
  in_ms = 0;
  in_pinned = false;
  incoming.clear();
  // Keep the sequence monotonic; a zero size marks "nothing to read".
  in_seq++;
}

uint64_t PushedFrameSource::frames_pushed() const {
  std::lock_guard<std::mutex> lk(mtx);
  return in_seq;
}

bool PushedFrameSource::fresh_locked(uint64_t now) const {
  if (in_seq == 0 || in_w == 0 || in_h == 0) return false;
  if (in_pinned || stale == 0) return true;
  return now - in_ms <= stale;
}

bool PushedFrameSource::frame_ready() {
  uint64_t now = clock();
  std::lock_guard<std::mutex> lk(mtx);
  return fresh_locked(now);
}

capture_status PushedFrameSource::read_frame(frame_view &out, std::string *err) {
  {
    std::lock_guard<std::mutex> lk(mtx);
    // clear() may have run since frame_ready(); that is "no frame", not a failed read.
    if (in_w == 0 || in_h == 0) {
      if (err) *err = "no frame pushed";
      return CAPTURE_UNAVAILABLE;
    }
    if (in_seq != cur_seq) {
      current.swap(incoming);
      cur_w = in_w; cur_h = in_h;
      cur_seq = in_seq;
    }
  }
  out.ptr_xrgb = current.data();
  out.w = cur_w;
  out.h = cur_h;
  out.stride_bytes = cur_w * 4;
  return CAPTURE_OK;
}

}  // namespace pixscope
