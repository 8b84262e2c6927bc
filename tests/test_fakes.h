#pragma once
#include <stdexcept>
#include <string>
#include <vector>

#include "frame_source.h"
#include "pixel_xrgb.h"
#include "snapshot_channel.h"
#include "tick_scheduler.h"

namespace pixscope {
namespace testing {

// Scriptable FrameSource. Owns its pixels; hands out views into them.
class FakeFrameSource : public FrameSource {
public:
  enum mode { READY, NOT_READY, READ_FAILS, THROWS, VANISHES };

  FakeFrameSource() {}
  FakeFrameSource(uint32_t w, uint32_t h, uint32_t xrgb) { set_solid(w, h, xrgb); }

  void set_solid(uint32_t w, uint32_t h, uint32_t xrgb) {
    fw = w; fh = h;
    px.assign((size_t)w * (size_t)h, xrgb);
  }
  void set_pixel(uint32_t x, uint32_t y, uint32_t xrgb) { px[(size_t)y * fw + x] = xrgb; }
  void set_mode(mode m) { md = m; }
  // Overrides the row pitch handed out in frame views (0 = tight rows).
  void set_stride_bytes(uint32_t s) { stride = s; }

  bool frame_ready() override {
    ready_calls++;
    return md != NOT_READY;
  }

  capture_status read_frame(frame_view &out, std::string *err) override {
    read_calls++;
    if (md == THROWS) throw std::runtime_error("decoder lost");
    if (md == VANISHES) return CAPTURE_UNAVAILABLE;
    if (md == READ_FAILS) {
      if (err) *err = "pixels not readable";
      return CAPTURE_READ_FAILED;
    }
    out.ptr_xrgb = px.data();
    out.w = fw;
    out.h = fh;
    out.stride_bytes = stride ? stride : fw * 4;
    return CAPTURE_OK;
  }

  int ready_calls = 0;
  int read_calls = 0;

private:
  mode md = READY;
  uint32_t fw = 0, fh = 0;
  uint32_t stride = 0;
  std::vector<uint32_t> px;
};

// Holds at most one pending tick; fire() runs it like a display refresh would.
class ManualScheduler : public TickScheduler {
public:
  tick_ticket schedule_next(tick_fn fn) override {
    scheduled++;
    pending_fn = fn;
    pending = next++;
    return pending;
  }

  void cancel(tick_ticket t) override {
    cancels++;
    if (t == kNoTicket || t != pending) return;
    pending = kNoTicket;
    pending_fn = nullptr;
  }

  bool has_pending() const { return pending != kNoTicket; }

  bool fire() {
    if (pending == kNoTicket) return false;
    tick_fn fn = pending_fn;
    pending = kNoTicket;
    pending_fn = nullptr;
    fn();
    return true;
  }

  int scheduled = 0;
  int cancels = 0;

private:
  tick_fn pending_fn;
  tick_ticket pending = kNoTicket;
  tick_ticket next = 1;
};

class CapturingSink : public SnapshotSink {
public:
  void publish(const histogram_snapshot &s) override { got.push_back(s); }
  std::vector<histogram_snapshot> got;
};

static inline uint32_t rgb(uint8_t r, uint8_t g, uint8_t b) { return pack_xrgb8888(r, g, b); }

}  // namespace testing
}  // namespace pixscope
