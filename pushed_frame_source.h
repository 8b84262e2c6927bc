#pragma once
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

#include "frame_source.h"

namespace pixscope {

static constexpr int kMaxPushedW = 3840;
static constexpr int kMaxPushedH = 2160;

/**
    FrameSource fed by an outside producer (HTTP upload, still image).

    Producers call push_*() from any thread. The tick thread swaps the newest
    frame into its own storage in read_frame(), so the pointer it hands out is
    never written by a producer. A frame older than stale_ms counts as "not
    playing" and the source reports no frame; pinned frames never go stale.
*/
class PushedFrameSource : public FrameSource {
public:
  explicit PushedFrameSource(uint32_t stale_ms, uint64_t (*now_ms)() = nullptr);

  void set_stale_ms(uint32_t ms);

  void push_frame(std::vector<uint32_t> &&xrgb, uint32_t w, uint32_t h, bool pinned);
  bool push_jpeg(const uint8_t *jpeg, size_t len, bool pinned, std::string *err);

  // Forget any pending frame; the source reports unavailable until the next push.
  void clear();

  uint64_t frames_pushed() const;

  bool frame_ready() override;
  capture_status read_frame(frame_view &out, std::string *err) override;

private:
  bool fresh_locked(uint64_t now) const;

  uint64_t (*clock)();

  mutable std::mutex mtx;
  std::vector<uint32_t> incoming;
  uint32_t in_w=0, in_h=0;
  uint64_t in_seq=0;
  uint64_t in_ms=0;
  bool in_pinned=false;
  uint32_t stale=0;

  // Tick thread only.
  std::vector<uint32_t> current;
  uint32_t cur_w=0, cur_h=0;
  uint64_t cur_seq=0;
};

}  // namespace pixscope
