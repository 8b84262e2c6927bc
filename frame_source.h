#pragma once
#include <stdint.h>
#include <string>

namespace pixscope {

// Borrowed view of an XRGB8888 frame. Valid until the next call into the source that produced it.
struct frame_view {
  const uint32_t *ptr_xrgb=nullptr;
  uint32_t stride_bytes=0;
  uint32_t w=0,h=0;

  bool valid() const { return ptr_xrgb && w && h && stride_bytes >= w*4u && (stride_bytes % 4u) == 0; }
};

// Outcome of one FrameBuffer::capture() attempt.
enum capture_status {
  CAPTURE_OK = 0,
  CAPTURE_UNAVAILABLE = 1,   // nothing decodable yet (not loaded, paused, ended, stale)
  CAPTURE_READ_FAILED = 2,   // pixel read failed or threw
};

const char *capture_status_to_string(capture_status s);

// Producer of frames for the analysis loop. Only ever called from the tick thread.
class FrameSource {
public:
  virtual ~FrameSource() {}

  // Cheap readiness check; false means "no usable frame this tick".
  virtual bool frame_ready() = 0;

  // Fills `out` with the current frame and returns CAPTURE_OK.
  // CAPTURE_UNAVAILABLE: the frame went away after frame_ready() said yes.
  // CAPTURE_READ_FAILED: the pixels cannot be read (*err says why).
  // Implementations may also throw std::exception.
  virtual capture_status read_frame(frame_view &out, std::string *err) = 0;
};

}  // namespace pixscope
