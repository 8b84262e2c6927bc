#pragma once
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

#include "frame_buffer.h"
#include "frame_source.h"
#include "histogram.h"
#include "snapshot_channel.h"
#include "synthetic_histogram.h"
#include "tick_scheduler.h"

namespace pixscope {

enum tick_mode { TICK_REAL=0, TICK_SYNTHETIC=1 };

// The whole real-vs-synthetic decision: only a successful capture is analysed.
tick_mode tick_mode_for(capture_status s);

struct loop_stats {
  bool active = false;
  uint64_t ticks = 0;
  uint64_t real_ticks = 0;
  uint64_t synthetic_ticks = 0;
  uint64_t unavailable = 0;
  uint64_t read_failures = 0;
  capture_status last_capture = CAPTURE_UNAVAILABLE;
  double synthetic_offset = 0.0;
  std::string last_error;
};

/**
    Per-tick orchestrator.

    Inactive until start(). While active every tick captures from the source,
    analyses the frame or falls back to synthetic data, publishes exactly one
    snapshot to the sink and requests the next tick. The buffer and the
    synthetic offset are only touched from inside tick().
*/
class AnalysisLoop {
public:
  AnalysisLoop(FrameSource &src, TickScheduler &sched, SnapshotSink &sink,
               std::unique_ptr<NoiseSource> noise);
  ~AnalysisLoop();

  AnalysisLoop(const AnalysisLoop&) = delete;
  AnalysisLoop& operator=(const AnalysisLoop&) = delete;

  // Sizes the frame buffer. Must succeed before start().
  bool init(uint32_t capture_w, uint32_t capture_h, std::string *err);

  // Inactive -> Active. Resets the synthetic offset to 0 and schedules the first tick.
  bool start();

  // Active -> Inactive. Cancels the pending tick before releasing the buffer.
  void stop();

  void tick();

  bool is_active() const { return active; }
  double synthetic_offset() const { return offset; }
  tick_ticket pending_ticket() const { return pending; }
  const FrameBuffer &frame_buffer() const { return buffer; }

  // Safe to call from any thread.
  loop_stats stats() const;

private:
  void note_read_failure(const std::string &err);

  FrameSource &src;
  TickScheduler &sched;
  SnapshotSink &sink;
  SyntheticGenerator synth;
  FrameBuffer buffer;

  bool active = false;
  double offset = 0.0;
  tick_ticket pending = kNoTicket;
  uint64_t last_fail_log_ms = 0;
  uint64_t fails_since_log = 0;

  mutable std::mutex stats_mtx;
  loop_stats st;
};

}  // namespace pixscope
