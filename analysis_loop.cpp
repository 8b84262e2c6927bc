#include "analysis_loop.h"

#include <stdio.h>

#include "mono_clock.h"

namespace pixscope {

static const uint64_t kFailLogEveryMs = 1000;

tick_mode tick_mode_for(capture_status s) {
  return (s == CAPTURE_OK) ? TICK_REAL : TICK_SYNTHETIC;
}

AnalysisLoop::AnalysisLoop(FrameSource &src_, TickScheduler &sched_, SnapshotSink &sink_,
                           std::unique_ptr<NoiseSource> noise)
  : src(src_), sched(sched_), sink(sink_), synth(std::move(noise)) {}

AnalysisLoop::~AnalysisLoop() { stop(); }

bool AnalysisLoop::init(uint32_t capture_w, uint32_t capture_h, std::string *err) {
  if (active) {
    if (err) *err = "cannot resize the frame buffer while active";
    return false;
  }
  return buffer.init(capture_w, capture_h, err);
}

bool AnalysisLoop::start() {
  if (active) return true;
  if (!buffer.is_initialized()) {
    fprintf(stderr, "[engine] start refused: frame buffer not initialized\n");
    return false;
  }
  active = true;
  offset = 0.0;
  fails_since_log = 0;
  last_fail_log_ms = 0;
  {
    std::lock_guard<std::mutex> lk(stats_mtx);
    st.active = true;
    st.synthetic_offset = 0.0;
    st.last_capture = CAPTURE_UNAVAILABLE;
    st.last_error.clear();
  }
  pending = sched.schedule_next([this]() { tick(); });
  fprintf(stderr, "[engine] active (capture %ux%u, %d waveform columns)\n",
          buffer.width(), buffer.height(), kWaveformColumns);
  return true;
}

void AnalysisLoop::stop() {
  if (pending != kNoTicket) {
    sched.cancel(pending);
    pending = kNoTicket;
  }
  if (!active) return;
  active = false;
  buffer.release();
  {
    std::lock_guard<std::mutex> lk(stats_mtx);
    st.active = false;
  }
  fprintf(stderr, "[engine] inactive\n");
}

void AnalysisLoop::note_read_failure(const std::string &err) {
  fails_since_log++;
  uint64_t now = monotonic_ms();
  if (last_fail_log_ms != 0 && now - last_fail_log_ms < kFailLogEveryMs) return;
  fprintf(stderr, "[engine] frame read failed (%llu in window): %s\n",
          (unsigned long long)fails_since_log, err.c_str());
  last_fail_log_ms = now;
  fails_since_log = 0;
}

void AnalysisLoop::tick() {
  pending = kNoTicket;
  if (!active) return;

  const capture_status cs = buffer.capture(src);

  histogram_snapshot snap;
  if (tick_mode_for(cs) == TICK_REAL) {
    snap = histogram_normalize(histogram_compute(buffer));
  } else {
    if (cs == CAPTURE_READ_FAILED) note_read_failure(buffer.last_error());
    offset += kSyntheticStep;
    snap = synth.generate(offset);
  }

  capture_status prev;
  {
    std::lock_guard<std::mutex> lk(stats_mtx);
    prev = st.last_capture;
    st.ticks++;
    if (cs == CAPTURE_OK) st.real_ticks++;
    else st.synthetic_ticks++;
    if (cs == CAPTURE_UNAVAILABLE) st.unavailable++;
    if (cs == CAPTURE_READ_FAILED) {
      st.read_failures++;
      st.last_error = buffer.last_error();
    }
    st.last_capture = cs;
    st.synthetic_offset = offset;
  }
  if (cs == CAPTURE_OK && prev != CAPTURE_OK) {
    fprintf(stderr, "[engine] source delivering frames; analysing\n");
  } else if (cs != CAPTURE_OK && prev == CAPTURE_OK) {
    fprintf(stderr, "[engine] no usable frame (%s); simulating\n", capture_status_to_string(cs));
  }

  sink.publish(snap);

  // The sink may have deactivated us.
  if (active) pending = sched.schedule_next([this]() { tick(); });
}

loop_stats AnalysisLoop::stats() const {
  std::lock_guard<std::mutex> lk(stats_mtx);
  return st;
}

}  // namespace pixscope
