#pragma once
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <mutex>

#include "histogram.h"

namespace pixscope {

// Receiver of the per-tick snapshot.
class SnapshotSink {
public:
  virtual ~SnapshotSink() {}
  virtual void publish(const histogram_snapshot &s) = 0;
};

// Latest-value holder between the tick thread and readers (web UI, stream).
// Readers always get a full copy; a snapshot is replaced, never edited.
class SnapshotChannel : public SnapshotSink {
public:
  void publish(const histogram_snapshot &s) override;

  // Copies the latest snapshot. Returns false if nothing was published yet.
  bool latest(histogram_snapshot &out) const;

  // Blocks until a snapshot newer than `after_seq` exists or the timeout
  // expires. Returns true and fills `out` on a newer snapshot.
  bool wait_newer(uint64_t after_seq, int timeout_ms, histogram_snapshot &out) const;

  uint64_t sequence() const { return seq.load(std::memory_order_acquire); }

private:
  mutable std::mutex mtx;
  mutable std::condition_variable cv;
  histogram_snapshot current{};
  std::atomic<uint64_t> seq{0};
};

}  // namespace pixscope
