#include "snapshot_channel.h"

#include <chrono>

namespace pixscope {

void SnapshotChannel::publish(const histogram_snapshot &s) {
  {
    std::lock_guard<std::mutex> lk(mtx);
    current = s;
    current.seq = seq.load(std::memory_order_relaxed) + 1;
    seq.store(current.seq, std::memory_order_release);
  }
  cv.notify_all();
}

bool SnapshotChannel::latest(histogram_snapshot &out) const {
  std::lock_guard<std::mutex> lk(mtx);
  if (current.seq == 0) return false;
  out = current;
  return true;
}

bool SnapshotChannel::wait_newer(uint64_t after_seq, int timeout_ms, histogram_snapshot &out) const {
  std::unique_lock<std::mutex> lk(mtx);
  bool got = cv.wait_for(lk, std::chrono::milliseconds(timeout_ms), [&] {
    return current.seq > after_seq;
  });
  if (!got) return false;
  out = current;
  return true;
}

}  // namespace pixscope
