#include "display_tick_scheduler.h"

#include <errno.h>
#include <fcntl.h>
#include <stdio.h>
#include <string.h>
#include <unistd.h>
#include <xf86drm.h>

#include <utility>

#include "mono_clock.h"

namespace pixscope {

static int open_card(const std::string &card) {
  if (!card.empty()) return open(card.c_str(), O_RDWR | O_CLOEXEC);
  int fd = open("/dev/dri/card1", O_RDWR | O_CLOEXEC);
  if (fd >= 0) return fd;
  return open("/dev/dri/card0", O_RDWR | O_CLOEXEC);
}

DisplayTickScheduler::DisplayTickScheduler(int refresh_hz) { set_refresh_hz(refresh_hz); }

DisplayTickScheduler::~DisplayTickScheduler() { close_vblank(); }

bool DisplayTickScheduler::open_vblank(const std::string &card, std::string *err) {
  close_vblank();
  int fd = open_card(card);
  if (fd < 0) {
    if (err) *err = std::string("open DRM card failed: ") + strerror(errno);
    return false;
  }

  // Wait once so a card without an active CRTC falls back to timer pacing up front.
  drmVBlank vbl;
  memset(&vbl, 0, sizeof(vbl));
  vbl.request.type = DRM_VBLANK_RELATIVE;
  vbl.request.sequence = 0;
  if (drmWaitVBlank(fd, &vbl) != 0) {
    if (err) *err = std::string("drmWaitVBlank failed: ") + strerror(errno);
    close(fd);
    return false;
  }
  drm_fd = fd;
  return true;
}

void DisplayTickScheduler::close_vblank() {
  if (drm_fd >= 0) {
    close(drm_fd);
    drm_fd = -1;
  }
}

void DisplayTickScheduler::set_refresh_hz(int hz) {
  if (hz < 1) hz = 1;
  if (hz > 240) hz = 240;
  period_us = 1000000ull / (uint64_t)hz;
  next_deadline_us = 0;
}

tick_ticket DisplayTickScheduler::schedule_next(tick_fn fn) {
  pending_fn = std::move(fn);
  pending_ticket = next_ticket++;
  return pending_ticket;
}

void DisplayTickScheduler::cancel(tick_ticket t) {
  if (t == kNoTicket || t != pending_ticket) return;
  pending_fn = nullptr;
  pending_ticket = kNoTicket;
}

bool DisplayTickScheduler::wait_vblank() {
  drmVBlank vbl;
  memset(&vbl, 0, sizeof(vbl));
  vbl.request.type = DRM_VBLANK_RELATIVE;
  vbl.request.sequence = 1;
  int rc;
  do { rc = drmWaitVBlank(drm_fd, &vbl); } while (rc != 0 && errno == EINTR);
  return rc == 0;
}

void DisplayTickScheduler::wait_timer() {
  uint64_t now = monotonic_us();
  if (next_deadline_us == 0 || now > next_deadline_us + period_us) {
    // First wait, or we fell a whole period behind: resync instead of bursting.
    next_deadline_us = now + period_us;
  }
  if (now < next_deadline_us) usleep((useconds_t)(next_deadline_us - now));
  next_deadline_us += period_us;
}

void DisplayTickScheduler::wait_refresh() {
  if (drm_fd >= 0) {
    if (wait_vblank()) return;
    fprintf(stderr, "[pacer] drmWaitVBlank failed (%s); falling back to %llu us timer\n",
            strerror(errno), (unsigned long long)period_us);
    close_vblank();
  }
  wait_timer();
}

namespace {
// Clears the re-entrancy flag even when the tick throws.
struct running_guard {
  explicit running_guard(bool &f) : flag(f) { flag = true; }
  ~running_guard() { flag = false; }
  bool &flag;
};
}  // namespace

bool DisplayTickScheduler::run_once() {
  if (running) return false;
  wait_refresh();
  if (pending_ticket == kNoTicket) return false;

  tick_fn fn = std::move(pending_fn);
  pending_fn = nullptr;
  pending_ticket = kNoTicket;

  running_guard guard(running);
  fn();
  return true;
}

}  // namespace pixscope
