#pragma once
#include <cstdint>
#include <string>

#include "tick_scheduler.h"

namespace pixscope {

/**
    Production TickScheduler driven from the supervisor loop.

    run_once() blocks until the next display refresh, then runs the pending
    tick (if any) on the calling thread. Refreshes come from DRM vertical
    blanks when a card could be opened, otherwise from CLOCK_MONOTONIC at
    refresh_hz. Holds at most one pending tick; a tick scheduled from inside a
    running tick waits for the following refresh.
*/
class DisplayTickScheduler : public TickScheduler {
public:
  explicit DisplayTickScheduler(int refresh_hz);
  ~DisplayTickScheduler();

  DisplayTickScheduler(const DisplayTickScheduler&) = delete;
  DisplayTickScheduler& operator=(const DisplayTickScheduler&) = delete;

  // card empty => try /dev/dri/card1 then /dev/dri/card0.
  bool open_vblank(const std::string &card, std::string *err);
  void close_vblank();
  bool using_vblank() const { return drm_fd >= 0; }

  void set_refresh_hz(int hz);

  tick_ticket schedule_next(tick_fn fn) override;
  void cancel(tick_ticket t) override;

  bool has_pending() const { return pending_ticket != kNoTicket; }

  // Returns true if a tick ran.
  bool run_once();

private:
  void wait_refresh();
  bool wait_vblank();
  void wait_timer();

  int drm_fd = -1;
  uint64_t period_us = 16667;
  uint64_t next_deadline_us = 0;

  tick_fn pending_fn;
  tick_ticket pending_ticket = kNoTicket;
  tick_ticket next_ticket = 1;
  bool running = false;
};

}  // namespace pixscope
