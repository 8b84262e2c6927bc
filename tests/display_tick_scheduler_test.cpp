#include <gtest/gtest.h>

#include <stdexcept>

#include "display_tick_scheduler.h"
#include "mono_clock.h"

using namespace pixscope;

// Timer pacing only; no DRM card is opened here.

TEST(DisplayTickScheduler, RunsPendingTickOnce) {
  DisplayTickScheduler sched(240);
  int runs = 0;
  tick_ticket t = sched.schedule_next([&runs]() { runs++; });
  EXPECT_NE(t, kNoTicket);
  EXPECT_TRUE(sched.has_pending());

  EXPECT_TRUE(sched.run_once());
  EXPECT_EQ(runs, 1);
  EXPECT_FALSE(sched.has_pending());
  EXPECT_FALSE(sched.run_once());
  EXPECT_EQ(runs, 1);
}

TEST(DisplayTickScheduler, CancelDropsPendingTick) {
  DisplayTickScheduler sched(240);
  int runs = 0;
  tick_ticket t = sched.schedule_next([&runs]() { runs++; });
  sched.cancel(t);
  EXPECT_FALSE(sched.has_pending());
  EXPECT_FALSE(sched.run_once());
  EXPECT_EQ(runs, 0);
}

TEST(DisplayTickScheduler, StaleTicketIsIgnored) {
  DisplayTickScheduler sched(240);
  int runs = 0;
  tick_ticket first = sched.schedule_next([]() {});
  tick_ticket second = sched.schedule_next([&runs]() { runs++; });
  EXPECT_NE(first, second);

  sched.cancel(first);
  sched.cancel(kNoTicket);
  EXPECT_TRUE(sched.has_pending());
  EXPECT_TRUE(sched.run_once());
  EXPECT_EQ(runs, 1);
}

TEST(DisplayTickScheduler, RescheduleFromInsideTickWaitsForNextRefresh) {
  DisplayTickScheduler sched(240);
  int runs = 0;
  std::function<void()> fn;
  fn = [&]() {
    runs++;
    if (runs < 3) sched.schedule_next(fn);
  };
  sched.schedule_next(fn);

  EXPECT_TRUE(sched.run_once());
  EXPECT_EQ(runs, 1);
  EXPECT_TRUE(sched.has_pending());
  EXPECT_TRUE(sched.run_once());
  EXPECT_TRUE(sched.run_once());
  EXPECT_EQ(runs, 3);
  EXPECT_FALSE(sched.has_pending());
}

TEST(DisplayTickScheduler, ThrowingTickDoesNotWedgeScheduler) {
  DisplayTickScheduler sched(240);
  sched.schedule_next([]() { throw std::runtime_error("tick failed"); });
  EXPECT_THROW(sched.run_once(), std::runtime_error);
  EXPECT_FALSE(sched.has_pending());

  int runs = 0;
  sched.schedule_next([&runs]() { runs++; });
  EXPECT_TRUE(sched.run_once());
  EXPECT_EQ(runs, 1);
}

TEST(DisplayTickScheduler, TimerPacesAtRefreshRate) {
  DisplayTickScheduler sched(100);
  EXPECT_FALSE(sched.using_vblank());

  sched.run_once();  // first wait anchors the deadline
  uint64_t t0 = monotonic_us();
  for (int i=0; i<5; i++) sched.run_once();
  uint64_t elapsed = monotonic_us() - t0;

  // Five 10 ms periods; allow generous slack on loaded machines.
  EXPECT_GE(elapsed, 40000u);
  EXPECT_LT(elapsed, 2000000u);
}
