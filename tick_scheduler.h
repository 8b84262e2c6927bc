#pragma once
#include <cstdint>
#include <functional>

namespace pixscope {

using tick_fn = std::function<void()>;
using tick_ticket = uint64_t;

static constexpr tick_ticket kNoTicket = 0;

// Display-synchronized request/cancel primitive. At most one tick is pending
// at a time and a tick is never started while another is still running.
class TickScheduler {
public:
  virtual ~TickScheduler() {}

  // Queues fn for the next refresh. Returns a non-zero ticket.
  virtual tick_ticket schedule_next(tick_fn fn) = 0;

  // Drops the pending tick if `t` still names it. Unknown tickets are ignored.
  virtual void cancel(tick_ticket t) = 0;
};

}  // namespace pixscope
