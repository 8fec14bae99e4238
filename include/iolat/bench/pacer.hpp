#pragma once

#include <chrono>
#include <cstdint>

namespace iolat {

// Open-loop timeline for one campaign. Slot i is due at origin + i * interval,
// with interval = 1s / rate. The schedule is fixed at construction and never
// resyncs to the wall clock: after a run of missed deadlines the pacer issues
// back-to-back until it catches up with the nominal schedule again.
class RatePacer {
 public:
  using Clock = std::chrono::steady_clock;

  // Throws Error{InvalidArgument} when rate is 0.
  RatePacer(Clock::time_point origin, uint32_t rate);

  Clock::duration interval() const noexcept { return interval_; }
  Clock::time_point origin() const noexcept { return origin_; }
  Clock::time_point scheduled_at(uint64_t slot) const noexcept;

  // Sleeps until the next slot is due, or counts a missed deadline when it
  // already is. Slot 0 is the origin and never counts as missed. Returns the
  // index of the slot just released.
  uint64_t pace();

  uint64_t issued() const noexcept { return next_slot_; }
  uint64_t missed() const noexcept { return missed_; }

 private:
  Clock::time_point origin_;
  Clock::duration interval_;
  uint64_t next_slot_{0};
  uint64_t missed_{0};
};

}  // namespace iolat
