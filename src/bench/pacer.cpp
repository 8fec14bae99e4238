#include "iolat/bench/pacer.hpp"

#include <thread>

#include "iolat/core/error.hpp"

namespace iolat {
namespace {

RatePacer::Clock::duration interval_for(uint32_t rate) {
  if (rate == 0) {
    throw Error{ErrorCode::InvalidArgument, "rate must be > 0"};
  }
  return std::chrono::duration_cast<RatePacer::Clock::duration>(
      std::chrono::nanoseconds(1'000'000'000LL / rate));
}

}  // namespace

RatePacer::RatePacer(Clock::time_point origin, uint32_t rate)
    : origin_(origin), interval_(interval_for(rate)) {}

RatePacer::Clock::time_point RatePacer::scheduled_at(uint64_t slot) const noexcept {
  return origin_ + interval_ * static_cast<Clock::rep>(slot);
}

uint64_t RatePacer::pace() {
  const uint64_t slot = next_slot_++;
  const auto due = scheduled_at(slot);
  if (Clock::now() < due) {
    std::this_thread::sleep_until(due);
  } else if (slot > 0) {
    ++missed_;
  }
  return slot;
}

}  // namespace iolat
