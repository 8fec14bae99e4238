#pragma once

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <ostream>
#include <string>

namespace iolat {

// Upper edges in microseconds: 32 * sqrt(2)^k for k = 0..kBucketEdgeCount-1.
inline constexpr size_t kBucketEdgeCount = 24;
// Edges plus the "+inf" overflow bucket.
inline constexpr size_t kBucketSlotCount = kBucketEdgeCount + 1;

using BucketEdges = std::array<double, kBucketEdgeCount>;

const BucketEdges& bucket_edges() noexcept;

// Axis label for bucket `idx`: "%.2fµs" below 1000us, "%.2fms" above,
// "+inf" for the overflow slot and beyond.
std::string bucket_name(size_t idx);

// Compact duration used by the text report, e.g. "45µs", "1.024ms".
std::string format_micros(uint64_t us);

class LatencyHistogram {
 public:
  void record(uint64_t us) noexcept;
  void record(std::chrono::microseconds d) noexcept;

  uint64_t count() const noexcept { return total_; }

  // Samples <= edge idx. Non-decreasing in idx.
  uint64_t cumulative(size_t idx) const noexcept;
  // Samples in slot idx alone; idx == kBucketEdgeCount is the overflow slot.
  uint64_t delta(size_t idx) const noexcept { return idx < slots_.size() ? slots_[idx] : 0; }
  uint64_t overflow() const noexcept { return slots_[kBucketEdgeCount]; }

 private:
  std::array<uint64_t, kBucketSlotCount> slots_{};
  uint64_t total_{0};
};

void render_text(std::ostream& os, const LatencyHistogram& h);

// Writes `<dir>/<name>.svg` and returns its path. Throws Error{IoError}.
std::filesystem::path render_svg_chart(const std::filesystem::path& dir,
                                       const std::string& name,
                                       const LatencyHistogram& h);

}  // namespace iolat
