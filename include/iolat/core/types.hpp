#pragma once

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace iolat {

enum class StoreKind { LocalFs };
enum class OpKind : uint8_t { Write = 0, Read = 1, Delete = 2 };

inline constexpr size_t kOpKindCount = 3;
inline constexpr std::array<OpKind, kOpKindCount> kAllOpKinds{OpKind::Write, OpKind::Read,
                                                              OpKind::Delete};

constexpr size_t op_index(OpKind op) noexcept { return static_cast<size_t>(op); }

const char* op_kind_name(OpKind op) noexcept;

struct StoreConfig {
  StoreKind kind{StoreKind::LocalFs};
  std::string root_dir{"/tmp"};
};

struct DriverConfig {
  size_t payload_size{4096};
  std::vector<uint32_t> rates{10, 20, 50, 100, 200, 500, 1000};
  std::chrono::seconds campaign_duration{30};
  uint64_t seed{1};
};

// Durations of one write -> read -> delete sequence, indexed by OpKind.
struct SequenceResult {
  std::array<std::chrono::microseconds, kOpKindCount> latency{};
};

struct LatencyStats {
  uint64_t count{};
  double mean{};
  double median{};
  double p95{};
  double min{};
  double max{};
};

}  // namespace iolat
