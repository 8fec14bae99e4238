#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include "iolat/core/types.hpp"
#include "iolat/histogram/histogram.hpp"
#include "iolat/store/store.hpp"

namespace iolat {

inline constexpr std::string_view kSmokeTestValue = "Hello World";

struct CampaignResult {
  uint32_t rate{};
  std::chrono::seconds duration{};
  uint64_t scheduled{};
  std::chrono::microseconds wall{};
  uint64_t missed{};
  std::array<LatencyHistogram, kOpKindCount> histograms{};
  std::array<LatencyStats, kOpKindCount> stats{};

  const LatencyHistogram& histogram(OpKind op) const { return histograms[op_index(op)]; }
  const LatencyStats& stat(OpKind op) const { return stats[op_index(op)]; }
};

struct CampaignObserver {
  std::function<void(uint32_t rate, uint64_t scheduled)> on_start;
  std::function<void(const CampaignResult&)> on_finish;
};

// write -> read -> compare -> delete -> read-must-fail against one key.
// Throws Error{CorrectnessViolation} on a mismatch or when the final read
// succeeds; backend failures propagate as BackendError.
SequenceResult run_sequence(const IStoreHandler& handler, const std::string& key,
                            std::string_view payload);

// Drives open-loop campaigns against one store client.
class RateDriver {
 public:
  // Generates a payload of cfg.payload_size bytes from cfg.seed.
  RateDriver(std::shared_ptr<IStoreClient> client, DriverConfig cfg);
  // Uses `payload` verbatim; cfg.payload_size is ignored.
  RateDriver(std::shared_ptr<IStoreClient> client, DriverConfig cfg, std::string payload);

  RateDriver(const RateDriver&) = delete;
  RateDriver& operator=(const RateDriver&) = delete;

  const DriverConfig& config() const noexcept { return cfg_; }
  const std::string& payload() const noexcept { return *payload_; }

  // Initializes the client, runs the smoke test, then one campaign per
  // configured rate in order.
  std::vector<CampaignResult> run(const CampaignObserver& observer = {});

  void smoke_test();
  CampaignResult run_campaign(uint32_t rate);

 private:
  std::string next_key();

  std::shared_ptr<IStoreClient> client_;
  DriverConfig cfg_;
  std::shared_ptr<const std::string> payload_;
  std::mutex client_mu_;
};

}  // namespace iolat
