#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <ostream>
#include <span>
#include <string>

#include "iolat/bench/driver.hpp"
#include "iolat/core/types.hpp"

namespace iolat {

struct ReportOptions {
  bool charts{true};
  std::filesystem::path chart_dir{"/tmp/images"};
};

// "<op>-qps-<rate>", e.g. "write-qps-100".
std::string chart_name(OpKind op, uint32_t rate);

void print_campaign_header(std::ostream& os, uint32_t rate, std::chrono::seconds duration,
                           uint64_t scheduled);

// Wall duration, missed deadlines, then the write/read/delete histograms.
// Chart failures are reported on stderr and do not throw.
void print_campaign(std::ostream& os, const CampaignResult& r, const ReportOptions& opts);

void print_summary(std::ostream& os, std::span<const CampaignResult> results);

}  // namespace iolat
