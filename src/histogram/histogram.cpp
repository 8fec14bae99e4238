#include "iolat/histogram/histogram.hpp"

#include <algorithm>
#include <cmath>
#include <format>
#include <numbers>
#include <string>

namespace iolat {
namespace {

constexpr double kFirstEdgeUs = 32.0;
constexpr size_t kBarWidth = 100;
constexpr size_t kLabelWidth = 10;
constexpr size_t kRuleWidth = kLabelWidth + 1 + kBarWidth + 1 + 10;

BucketEdges make_edges() {
  BucketEdges edges{};
  for (size_t k = 0; k < edges.size(); ++k) {
    const double base = std::ldexp(kFirstEdgeUs, static_cast<int>(k / 2));
    edges[k] = (k % 2 == 0) ? base : base * std::numbers::sqrt2;
  }
  return edges;
}

std::string trim_fraction(std::string s) {
  if (s.find('.') == std::string::npos) {
    return s;
  }
  while (!s.empty() && s.back() == '0') {
    s.pop_back();
  }
  if (!s.empty() && s.back() == '.') {
    s.pop_back();
  }
  return s;
}

}  // namespace

const BucketEdges& bucket_edges() noexcept {
  static const BucketEdges edges = make_edges();
  return edges;
}

std::string bucket_name(size_t idx) {
  const auto& edges = bucket_edges();
  if (idx >= edges.size()) {
    return "+inf";
  }
  const double us = edges[idx];
  if (us < 1000.0) {
    return std::format("{:.2f}µs", us);
  }
  return std::format("{:.2f}ms", us / 1000.0);
}

std::string format_micros(uint64_t us) {
  if (us < 1000) {
    return std::format("{}µs", us);
  }
  if (us < 1'000'000) {
    return trim_fraction(std::format("{:.3f}", static_cast<double>(us) / 1e3)) + "ms";
  }
  return trim_fraction(std::format("{:.6f}", static_cast<double>(us) / 1e6)) + "s";
}

void LatencyHistogram::record(uint64_t us) noexcept {
  const auto& edges = bucket_edges();
  const auto it = std::lower_bound(edges.begin(), edges.end(), static_cast<double>(us));
  ++slots_[static_cast<size_t>(it - edges.begin())];
  ++total_;
}

void LatencyHistogram::record(std::chrono::microseconds d) noexcept {
  record(d.count() < 0 ? 0 : static_cast<uint64_t>(d.count()));
}

uint64_t LatencyHistogram::cumulative(size_t idx) const noexcept {
  const size_t last = std::min(idx, slots_.size() - 1);
  uint64_t sum = 0;
  for (size_t i = 0; i <= last; ++i) {
    sum += slots_[i];
  }
  return sum;
}

void render_text(std::ostream& os, const LatencyHistogram& h) {
  const uint64_t sum = h.count();
  const std::string rule(kRuleWidth, '-');

  const auto row = [&](const std::string& label, uint64_t delta) {
    const size_t dots =
        sum == 0 ? 0 : static_cast<size_t>((delta * kBarWidth + sum - 1) / sum);
    os << std::format("    {:<10} {}{} {}\n", label, std::string(dots, '.'),
                      std::string(kBarWidth - std::min(dots, kBarWidth), ' '), delta);
  };

  os << "    " << rule << "\n";
  const auto& edges = bucket_edges();
  uint64_t before = 0;
  for (size_t idx = 0; idx < edges.size(); idx += 2) {
    const uint64_t cum = h.cumulative(idx);
    row(format_micros(static_cast<uint64_t>(edges[idx])), cum - before);
    before = cum;
  }
  row("+inf", sum - before);
  os << "    " << rule << "\n";
}

}  // namespace iolat
