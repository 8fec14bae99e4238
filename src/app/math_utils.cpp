#include "app/math_utils.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>

namespace iolat::app {

LatencyStats calc_stats(std::vector<double> values) {
  LatencyStats out{};
  if (values.empty()) {
    return out;
  }
  std::sort(values.begin(), values.end());
  out.count = values.size();
  out.min = values.front();
  out.max = values.back();
  const double sum = std::accumulate(values.begin(), values.end(), 0.0);
  out.mean = sum / static_cast<double>(values.size());

  const auto percentile = [&](double p) {
    const double idx = p * static_cast<double>(values.size() - 1);
    const auto lo = static_cast<size_t>(std::floor(idx));
    const auto hi = static_cast<size_t>(std::ceil(idx));
    if (lo == hi) {
      return values[lo];
    }
    const double frac = idx - static_cast<double>(lo);
    return values[lo] * (1.0 - frac) + values[hi] * frac;
  };

  out.median = percentile(0.50);
  out.p95 = percentile(0.95);
  return out;
}

double percent_of(uint64_t part, uint64_t whole) {
  if (whole == 0) {
    return 0.0;
  }
  return static_cast<double>(part) * 100.0 / static_cast<double>(whole);
}

uint64_t xorshift64(uint64_t& s) {
  s ^= s << 13;
  s ^= s >> 7;
  s ^= s << 17;
  return s;
}

}  // namespace iolat::app
