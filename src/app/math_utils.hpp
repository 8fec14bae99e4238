#pragma once

#include <cstdint>
#include <vector>

#include "iolat/core/types.hpp"

namespace iolat::app {

LatencyStats calc_stats(std::vector<double> values);
double percent_of(uint64_t part, uint64_t whole);
uint64_t xorshift64(uint64_t& s);

}  // namespace iolat::app
