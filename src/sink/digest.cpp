#include "sink/digest.hpp"

#include <format>

#include <xxhash.h>

namespace iolat::app {

uint64_t payload_digest(std::string_view data) {
  return XXH64(data.data(), data.size(), 0);
}

std::string describe_payload(std::string_view data) {
  return std::format("xxh64={:016x} len={}", payload_digest(data), data.size());
}

}  // namespace iolat::app
