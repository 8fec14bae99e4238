#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace iolat::app {

// Deterministic alphanumeric payloads: equal seeds give equal output.
class PayloadGenerator {
 public:
  explicit PayloadGenerator(uint64_t seed);

  std::string generate(size_t size) const;

 private:
  uint64_t seed_;
};

}  // namespace iolat::app
