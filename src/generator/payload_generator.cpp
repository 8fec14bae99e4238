#include "generator/payload_generator.hpp"

#include <string_view>

#include "app/math_utils.hpp"

namespace iolat::app {
namespace {

constexpr std::string_view kAlphanumeric =
    "0123456789ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz";

}  // namespace

PayloadGenerator::PayloadGenerator(uint64_t seed) : seed_(seed) {}

std::string PayloadGenerator::generate(size_t size) const {
  std::string out(size, '\0');
  // xorshift has a fixed point at zero.
  uint64_t s = (seed_ ^ 0x9e3779b97f4a7c15ULL) | 1;
  for (auto& c : out) {
    c = kAlphanumeric[xorshift64(s) % kAlphanumeric.size()];
  }
  return out;
}

}  // namespace iolat::app
