#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace iolat::app {

uint64_t payload_digest(std::string_view data);

// "xxh64=0123456789abcdef len=N"
std::string describe_payload(std::string_view data);

}  // namespace iolat::app
