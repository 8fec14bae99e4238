#include "iolat/core/error.hpp"

namespace iolat {

const char *error_code_name(ErrorCode code) noexcept {
  switch (code) {
    case ErrorCode::InvalidArgument:
      return "invalid_argument";
    case ErrorCode::IoError:
      return "io_error";
    case ErrorCode::NotFound:
      return "not_found";
    case ErrorCode::CorrectnessViolation:
      return "correctness_violation";
    case ErrorCode::Internal:
      return "internal";
  }
  return "internal";
}

}  // namespace iolat
