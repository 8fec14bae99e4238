#pragma once

#include <exception>
#include <string>
#include <utility>

namespace iolat {

enum class ErrorCode {
  InvalidArgument,
  IoError,
  NotFound,
  CorrectnessViolation,
  Internal,
};

const char *error_code_name(ErrorCode code) noexcept;

class Error : public std::exception {
  ErrorCode code_{ErrorCode::Internal};
  std::string message_{};

public:
  Error() = default;
  Error(ErrorCode c, std::string m) : code_(c), message_(std::move(m)) {}
  explicit Error(std::string m) : message_(std::move(m)) {}

  const char *what() const noexcept override { return message_.c_str(); }

  ErrorCode code() const noexcept { return code_; }
};

// Failure of a single backend operation on a single key.
class BackendError : public Error {
  std::string op_{};
  std::string key_{};
  std::string cause_{};

public:
  BackendError(ErrorCode c, std::string op, std::string key, std::string cause)
      : Error(c, op + " " + key + ": " + cause), op_(std::move(op)),
        key_(std::move(key)), cause_(std::move(cause)) {}

  const std::string &op() const noexcept { return op_; }
  const std::string &key() const noexcept { return key_; }
  const std::string &cause() const noexcept { return cause_; }
};

} // namespace iolat
