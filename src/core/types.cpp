#include "iolat/core/types.hpp"

namespace iolat {

const char* op_kind_name(OpKind op) noexcept {
  switch (op) {
    case OpKind::Write:
      return "write";
    case OpKind::Read:
      return "read";
    case OpKind::Delete:
      return "delete";
  }
  return "unknown";
}

}  // namespace iolat
