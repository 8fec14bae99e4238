#pragma once

#include <tl/expected.hpp>

#include "iolat/core/error.hpp"

namespace iolat {

template <class T>
using Expected = tl::expected<T, Error>;

template <class E>
using unexpected = tl::unexpected<E>;

using tl::make_unexpected;

}  // namespace iolat
