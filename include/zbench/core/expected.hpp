#pragma once

#include <string>
#include <utility>

#include "zbench/core/error.hpp"

#if __has_include(<expected>) && __cplusplus > 202002L
#include <expected>
#define ZBENCH_HAVE_STD_EXPECTED 1
#else
#include <tl/expected.hpp>
#define ZBENCH_HAVE_STD_EXPECTED 0
#endif

namespace zbench {

#if ZBENCH_HAVE_STD_EXPECTED

template <class T>
using Expected = std::expected<T, Error>;

template <class E>
using unexpected = std::unexpected<E>;

#else

template <class T>
using Expected = tl::expected<T, Error>;

template <class E>
using unexpected = tl::unexpected<E>;

#endif

inline unexpected<Error> fail(ErrorCode code, std::string message) {
  return unexpected<Error>(Error{code, std::move(message)});
}

}  // namespace zbench
