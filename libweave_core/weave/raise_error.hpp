// This file is part of Weave, the actor wiring layer. See the file LICENSE in
// the main distribution directory for license terms and copyright.

#pragma once

#include "weave/detail/build_config.hpp"
#include "weave/detail/core_export.hpp"

#ifdef WEAVE_ENABLE_EXCEPTIONS
#  include <stdexcept>
#endif

#include <type_traits>

namespace weave::detail {

/// Writes `msg` to the current logger before raising an error.
WEAVE_CORE_EXPORT void log_cstring_error(const char* msg);

/// Prints `msg` and terminates the process.
[[noreturn]] WEAVE_CORE_EXPORT void critical(const char* file, int line,
                                             const char* msg);

#ifdef WEAVE_ENABLE_EXCEPTIONS

template <class T>
[[noreturn]] std::enable_if_t<std::is_constructible_v<T, const char*>>
throw_impl(const char* msg) {
  throw T{msg};
}

#endif // WEAVE_ENABLE_EXCEPTIONS

} // namespace weave::detail

#define WEAVE_RAISE_ERROR_SELECT(_1, _2, name, ...) name

#ifdef WEAVE_ENABLE_EXCEPTIONS

#  define WEAVE_RAISE_ERROR_IMPL_2(exception_type, msg)                        \
    do {                                                                       \
      ::weave::detail::log_cstring_error(msg);                                 \
      ::weave::detail::throw_impl<exception_type>(msg);                        \
    } while (false)

#  define WEAVE_RAISE_ERROR_IMPL_1(msg)                                        \
    WEAVE_RAISE_ERROR_IMPL_2(std::runtime_error, msg)

#else // WEAVE_ENABLE_EXCEPTIONS

#  define WEAVE_RAISE_ERROR_IMPL_1(msg)                                        \
    do {                                                                       \
      ::weave::detail::log_cstring_error(msg);                                 \
      ::weave::detail::critical(__FILE__, __LINE__, msg);                      \
    } while (false)

#  define WEAVE_RAISE_ERROR_IMPL_2(unused, msg) WEAVE_RAISE_ERROR_IMPL_1(msg)

#endif // WEAVE_ENABLE_EXCEPTIONS

/// Throws an exception if `WEAVE_ENABLE_EXCEPTIONS` is defined, otherwise
/// calls abort() after printing a given message.
#define WEAVE_RAISE_ERROR(...)                                                 \
  WEAVE_RAISE_ERROR_SELECT(__VA_ARGS__, WEAVE_RAISE_ERROR_IMPL_2,              \
                           WEAVE_RAISE_ERROR_IMPL_1)                           \
  (__VA_ARGS__)
