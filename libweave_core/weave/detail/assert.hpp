// This file is part of Weave, the actor wiring layer. See the file LICENSE in
// the main distribution directory for license terms and copyright.

#pragma once

#include "weave/detail/build_config.hpp"
#include "weave/detail/core_export.hpp"

namespace weave::detail {

[[noreturn]] WEAVE_CORE_EXPORT void assertion_failed(const char* file, int line,
                                                     const char* stmt);

} // namespace weave::detail

#ifdef WEAVE_ENABLE_RUNTIME_CHECKS
#  define WEAVE_ASSERT(stmt)                                                   \
    if (static_cast<bool>(stmt) == false) {                                    \
      weave::detail::assertion_failed(__FILE__, __LINE__, #stmt);              \
    }                                                                          \
    static_cast<void>(0)
#else
#  define WEAVE_ASSERT(unused) static_cast<void>(0)
#endif
