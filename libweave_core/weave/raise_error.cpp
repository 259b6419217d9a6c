// This file is part of Weave, the actor wiring layer. See the file LICENSE in
// the main distribution directory for license terms and copyright.

#include "weave/raise_error.hpp"

#include "weave/log/core.hpp"

#include <cstdio>
#include <cstdlib>

namespace weave::detail {

void log_cstring_error(const char* msg) {
  log::core::error("{}", msg);
}

void critical(const char* file, int line, const char* msg) {
  fprintf(stderr, "[FATAL] critical error (%s:%d): %s\n", file, line, msg);
  abort();
}

} // namespace weave::detail
