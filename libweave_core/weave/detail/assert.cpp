// This file is part of Weave, the actor wiring layer. See the file LICENSE in
// the main distribution directory for license terms and copyright.

#include "weave/detail/assert.hpp"

#include <cstdio>
#include <cstdlib>

namespace weave::detail {

void assertion_failed(const char* file, int line, const char* stmt) {
  fprintf(stderr, "%s:%d: requirement failed '%s'\n", file, line, stmt);
  fflush(stderr);
  abort();
}

} // namespace weave::detail
