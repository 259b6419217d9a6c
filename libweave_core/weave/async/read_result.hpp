// This file is part of Weave, the actor wiring layer. See the file LICENSE in
// the main distribution directory for license terms and copyright.

#pragma once

#include "weave/detail/core_export.hpp"

#include <string>

namespace weave::async {

enum class read_result {
  /// Signals that the read operation succeeded.
  ok,
  /// Signals that the reader reached the end of the input.
  stop,
  /// Signals that the reader was interrupted.
  abort,
  /// Signals that the read operation timed out.
  timeout,
};

WEAVE_CORE_EXPORT std::string to_string(read_result);

} // namespace weave::async
