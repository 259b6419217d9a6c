// This file is part of Weave, the actor wiring layer. See the file LICENSE in
// the main distribution directory for license terms and copyright.

#pragma once

#include "weave/detail/core_export.hpp"

#include <cstdint>
#include <string>
#include <string_view>

namespace weave {

/// Control signals that the runtime delivers to an actor.
enum class runtime_request : uint8_t {
  /// Asks the actor to leave its run loop.
  shutdown,
};

/// @relates runtime_request
WEAVE_CORE_EXPORT std::string to_string(runtime_request);

/// @relates runtime_request
WEAVE_CORE_EXPORT bool from_string(std::string_view, runtime_request&);

} // namespace weave
