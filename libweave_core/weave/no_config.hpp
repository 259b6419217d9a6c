// This file is part of Weave, the actor wiring layer. See the file LICENSE in
// the main distribution directory for license terms and copyright.

#pragma once

#include <string>

namespace weave {

/// Connection config for boxes with a single implicit peer.
struct no_config {};

/// @relates no_config
inline std::string to_string(no_config) {
  return "no_config";
}

/// @relates no_config
constexpr bool operator==(no_config, no_config) noexcept {
  return true;
}

} // namespace weave
