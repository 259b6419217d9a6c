// This file is part of Weave, the actor wiring layer. See the file LICENSE in
// the main distribution directory for license terms and copyright.

#pragma once

#include "weave/deep_to_string.hpp"

#include <concepts>
#include <string>

namespace weave {

/// Payload types that may travel on a channel. Messages cross thread
/// boundaries by moving and must be renderable for log output.
template <class T>
concept message = std::movable<T> && detail::renderable<T>;

/// Placeholder for a box that never receives or never sends messages.
struct no_message {};

/// @relates no_message
inline std::string to_string(no_message) {
  return "no_message";
}

/// @relates no_message
constexpr bool operator==(no_message, no_message) noexcept {
  return true;
}

} // namespace weave
