// This file is part of Weave, the actor wiring layer. See the file LICENSE in
// the main distribution directory for license terms and copyright.

#pragma once

#include "weave/detail/core_export.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <type_traits>

namespace weave {

/// SEC stands for "System Error Code". This enum contains error codes for
/// the wiring layer and its message boxes.
enum class sec : uint8_t {
  /// No error.
  none = 0,
  /// The other end of a channel is gone.
  channel_closed = 1,
  /// A function received an argument outside its domain.
  invalid_argument,
  /// A user-defined handler failed with an exception.
  runtime_error,
  /// An operation was called in an invalid state.
  logic_error,
  /// A config lookup found no value for the key.
  no_such_key,
  /// A config value has an unexpected type.
  type_clash,
  /// A response referred to a client that never connected.
  unknown_client,
};

/// @relates sec
WEAVE_CORE_EXPORT std::string to_string(sec);

/// @relates sec
WEAVE_CORE_EXPORT bool from_string(std::string_view, sec&);

/// @relates sec
WEAVE_CORE_EXPORT bool from_integer(std::underlying_type_t<sec>, sec&);

} // namespace weave
