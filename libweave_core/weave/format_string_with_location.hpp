// This file is part of Weave, the actor wiring layer. See the file LICENSE in
// the main distribution directory for license terms and copyright.

#pragma once

#include <source_location>
#include <string_view>
#include <type_traits>

namespace weave {

/// Wraps a format string and its source location. Constructing this type
/// implicitly from a string literal captures the location of the caller.
struct format_string_with_location {
  template <class T>
    requires std::is_convertible_v<const T&, std::string_view>
  constexpr format_string_with_location(
    const T& str,
    const std::source_location& loc = std::source_location::current())
    : value(str), location(loc) {
    // nop
  }

  std::string_view value;

  std::source_location location;
};

} // namespace weave
