// This file is part of Weave, the actor wiring layer. See the file LICENSE in
// the main distribution directory for license terms and copyright.

#pragma once

#include "weave/deep_to_string.hpp"
#include "weave/detail/core_export.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace weave::detail {

/// Renders a single format argument. Unlike `deep_to_string`, strings and
/// characters appear without quotes.
template <class T>
std::string format_arg(const T& x) {
  if constexpr (std::is_same_v<T, char>) {
    return std::string(1, x);
  } else if constexpr (string_like<T>) {
    return std::string{std::string_view{x}};
  } else {
    return deep_to_string(x);
  }
}

/// Replaces each `{}` in `fstr` with the next element of `args`. The sequences
/// `{{` and `}}` produce a literal brace. Surplus placeholders remain empty.
WEAVE_CORE_EXPORT std::string vformat(std::string_view fstr,
                                      const std::vector<std::string>& args);

/// Formats `fstr` with `{}` placeholders.
template <class... Ts>
std::string format(std::string_view fstr, const Ts&... xs) {
  if constexpr (sizeof...(Ts) == 0) {
    return vformat(fstr, {});
  } else {
    return vformat(fstr, std::vector<std::string>{format_arg(xs)...});
  }
}

} // namespace weave::detail
