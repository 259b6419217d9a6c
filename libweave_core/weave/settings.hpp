// This file is part of Weave, the actor wiring layer. See the file LICENSE in
// the main distribution directory for license terms and copyright.

#pragma once

#include "weave/detail/core_export.hpp"
#include "weave/error.hpp"
#include "weave/expected.hpp"

#include <cstdint>
#include <limits>
#include <map>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>
#include <vector>

namespace weave {

/// A single configuration value. The first alternative represents "no value".
using config_value
  = std::variant<std::monostate, bool, int64_t, double, std::string>;

/// Maps dotted keys such as `weave.logger.verbosity` to configuration values.
using settings = std::map<std::string, config_value, std::less<>>;

/// Stores `value` under `key`, overriding any previous value.
WEAVE_CORE_EXPORT void put(settings& xs, std::string_view key,
                           config_value value);

/// Returns a pointer to the value stored under `key` or `nullptr`.
WEAVE_CORE_EXPORT const config_value* get_if(const settings* xs,
                                             std::string_view key);

/// Converts the value stored under `key` to `T`.
/// @returns `sec::no_such_key` if `key` is missing and `sec::type_clash` if
///          the value does not fit into `T`.
template <class T>
expected<T> get_as(const settings& xs, std::string_view key) {
  auto* val = get_if(&xs, key);
  if (val == nullptr)
    return unexpected{make_error(sec::no_such_key, key)};
  if constexpr (std::is_same_v<T, bool>) {
    if (auto* x = std::get_if<bool>(val))
      return *x;
  } else if constexpr (std::is_integral_v<T>) {
    if (auto* x = std::get_if<int64_t>(val)) {
      using limits = std::numeric_limits<T>;
      if constexpr (std::is_signed_v<T>) {
        if (*x >= limits::min() && *x <= limits::max())
          return static_cast<T>(*x);
      } else {
        if (*x >= 0 && static_cast<uint64_t>(*x) <= limits::max())
          return static_cast<T>(*x);
      }
      return unexpected{make_error(sec::invalid_argument, key,
                                   "value out of range")};
    }
  } else if constexpr (std::is_floating_point_v<T>) {
    if (auto* x = std::get_if<double>(val))
      return static_cast<T>(*x);
    if (auto* x = std::get_if<int64_t>(val))
      return static_cast<T>(*x);
  } else {
    static_assert(std::is_same_v<T, std::string>,
                  "get_as: unsupported target type");
    if (auto* x = std::get_if<std::string>(val))
      return *x;
  }
  return unexpected{make_error(sec::type_clash, key)};
}

/// Returns the value stored under `key` or `fallback` if the key is missing
/// or has an incompatible type.
template <class T>
T get_or(const settings& xs, std::string_view key, T fallback) {
  if (auto val = get_as<T>(xs, key))
    return std::move(*val);
  return fallback;
}

/// @private
inline std::string get_or(const settings& xs, std::string_view key,
                          const char* fallback) {
  return get_or(xs, key, std::string{fallback});
}

/// Parses `str` as boolean, integer, real or (as fallback) string.
WEAVE_CORE_EXPORT config_value parse_config_value(std::string_view str);

/// Parses command line arguments of the form `--key=value`. Arguments that do
/// not start with `--` are ignored.
/// @returns `sec::invalid_argument` if an option has no `=` or an empty key.
WEAVE_CORE_EXPORT expected<settings>
parse_settings(const std::vector<std::string>& args);

/// @copydoc parse_settings
WEAVE_CORE_EXPORT expected<settings> parse_settings(int argc, char** argv);

} // namespace weave
