// This file is part of Weave, the actor wiring layer. See the file LICENSE in
// the main distribution directory for license terms and copyright.

#pragma once

#include "weave/defaults.hpp"
#include "weave/detail/core_export.hpp"
#include "weave/expected.hpp"
#include "weave/settings.hpp"

#include <cstddef>
#include <string>
#include <string_view>

namespace weave {

/// Configures the request queue and the concurrency of a server actor.
class WEAVE_CORE_EXPORT server_config {
public:
  /// Capacity of the shared request queue.
  size_t capacity = defaults::server::capacity;

  /// Maximum number of requests processed at the same time by a concurrent
  /// server. Values below 1 are treated as 1 when building the message box.
  size_t max_concurrency = defaults::server::max_concurrency;

  server_config& with_capacity(size_t value) noexcept {
    capacity = value;
    return *this;
  }

  server_config& with_max_concurrency(size_t value) noexcept {
    max_concurrency = value;
    return *this;
  }

  /// Reads `<prefix>.capacity` and `<prefix>.max-concurrency` from `cfg`,
  /// using the defaults for missing keys.
  /// @returns `sec::invalid_argument` for a zero capacity or a negative value
  ///          and `sec::type_clash` for a value of the wrong type.
  static expected<server_config> from(const settings& cfg,
                                      std::string_view prefix);
};

/// @relates server_config
WEAVE_CORE_EXPORT std::string to_string(const server_config& x);

/// @relates server_config
inline bool operator==(const server_config& x,
                       const server_config& y) noexcept {
  return x.capacity == y.capacity && x.max_concurrency == y.max_concurrency;
}

} // namespace weave
