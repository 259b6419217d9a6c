// This file is part of Weave, the actor wiring layer. See the file LICENSE in
// the main distribution directory for license terms and copyright.

#pragma once

#include "weave/detail/core_export.hpp"

#include <optional>
#include <string_view>

namespace weave::log::level {

/// Disables all log output.
constexpr unsigned quiet = 0;

/// Severity for unrecoverable conditions.
constexpr unsigned error = 3;

/// Severity for conditions the application can recover from.
constexpr unsigned warning = 6;

/// Severity for noteworthy events such as an actor starting or stopping.
constexpr unsigned info = 9;

/// Severity for messages passing through message boxes.
constexpr unsigned debug = 12;

/// Severity for entering and leaving functions.
constexpr unsigned trace = 15;

} // namespace weave::log::level

namespace weave::log {

/// Returns the upper-case name of `level`, e.g., `DEBUG`.
WEAVE_CORE_EXPORT std::string_view level_name(unsigned level) noexcept;

/// Parses a lower-case level name such as `debug`.
WEAVE_CORE_EXPORT std::optional<unsigned>
level_from_string(std::string_view str) noexcept;

} // namespace weave::log
