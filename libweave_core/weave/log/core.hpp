// This file is part of Weave, the actor wiring layer. See the file LICENSE in
// the main distribution directory for license terms and copyright.

#pragma once

#include "weave/logger.hpp"

#include <string_view>

namespace weave::log::core {

/// The name of this component in log events.
constexpr std::string_view component = "weave.core";

/// Logs a message with `trace` severity and returns a guard that logs the
/// matching exit message.
template <class... Ts>
[[nodiscard]] logger::trace_exit_guard
trace(format_string_with_location fmt_str, const Ts&... args) {
  return logger::trace(component, fmt_str, args...);
}

/// Logs a message with `debug` severity.
template <class... Ts>
void debug(format_string_with_location fmt_str, const Ts&... args) {
  logger::log(level::debug, component, fmt_str, args...);
}

/// Logs a message with `info` severity.
template <class... Ts>
void info(format_string_with_location fmt_str, const Ts&... args) {
  logger::log(level::info, component, fmt_str, args...);
}

/// Logs a message with `warning` severity.
template <class... Ts>
void warning(format_string_with_location fmt_str, const Ts&... args) {
  logger::log(level::warning, component, fmt_str, args...);
}

/// Logs a message with `error` severity.
template <class... Ts>
void error(format_string_with_location fmt_str, const Ts&... args) {
  logger::log(level::error, component, fmt_str, args...);
}

} // namespace weave::log::core
