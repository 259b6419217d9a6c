// This file is part of Weave, the actor wiring layer. See the file LICENSE in
// the main distribution directory for license terms and copyright.

#pragma once

#include "weave/detail/core_export.hpp"
#include "weave/detail/format.hpp"
#include "weave/format_string_with_location.hpp"
#include "weave/log/event.hpp"
#include "weave/log/level.hpp"
#include "weave/settings.hpp"

#include <memory>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>

namespace weave {

/// Centrally logs events from all message boxes and actors in the process.
/// Unless the application installs its own logger via `set_current_logger`,
/// events go to a console logger that prints to `std::clog` with the
/// verbosity chosen at build time (`WEAVE_LOG_LEVEL`).
class WEAVE_CORE_EXPORT logger {
public:
  // -- member types -----------------------------------------------------------

  /// Helper class to print exit trace messages on scope exit.
  class trace_exit_guard {
  public:
    trace_exit_guard() = default;

    trace_exit_guard(std::shared_ptr<logger> instance, log::event event)
      : instance_(std::move(instance)), event_(std::move(event)) {
      // nop
    }

    trace_exit_guard(trace_exit_guard&&) noexcept = default;

    trace_exit_guard& operator=(trace_exit_guard&&) noexcept = default;

    ~trace_exit_guard() {
      if (instance_) {
        event_.message = "EXIT";
        instance_->do_log(std::move(event_));
      }
    }

  private:
    std::shared_ptr<logger> instance_;
    log::event event_;
  };

  // -- constructors, destructors, and assignment operators --------------------

  virtual ~logger();

  // -- logging ----------------------------------------------------------------

  /// Logs a message.
  /// @param level Severity of the message.
  /// @param component Name of the component logging the message.
  /// @param fmt_str The format string (with source location) for the message.
  /// @param args Arguments for the format string.
  template <class... Ts>
  static void log(unsigned level, std::string_view component,
                  format_string_with_location fmt_str, const Ts&... args) {
    auto instance = current_logger();
    if (instance && instance->accepts(level, component)) {
      instance->do_log(make_event(level, component, fmt_str.location,
                                  detail::format(fmt_str.value, args...)));
    }
  }

  /// Logs a message with `trace` severity and returns a guard that logs the
  /// matching exit message when going out of scope.
  template <class... Ts>
  [[nodiscard]] static trace_exit_guard
  trace(std::string_view component, format_string_with_location fmt_str,
        const Ts&... args) {
    auto instance = current_logger();
    if (instance && instance->accepts(log::level::trace, component)) {
      auto msg = std::string{"ENTRY"};
      if (!fmt_str.value.empty()) {
        msg += ' ';
        msg += detail::format(fmt_str.value, args...);
      }
      auto event = make_event(log::level::trace, component, fmt_str.location,
                              std::move(msg));
      instance->do_log(log::event{event});
      return {std::move(instance), std::move(event)};
    }
    return {};
  }

  // -- properties -------------------------------------------------------------

  /// Returns whether the logger is configured to accept input for given
  /// component and log level.
  virtual bool accepts(unsigned level, std::string_view component) = 0;

  // -- static utility functions -----------------------------------------------

  /// Creates a console logger that writes to `out`. The verbosity is read from
  /// `weave.logger.verbosity` and falls back to the build-time default.
  static std::shared_ptr<logger> make_console_logger(const settings& cfg,
                                                     std::ostream& out);

  /// Returns the process-wide logger. Never returns `nullptr`.
  static std::shared_ptr<logger> current_logger();

  /// Replaces the process-wide logger. Passing `nullptr` restores the default
  /// console logger.
  static void set_current_logger(std::shared_ptr<logger> instance);

protected:
  // -- virtual API ------------------------------------------------------------

  /// Writes an event to the log.
  virtual void do_log(log::event&& event) = 0;

private:
  static log::event make_event(unsigned level, std::string_view component,
                               const std::source_location& loc,
                               std::string message);
};

} // namespace weave
