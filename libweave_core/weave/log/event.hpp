// This file is part of Weave, the actor wiring layer. See the file LICENSE in
// the main distribution directory for license terms and copyright.

#pragma once

#include <chrono>
#include <source_location>
#include <string>
#include <string_view>
#include <thread>

namespace weave::log {

/// Captures a single log message with its meta data.
struct event {
  /// Severity of the event.
  unsigned level;

  /// Name of the component that generated the event.
  std::string_view component;

  /// Location in the source code where the event originated.
  std::source_location location;

  /// Thread that generated the event.
  std::thread::id thread;

  /// Time when the event was generated.
  std::chrono::system_clock::time_point timestamp;

  /// The formatted message.
  std::string message;
};

} // namespace weave::log
