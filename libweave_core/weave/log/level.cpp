// This file is part of Weave, the actor wiring layer. See the file LICENSE in
// the main distribution directory for license terms and copyright.

#include "weave/log/level.hpp"

namespace weave::log {

std::string_view level_name(unsigned lvl) noexcept {
  if (lvl <= level::quiet)
    return "QUIET";
  if (lvl <= level::error)
    return "ERROR";
  if (lvl <= level::warning)
    return "WARNING";
  if (lvl <= level::info)
    return "INFO";
  if (lvl <= level::debug)
    return "DEBUG";
  return "TRACE";
}

std::optional<unsigned> level_from_string(std::string_view str) noexcept {
  if (str == "quiet")
    return level::quiet;
  if (str == "error")
    return level::error;
  if (str == "warning")
    return level::warning;
  if (str == "info")
    return level::info;
  if (str == "debug")
    return level::debug;
  if (str == "trace")
    return level::trace;
  return std::nullopt;
}

} // namespace weave::log
