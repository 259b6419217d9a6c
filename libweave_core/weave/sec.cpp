// This file is part of Weave, the actor wiring layer. See the file LICENSE in
// the main distribution directory for license terms and copyright.

#include "weave/sec.hpp"

namespace weave {

std::string to_string(sec x) {
  switch (x) {
    default:
      return "???";
    case sec::none:
      return "none";
    case sec::channel_closed:
      return "channel_closed";
    case sec::invalid_argument:
      return "invalid_argument";
    case sec::runtime_error:
      return "runtime_error";
    case sec::logic_error:
      return "logic_error";
    case sec::no_such_key:
      return "no_such_key";
    case sec::type_clash:
      return "type_clash";
    case sec::unknown_client:
      return "unknown_client";
  }
}

bool from_string(std::string_view in, sec& out) {
  for (auto i = uint8_t{0}; i <= static_cast<uint8_t>(sec::unknown_client);
       ++i) {
    auto code = static_cast<sec>(i);
    if (to_string(code) == in) {
      out = code;
      return true;
    }
  }
  return false;
}

bool from_integer(std::underlying_type_t<sec> in, sec& out) {
  if (in <= static_cast<uint8_t>(sec::unknown_client)) {
    out = static_cast<sec>(in);
    return true;
  }
  return false;
}

} // namespace weave
