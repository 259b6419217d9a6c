// This file is part of Weave, the actor wiring layer. See the file LICENSE in
// the main distribution directory for license terms and copyright.

#include "weave/runtime_request.hpp"

namespace weave {

std::string to_string(runtime_request x) {
  switch (x) {
    default:
      return "???";
    case runtime_request::shutdown:
      return "weave::runtime_request::shutdown";
  }
}

bool from_string(std::string_view in, runtime_request& out) {
  if (in == "weave::runtime_request::shutdown") {
    out = runtime_request::shutdown;
    return true;
  }
  return false;
}

} // namespace weave
