// This file is part of Weave, the actor wiring layer. See the file LICENSE in
// the main distribution directory for license terms and copyright.

#include "weave/async/read_result.hpp"

namespace weave::async {

std::string to_string(read_result x) {
  switch (x) {
    default:
      return "???";
    case read_result::ok:
      return "ok";
    case read_result::stop:
      return "stop";
    case read_result::abort:
      return "abort";
    case read_result::timeout:
      return "timeout";
  }
}

} // namespace weave::async
