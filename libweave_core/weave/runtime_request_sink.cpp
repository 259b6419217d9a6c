// This file is part of Weave, the actor wiring layer. See the file LICENSE in
// the main distribution directory for license terms and copyright.

#include "weave/runtime_request_sink.hpp"

namespace weave {

runtime_request_sink::~runtime_request_sink() {
  // nop
}

} // namespace weave
