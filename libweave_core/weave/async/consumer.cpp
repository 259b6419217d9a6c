// This file is part of Weave, the actor wiring layer. See the file LICENSE in
// the main distribution directory for license terms and copyright.

#include "weave/async/consumer.hpp"

namespace weave::async {

consumer::~consumer() {
  // nop
}

} // namespace weave::async
