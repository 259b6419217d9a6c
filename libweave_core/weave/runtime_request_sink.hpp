// This file is part of Weave, the actor wiring layer. See the file LICENSE in
// the main distribution directory for license terms and copyright.

#pragma once

#include "weave/detail/core_export.hpp"
#include "weave/runtime_request.hpp"
#include "weave/sender.hpp"

namespace weave {

/// A box under construction that accepts control signals from the runtime.
class WEAVE_CORE_EXPORT runtime_request_sink {
public:
  virtual ~runtime_request_sink();

  /// Returns a new handle for delivering control signals to this box.
  virtual dyn_sender<runtime_request> get_signal_sender() const = 0;
};

} // namespace weave
