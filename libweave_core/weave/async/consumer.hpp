// This file is part of Weave, the actor wiring layer. See the file LICENSE in
// the main distribution directory for license terms and copyright.

#pragma once

#include "weave/detail/core_export.hpp"

namespace weave::async {

/// Base type for consumers that wait on one or more queues at once.
class WEAVE_CORE_EXPORT consumer {
public:
  virtual ~consumer();

  /// Called to signal to the consumer that a producer added an item to the
  /// queue or that the last producer disconnected.
  /// @note Called while the queue holds its lock. Implementations must not
  ///       call back into the queue.
  virtual void on_producer_wakeup() = 0;
};

} // namespace weave::async
