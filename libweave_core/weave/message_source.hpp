// This file is part of Weave, the actor wiring layer. See the file LICENSE in
// the main distribution directory for license terms and copyright.

#pragma once

#include "weave/fwd.hpp"
#include "weave/no_config.hpp"
#include "weave/sender.hpp"

namespace weave {

/// A box under construction that emits messages of type `M`.
template <class M, class Config = no_config>
class message_source {
public:
  virtual ~message_source() = default;

  /// Adds `out` as a destination. The source decides how to interpret
  /// `cfg`, e.g., as routing key or not at all.
  virtual void register_peer(Config cfg, dyn_sender<M> out) = 0;

  /// Registers `peer` as a destination for all outgoing messages.
  void add_sink(const message_sink<M, Config>& peer) {
    register_peer(peer.get_config(), peer.get_sender());
  }
};

} // namespace weave
