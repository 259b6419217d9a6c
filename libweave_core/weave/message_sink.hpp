// This file is part of Weave, the actor wiring layer. See the file LICENSE in
// the main distribution directory for license terms and copyright.

#pragma once

#include "weave/fwd.hpp"
#include "weave/mapping_sender.hpp"
#include "weave/message_source.hpp"
#include "weave/no_config.hpp"
#include "weave/sender.hpp"

#include <concepts>
#include <memory>
#include <utility>

namespace weave {

/// A box under construction that receives messages of type `M`.
template <class M, class Config = no_config>
class message_sink {
public:
  virtual ~message_sink() = default;

  /// Returns the config that sources use when routing to this sink.
  virtual Config get_config() const = 0;

  /// Returns a new handle for delivering messages to this sink.
  virtual dyn_sender<M> get_sender() const = 0;

  /// Asks `source` to deliver its messages to this sink.
  template <class N>
    requires std::convertible_to<N, M>
  void add_input(message_source<N, Config>& source) {
    source.register_peer(get_config(), adapt<N, M>(get_sender()));
  }

  /// Asks `source` to deliver its messages to this sink after expanding each
  /// of them into zero or more messages with `fn`. Delivers the results of
  /// `fn` in order, one input message at a time.
  template <class N, class F>
    requires mapper<F, N, M>
  void add_mapped_input(message_source<N, Config>& source, F fn) {
    auto fn_ptr = std::make_shared<const F>(std::move(fn));
    source.register_peer(get_config(), make_sender<mapping_sender<N, M, F>>(
                                         std::move(fn_ptr), get_sender()));
  }
};

} // namespace weave
