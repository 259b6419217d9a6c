// This file is part of Weave, the actor wiring layer. See the file LICENSE in
// the main distribution directory for license terms and copyright.

#pragma once

#include "weave/builder.hpp"
#include "weave/error.hpp"
#include "weave/log/core.hpp"
#include "weave/no_config.hpp"
#include "weave/runtime_request_sink.hpp"
#include "weave/server.hpp"
#include "weave/server_actor.hpp"
#include "weave/server_config.hpp"
#include "weave/server_message_box_builder.hpp"
#include "weave/service.hpp"

#include <concepts>
#include <string>
#include <string_view>
#include <utility>

namespace weave::detail {

template <class S, class Kind>
struct server_actor_for;

template <class S>
struct server_actor_for<S, sequential> {
  using type = server_actor<S>;
};

template <class S>
struct server_actor_for<S, concurrent> {
  using type = concurrent_server_actor<S>;
};

} // namespace weave::detail

namespace weave {

/// Combines a server with a server message box. The builder can be wired like
/// a `server_message_box_builder` before turning it into an actor.
/// @tparam S The server implementation.
/// @tparam Kind Either `sequential` or `concurrent`. The latter requires a
///              copyable server.
template <server S, class Kind = sequential>
  requires(std::same_as<Kind, sequential>
           || (std::same_as<Kind, concurrent> && concurrent_server<S>))
class server_actor_builder
  : public infallible_builder<server_actor_builder<S, Kind>,
                              typename detail::server_actor_for<S, Kind>::type>,
    public service_provider<typename S::request_type,
                            typename S::response_type>,
    public runtime_request_sink {
public:
  // -- member types -----------------------------------------------------------

  using request_type = typename S::request_type;

  using response_type = typename S::response_type;

  using product_type = typename detail::server_actor_for<S, Kind>::type;

  using box_builder_type
    = server_message_box_builder<request_type, response_type>;

  // -- constructors, destructors, and assignment operators --------------------

  explicit server_actor_builder(S srv, const server_config& cfg = {},
                                Kind = {})
    : box_(std::string{std::string_view{srv.name()}}, cfg.capacity),
      server_(std::move(srv)) {
    box_.with_max_concurrency(cfg.max_concurrency);
  }

  server_actor_builder(server_actor_builder&&) noexcept = default;

  server_actor_builder& operator=(server_actor_builder&&) noexcept = default;

  // -- properties -------------------------------------------------------------

  const box_builder_type& box() const noexcept {
    return box_;
  }

  // -- service_provider -------------------------------------------------------

  dyn_sender<request_type>
  connect_consumer(no_config cfg,
                   dyn_sender<response_type> response_sender) override {
    return box_.connect_consumer(cfg, std::move(response_sender));
  }

  // -- runtime_request_sink ---------------------------------------------------

  dyn_sender<runtime_request> get_signal_sender() const override {
    return box_.get_signal_sender();
  }

  // -- building and running ---------------------------------------------------

  /// Consumes the builder and returns the actor.
  product_type build() && {
    if constexpr (std::same_as<Kind, sequential>)
      return product_type{std::move(server_), std::move(box_).build()};
    else
      return product_type{std::move(server_),
                          std::move(box_).build_concurrent()};
  }

  /// Consumes the builder and runs the actor on the calling thread.
  /// @returns an empty error after a shutdown request, otherwise the reason
  ///          for stopping.
  error run() && {
    auto actor = std::move(*this).build();
    return actor.run();
  }

private:
  box_builder_type box_;
  S server_;
};

} // namespace weave
