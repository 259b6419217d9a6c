// This file is part of Weave, the actor wiring layer. See the file LICENSE in
// the main distribution directory for license terms and copyright.

#pragma once

#include "weave/message.hpp"

#include <concepts>
#include <string_view>

namespace weave {

/// Business logic that turns requests into responses. Servers have a name
/// for log output and process one request per call to `handle`.
template <class S>
concept server = requires(S& srv, typename S::request_type req) {
  typename S::response_type;
  requires message<typename S::request_type>;
  requires message<typename S::response_type>;
  { srv.name() } -> std::convertible_to<std::string_view>;
  {
    srv.handle(std::move(req))
  } -> std::convertible_to<typename S::response_type>;
};

/// A server that may run several requests at once. Each in-flight request
/// operates on its own copy of the server.
template <class S>
concept concurrent_server = server<S> && std::copy_constructible<S>;

/// Selects sequential request processing in `server_actor_builder`.
struct sequential {};

/// Selects concurrent request processing in `server_actor_builder`.
struct concurrent {};

} // namespace weave
