// This file is part of Weave, the actor wiring layer. See the file LICENSE in
// the main distribution directory for license terms and copyright.

#pragma once

#include "weave/detail/build_config.hpp"
#include "weave/error.hpp"
#include "weave/log/core.hpp"
#include "weave/sec.hpp"
#include "weave/server.hpp"
#include "weave/server_message_box.hpp"

#include <exception>
#include <string>
#include <utility>

namespace weave {

namespace detail {

/// Returns the result of the run loop after `box` returned no more input.
template <class Box>
error on_input_done(const Box& box) {
  if (box.shutdown_requested()) {
    log::core::debug("{}: shut down", box.name());
    return {};
  }
  log::core::warning("{}: input closed without shutdown request", box.name());
  return make_error(sec::channel_closed, "input closed unexpectedly",
                    box.name());
}

} // namespace detail

/// Runs a server on a message box, handling one request at a time.
template <server S>
class server_actor {
public:
  using request_type = typename S::request_type;

  using response_type = typename S::response_type;

  using box_type = server_message_box<request_type, response_type>;

  server_actor(S srv, box_type box)
    : server_(std::move(srv)), box_(std::move(box)) {
    // nop
  }

  const S& handler() const noexcept {
    return server_;
  }

  box_type& box() noexcept {
    return box_;
  }

  /// Processes requests until receiving a shutdown request.
  /// @returns an empty error after a shutdown request, otherwise the reason
  ///          for leaving the loop.
  error run() {
    auto guard = log::core::trace("name = {}", box_.name());
    while (auto msg = box_.recv()) {
      auto& [id, req] = *msg;
      if (auto err = handle(id, std::move(req)))
        return err;
    }
    return detail::on_input_done(box_);
  }

private:
  error handle(client_id id, request_type req) {
#ifdef WEAVE_ENABLE_EXCEPTIONS
    try {
      auto res = static_cast<response_type>(server_.handle(std::move(req)));
      return box_.send(std::pair{id, std::move(res)});
    } catch (const std::exception& ex) {
      log::core::error("{}: handler failed: {}", box_.name(), ex.what());
      return make_error(sec::runtime_error, ex.what());
    }
#else
    auto res = static_cast<response_type>(server_.handle(std::move(req)));
    return box_.send(std::pair{id, std::move(res)});
#endif
  }

  S server_;
  box_type box_;
};

/// Runs a server on a message box, handling up to `max_concurrency` requests
/// at a time. Each request runs on a copy of the server.
template <concurrent_server S>
class concurrent_server_actor {
public:
  using request_type = typename S::request_type;

  using response_type = typename S::response_type;

  using box_type = concurrent_server_message_box<request_type, response_type>;

  concurrent_server_actor(S srv, box_type box)
    : server_(std::move(srv)), box_(std::move(box)) {
    // nop
  }

  const S& handler() const noexcept {
    return server_;
  }

  box_type& box() noexcept {
    return box_;
  }

  /// Processes requests until receiving a shutdown request or until a request
  /// fails and then waits for all in-flight requests.
  /// @returns an empty error after a shutdown request, otherwise the reason
  ///          for leaving the loop.
  error run() {
    auto guard = log::core::trace("name = {}, max_concurrency = {}",
                                  box_.name(), box_.max_concurrency());
    while (auto msg = box_.recv()) {
      auto& [id, req] = *msg;
      box_.launch(id, [srv = server_, req = std::move(req)]() mutable {
        return static_cast<response_type>(srv.handle(std::move(req)));
      });
      if (box_.failure())
        break;
    }
    if (auto err = box_.await_pending())
      return err;
    return detail::on_input_done(box_);
  }

private:
  S server_;
  box_type box_;
};

} // namespace weave
