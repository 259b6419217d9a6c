// This file is part of Weave, the actor wiring layer. See the file LICENSE in
// the main distribution directory for license terms and copyright.

#pragma once

#include "weave/async/bounded_queue.hpp"
#include "weave/builder.hpp"
#include "weave/client_id.hpp"
#include "weave/defaults.hpp"
#include "weave/expected.hpp"
#include "weave/fan_out_sender.hpp"
#include "weave/keyed_sender.hpp"
#include "weave/log/core.hpp"
#include "weave/logging_receiver.hpp"
#include "weave/logging_sender.hpp"
#include "weave/message.hpp"
#include "weave/no_config.hpp"
#include "weave/raise_error.hpp"
#include "weave/runtime_request_sink.hpp"
#include "weave/server_message_box.hpp"
#include "weave/service.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

namespace weave {

/// Builds a message box that serves any number of clients. All clients share
/// one request queue. Each client receives a unique ID at connection time
/// and the box routes each response only to the client with the matching ID.
template <class Request, class Response>
class server_message_box_builder
  : public infallible_builder<server_message_box_builder<Request, Response>,
                              server_message_box<Request, Response>>,
    public service_provider<Request, Response>,
    public runtime_request_sink {
public:
  static_assert(message<Request> && message<Response>,
                "message boxes require movable and renderable types");

  // -- member types -----------------------------------------------------------

  using product_type = server_message_box<Request, Response>;

  using concurrent_product_type
    = concurrent_server_message_box<Request, Response>;

  using request_type = std::pair<client_id, Request>;

  using response_type = std::pair<client_id, Response>;

  // -- constructors, destructors, and assignment operators --------------------

  explicit server_message_box_builder(
    std::string name, size_t capacity = defaults::server::capacity)
    : name_(std::move(name)) {
    std::tie(input_tx_, input_rx_)
      = async::make_bounded_queue<request_type>(capacity);
    std::tie(signal_tx_, signal_rx_) = async::make_bounded_queue<
      runtime_request>(defaults::message_box::signal_capacity);
  }

  server_message_box_builder(server_message_box_builder&&) noexcept = default;

  server_message_box_builder& operator=(server_message_box_builder&&) noexcept
    = default;

  // -- properties -------------------------------------------------------------

  const std::string& name() const noexcept {
    return name_;
  }

  /// Returns the number of connected clients.
  size_t client_count() const noexcept {
    return clients_.size();
  }

  size_t max_concurrency() const noexcept {
    return max_concurrency_;
  }

  /// Sets the maximum number of in-flight requests for `build_concurrent`.
  /// Values below 1 are treated as 1.
  server_message_box_builder& with_max_concurrency(size_t value) & {
    max_concurrency_ = std::max(value, size_t{1});
    return *this;
  }

  /// @copydoc with_max_concurrency
  server_message_box_builder&& with_max_concurrency(size_t value) && {
    max_concurrency_ = std::max(value, size_t{1});
    return std::move(*this);
  }

  // -- service_provider -------------------------------------------------------

  dyn_sender<Request>
  connect_consumer(no_config, dyn_sender<Response> response_sender) override {
    require_valid();
    if (!response_sender)
      WEAVE_RAISE_ERROR(std::invalid_argument,
                        "cannot connect a client without response sender");
    auto id = client_id{clients_.size()};
    clients_.push_back(std::move(response_sender));
    log::core::debug("{}: connect client {}", name_, id);
    return make_sender<keyed_sender<Request>>(id, input_tx_.sender_clone());
  }

  // -- runtime_request_sink ---------------------------------------------------

  dyn_sender<runtime_request> get_signal_sender() const override {
    require_valid();
    return signal_tx_.sender_clone();
  }

  // -- building ---------------------------------------------------------------

  /// Consumes the builder and returns a box for processing one request at a
  /// time.
  product_type build() && {
    require_valid();
    log::core::debug("build server box {} with {} clients", name_,
                     clients_.size());
    // Dropping our own senders lets the box see its input close once all
    // clients are gone.
    auto input_tx = std::move(input_tx_);
    auto signal_tx = std::move(signal_tx_);
    auto routes = make_sender<fan_out_sender<Response>>(std::move(clients_));
    clients_.clear();
    return product_type{
      logging_receiver<request_type>{name_, std::move(input_rx_),
                                     std::move(signal_rx_)},
      logging_sender<response_type>{name_, std::move(routes)}};
  }

  /// Consumes the builder and returns a box for processing up to
  /// `max_concurrency()` requests at a time.
  concurrent_product_type build_concurrent() && {
    auto n = max_concurrency_;
    return concurrent_product_type{std::move(*this).build(), n};
  }

  /// Like `build_concurrent`, but returns an `expected`.
  expected<concurrent_product_type> try_build_concurrent() && {
    return std::move(*this).build_concurrent();
  }

private:
  void require_valid() const {
    if (!input_tx_)
      WEAVE_RAISE_ERROR(std::logic_error,
                        "cannot wire a server box builder after building");
  }

  std::string name_;
  size_t max_concurrency_ = defaults::server::box_max_concurrency;
  async::queue_sender<request_type> input_tx_;
  async::queue_receiver<request_type> input_rx_;
  async::queue_sender<runtime_request> signal_tx_;
  async::queue_receiver<runtime_request> signal_rx_;
  std::vector<dyn_sender<Response>> clients_;
};

} // namespace weave
