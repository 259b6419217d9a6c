// This file is part of Weave, the actor wiring layer. See the file LICENSE in
// the main distribution directory for license terms and copyright.

#pragma once

#include "weave/async/bounded_queue.hpp"
#include "weave/builder.hpp"
#include "weave/defaults.hpp"
#include "weave/log/core.hpp"
#include "weave/message.hpp"
#include "weave/message_sink.hpp"
#include "weave/message_source.hpp"
#include "weave/no_config.hpp"
#include "weave/null_sender.hpp"
#include "weave/raise_error.hpp"
#include "weave/runtime_request_sink.hpp"
#include "weave/service.hpp"
#include "weave/simple_message_box.hpp"

#include <stdexcept>
#include <string>
#include <tuple>
#include <utility>

namespace weave {

/// Builds a `simple_message_box` that receives `In` from any number of
/// producers and sends `Out` to at most one peer.
///
/// The box has a single output route. Each call to `register_peer`,
/// `connect_consumer` or `set_request_sender` replaces the previous route. A
/// box without route discards all outgoing messages, which allows wiring a
/// graph incrementally.
template <class In, class Out>
class simple_message_box_builder
  : public infallible_builder<simple_message_box_builder<In, Out>,
                              simple_message_box<In, Out>>,
    public message_sink<In>,
    public message_source<Out>,
    public service_provider<In, Out>,
    public service_consumer<Out, In>,
    public runtime_request_sink {
public:
  static_assert(message<In> && message<Out>,
                "message boxes require movable and renderable types");

  // -- member types -----------------------------------------------------------

  using product_type = simple_message_box<In, Out>;

  // -- constructors, destructors, and assignment operators --------------------

  explicit simple_message_box_builder(
    std::string name, size_t capacity = defaults::message_box::capacity)
    : name_(std::move(name)), output_(make_sender<null_sender<Out>>()) {
    std::tie(input_tx_, input_rx_) = async::make_bounded_queue<In>(capacity);
    std::tie(signal_tx_, signal_rx_) = async::make_bounded_queue<
      runtime_request>(defaults::message_box::signal_capacity);
  }

  simple_message_box_builder(simple_message_box_builder&&) noexcept = default;

  simple_message_box_builder& operator=(simple_message_box_builder&&) noexcept
    = default;

  // -- properties -------------------------------------------------------------

  const std::string& name() const noexcept {
    return name_;
  }

  // -- message_sink -----------------------------------------------------------

  no_config get_config() const override {
    return {};
  }

  dyn_sender<In> get_sender() const override {
    require_valid();
    return input_tx_.sender_clone();
  }

  // -- message_source ---------------------------------------------------------

  void register_peer(no_config, dyn_sender<Out> out) override {
    set_output(std::move(out));
  }

  // -- service_provider -------------------------------------------------------

  dyn_sender<In> connect_consumer(no_config,
                                  dyn_sender<Out> response_sender) override {
    set_output(std::move(response_sender));
    return input_tx_.sender_clone();
  }

  // -- service_consumer -------------------------------------------------------

  dyn_sender<In> get_response_sender() const override {
    return get_sender();
  }

  void set_request_sender(dyn_sender<Out> req) override {
    set_output(std::move(req));
  }

  /// Connects this box to `provider`.
  /// @returns this builder for chaining further calls.
  simple_message_box_builder&
  set_connection(service_provider<Out, In>& provider) {
    service_consumer<Out, In>::set_connection(provider);
    return *this;
  }

  // -- runtime_request_sink ---------------------------------------------------

  dyn_sender<runtime_request> get_signal_sender() const override {
    require_valid();
    return signal_tx_.sender_clone();
  }

  // -- building ---------------------------------------------------------------

  /// Consumes the builder and returns the box.
  product_type build() && {
    require_valid();
    log::core::debug("build message box {}", name_);
    // Dropping our own senders lets the box see its input close once all
    // peers are gone.
    auto input_tx = std::move(input_tx_);
    auto signal_tx = std::move(signal_tx_);
    return product_type{
      logging_receiver<In>{name_, std::move(input_rx_), std::move(signal_rx_)},
      logging_sender<Out>{name_, std::move(output_)}};
  }

private:
  void require_valid() const {
    if (!input_tx_)
      WEAVE_RAISE_ERROR(std::logic_error,
                        "cannot wire a message box builder after building");
  }

  void set_output(dyn_sender<Out> out) {
    require_valid();
    if (!out)
      WEAVE_RAISE_ERROR(std::invalid_argument,
                        "cannot use an invalid sender as output route");
    log::core::debug("{}: replace output route", name_);
    output_ = std::move(out);
  }

  std::string name_;
  async::queue_sender<In> input_tx_;
  async::queue_receiver<In> input_rx_;
  async::queue_sender<runtime_request> signal_tx_;
  async::queue_receiver<runtime_request> signal_rx_;
  dyn_sender<Out> output_;
};

} // namespace weave
