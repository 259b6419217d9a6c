// This file is part of Weave, the actor wiring layer. See the file LICENSE in
// the main distribution directory for license terms and copyright.

#pragma once

#include "weave/fwd.hpp"
#include "weave/no_config.hpp"
#include "weave/sender.hpp"

#include <concepts>
#include <utility>

namespace weave {

/// A box under construction that serves requests of type `Request` with
/// responses of type `Response`.
template <class Request, class Response, class Config = no_config>
class service_provider {
public:
  using consumer_type = service_consumer<Request, Response, Config>;

  virtual ~service_provider() = default;

  /// Registers a new consumer that receives its responses via
  /// `response_sender`. May be called once per consumer.
  /// @returns the sender the consumer uses for submitting requests.
  virtual dyn_sender<Request>
  connect_consumer(Config cfg, dyn_sender<Response> response_sender) = 0;

  /// Connects `consumer` to this provider.
  void add_peer(consumer_type& consumer) {
    auto req = connect_consumer(consumer.get_config(),
                                consumer.get_response_sender());
    consumer.set_request_sender(std::move(req));
  }
};

/// A box under construction that sends requests of type `Request` to a
/// provider and receives responses of type `Response`.
template <class Request, class Response, class Config = no_config>
class service_consumer {
public:
  using provider_type = service_provider<Request, Response, Config>;

  virtual ~service_consumer() = default;

  /// Returns the config for the provider.
  virtual Config get_config() const = 0;

  /// Returns the sender the provider uses for delivering responses.
  virtual dyn_sender<Response> get_response_sender() const = 0;

  /// Stores the sender for submitting requests to the provider.
  virtual void set_request_sender(dyn_sender<Request> req) = 0;

  /// Connects this consumer to `provider`. Derived builders hide this member
  /// function with an overload that returns the concrete builder type.
  service_consumer& set_connection(provider_type& provider) {
    provider.add_peer(*this);
    return *this;
  }
};

/// Connects `consumer` to `provider` and returns the consumer.
/// @relates service_consumer
template <class Consumer, class Request, class Response, class Config>
  requires std::derived_from<Consumer,
                             service_consumer<Request, Response, Config>>
Consumer with_connection(Consumer consumer,
                         service_provider<Request, Response, Config>& provider) {
  provider.add_peer(consumer);
  return consumer;
}

} // namespace weave
