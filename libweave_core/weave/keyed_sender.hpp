// This file is part of Weave, the actor wiring layer. See the file LICENSE in
// the main distribution directory for license terms and copyright.

#pragma once

#include "weave/client_id.hpp"
#include "weave/sender.hpp"

#include <memory>
#include <utility>

namespace weave {

/// Tags each message with a fixed client ID before forwarding it to a shared
/// request queue.
template <class T>
class keyed_sender : public sender<T> {
public:
  keyed_sender(client_id id, dyn_sender<std::pair<client_id, T>> decorated)
    : id_(id), decorated_(std::move(decorated)) {
    // nop
  }

  client_id id() const noexcept {
    return id_;
  }

  error send(T msg) override {
    return decorated_.send(std::pair{id_, std::move(msg)});
  }

  std::unique_ptr<sender<T>> clone() const override {
    return std::make_unique<keyed_sender>(id_, decorated_);
  }

private:
  client_id id_;
  dyn_sender<std::pair<client_id, T>> decorated_;
};

} // namespace weave
