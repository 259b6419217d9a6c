// This file is part of Weave, the actor wiring layer. See the file LICENSE in
// the main distribution directory for license terms and copyright.

#pragma once

#include "weave/log/core.hpp"
#include "weave/sender.hpp"

#include <memory>
#include <string>
#include <utility>

namespace weave {

/// Logs every outgoing message at debug level before forwarding it.
template <class T>
class logging_sender : public sender<T> {
public:
  logging_sender(std::string name, dyn_sender<T> decorated)
    : name_(std::move(name)), decorated_(std::move(decorated)) {
    // nop
  }

  const std::string& name() const noexcept {
    return name_;
  }

  error send(T msg) override {
    log::core::debug("{} -> {}", name_, msg);
    auto err = decorated_.send(std::move(msg));
    if (err)
      log::core::debug("{} failed to send: {}", name_, err);
    return err;
  }

  std::unique_ptr<sender<T>> clone() const override {
    return std::make_unique<logging_sender>(*this);
  }

private:
  std::string name_;
  dyn_sender<T> decorated_;
};

} // namespace weave
