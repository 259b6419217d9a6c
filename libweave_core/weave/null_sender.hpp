// This file is part of Weave, the actor wiring layer. See the file LICENSE in
// the main distribution directory for license terms and copyright.

#pragma once

#include "weave/sender.hpp"

#include <memory>

namespace weave {

/// A sender that discards all messages. Serves as output route of boxes that
/// have not been connected yet, so sending always succeeds.
template <class T>
class null_sender : public sender<T> {
public:
  error send(T) override {
    return {};
  }

  std::unique_ptr<sender<T>> clone() const override {
    return std::make_unique<null_sender>();
  }
};

} // namespace weave
