// This file is part of Weave, the actor wiring layer. See the file LICENSE in
// the main distribution directory for license terms and copyright.

#pragma once

#include "weave/client_id.hpp"
#include "weave/error.hpp"
#include "weave/log/core.hpp"
#include "weave/sec.hpp"
#include "weave/sender.hpp"

#include <memory>
#include <utility>
#include <vector>

namespace weave {

/// Routes each `(id, msg)` pair to the sender registered for `id`. Never
/// delivers to any other entry. Messages for unknown IDs are dropped with a
/// warning that carries `sec::unknown_client`.
template <class T>
class fan_out_sender : public sender<std::pair<client_id, T>> {
public:
  using super = sender<std::pair<client_id, T>>;

  explicit fan_out_sender(std::vector<dyn_sender<T>> clients)
    : clients_(std::move(clients)) {
    // nop
  }

  size_t size() const noexcept {
    return clients_.size();
  }

  error send(std::pair<client_id, T> msg) override {
    auto& [id, payload] = msg;
    if (id >= clients_.size()) {
      log::core::warning("drop response: {}",
                         make_error(sec::unknown_client, id, clients_.size()));
      return {};
    }
    return clients_[id].send(std::move(payload));
  }

  std::unique_ptr<super> clone() const override {
    return std::make_unique<fan_out_sender>(clients_);
  }

private:
  std::vector<dyn_sender<T>> clients_;
};

} // namespace weave
