// This file is part of Weave, the actor wiring layer. See the file LICENSE in
// the main distribution directory for license terms and copyright.

#pragma once

#include "weave/async/bounded_queue.hpp"
#include "weave/async/consumer.hpp"
#include "weave/async/read_result.hpp"
#include "weave/log/core.hpp"
#include "weave/runtime_request.hpp"

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <variant>

namespace weave {

/// The receiving end of a message box. Observes a data queue and a queue for
/// control signals at the same time and logs everything it receives. Pending
/// control signals always take precedence over data.
template <class T>
class logging_receiver {
public:
  // -- member types -----------------------------------------------------------

  using value_type = T;

  using clock_type = std::chrono::steady_clock;

  // -- constructors, destructors, and assignment operators --------------------

  logging_receiver(std::string name, async::queue_receiver<T> input,
                   async::queue_receiver<runtime_request> signals)
    : state_(std::make_unique<state>(std::move(name), std::move(input),
                                     std::move(signals))) {
    state_->input.set_consumer(state_.get());
    state_->signals.set_consumer(state_.get());
  }

  logging_receiver(logging_receiver&&) noexcept = default;

  logging_receiver& operator=(logging_receiver&&) noexcept = default;

  // -- properties -------------------------------------------------------------

  const std::string& name() const noexcept {
    return state_->name;
  }

  /// Returns whether this receiver has seen a shutdown request.
  bool shutdown_requested() const noexcept {
    return state_->shutdown;
  }

  // -- receiving --------------------------------------------------------------

  /// Blocks until the next message arrives.
  /// @returns `std::nullopt` after a shutdown request or when all senders are
  ///          gone and the input queue is empty.
  std::optional<T> recv() {
    std::optional<T> result;
    pull(result, nullptr);
    return result;
  }

  /// Like `recv`, but gives up after `timeout`.
  template <class Rep, class Period>
  std::optional<T> recv_for(std::chrono::duration<Rep, Period> timeout) {
    std::optional<T> result;
    auto deadline = clock_type::now() + timeout;
    pull(result, &deadline);
    return result;
  }

  /// Returns the next control signal or message without blocking.
  std::optional<std::variant<T, runtime_request>> try_recv() {
    if (auto sig = state_->signals.try_pop()) {
      on_signal(*sig);
      return std::variant<T, runtime_request>{std::in_place_index<1>, *sig};
    }
    if (auto item = state_->input.try_pop()) {
      log::core::debug("{} <- {}", state_->name, *item);
      return std::variant<T, runtime_request>{std::in_place_index<0>,
                                              std::move(*item)};
    }
    return std::nullopt;
  }

  /// Returns the next pending control signal without blocking.
  std::optional<runtime_request> recv_signal() {
    auto sig = state_->signals.try_pop();
    if (sig)
      on_signal(*sig);
    return sig;
  }

  // -- interruption -----------------------------------------------------------

  /// Returns a function object that wakes up a blocked `recv` or `recv_for`
  /// from any thread and makes all further calls return `std::nullopt`.
  /// @warning the function object must not outlive this receiver.
  auto interrupter() const noexcept {
    return [st = state_.get()] { st->interrupt(); };
  }

  /// Returns whether this receiver has been interrupted.
  bool interrupted() const {
    std::lock_guard guard{state_->mtx};
    return state_->interrupted;
  }

private:
  struct state : async::consumer {
    state(std::string name, async::queue_receiver<T> input,
          async::queue_receiver<runtime_request> signals)
      : name(std::move(name)),
        input(std::move(input)),
        signals(std::move(signals)) {
      // nop
    }

    ~state() override {
      input.set_consumer(nullptr);
      signals.set_consumer(nullptr);
    }

    void on_producer_wakeup() override {
      std::lock_guard guard{mtx};
      ++wakeups;
      cv.notify_all();
    }

    void interrupt() {
      std::lock_guard guard{mtx};
      interrupted = true;
      ++wakeups;
      cv.notify_all();
    }

    mutable std::mutex mtx;
    std::condition_variable cv;
    size_t wakeups = 0;
    bool interrupted = false;
    bool shutdown = false;
    std::string name;
    async::queue_receiver<T> input;
    async::queue_receiver<runtime_request> signals;
  };

  void on_signal(runtime_request sig) {
    log::core::debug("{} <- signal {}", state_->name, sig);
    if (sig == runtime_request::shutdown)
      state_->shutdown = true;
  }

  async::read_result pull(std::optional<T>& out,
                          const clock_type::time_point* deadline) {
    auto& st = *state_;
    for (;;) {
      if (st.shutdown)
        return async::read_result::stop;
      {
        std::lock_guard guard{st.mtx};
        if (st.interrupted) {
          log::core::debug("{}: interrupted", st.name);
          return async::read_result::abort;
        }
        st.wakeups = 0;
      }
      if (auto sig = st.signals.try_pop()) {
        on_signal(*sig);
        continue;
      }
      if (auto item = st.input.try_pop()) {
        log::core::debug("{} <- {}", st.name, *item);
        out = std::move(item);
        return async::read_result::ok;
      }
      if (st.input.drained()) {
        log::core::debug("{}: input closed", st.name);
        return async::read_result::stop;
      }
      std::unique_lock guard{st.mtx};
      auto has_wakeup = [&st] { return st.wakeups > 0; };
      if (deadline == nullptr) {
        st.cv.wait(guard, has_wakeup);
      } else if (!st.cv.wait_until(guard, *deadline, has_wakeup)) {
        return async::read_result::timeout;
      }
    }
  }

  std::unique_ptr<state> state_;
};

} // namespace weave
