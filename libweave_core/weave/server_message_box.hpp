// This file is part of Weave, the actor wiring layer. See the file LICENSE in
// the main distribution directory for license terms and copyright.

#pragma once

#include "weave/client_id.hpp"
#include "weave/detail/build_config.hpp"
#include "weave/error.hpp"
#include "weave/log/core.hpp"
#include "weave/logging_sender.hpp"
#include "weave/runtime_request.hpp"
#include "weave/sec.hpp"
#include "weave/simple_message_box.hpp"

#include <algorithm>
#include <atomic>
#include <concepts>
#include <cstddef>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <semaphore>
#include <string>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

namespace weave {

/// A message box that receives requests tagged with the ID of the client and
/// sends responses back to the client with the same ID.
template <class Request, class Response>
using server_message_box
  = simple_message_box<std::pair<client_id, Request>,
                       std::pair<client_id, Response>>;

/// Wraps a `server_message_box` to process up to `max_concurrency` requests
/// at the same time. Each request runs on its own worker thread. Responses
/// leave the box in completion order.
template <class Request, class Response>
class concurrent_server_message_box {
public:
  // -- member types -----------------------------------------------------------

  using request_type = std::pair<client_id, Request>;

  using response_type = std::pair<client_id, Response>;

  using box_type = server_message_box<Request, Response>;

  // -- constructors, destructors, and assignment operators --------------------

  concurrent_server_message_box(box_type box, size_t max_concurrency)
    : box_(std::move(box)),
      state_(std::make_unique<state>(std::max(max_concurrency, size_t{1}),
                                     box_.interrupter())) {
    // nop
  }

  concurrent_server_message_box(concurrent_server_message_box&&) noexcept
    = default;

  concurrent_server_message_box&
  operator=(concurrent_server_message_box&&) = delete;

  ~concurrent_server_message_box() {
    if (!state_ || state_->workers.empty())
      return;
    if (auto err = await_pending())
      log::core::warning("{}: request failed: {}", box_.name(), err);
  }

  // -- properties -------------------------------------------------------------

  const std::string& name() const noexcept {
    return box_.name();
  }

  size_t max_concurrency() const noexcept {
    return state_->max_concurrency;
  }

  bool shutdown_requested() const noexcept {
    return box_.shutdown_requested();
  }

  /// Returns the first error reported by a request handler, if any.
  error failure() const {
    std::lock_guard guard{state_->mtx};
    return state_->failure;
  }

  // -- messaging --------------------------------------------------------------

  /// Waits until fewer than `max_concurrency` requests are in flight and then
  /// receives the next request. The caller must pass each received request to
  /// `launch`, which releases the slot once the response has been sent.
  /// @returns `std::nullopt` after a shutdown request, when all clients are
  ///          gone or after a request handler failed.
  std::optional<request_type> recv() {
    state_->slots.acquire();
    auto result = box_.recv();
    if (!result)
      state_->slots.release();
    return result;
  }

  /// Runs `task` on a worker thread and sends its result as response for the
  /// client `id`.
  /// @pre The caller has received a request via `recv`.
  template <class F>
    requires std::invocable<F&>
             && std::convertible_to<std::invoke_result_t<F&>, Response>
  void launch(client_id id, F task) {
    reap();
    auto done = std::make_shared<std::atomic<bool>>(false);
    auto st = state_.get();
    auto fn = [st, id, done, out = box_.output(),
               task = std::move(task)]() mutable {
      error err;
#ifdef WEAVE_ENABLE_EXCEPTIONS
      try {
        err = out.send(response_type{id, static_cast<Response>(task())});
      } catch (const std::exception& ex) {
        err = make_error(sec::runtime_error, ex.what());
      }
#else
      err = out.send(response_type{id, static_cast<Response>(task())});
#endif
      if (err)
        st->set_failure(std::move(err));
      st->slots.release();
      done->store(true);
    };
    state_->workers.push_back(worker{std::thread{std::move(fn)}, done});
  }

  /// Sends a response directly, bypassing the worker threads.
  error send(response_type msg) {
    return box_.send(std::move(msg));
  }

  /// @copydoc logging_receiver::recv_signal
  std::optional<runtime_request> recv_signal() {
    return box_.recv_signal();
  }

  /// Blocks until all launched requests have completed.
  /// @returns the first error reported by a request handler, if any.
  error await_pending() {
    for (auto& w : state_->workers)
      w.thread.join();
    state_->workers.clear();
    return failure();
  }

private:
  struct worker {
    std::thread thread;
    std::shared_ptr<std::atomic<bool>> done;
  };

  struct state {
    state(size_t n, std::function<void()> interrupt_fn)
      : max_concurrency(n),
        slots(static_cast<std::ptrdiff_t>(n)),
        interrupt(std::move(interrupt_fn)) {
      // nop
    }

    /// Stores the first error and wakes up a blocked `recv`.
    void set_failure(error err) {
      {
        std::lock_guard guard{mtx};
        if (failure)
          return;
        failure = std::move(err);
      }
      interrupt();
    }

    size_t max_concurrency;
    std::counting_semaphore<> slots;
    std::function<void()> interrupt;
    mutable std::mutex mtx;
    error failure;
    std::vector<worker> workers;
  };

  /// Joins all workers that have finished.
  void reap() {
    auto& xs = state_->workers;
    auto i = std::partition(xs.begin(), xs.end(),
                            [](const worker& w) { return !w.done->load(); });
    for (auto j = i; j != xs.end(); ++j)
      j->thread.join();
    xs.erase(i, xs.end());
  }

  box_type box_;
  std::unique_ptr<state> state_;
};

} // namespace weave
