// This file is part of Weave, the actor wiring layer. See the file LICENSE in
// the main distribution directory for license terms and copyright.

#pragma once

#include "weave/async/consumer.hpp"
#include "weave/detail/assert.hpp"
#include "weave/error.hpp"
#include "weave/sender.hpp"

#include <algorithm>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>

namespace weave::async {

/// A bounded FIFO queue for transmitting items from any number of producers to
/// a single consumer. Producers block while the queue is full. The queue
/// closes for the consumer once all producers are gone and for producers
/// once the consumer is gone.
template <class T>
class bounded_queue {
public:
  // -- member types -----------------------------------------------------------

  using value_type = T;

  // -- constructors, destructors, and assignment operators --------------------

  /// @param capacity Maximum number of buffered items. A capacity of 0 is
  ///                 treated as 1.
  explicit bounded_queue(size_t capacity)
    : capacity_(std::max(capacity, size_t{1})) {
    // nop
  }

  bounded_queue(const bounded_queue&) = delete;

  bounded_queue& operator=(const bounded_queue&) = delete;

  // -- properties -------------------------------------------------------------

  size_t capacity() const noexcept {
    return capacity_;
  }

  /// Returns the number of buffered items.
  size_t size() const {
    std::lock_guard guard{mtx_};
    return buf_.size();
  }

  /// Returns whether the consumer has received all items and no producer
  /// remains that could add new ones.
  bool drained() const {
    std::lock_guard guard{mtx_};
    return buf_.empty() && producers_ == 0;
  }

  // -- producer interface -----------------------------------------------------

  /// Appends `item` to the queue, blocking while the queue is full.
  /// @returns `sec::channel_closed` if the consumer is gone.
  error push(T item) {
    std::unique_lock guard{mtx_};
    not_full_.wait(guard, [this] {
      return consumer_closed_ || buf_.size() < capacity_;
    });
    if (consumer_closed_)
      return make_error(sec::channel_closed, "the receiver is gone");
    buf_.emplace_back(std::move(item));
    not_empty_.notify_one();
    if (consumer_ != nullptr)
      consumer_->on_producer_wakeup();
    return {};
  }

  void add_producer() {
    std::lock_guard guard{mtx_};
    ++producers_;
  }

  void remove_producer() {
    std::lock_guard guard{mtx_};
    WEAVE_ASSERT(producers_ > 0);
    if (--producers_ == 0) {
      not_empty_.notify_all();
      if (consumer_ != nullptr)
        consumer_->on_producer_wakeup();
    }
  }

  // -- consumer interface -----------------------------------------------------

  /// Removes the next item from the queue without blocking.
  std::optional<T> try_pop() {
    std::lock_guard guard{mtx_};
    return pop_unsafe();
  }

  /// Removes the next item from the queue, blocking while the queue is empty.
  /// @returns `std::nullopt` once all producers are gone and the queue is
  ///          empty.
  std::optional<T> pop() {
    std::unique_lock guard{mtx_};
    not_empty_.wait(guard, [this] { return !buf_.empty() || producers_ == 0; });
    return pop_unsafe();
  }

  /// Registers a consumer that receives a wakeup for each new item and when
  /// the last producer disconnects. Passing `nullptr` removes the consumer.
  void set_consumer(consumer* ptr) {
    std::lock_guard guard{mtx_};
    consumer_ = ptr;
  }

  /// Closes the queue for producers. Producers blocked in `push` return
  /// immediately and buffered items are destroyed.
  void close_consumer() {
    std::deque<T> dropped;
    {
      std::lock_guard guard{mtx_};
      consumer_closed_ = true;
      consumer_ = nullptr;
      dropped.swap(buf_);
      not_full_.notify_all();
    }
  }

private:
  std::optional<T> pop_unsafe() {
    if (buf_.empty())
      return std::nullopt;
    auto result = std::optional<T>{std::move(buf_.front())};
    buf_.pop_front();
    not_full_.notify_one();
    return result;
  }

  mutable std::mutex mtx_;
  std::condition_variable not_full_;
  std::condition_variable not_empty_;
  std::deque<T> buf_;
  size_t capacity_;
  size_t producers_ = 0;
  bool consumer_closed_ = false;
  consumer* consumer_ = nullptr;
};

/// @relates bounded_queue
template <class T>
using bounded_queue_ptr = std::shared_ptr<bounded_queue<T>>;

/// The producing end of a `bounded_queue`. Each copy counts as one producer.
template <class T>
class queue_sender : public sender<T> {
public:
  queue_sender() = default;

  explicit queue_sender(bounded_queue_ptr<T> queue) : queue_(std::move(queue)) {
    if (queue_)
      queue_->add_producer();
  }

  queue_sender(const queue_sender& other) : queue_(other.queue_) {
    if (queue_)
      queue_->add_producer();
  }

  queue_sender(queue_sender&& other) noexcept = default;

  queue_sender& operator=(const queue_sender& other) {
    queue_sender tmp{other};
    std::swap(queue_, tmp.queue_);
    return *this;
  }

  queue_sender& operator=(queue_sender&& other) noexcept {
    std::swap(queue_, other.queue_);
    return *this;
  }

  ~queue_sender() override {
    if (queue_)
      queue_->remove_producer();
  }

  explicit operator bool() const noexcept {
    return queue_ != nullptr;
  }

  error send(T msg) override {
    if (!queue_)
      return make_error(sec::channel_closed, "invalid queue sender");
    return queue_->push(std::move(msg));
  }

  std::unique_ptr<sender<T>> clone() const override {
    return std::make_unique<queue_sender>(*this);
  }

  /// Creates a type-erased copy of this sender.
  dyn_sender<T> sender_clone() const {
    return dyn_sender<T>{clone()};
  }

private:
  bounded_queue_ptr<T> queue_;
};

/// The consuming end of a `bounded_queue`. Destroying the receiver closes the
/// queue for all producers.
template <class T>
class queue_receiver {
public:
  queue_receiver() = default;

  explicit queue_receiver(bounded_queue_ptr<T> queue)
    : queue_(std::move(queue)) {
    // nop
  }

  queue_receiver(const queue_receiver&) = delete;

  queue_receiver& operator=(const queue_receiver&) = delete;

  queue_receiver(queue_receiver&&) noexcept = default;

  queue_receiver& operator=(queue_receiver&& other) noexcept {
    std::swap(queue_, other.queue_);
    return *this;
  }

  ~queue_receiver() {
    if (queue_)
      queue_->close_consumer();
  }

  explicit operator bool() const noexcept {
    return queue_ != nullptr;
  }

  /// @copydoc bounded_queue::try_pop
  std::optional<T> try_pop() {
    return queue_->try_pop();
  }

  /// @copydoc bounded_queue::pop
  std::optional<T> pop() {
    return queue_->pop();
  }

  /// @copydoc bounded_queue::drained
  bool drained() const {
    return queue_->drained();
  }

  /// @copydoc bounded_queue::set_consumer
  void set_consumer(consumer* ptr) {
    queue_->set_consumer(ptr);
  }

private:
  bounded_queue_ptr<T> queue_;
};

/// Creates a new bounded queue and returns its producing and consuming end.
/// @relates bounded_queue
template <class T>
std::pair<queue_sender<T>, queue_receiver<T>>
make_bounded_queue(size_t capacity) {
  auto queue = std::make_shared<bounded_queue<T>>(capacity);
  return {queue_sender<T>{queue}, queue_receiver<T>{queue}};
}

} // namespace weave::async
