// This file is part of Weave, the actor wiring layer. See the file LICENSE in
// the main distribution directory for license terms and copyright.

#pragma once

#include "weave/error.hpp"
#include "weave/raise_error.hpp"

#include <memory>
#include <utility>

namespace weave {

/// A capability to deliver messages of type `T` to some destination. Message
/// boxes hand out senders to their peers, which then deliver messages without
/// knowing the concrete type of the receiving box.
template <class T>
class sender {
public:
  using value_type = T;

  virtual ~sender() = default;

  /// Delivers `msg` to the destination of this sender. May block the calling
  /// thread until the destination has room for `msg`.
  /// @returns `sec::channel_closed` if the destination no longer exists.
  virtual error send(T msg) = 0;

  /// Creates a new sender for the same destination.
  virtual std::unique_ptr<sender> clone() const = 0;
};

/// An owning, type-erased handle to a `sender`. Copying the handle clones the
/// sender and each copy delivers to the same destination.
template <class T>
class dyn_sender {
public:
  // -- member types -----------------------------------------------------------

  using value_type = T;

  // -- constructors, destructors, and assignment operators --------------------

  dyn_sender() noexcept = default;

  explicit dyn_sender(std::unique_ptr<sender<T>> ptr) noexcept
    : ptr_(std::move(ptr)) {
    // nop
  }

  dyn_sender(dyn_sender&&) noexcept = default;

  dyn_sender& operator=(dyn_sender&&) noexcept = default;

  dyn_sender(const dyn_sender& other)
    : ptr_(other.ptr_ ? other.ptr_->clone() : nullptr) {
    // nop
  }

  dyn_sender& operator=(const dyn_sender& other) {
    if (this != &other)
      ptr_ = other.ptr_ ? other.ptr_->clone() : nullptr;
    return *this;
  }

  // -- properties -------------------------------------------------------------

  /// Checks whether this handle refers to a sender.
  explicit operator bool() const noexcept {
    return ptr_ != nullptr;
  }

  sender<T>* get() const noexcept {
    return ptr_.get();
  }

  // -- messaging --------------------------------------------------------------

  /// @copydoc sender::send
  /// @pre `static_cast<bool>(*this)`
  error send(T msg) {
    if (!ptr_)
      return make_error(sec::logic_error, "send on an invalid dyn_sender");
    return ptr_->send(std::move(msg));
  }

private:
  std::unique_ptr<sender<T>> ptr_;
};

/// Creates a new sender of type `Impl` and wraps it into a `dyn_sender`.
/// @relates dyn_sender
template <class Impl, class... Ts>
dyn_sender<typename Impl::value_type> make_sender(Ts&&... xs) {
  using handle_type = dyn_sender<typename Impl::value_type>;
  return handle_type{std::make_unique<Impl>(std::forward<Ts>(xs)...)};
}

} // namespace weave
