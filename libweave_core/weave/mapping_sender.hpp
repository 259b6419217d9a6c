// This file is part of Weave, the actor wiring layer. See the file LICENSE in
// the main distribution directory for license terms and copyright.

#pragma once

#include "weave/sender.hpp"

#include <concepts>
#include <functional>
#include <memory>
#include <ranges>
#include <type_traits>
#include <utility>

namespace weave {

/// A function object that expands one `In` into a range of `Out`.
template <class F, class In, class Out>
concept mapper
  = std::copy_constructible<F> && std::invocable<const F&, In>
    && std::ranges::input_range<std::invoke_result_t<const F&, In>>
    && std::convertible_to<
      std::ranges::range_reference_t<std::invoke_result_t<const F&, In>>,
      Out>;

/// Accepts messages of type `In` and forwards them as `Out`.
template <class In, class Out>
  requires std::convertible_to<In, Out>
class converting_sender : public sender<In> {
public:
  explicit converting_sender(dyn_sender<Out> decorated)
    : decorated_(std::move(decorated)) {
    // nop
  }

  error send(In msg) override {
    return decorated_.send(static_cast<Out>(std::move(msg)));
  }

  std::unique_ptr<sender<In>> clone() const override {
    return std::make_unique<converting_sender>(decorated_);
  }

private:
  dyn_sender<Out> decorated_;
};

/// Turns a sender for `Out` into a sender for `In`. Returns `out` unchanged if
/// both types are the same.
template <class In, class Out>
  requires std::convertible_to<In, Out>
dyn_sender<In> adapt(dyn_sender<Out> out) {
  if constexpr (std::is_same_v<In, Out>)
    return out;
  else
    return make_sender<converting_sender<In, Out>>(std::move(out));
}

/// Applies a mapper to each incoming message and forwards all elements of the
/// resulting range in order. Stops at the first element that fails to send.
template <class In, class Out, class F>
  requires mapper<F, In, Out>
class mapping_sender : public sender<In> {
public:
  mapping_sender(std::shared_ptr<const F> fn, dyn_sender<Out> decorated)
    : fn_(std::move(fn)), decorated_(std::move(decorated)) {
    // nop
  }

  error send(In msg) override {
    for (auto&& item : std::invoke(*fn_, std::move(msg)))
      if (auto err = decorated_.send(static_cast<Out>(
            std::forward<decltype(item)>(item))))
        return err;
    return {};
  }

  std::unique_ptr<sender<In>> clone() const override {
    return std::make_unique<mapping_sender>(fn_, decorated_);
  }

private:
  std::shared_ptr<const F> fn_;
  dyn_sender<Out> decorated_;
};

} // namespace weave
