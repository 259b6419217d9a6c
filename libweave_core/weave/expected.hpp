// This file is part of Weave, the actor wiring layer. See the file LICENSE in
// the main distribution directory for license terms and copyright.

#pragma once

#include "weave/detail/assert.hpp"
#include "weave/error.hpp"
#include "weave/raise_error.hpp"

#include <concepts>
#include <memory>
#include <type_traits>
#include <utility>
#include <variant>

namespace weave {

struct unexpect_t {};

inline constexpr unexpect_t unexpect{};

/// Represents an unexpected value to be stored in weave::expected.
template <class E>
class unexpected {
public:
  explicit unexpected(E err) : error_{std::move(err)} {
    // nop
  }

  E& error() & noexcept {
    return error_;
  }

  E&& error() && noexcept {
    return std::move(error_);
  }

  const E& error() const& noexcept {
    return error_;
  }

private:
  E error_;
};

/// @relates unexpected
template <class E>
unexpected(E) -> unexpected<E>;

/// Represents the result of a computation which can either complete
/// successfully with an instance of type `T` or fail with an `error`.
/// @tparam T The type of the result.
template <class T>
class expected {
public:
  // -- member types -----------------------------------------------------------

  using value_type = T;

  using error_type = weave::error;

  using unexpected_type = unexpected<weave::error>;

  // -- constructors, destructors, and assignment operators --------------------

  template <class U = T>
    requires(std::is_constructible_v<T, U>
             && !std::is_same_v<std::remove_cvref_t<U>, expected>
             && !std::is_same_v<std::remove_cvref_t<U>, unexpected_type>)
  expected(U&& x) : storage_(std::in_place_index<0>, std::forward<U>(x)) {
    // nop
  }

  expected(unexpected_type x)
    : storage_(std::in_place_index<1>, std::move(x).error()) {
    WEAVE_ASSERT(static_cast<bool>(std::get<1>(storage_)));
  }

  template <class... Ts>
  explicit expected(std::in_place_t, Ts&&... xs)
    : storage_(std::in_place_index<0>, std::forward<Ts>(xs)...) {
    // nop
  }

  template <class... Ts>
  explicit expected(unexpect_t, Ts&&... xs)
    : storage_(std::in_place_index<1>, std::forward<Ts>(xs)...) {
    // nop
  }

  expected(const expected&) = default;

  expected(expected&&) noexcept(std::is_nothrow_move_constructible_v<T>)
    = default;

  expected& operator=(const expected&) = default;

  expected& operator=(expected&&) noexcept(
    std::is_nothrow_move_assignable_v<T>)
    = default;

  // -- observers --------------------------------------------------------------

  /// Returns `true` if the object holds a value (is engaged).
  bool has_value() const noexcept {
    return storage_.index() == 0;
  }

  /// Returns `true` if the object holds a value (is engaged).
  explicit operator bool() const noexcept {
    return has_value();
  }

  /// Returns the contained value or raises an error if the object holds an
  /// error.
  T& value() & {
    if (!has_value())
      WEAVE_RAISE_ERROR("bad expected access");
    return std::get<0>(storage_);
  }

  /// @copydoc value
  const T& value() const& {
    if (!has_value())
      WEAVE_RAISE_ERROR("bad expected access");
    return std::get<0>(storage_);
  }

  /// @copydoc value
  T&& value() && {
    if (!has_value())
      WEAVE_RAISE_ERROR("bad expected access");
    return std::get<0>(std::move(storage_));
  }

  /// Returns the contained value or `fallback` if the object holds an error.
  template <class U>
  T value_or(U&& fallback) const& {
    if (has_value())
      return std::get<0>(storage_);
    return static_cast<T>(std::forward<U>(fallback));
  }

  /// @pre `has_value()`
  T& operator*() & noexcept {
    WEAVE_ASSERT(has_value());
    return *std::get_if<0>(&storage_);
  }

  /// @pre `has_value()`
  const T& operator*() const& noexcept {
    WEAVE_ASSERT(has_value());
    return *std::get_if<0>(&storage_);
  }

  /// @pre `has_value()`
  T&& operator*() && noexcept {
    WEAVE_ASSERT(has_value());
    return std::move(*std::get_if<0>(&storage_));
  }

  /// @pre `has_value()`
  T* operator->() noexcept {
    WEAVE_ASSERT(has_value());
    return std::get_if<0>(&storage_);
  }

  /// @pre `has_value()`
  const T* operator->() const noexcept {
    WEAVE_ASSERT(has_value());
    return std::get_if<0>(&storage_);
  }

  /// Returns the contained error.
  /// @pre `!has_value()`
  weave::error& error() & noexcept {
    WEAVE_ASSERT(!has_value());
    return *std::get_if<1>(&storage_);
  }

  /// @copydoc error
  const weave::error& error() const& noexcept {
    WEAVE_ASSERT(!has_value());
    return *std::get_if<1>(&storage_);
  }

  /// @copydoc error
  weave::error&& error() && noexcept {
    WEAVE_ASSERT(!has_value());
    return std::move(*std::get_if<1>(&storage_));
  }

private:
  std::variant<T, weave::error> storage_;
};

/// @relates expected
template <class T>
bool operator==(const expected<T>& x, const expected<T>& y) {
  if (x && y)
    return *x == *y;
  if (!x && !y)
    return x.error() == y.error();
  return false;
}

/// Compares the value of `x` to `y`. An `expected` holding an error is never
/// equal to a value.
/// @relates expected
template <class T, class U>
  requires(!std::is_same_v<U, expected<T>>)
bool operator==(const expected<T>& x, const U& y) {
  return x && *x == y;
}

/// @relates expected
template <class T>
std::string to_string(const expected<T>& x) {
  if (x)
    return deep_to_string(*x);
  return "!" + to_string(x.error());
}

} // namespace weave
