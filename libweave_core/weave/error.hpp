// This file is part of Weave, the actor wiring layer. See the file LICENSE in
// the main distribution directory for license terms and copyright.

#pragma once

#include "weave/detail/core_export.hpp"
#include "weave/detail/format.hpp"
#include "weave/sec.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace weave {

/// Stores a system error code plus optional, human-readable context
/// information. A default-constructed error represents "no error" and
/// evaluates to `false`. Functions that can only succeed or fail return an
/// `error`, functions that produce a value on success return an `expected`.
class WEAVE_CORE_EXPORT error {
public:
  // -- constructors, destructors, and assignment operators --------------------

  error() noexcept = default;

  error(error&&) noexcept = default;

  error& operator=(error&&) noexcept = default;

  error(const error&);

  error& operator=(const error&);

  error(sec code);

  error(sec code, std::vector<std::string> context);

  // -- properties -------------------------------------------------------------

  /// Returns the error code, whereas `sec::none` means "no error".
  sec code() const noexcept {
    return data_ ? data_->code : sec::none;
  }

  /// Returns additional context information.
  /// @pre `*this != none`
  const std::vector<std::string>& context() const noexcept;

  /// Returns a human-readable error description if the context consists of
  /// exactly one string, otherwise returns an empty string.
  std::string_view what() const noexcept;

  // -- observers --------------------------------------------------------------

  explicit operator bool() const noexcept {
    return data_ != nullptr;
  }

  bool operator!() const noexcept {
    return data_ == nullptr;
  }

  friend bool operator==(const error& lhs, const error& rhs) noexcept {
    return lhs.code() == rhs.code();
  }

  friend bool operator==(const error& lhs, sec rhs) noexcept {
    return lhs.code() == rhs;
  }

private:
  struct data {
    sec code;
    std::vector<std::string> context;
  };

  std::unique_ptr<data> data_;
};

/// @relates error
WEAVE_CORE_EXPORT std::string to_string(const error& x);

/// Creates an error from `code` and renders all further arguments into the
/// context of the error.
/// @relates error
template <class... Ts>
error make_error(sec code, const Ts&... xs) {
  if constexpr (sizeof...(Ts) == 0)
    return error{code};
  else
    return error{code, std::vector<std::string>{detail::format_arg(xs)...}};
}

} // namespace weave
