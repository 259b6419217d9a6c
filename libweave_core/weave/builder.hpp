// This file is part of Weave, the actor wiring layer. See the file LICENSE in
// the main distribution directory for license terms and copyright.

#pragma once

#include "weave/error.hpp"
#include "weave/expected.hpp"
#include "weave/raise_error.hpp"

#include <string>
#include <utility>

namespace weave {

/// CRTP base for builders that may fail. `Derived` must provide
/// `expected<Product> try_build() &&`.
///
/// Builders are linear: building consumes the builder, leaving it in a
/// moved-from state that must not be wired again.
template <class Derived, class Product>
class builder {
public:
  using product_type = Product;

  /// Builds the product or raises an error if `try_build` fails. Only use this
  /// function where construction cannot fail or where failing is fatal.
  Product build() && {
    auto result = static_cast<Derived&&>(*this).try_build();
    if (!result) {
      auto msg = "failed to build: " + to_string(result.error());
      WEAVE_RAISE_ERROR(msg.c_str());
    }
    return std::move(*result);
  }
};

/// CRTP base for builders that cannot fail. `Derived` must provide
/// `Product build() &&`.
template <class Derived, class Product>
class infallible_builder {
public:
  using product_type = Product;

  /// Builds the product. Never returns an error.
  expected<Product> try_build() && {
    return static_cast<Derived&&>(*this).build();
  }
};

} // namespace weave
