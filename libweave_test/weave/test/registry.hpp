// This file is part of Weave, the actor wiring layer. See the file LICENSE in
// the main distribution directory for license terms and copyright.

#pragma once

#include "weave/detail/test_export.hpp"

#include <cstddef>
#include <memory>
#include <string_view>
#include <vector>

namespace weave::test {

class context;
class runnable;

/// Stores all tests of the executable.
class WEAVE_TEST_EXPORT registry {
public:
  using factory = std::unique_ptr<runnable> (*)(context&);

  struct entry {
    std::string_view description;
    std::string_view file;
    int line;
    factory make;
  };

  /// Returns all registered tests in registration order.
  static const std::vector<entry>& tests();

  /// Registers a new test.
  /// @returns the number of registered tests.
  static ptrdiff_t add(std::string_view description, std::string_view file,
                       int line, factory make);

  /// Registers a test of type `T`.
  template <class T>
  static ptrdiff_t add(std::string_view description, std::string_view file,
                       int line) {
    auto make = [](context& ctx) -> std::unique_ptr<runnable> {
      return std::make_unique<T>(ctx);
    };
    return add(description, file, line, make);
  }
};

} // namespace weave::test
