// This file is part of Weave, the actor wiring layer. See the file LICENSE in
// the main distribution directory for license terms and copyright.

#include "weave/builder.hpp"

#include "weave/test/test.hpp"

#include <stdexcept>
#include <string>
#include <string_view>

using namespace weave;

namespace {

// Builds a string of bounded length.
class bounded_string_builder
  : public builder<bounded_string_builder, std::string> {
public:
  explicit bounded_string_builder(size_t max_size) : max_size_(max_size) {
    // nop
  }

  bounded_string_builder&& append(std::string_view str) && {
    str_ += str;
    return std::move(*this);
  }

  expected<std::string> try_build() && {
    if (str_.size() > max_size_)
      return unexpected{make_error(sec::invalid_argument, "string too long")};
    return std::move(str_);
  }

private:
  size_t max_size_;
  std::string str_;
};

// Builds a number that cannot fail.
class counter_builder : public infallible_builder<counter_builder, int> {
public:
  counter_builder&& add(int x) && {
    value_ += x;
    return std::move(*this);
  }

  int build() && {
    return value_;
  }

private:
  int value_ = 0;
};

TEST("fallible builders report errors via try_build") {
  SECTION("try_build returns the product on success") {
    auto res = bounded_string_builder{5}.append("abc").try_build();
    check_eq(res, "abc");
  }
  SECTION("try_build returns an error on failure") {
    auto res = bounded_string_builder{2}.append("abc").try_build();
    require(!res);
    check_eq(res.error(), sec::invalid_argument);
  }
}

TEST("build raises an error if try_build fails") {
  SECTION("build returns the product on success") {
    check_eq(bounded_string_builder{5}.append("abc").build(), "abc");
  }
  SECTION("build raises on failure") {
    auto raised = false;
    try {
      static_cast<void>(bounded_string_builder{2}.append("abc").build());
    } catch (const std::runtime_error& ex) {
      raised = true;
      check(std::string_view{ex.what()}.find("string too long")
            != std::string_view::npos);
    }
    check(raised);
  }
}

TEST("infallible builders provide try_build") {
  check_eq(counter_builder{}.add(1).add(2).build(), 3);
  auto res = counter_builder{}.add(4).try_build();
  check_eq(res, 4);
}

} // namespace
