// This file is part of Weave, the actor wiring layer. See the file LICENSE in
// the main distribution directory for license terms and copyright.

#include "weave/detail/format.hpp"

#include "weave/test/test.hpp"

#include <string>
#include <vector>

using namespace weave;
using namespace std::literals;

namespace {

TEST("format replaces placeholders in order") {
  check_eq(detail::format("{} + {} = {}", 1, 2, 3), "1 + 2 = 3");
  check_eq(detail::format("no placeholders"), "no placeholders");
}

TEST("format renders strings and characters without quotes") {
  check_eq(detail::format("{} -> {}", "box"s, 'x'), "box -> x");
  check_eq(detail::format("[{}]", std::vector<std::string>{"a"}),
           R"_([["a"]])_");
}

TEST("format supports escaped braces") {
  check_eq(detail::format("{{}} {}", 1), "{} 1");
  check_eq(detail::format("{{{}}}", 1), "{1}");
}

TEST("format leaves surplus placeholders empty") {
  check_eq(detail::format("{} and {}", 1), "1 and ");
  check_eq(detail::vformat("{}", {}), "");
}

} // namespace
