// This file is part of Weave, the actor wiring layer. See the file LICENSE in
// the main distribution directory for license terms and copyright.

#include "weave/settings.hpp"

#include "weave/test/test.hpp"

#include <cstdint>
#include <string>
#include <vector>

using namespace weave;
using namespace std::literals;

namespace {

TEST("put stores values and overrides previous ones") {
  settings xs;
  put(xs, "a.b", int64_t{1});
  put(xs, "a.b", "two"s);
  check_eq(xs.size(), 1u);
  check_eq(get_as<std::string>(xs, "a.b"), "two"s);
}

TEST("get_as converts values to the requested type") {
  settings xs;
  put(xs, "flag", true);
  put(xs, "num", int64_t{42});
  put(xs, "neg", int64_t{-1});
  put(xs, "real", 2.5);
  SECTION("matching types produce a value") {
    check_eq(get_as<bool>(xs, "flag"), true);
    check_eq(get_as<int64_t>(xs, "num"), int64_t{42});
    check_eq(get_as<size_t>(xs, "num"), size_t{42});
    check_eq(get_as<double>(xs, "real"), 2.5);
    check_eq(get_as<double>(xs, "num"), 42.0);
  }
  SECTION("missing keys produce no_such_key") {
    check_eq(get_as<int64_t>(xs, "nope").error(), sec::no_such_key);
  }
  SECTION("values of the wrong type produce type_clash") {
    check_eq(get_as<int64_t>(xs, "flag").error(), sec::type_clash);
    check_eq(get_as<std::string>(xs, "num").error(), sec::type_clash);
  }
  SECTION("values out of range produce invalid_argument") {
    check_eq(get_as<size_t>(xs, "neg").error(), sec::invalid_argument);
    check_eq(get_as<uint8_t>(xs, "num").value_or(0), uint8_t{42});
  }
}

TEST("get_or falls back to the default on errors") {
  settings xs;
  put(xs, "name", "box"s);
  check_eq(get_or(xs, "name", "default"), "box");
  check_eq(get_or(xs, "missing", "default"), "default");
  check_eq(get_or(xs, "name", int64_t{7}), int64_t{7});
}

TEST("parse_config_value detects the type of its input") {
  check_eq(parse_config_value("true"), config_value{true});
  check_eq(parse_config_value("false"), config_value{false});
  check_eq(parse_config_value("123"), config_value{int64_t{123}});
  check_eq(parse_config_value("-4"), config_value{int64_t{-4}});
  check_eq(parse_config_value("0.5"), config_value{0.5});
  check_eq(parse_config_value("debug"), config_value{"debug"s});
  check_eq(parse_config_value("12abc"), config_value{"12abc"s});
}

TEST("parse_settings reads --key=value arguments") {
  SECTION("valid arguments") {
    auto args = std::vector<std::string>{"--server.capacity=32", "ignored",
                                         "--weave.logger.verbosity=debug"};
    auto xs = parse_settings(args);
    require(xs.has_value());
    check_eq(xs->size(), 2u);
    check_eq(get_as<int64_t>(*xs, "server.capacity"), int64_t{32});
    check_eq(get_or(*xs, "weave.logger.verbosity", ""), "debug");
  }
  SECTION("options without a value") {
    auto xs = parse_settings(std::vector<std::string>{"--foo"});
    require(!xs);
    check_eq(xs.error(), sec::invalid_argument);
  }
  SECTION("options without a key") {
    auto xs = parse_settings(std::vector<std::string>{"--=1"});
    require(!xs);
    check_eq(xs.error(), sec::invalid_argument);
  }
}

} // namespace
