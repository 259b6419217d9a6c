// This file is part of Weave, the actor wiring layer. See the file LICENSE in
// the main distribution directory for license terms and copyright.

#include "weave/server_config.hpp"

#include "weave/test/scenario.hpp"
#include "weave/test/test.hpp"

#include <cstdint>
#include <string>

using namespace weave;
using namespace std::literals;

namespace {

TEST("server configs have defaults and chainable setters") {
  server_config cfg;
  check_eq(cfg.capacity, 16u);
  check_eq(cfg.max_concurrency, 4u);
  cfg.with_capacity(8).with_max_concurrency(2);
  check_eq(cfg.capacity, 8u);
  check_eq(cfg.max_concurrency, 2u);
  check_eq(to_string(cfg),
           "server_config(capacity = 8, max_concurrency = 2)");
}

SCENARIO("server configs can be read from settings") {
  GIVEN("empty settings") {
    settings xs;
    WHEN("reading a server config") {
      auto cfg = server_config::from(xs, "echo");
      THEN("the config uses the defaults") {
        require(cfg.has_value());
        check_eq(*cfg, server_config{});
      }
    }
  }
  GIVEN("settings with overrides") {
    settings xs;
    put(xs, "echo.capacity", int64_t{64});
    put(xs, "echo.max-concurrency", int64_t{8});
    put(xs, "other.capacity", int64_t{2});
    WHEN("reading a server config") {
      auto cfg = server_config::from(xs, "echo");
      THEN("the config uses the values under the prefix") {
        require(cfg.has_value());
        check_eq(cfg->capacity, 64u);
        check_eq(cfg->max_concurrency, 8u);
      }
    }
  }
  GIVEN("settings with a zero concurrency") {
    settings xs;
    put(xs, "echo.max-concurrency", int64_t{0});
    WHEN("reading a server config") {
      auto cfg = server_config::from(xs, "echo");
      THEN("the config keeps the zero for the box builder to clamp") {
        require(cfg.has_value());
        check_eq(cfg->max_concurrency, 0u);
      }
    }
  }
  GIVEN("settings with invalid values") {
    settings xs;
    WHEN("the capacity is zero") {
      put(xs, "echo.capacity", int64_t{0});
      THEN("reading the config fails with invalid_argument") {
        auto cfg = server_config::from(xs, "echo");
        require(!cfg);
        check_eq(cfg.error(), sec::invalid_argument);
      }
    }
    WHEN("the concurrency is negative") {
      put(xs, "echo.max-concurrency", int64_t{-1});
      THEN("reading the config fails with invalid_argument") {
        auto cfg = server_config::from(xs, "echo");
        require(!cfg);
        check_eq(cfg.error(), sec::invalid_argument);
      }
    }
    WHEN("the capacity has the wrong type") {
      put(xs, "echo.capacity", "large"s);
      THEN("reading the config fails with type_clash") {
        auto cfg = server_config::from(xs, "echo");
        require(!cfg);
        check_eq(cfg.error(), sec::type_clash);
      }
    }
  }
}

} // namespace
