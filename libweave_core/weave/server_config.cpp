// This file is part of Weave, the actor wiring layer. See the file LICENSE in
// the main distribution directory for license terms and copyright.

#include "weave/server_config.hpp"

#include "weave/detail/format.hpp"

namespace weave {

namespace {

error read_size(const settings& cfg, const std::string& key, size_t& out,
                bool allow_zero) {
  if (get_if(&cfg, key) == nullptr)
    return {};
  auto val = get_as<int64_t>(cfg, key);
  if (!val)
    return std::move(val).error();
  if (*val < 0 || (*val == 0 && !allow_zero))
    return make_error(sec::invalid_argument, key, "expected a positive value");
  out = static_cast<size_t>(*val);
  return {};
}

} // namespace

expected<server_config> server_config::from(const settings& cfg,
                                            std::string_view prefix) {
  server_config result;
  auto key = [prefix](std::string_view name) {
    auto str = std::string{prefix};
    if (!str.empty())
      str += '.';
    str += name;
    return str;
  };
  if (auto err = read_size(cfg, key("capacity"), result.capacity, false))
    return unexpected{std::move(err)};
  // A zero concurrency is legal here, message boxes clamp it to 1.
  if (auto err = read_size(cfg, key("max-concurrency"),
                           result.max_concurrency, true))
    return unexpected{std::move(err)};
  return result;
}

std::string to_string(const server_config& x) {
  return detail::format("server_config(capacity = {}, max_concurrency = {})",
                        x.capacity, x.max_concurrency);
}

} // namespace weave
