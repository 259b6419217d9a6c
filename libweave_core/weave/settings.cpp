// This file is part of Weave, the actor wiring layer. See the file LICENSE in
// the main distribution directory for license terms and copyright.

#include "weave/settings.hpp"

#include <charconv>

namespace weave {

void put(settings& xs, std::string_view key, config_value value) {
  if (auto i = xs.find(key); i != xs.end())
    i->second = std::move(value);
  else
    xs.emplace(std::string{key}, std::move(value));
}

const config_value* get_if(const settings* xs, std::string_view key) {
  if (xs == nullptr)
    return nullptr;
  if (auto i = xs->find(key); i != xs->end())
    return &i->second;
  return nullptr;
}

config_value parse_config_value(std::string_view str) {
  if (str == "true")
    return true;
  if (str == "false")
    return false;
  auto first = str.data();
  auto last = str.data() + str.size();
  int64_t ival = 0;
  if (auto [ptr, ec] = std::from_chars(first, last, ival);
      ec == std::errc{} && ptr == last)
    return ival;
  double dval = 0;
  if (auto [ptr, ec] = std::from_chars(first, last, dval);
      ec == std::errc{} && ptr == last)
    return dval;
  return std::string{str};
}

expected<settings> parse_settings(const std::vector<std::string>& args) {
  settings result;
  for (const auto& arg : args) {
    std::string_view str{arg};
    if (!str.starts_with("--"))
      continue;
    str.remove_prefix(2);
    auto sep = str.find('=');
    if (sep == std::string_view::npos || sep == 0)
      return unexpected{make_error(sec::invalid_argument,
                                   "expected --key=value, got", arg)};
    put(result, str.substr(0, sep), parse_config_value(str.substr(sep + 1)));
  }
  return result;
}

expected<settings> parse_settings(int argc, char** argv) {
  std::vector<std::string> args;
  if (argc > 1)
    args.assign(argv + 1, argv + argc);
  return parse_settings(args);
}

} // namespace weave
