// This file is part of Weave, the actor wiring layer. See the file LICENSE in
// the main distribution directory for license terms and copyright.

#include "weave/detail/format.hpp"

namespace weave::detail {

std::string vformat(std::string_view fstr,
                    const std::vector<std::string>& args) {
  std::string result;
  result.reserve(fstr.size());
  size_t next_arg = 0;
  for (size_t pos = 0; pos < fstr.size(); ++pos) {
    auto c = fstr[pos];
    auto next = pos + 1 < fstr.size() ? fstr[pos + 1] : '\0';
    if (c == '{' && next == '{') {
      result += '{';
      ++pos;
    } else if (c == '}' && next == '}') {
      result += '}';
      ++pos;
    } else if (c == '{' && next == '}') {
      if (next_arg < args.size())
        result += args[next_arg];
      ++next_arg;
      ++pos;
    } else {
      result += c;
    }
  }
  return result;
}

} // namespace weave::detail
