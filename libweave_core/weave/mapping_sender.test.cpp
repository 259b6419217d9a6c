// This file is part of Weave, the actor wiring layer. See the file LICENSE in
// the main distribution directory for license terms and copyright.

#include "weave/mapping_sender.hpp"

#include "weave/test/test.hpp"

#include "weave/recording_sender.test.hpp"

#include <memory>
#include <string>
#include <vector>

using namespace weave;
using namespace std::literals;

namespace {

using string_list = std::vector<std::string>;

auto split_words = [](const std::string& str) {
  string_list result;
  std::string word;
  for (auto c : str) {
    if (c == ' ') {
      if (!word.empty())
        result.push_back(std::move(word));
      word.clear();
    } else {
      word += c;
    }
  }
  if (!word.empty())
    result.push_back(std::move(word));
  return result;
};

using split_fn = decltype(split_words);

static_assert(mapper<split_fn, std::string, std::string>);

static_assert(!mapper<split_fn, std::string, int>);

TEST("mapping senders forward all results of the mapper in order") {
  auto [hdl, rec] = testing::make_recorder<std::string>();
  auto fn = std::make_shared<const split_fn>(split_words);
  auto uut = make_sender<mapping_sender<std::string, std::string, split_fn>>(
    fn, hdl);
  check(!uut.send("hello world"s));
  check(!uut.send(""s));
  check(!uut.send("  again "s));
  check_eq(rec->items(), string_list{"hello", "world", "again"});
}

TEST("copies of a mapping sender share the mapper") {
  auto calls = std::make_shared<int>(0);
  auto count_calls = [calls](int x) {
    ++*calls;
    return std::vector<int>{x};
  };
  using fn_type = decltype(count_calls);
  auto [hdl, rec] = testing::make_recorder<int>();
  auto uut = make_sender<mapping_sender<int, int, fn_type>>(
    std::make_shared<const fn_type>(count_calls), hdl);
  auto copy = uut;
  check(!uut.send(1));
  check(!copy.send(2));
  check_eq(*calls, 2);
  check_eq(rec->items(), std::vector<int>{1, 2});
}

TEST("mapping senders stop at the first error") {
  auto repeat = [](int x) { return std::vector<int>(3, x); };
  using fn_type = decltype(repeat);
  auto uut = make_sender<mapping_sender<int, int, fn_type>>(
    std::make_shared<const fn_type>(repeat),
    make_sender<testing::closed_sender<int>>());
  check_eq(uut.send(1), sec::channel_closed);
}

} // namespace
