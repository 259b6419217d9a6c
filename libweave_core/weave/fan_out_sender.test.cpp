// This file is part of Weave, the actor wiring layer. See the file LICENSE in
// the main distribution directory for license terms and copyright.

#include "weave/fan_out_sender.hpp"

#include "weave/test/test.hpp"

#include "weave/recording_logger.test.hpp"
#include "weave/recording_sender.test.hpp"

#include <string>
#include <utility>
#include <vector>

using namespace weave;
using namespace std::literals;

namespace {

struct fixture : testing::log_fixture {
  fixture() {
    for (size_t i = 0; i < 3; ++i) {
      auto [hdl, rec] = testing::make_recorder<std::string>();
      clients.push_back(std::move(hdl));
      records.push_back(std::move(rec));
    }
  }

  std::vector<dyn_sender<std::string>> clients;
  std::vector<std::shared_ptr<testing::recording<std::string>>> records;
};

WITH_FIXTURE(fixture) {

TEST("fan-out senders route each message only to its client") {
  auto uut = make_sender<fan_out_sender<std::string>>(clients);
  check(!uut.send(std::pair{client_id{1}, "one"s}));
  check(!uut.send(std::pair{client_id{2}, "two"s}));
  check(!uut.send(std::pair{client_id{1}, "three"s}));
  check_eq(records[0]->size(), 0u);
  check_eq(records[1]->items(), std::vector<std::string>{"one", "three"});
  check_eq(records[2]->items(), std::vector<std::string>{"two"});
}

TEST("fan-out senders drop messages for unknown clients") {
  auto uut = fan_out_sender<std::string>{clients};
  check_eq(uut.size(), 3u);
  check(!uut.send(std::pair{client_id{3}, "nobody"s}));
  for (auto& rec : records)
    check_eq(rec->size(), 0u);
  check_eq(log_recorder->count("WARNING weave.core drop response: "
                               "unknown_client"),
           1u);
}

} // WITH_FIXTURE(fixture)

TEST("fan-out senders forward errors of their clients") {
  auto clients = std::vector<dyn_sender<int>>{};
  clients.push_back(make_sender<testing::closed_sender<int>>());
  auto uut = make_sender<fan_out_sender<int>>(std::move(clients));
  check_eq(uut.send(std::pair{client_id{0}, 1}), sec::channel_closed);
}

} // namespace
