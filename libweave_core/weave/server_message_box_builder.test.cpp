// This file is part of Weave, the actor wiring layer. See the file LICENSE in
// the main distribution directory for license terms and copyright.

#include "weave/server_message_box_builder.hpp"

#include "weave/test/scenario.hpp"
#include "weave/test/test.hpp"

#include "weave/recording_logger.test.hpp"
#include "weave/recording_sender.test.hpp"

#include <atomic>
#include <chrono>
#include <future>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

using namespace weave;
using namespace std::literals;

namespace {

using uut_type = server_message_box_builder<std::string, std::string>;

using response_list = std::vector<std::string>;

TEST("clients receive consecutive IDs") {
  auto uut = uut_type{"server"};
  check_eq(uut.client_count(), 0u);
  std::vector<dyn_sender<std::string>> inputs;
  for (size_t i = 0; i < 3; ++i) {
    auto [out, rec] = testing::make_recorder<std::string>();
    inputs.push_back(uut.connect_consumer(no_config{}, out));
  }
  check_eq(uut.client_count(), 3u);
  auto box = std::move(uut).build();
  for (size_t i = 0; i < inputs.size(); ++i)
    check(!inputs[i].send("ping"s));
  for (size_t i = 0; i < inputs.size(); ++i) {
    auto msg = box.recv_for(1s);
    require(msg.has_value());
    check_eq(msg->first, client_id{i});
    check_eq(msg->second, "ping");
  }
}

TEST("the maximum concurrency is at least 1") {
  auto uut = uut_type{"server"};
  check_eq(uut.max_concurrency(), 1u);
  uut.with_max_concurrency(0);
  check_eq(uut.max_concurrency(), 1u);
  uut.with_max_concurrency(8);
  check_eq(uut.max_concurrency(), 8u);
  auto box = uut_type{"server"}.with_max_concurrency(0).build_concurrent();
  check_eq(box.max_concurrency(), 1u);
}

TEST("connecting a client without response sender fails") {
  auto uut = uut_type{"server"};
  auto raised = false;
  try {
    static_cast<void>(uut.connect_consumer(no_config{}, {}));
  } catch (const std::invalid_argument&) {
    raised = true;
  }
  check(raised);
  check_eq(uut.client_count(), 0u);
}

SCENARIO("servers route responses to the requesting client only") {
  GIVEN("a server box with two clients") {
    auto [out0, rec0] = testing::make_recorder<std::string>();
    auto [out1, rec1] = testing::make_recorder<std::string>();
    auto uut = uut_type{"server"};
    auto in0 = uut.connect_consumer(no_config{}, out0);
    auto in1 = uut.connect_consumer(no_config{}, out1);
    auto box = std::move(uut).build();
    WHEN("client 0 sends a request") {
      check(!in0.send("hello"s));
      THEN("only client 0 receives the response") {
        auto msg = box.recv_for(1s);
        require(msg.has_value());
        check_eq(msg->first, 0u);
        check(!box.send(std::pair{msg->first, msg->second + " world"}));
        check_eq(rec0->items(), response_list{"hello world"});
        check_eq(rec1->size(), 0u);
      }
    }
    WHEN("the server responds to an unknown client") {
      THEN("the box drops the response") {
        check(!box.send(std::pair{client_id{42}, "lost"s}));
        check_eq(rec0->size(), 0u);
        check_eq(rec1->size(), 0u);
      }
    }
    WHEN("a client is gone") {
      THEN("sending to it reports the error") {
        auto uut2 = uut_type{"server2"};
        static_cast<void>(uut2.connect_consumer(
          no_config{}, make_sender<testing::closed_sender<std::string>>()));
        auto box2 = std::move(uut2).build();
        check_eq(box2.send(std::pair{client_id{0}, "x"s}),
                 sec::channel_closed);
      }
    }
  }
}

TEST("server boxes see their input close after all clients are gone") {
  auto uut = uut_type{"server"};
  auto [out, rec] = testing::make_recorder<std::string>();
  auto in = std::optional{uut.connect_consumer(no_config{}, out)};
  auto box = std::move(uut).build();
  in.reset();
  check_eq(box.recv(), std::nullopt);
  check(!box.shutdown_requested());
}

SCENARIO("concurrent server boxes limit the number of in-flight requests") {
  GIVEN("a concurrent box with two slots and three clients") {
    auto uut = uut_type{"server"};
    uut.with_max_concurrency(2);
    std::vector<dyn_sender<std::string>> inputs;
    auto [out, rec] = testing::make_recorder<std::string>();
    for (size_t i = 0; i < 3; ++i)
      inputs.push_back(uut.connect_consumer(no_config{}, out));
    auto box = std::move(uut).build_concurrent();
    check_eq(box.max_concurrency(), 2u);
    for (auto& in : inputs)
      check(!in.send("req"s));
    WHEN("two requests block in their handlers") {
      std::promise<void> gate;
      auto gate_future = gate.get_future().share();
      auto blocking_task = [gate_future] {
        gate_future.wait();
        return "done"s;
      };
      for (size_t i = 0; i < 2; ++i) {
        auto msg = box.recv();
        require(msg.has_value());
        box.launch(msg->first, blocking_task);
      }
      THEN("the third request waits until a handler completes") {
        std::atomic<bool> received = false;
        std::optional<std::pair<client_id, std::string>> third;
        std::thread receiver{[&] {
          third = box.recv();
          received = true;
        }};
        std::this_thread::sleep_for(50ms);
        check(!received.load());
        check_eq(rec->size(), 0u);
        gate.set_value();
        receiver.join();
        check(received.load());
        require(third.has_value());
        box.launch(third->first, [] { return "fast"s; });
        check(!box.await_pending());
        check_eq(rec->size(), 3u);
      }
    }
  }
}

TEST("concurrent server boxes report failing handlers") {
  auto uut = uut_type{"server"};
  auto [out, rec] = testing::make_recorder<std::string>();
  auto in = uut.connect_consumer(no_config{}, out);
  auto box = std::move(uut).with_max_concurrency(2).build_concurrent();
  check(!in.send("req"s));
  auto msg = box.recv();
  require(msg.has_value());
  box.launch(msg->first, []() -> std::string {
    throw std::runtime_error("boom");
  });
  // The client stays connected, so only the failure may end this call.
  check_eq(box.recv(), std::nullopt);
  check(!box.shutdown_requested());
  check_eq(box.await_pending(), sec::runtime_error);
  check_eq(box.failure(), sec::runtime_error);
  check_eq(rec->size(), 0u);
}

WITH_FIXTURE(testing::log_fixture) {

TEST("concurrent server boxes report a failure only once") {
  {
    auto uut = uut_type{"server"};
    auto [out, rec] = testing::make_recorder<std::string>();
    auto in = uut.connect_consumer(no_config{}, out);
    auto box = std::move(uut).build_concurrent();
    check(!in.send("req"s));
    auto msg = box.recv();
    require(msg.has_value());
    box.launch(msg->first, []() -> std::string {
      throw std::runtime_error("boom");
    });
    check_eq(box.await_pending(), sec::runtime_error);
  }
  check_eq(log_recorder->count("request failed"), 0u);
}

TEST("concurrent server boxes wait for pending requests on destruction") {
  {
    auto uut = uut_type{"server"};
    auto [out, rec] = testing::make_recorder<std::string>();
    auto in = uut.connect_consumer(no_config{}, out);
    auto box = std::move(uut).build_concurrent();
    check(!in.send("req"s));
    auto msg = box.recv();
    require(msg.has_value());
    box.launch(msg->first, []() -> std::string {
      std::this_thread::sleep_for(10ms);
      throw std::runtime_error("boom");
    });
  }
  check_eq(log_recorder->count("request failed"), 1u);
}

} // WITH_FIXTURE(testing::log_fixture)

} // namespace
