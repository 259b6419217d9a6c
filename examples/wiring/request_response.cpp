// This example connects two clients to a server actor. Each client sends a
// few requests and prints the responses it receives.
//
// Run with `--weave.logger.verbosity=debug` to see the message flow and with
// `--server.capacity=N` to change the size of the request queue.

#include "weave/logger.hpp"
#include "weave/server_actor_builder.hpp"
#include "weave/server_config.hpp"
#include "weave/settings.hpp"
#include "weave/simple_message_box_builder.hpp"

#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

using namespace weave;

namespace {

// Computes the length of a string.
struct length_server {
  using request_type = std::string;

  using response_type = int64_t;

  std::string_view name() const {
    return "length-server";
  }

  int64_t handle(const std::string& str) {
    return static_cast<int64_t>(str.size());
  }
};

// Clients receive lengths and send strings.
using client_builder = simple_message_box_builder<int64_t, std::string>;

void run_client(simple_message_box<int64_t, std::string> box,
                std::vector<std::string> words) {
  for (auto& word : words) {
    if (auto err = box.send(word)) {
      std::cerr << box.name() << ": failed to send: " << to_string(err)
                << '\n';
      return;
    }
    if (auto len = box.recv())
      std::cout << box.name() << ": length of '" << word << "' is " << *len
                << '\n';
    else
      return;
  }
}

} // namespace

int main(int argc, char** argv) {
  auto cfg = parse_settings(argc, argv);
  if (!cfg) {
    std::cerr << "invalid arguments: " << to_string(cfg.error()) << '\n';
    return EXIT_FAILURE;
  }
  logger::set_current_logger(logger::make_console_logger(*cfg, std::clog));
  auto srv_cfg = server_config::from(*cfg, "server");
  if (!srv_cfg) {
    std::cerr << "invalid server config: " << to_string(srv_cfg.error())
              << '\n';
    return EXIT_FAILURE;
  }
  // Wire everything up.
  auto srv = server_actor_builder<length_server>{length_server{}, *srv_cfg};
  auto alice = with_connection(client_builder{"alice"}, srv);
  auto bob = with_connection(client_builder{"bob"}, srv);
  auto shutdown = srv.get_signal_sender();
  // Run the server and the clients.
  auto server_thread = std::thread{[actor = std::move(srv).build()]() mutable {
    if (auto err = actor.run())
      std::cerr << "server stopped: " << to_string(err) << '\n';
  }};
  auto alice_thread = std::thread{run_client, std::move(alice).build(),
                                  std::vector<std::string>{"hello", "world"}};
  auto bob_thread = std::thread{run_client, std::move(bob).build(),
                                std::vector<std::string>{"actor", "wiring",
                                                         "layer"}};
  alice_thread.join();
  bob_thread.join();
  if (auto err = shutdown.send(runtime_request::shutdown))
    std::cerr << "failed to stop the server: " << to_string(err) << '\n';
  server_thread.join();
  return EXIT_SUCCESS;
}
