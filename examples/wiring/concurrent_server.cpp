// This example runs a slow server that checks numbers for primality. The
// server processes up to `server.max-concurrency` requests at the same time,
// so the total runtime drops with a higher concurrency.
//
// Run for example with `--server.max-concurrency=8 --count=32`.

#include "weave/logger.hpp"
#include "weave/server_actor_builder.hpp"
#include "weave/server_config.hpp"
#include "weave/settings.hpp"
#include "weave/simple_message_box_builder.hpp"

#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <string_view>
#include <thread>
#include <utility>

using namespace weave;
using namespace std::literals;

namespace {

struct prime_server {
  using request_type = int64_t;

  using response_type = bool;

  std::string_view name() const {
    return "prime-server";
  }

  bool handle(int64_t n) {
    // Simulate an expensive computation.
    std::this_thread::sleep_for(50ms);
    if (n < 2)
      return false;
    for (int64_t i = 2; i * i <= n; ++i)
      if (n % i == 0)
        return false;
    return true;
  }
};

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
  auto count = get_or(*cfg, "count", int64_t{16});
  std::cout << "checking " << count << " numbers with up to "
            << srv_cfg->max_concurrency << " requests in flight\n";
  auto srv = server_actor_builder<prime_server, concurrent>{prime_server{},
                                                            *srv_cfg,
                                                            concurrent{}};
  auto client = with_connection(
    simple_message_box_builder<bool, int64_t>{"client"}, srv);
  auto shutdown = srv.get_signal_sender();
  auto server_thread = std::thread{[actor = std::move(srv).build()]() mutable {
    if (auto err = actor.run())
      std::cerr << "server stopped: " << to_string(err) << '\n';
  }};
  auto box = std::move(client).build();
  auto start = std::chrono::steady_clock::now();
  // Keep the request queue busy from a second thread while collecting
  // responses on this one.
  auto sender_thread = std::thread{[out = box.output(), count]() mutable {
    for (int64_t n = 0; n < count; ++n)
      if (auto err = out.send(n)) {
        std::cerr << "client: failed to send: " << to_string(err) << '\n';
        return;
      }
  }};
  int64_t primes = 0;
  for (int64_t i = 0; i < count; ++i) {
    auto res = box.recv();
    if (!res)
      break;
    if (*res)
      ++primes;
  }
  sender_thread.join();
  auto elapsed = std::chrono::steady_clock::now() - start;
  std::cout << "found " << primes << " primes in "
            << std::chrono::duration_cast<std::chrono::milliseconds>(elapsed)
                 .count()
            << "ms\n";
  if (auto err = shutdown.send(runtime_request::shutdown))
    std::cerr << "failed to stop the server: " << to_string(err) << '\n';
  server_thread.join();
  return EXIT_SUCCESS;
}
