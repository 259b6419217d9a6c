// This example builds a three-stage pipeline. The first stage reads lines from
// standard input. The second stage receives the words of each line via a
// mapped input and forwards them to the last stage, which counts how often
// each word occurs.
//
// Run with `--pipeline.capacity=N` to change the size of all input queues.

#include "weave/defaults.hpp"
#include "weave/logger.hpp"
#include "weave/message.hpp"
#include "weave/settings.hpp"
#include "weave/simple_message_box_builder.hpp"

#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <map>
#include <sstream>
#include <string>
#include <thread>
#include <utility>
#include <vector>

using namespace weave;

namespace {

using word_list = std::vector<std::string>;

word_list split(const std::string& line) {
  word_list result;
  std::istringstream in{line};
  for (std::string word; in >> word;)
    result.push_back(std::move(word));
  return result;
}

} // namespace

int main(int argc, char** argv) {
  auto cfg = parse_settings(argc, argv);
  if (!cfg) {
    std::cerr << "invalid arguments: " << to_string(cfg.error()) << '\n';
    return EXIT_FAILURE;
  }
  logger::set_current_logger(logger::make_console_logger(*cfg, std::clog));
  auto capacity = get_or(*cfg, "pipeline.capacity",
                         static_cast<int64_t>(defaults::message_box::capacity));
  if (capacity < 1) {
    std::cerr << "pipeline.capacity must be positive\n";
    return EXIT_FAILURE;
  }
  auto cap = static_cast<size_t>(capacity);
  // The reader has no input of its own, so it only produces lines.
  auto reader = simple_message_box_builder<no_message, std::string>{"reader",
                                                                     cap};
  auto splitter = simple_message_box_builder<std::string, std::string>{
    "splitter", cap};
  auto counter = simple_message_box_builder<std::string, no_message>{"counter",
                                                                     cap};
  splitter.add_mapped_input(reader, split);
  counter.add_input(splitter);
  auto splitter_thread = std::thread{
    [box = std::move(splitter).build()]() mutable {
      while (auto word = box.recv()) {
        if (auto err = box.send(std::move(*word))) {
          std::cerr << "splitter: " << to_string(err) << '\n';
          return;
        }
      }
    }};
  std::map<std::string, size_t> counts;
  auto counter_thread = std::thread{
    [&counts, box = std::move(counter).build()]() mutable {
      while (auto word = box.recv())
        ++counts[*word];
    }};
  // Destroying the reader closes the input of the splitter, which in turn
  // closes the input of the counter.
  {
    auto reader_box = std::move(reader).build();
    for (std::string line; std::getline(std::cin, line);) {
      if (auto err = reader_box.send(std::move(line))) {
        std::cerr << "reader: " << to_string(err) << '\n';
        break;
      }
    }
  }
  splitter_thread.join();
  counter_thread.join();
  for (const auto& [word, n] : counts)
    std::cout << word << ": " << n << '\n';
  return EXIT_SUCCESS;
}
