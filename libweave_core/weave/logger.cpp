// This file is part of Weave, the actor wiring layer. See the file LICENSE in
// the main distribution directory for license terms and copyright.

#include "weave/logger.hpp"

#include "weave/detail/build_config.hpp"

#include <atomic>
#include <iostream>
#include <mutex>
#include <sstream>

namespace weave {

namespace {

/// Prints log events line by line to an output stream.
class console_logger : public logger {
public:
  console_logger(unsigned verbosity, std::ostream& out)
    : verbosity_(verbosity), out_(&out) {
    // nop
  }

  bool accepts(unsigned level, std::string_view) override {
    return level <= verbosity_ && level > log::level::quiet;
  }

protected:
  void do_log(log::event&& event) override {
    std::ostringstream line;
    line << log::level_name(event.level) << ' ' << event.component << " ["
         << event.thread << "] " << file_name(event.location.file_name())
         << ':' << event.location.line() << ' ' << event.message << '\n';
    std::lock_guard guard{mtx_};
    *out_ << line.str() << std::flush;
  }

private:
  static std::string_view file_name(std::string_view path) {
    if (auto pos = path.find_last_of('/'); pos != std::string_view::npos)
      return path.substr(pos + 1);
    return path;
  }

  unsigned verbosity_;
  std::mutex mtx_;
  std::ostream* out_;
};

unsigned default_verbosity() {
  return log::level_from_string(WEAVE_LOG_LEVEL_DEFAULT)
    .value_or(log::level::warning);
}

std::shared_ptr<logger> make_default_logger() {
  return std::make_shared<console_logger>(default_verbosity(), std::clog);
}

std::atomic<std::shared_ptr<logger>>& current_instance() {
  static std::atomic<std::shared_ptr<logger>> instance{make_default_logger()};
  return instance;
}

} // namespace

logger::~logger() {
  // nop
}

std::shared_ptr<logger> logger::make_console_logger(const settings& cfg,
                                                    std::ostream& out) {
  auto verbosity = default_verbosity();
  auto str = get_or(cfg, "weave.logger.verbosity", std::string{});
  if (auto lvl = log::level_from_string(str))
    verbosity = *lvl;
  return std::make_shared<console_logger>(verbosity, out);
}

std::shared_ptr<logger> logger::current_logger() {
  return current_instance().load();
}

void logger::set_current_logger(std::shared_ptr<logger> instance) {
  if (instance == nullptr)
    instance = make_default_logger();
  current_instance().store(std::move(instance));
}

log::event logger::make_event(unsigned level, std::string_view component,
                              const std::source_location& loc,
                              std::string message) {
  return log::event{level,
                    component,
                    loc,
                    std::this_thread::get_id(),
                    std::chrono::system_clock::now(),
                    std::move(message)};
}

} // namespace weave
