// This file is part of Weave, the actor wiring layer. See the file LICENSE in
// the main distribution directory for license terms and copyright.

#include "weave/test/reporter.hpp"

#include "weave/raise_error.hpp"

#include <iostream>
#include <stdexcept>

namespace weave::test {

namespace {

reporter* global_instance;

} // namespace

reporter::reporter(std::ostream& out) : out_(&out) {
  // nop
}

void reporter::begin_test(std::string_view description) {
  test_ = description;
  test_stats_ = stats{};
  if (verbose_)
    *out_ << "TEST " << description << '\n';
}

void reporter::end_test() {
  total_stats_.passed += test_stats_.passed;
  total_stats_.failed += test_stats_.failed;
  if (test_stats_.failed > 0)
    ++failed_tests_;
  if (verbose_)
    *out_ << "  passed: " << test_stats_.passed
          << ", failed: " << test_stats_.failed << '\n';
}

void reporter::pass(const std::source_location& loc) {
  ++test_stats_.passed;
  if (verbose_)
    *out_ << "  pass " << loc.file_name() << ':' << loc.line() << '\n';
}

void reporter::fail(std::string_view path, std::string_view what,
                    const std::source_location& loc) {
  ++test_stats_.failed;
  *out_ << "FAIL " << path << '\n'
        << "  " << loc.file_name() << ':' << loc.line() << ": " << what
        << '\n';
}

void reporter::print_summary() {
  *out_ << "summary: " << (total_stats_.passed + total_stats_.failed)
        << " checks, " << total_stats_.failed << " failed, " << failed_tests_
        << " failed tests\n";
}

reporter& reporter::instance() {
  if (global_instance == nullptr)
    WEAVE_RAISE_ERROR(std::logic_error, "no reporter available");
  return *global_instance;
}

void reporter::instance(reporter* ptr) {
  global_instance = ptr;
}

} // namespace weave::test
