// This file is part of Weave, the actor wiring layer. See the file LICENSE in
// the main distribution directory for license terms and copyright.

#pragma once

#include "weave/detail/test_export.hpp"

namespace weave::test {

/// Runs all registered tests that match the command line filter.
/// Accepts `-t <regex>` (or `--test=<regex>`) for selecting tests by their
/// description and `-v` for printing each check.
/// @returns `EXIT_SUCCESS` if all checks pass, `EXIT_FAILURE` otherwise.
WEAVE_TEST_EXPORT int run(int argc, char** argv);

} // namespace weave::test
