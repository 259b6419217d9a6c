// This file is part of Weave, the actor wiring layer. See the file LICENSE in
// the main distribution directory for license terms and copyright.

#pragma once

#include "weave/test/test.hpp"

/// Defines a new test in BDD style. Behaves like `TEST`.
#define SCENARIO(description) TEST(description)

#define WEAVE_TEST_BDD_BLOCK(type, description)                                \
  if (auto weave_block_guard = this->ctx().enter(type, description, __LINE__))

#define GIVEN(description) WEAVE_TEST_BDD_BLOCK("GIVEN", description)

#define WHEN(description) WEAVE_TEST_BDD_BLOCK("WHEN", description)

#define THEN(description) WEAVE_TEST_BDD_BLOCK("THEN", description)

#define AND_THEN(description) WEAVE_TEST_BDD_BLOCK("AND_THEN", description)
