// This file is part of Weave, the actor wiring layer. See the file LICENSE in
// the main distribution directory for license terms and copyright.

#pragma once

#define WEAVE_PP_CAT(a, b) WEAVE_PP_CAT_I(a, b)
#define WEAVE_PP_CAT_I(a, b) a##b

/// Creates a unique identifier from `prefix` and the current line.
#define WEAVE_PP_UNIFYN(prefix) WEAVE_PP_CAT(prefix, __LINE__)

#define WEAVE_PP_STR(x) WEAVE_PP_STR_I(x)
#define WEAVE_PP_STR_I(x) #x

#define WEAVE_VOID_STMT static_cast<void>(0)

#define WEAVE_IGNORE_UNUSED(x) static_cast<void>(x)
