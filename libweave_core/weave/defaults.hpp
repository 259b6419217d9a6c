// This file is part of Weave, the actor wiring layer. See the file LICENSE in
// the main distribution directory for license terms and copyright.

#pragma once

#include <cstddef>

// -- hard-coded default values for various Weave options ----------------------

namespace weave::defaults::message_box {

/// Capacity of the input queue of a message box.
constexpr auto capacity = size_t{16};

/// Capacity of the queue for runtime requests such as shutdown signals. Kept
/// small and independent of the input capacity.
constexpr auto signal_capacity = size_t{4};

} // namespace weave::defaults::message_box

namespace weave::defaults::server {

/// Capacity of the shared request queue of a server.
constexpr auto capacity = size_t{16};

/// Number of requests a concurrent server may process at the same time.
constexpr auto max_concurrency = size_t{4};

/// Concurrency of a server message box builder before calling
/// `with_max_concurrency`.
constexpr auto box_max_concurrency = size_t{1};

} // namespace weave::defaults::server
