// This file is part of Weave, the actor wiring layer. See the file LICENSE in
// the main distribution directory for license terms and copyright.

#pragma once

#include <cstddef>

namespace weave {

/// Identifies a consumer of a server message box. Assigned in connection order
/// and equal to the index of the consumer in the response registry.
using client_id = size_t;

} // namespace weave
