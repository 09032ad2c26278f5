#pragma once

// ==============================================================================
// Chaining Helpers
// ==============================================================================
// Shorthand for common wiring patterns. Each helper stops at the first failed
// connection (already logged by the graph) and returns nullptr.
// ==============================================================================

#include "graph/node.h"

#include <cstddef>
#include <initializer_list>

namespace Patchwork::Engine {

/// Connect each node's outlet 0 to the next node's inlet 0.
/// @return the last node, or nullptr on failure or an empty list
Node* series(std::initializer_list<Node*> nodes);

/// Connect outlet @p outIndex of @p source to inlet 0 of every target.
/// @return @p source, or nullptr on failure
Node* split(Node& source, std::initializer_list<Node*> targets, size_t outIndex = 0);

/// Connect outlet 0 of every source to inlet @p inIndex of @p target.
/// @return @p target, or nullptr on failure
Node* join(std::initializer_list<Node*> sources, Node& target, size_t inIndex = 0);

} // namespace Patchwork::Engine
