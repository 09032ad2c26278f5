#pragma once

// ==============================================================================
// Port - Reference to a Node Endpoint
// ==============================================================================
// Either a signal port (inlet or outlet by index) or a control parameter of a
// node. Direction is fixed when the port is made; parameter ports are always
// inputs.
// ==============================================================================

#include <cstddef>
#include <cstdint>

namespace Patchwork::Engine {

class Node;
class ControlParameter;

enum class PortDirection : uint8_t { Input, Output };
enum class PortKind : uint8_t { Signal, Parameter };

struct Port {
    Node* node = nullptr;
    PortDirection direction = PortDirection::Input;
    PortKind kind = PortKind::Signal;
    size_t index = 0;
    ControlParameter* parameter = nullptr;

    [[nodiscard]] bool isValid() const noexcept {
        return node != nullptr && (kind == PortKind::Signal || parameter != nullptr);
    }
};

} // namespace Patchwork::Engine
