#include "graph/chain.h"

namespace Patchwork::Engine {

Node* series(std::initializer_list<Node*> nodes) {
    Node* previous = nullptr;
    for (Node* node : nodes) {
        if (node == nullptr) return nullptr;
        if (previous != nullptr && previous->connect(*node) == nullptr) return nullptr;
        previous = node;
    }
    return previous;
}

Node* split(Node& source, std::initializer_list<Node*> targets, size_t outIndex) {
    for (Node* target : targets) {
        if (target == nullptr || source.connect(*target, outIndex, 0) == nullptr) return nullptr;
    }
    return &source;
}

Node* join(std::initializer_list<Node*> sources, Node& target, size_t inIndex) {
    for (Node* source : sources) {
        if (source == nullptr || source->connect(target, 0, inIndex) == nullptr) return nullptr;
    }
    return &target;
}

} // namespace Patchwork::Engine
