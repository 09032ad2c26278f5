#include "registry/module_registry.h"
#include "core/engine_error.h"

#include <failsafe/failsafe.hh>

#include <utility>

namespace Patchwork::Engine {

std::string_view moduleStateName(ModuleState state) noexcept {
    switch (state) {
        case ModuleState::Unregistered: return "unregistered";
        case ModuleState::Loading:      return "loading";
        case ModuleState::Loaded:       return "loaded";
    }
    return "unknown";
}

ModuleRegistry::Entry& ModuleRegistry::entryFor(std::string_view name) {
    auto it = entries_.find(name);
    if (it == entries_.end()) {
        it = entries_.emplace(std::string(name), Entry{}).first;
    }
    return it->second;
}

// =============================================================================
// Registration
// =============================================================================

bool ModuleRegistry::registerModule(std::string name, Loader loader) {
    if (name.empty()) {
        LOG_ERROR("registry", errorName(EngineError::ConfigurationError), "module name is empty");
        return false;
    }

    Entry& entry = entryFor(name);
    if (entry.state != ModuleState::Unregistered) {
        LOG_WARN("registry", "module", name, "already", moduleStateName(entry.state));
        return false;
    }
    entry.state = ModuleState::Loading;
    LOG_DEBUG("registry", "loading module", name);

    if (loader) {
        loader([this, name]() { markLoaded(name); });
    }
    return true;
}

// =============================================================================
// Requests
// =============================================================================

RequestStatus ModuleRegistry::request(std::string_view name, Continuation continuation) {
    if (name.empty() || !continuation) {
        LOG_ERROR("registry", errorName(EngineError::ConfigurationError),
                  "rejected module request for '", name, "'");
        return RequestStatus::Rejected;
    }

    Entry& entry = entryFor(name);
    if (entry.state == ModuleState::Loaded) {
        continuation();
        return RequestStatus::Ready;
    }

    if (entry.state == ModuleState::Unregistered) {
        LOG_DEBUG("registry", "module", name, "requested before registration");
    }
    entry.pending.push_back(std::move(continuation));
    return RequestStatus::Queued;
}

bool ModuleRegistry::markLoaded(std::string_view name) {
    if (name.empty()) return false;

    Entry& entry = entryFor(name);
    if (entry.state == ModuleState::Loaded) {
        return false;
    }

    // Continuations may request more modules; the queue is moved out first
    // and the state is final before any of them runs.
    entry.state = ModuleState::Loaded;
    std::vector<Continuation> queued = std::move(entry.pending);
    entry.pending.clear();

    LOG_INFO("registry", "module", name, "loaded,", queued.size(), "pending continuations");
    for (auto& continuation : queued) {
        continuation();
    }
    return true;
}

// =============================================================================
// Queries
// =============================================================================

ModuleState ModuleRegistry::state(std::string_view name) const {
    const auto it = entries_.find(name);
    return it == entries_.end() ? ModuleState::Unregistered : it->second.state;
}

size_t ModuleRegistry::pendingCount(std::string_view name) const {
    const auto it = entries_.find(name);
    return it == entries_.end() ? 0 : it->second.pending.size();
}

std::vector<std::string> ModuleRegistry::loadedModules() const {
    std::vector<std::string> result;
    for (const auto& [name, entry] : entries_) {
        if (entry.state == ModuleState::Loaded) result.push_back(name);
    }
    return result;
}

} // namespace Patchwork::Engine
