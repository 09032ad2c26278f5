#pragma once

// ==============================================================================
// ModuleRegistry - Deferred Kernel Module Availability
// ==============================================================================
// Tracks which named DSP kernel modules are available and holds the
// continuations waiting for them. Each name resolves at most once:
//
//   Unregistered --registerModule()--> Loading --markLoaded()--> Loaded
//
// A request for a module that is not yet Loaded queues its continuation.
// When the module is marked Loaded every queued continuation fires exactly
// once, synchronously, in the order it was requested; later requests fire
// immediately. Marking a name Loaded does not require a prior registration.
//
// Thread Safety: control plane only. Never called from render code.
// ==============================================================================

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace Patchwork::Engine {

enum class ModuleState : uint8_t {
    Unregistered,
    Loading,
    Loaded
};

enum class RequestStatus : uint8_t {
    Ready,    ///< Module was Loaded; the continuation already ran
    Queued,   ///< Continuation waits for markLoaded()
    Rejected  ///< Empty name or empty continuation; nothing queued
};

[[nodiscard]] std::string_view moduleStateName(ModuleState state) noexcept;

class ModuleRegistry {
public:
    using Continuation = std::function<void()>;

    /// Handed to a loader; calling it marks the module Loaded. Safe to call
    /// more than once.
    using Resolver = std::function<void()>;

    /// Starts loading a module. May call the resolver synchronously or keep
    /// it for later.
    using Loader = std::function<void(Resolver)>;

    ModuleRegistry() = default;
    ~ModuleRegistry() = default;

    ModuleRegistry(const ModuleRegistry&) = delete;
    ModuleRegistry& operator=(const ModuleRegistry&) = delete;

    /// Register a module and run its loader.
    /// @return false if the name is empty or was already registered
    bool registerModule(std::string name, Loader loader);

    /// Ask for a module. Returns immediately.
    RequestStatus request(std::string_view name, Continuation continuation);

    /// Mark a module Loaded and flush its queue.
    /// @return false if it was already Loaded
    bool markLoaded(std::string_view name);

    [[nodiscard]] ModuleState state(std::string_view name) const;
    [[nodiscard]] bool isLoaded(std::string_view name) const { return state(name) == ModuleState::Loaded; }

    /// Number of continuations waiting on a module.
    [[nodiscard]] size_t pendingCount(std::string_view name) const;

    [[nodiscard]] std::vector<std::string> loadedModules() const;

private:
    struct Entry {
        ModuleState state = ModuleState::Unregistered;
        std::vector<Continuation> pending;
    };

    Entry& entryFor(std::string_view name);

    std::map<std::string, Entry, std::less<>> entries_;
};

} // namespace Patchwork::Engine
