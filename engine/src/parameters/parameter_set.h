#pragma once

// ==============================================================================
// ParameterSet - Named Parameter Access for a Node
// ==============================================================================
// Owned component embedded in every Node. Holds the node's ControlParameters
// in declaration order plus optional macros: named values that fan out to
// several underlying parameters through a setter.
//
// set()/setNormalized() take an optional time constant. A positive time
// constant tweens with setTargetAtTime; zero jumps at the current time.
// ==============================================================================

#include "parameters/control_parameter.h"

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace Patchwork::Engine {

class ParameterSet {
public:
    /// Receives a macro value already clamped to the macro range.
    using MacroSetter = std::function<void(float value, double timeConstant)>;

    explicit ParameterSet(size_t blockSize = 128);

    ParameterSet(const ParameterSet&) = delete;
    ParameterSet& operator=(const ParameterSet&) = delete;

    /// Add a parameter. An existing name is returned unchanged.
    ControlParameter& add(const ParameterDescriptor& descriptor);

    /// Add a macro over [minValue, maxValue].
    /// @return false if the name is already used
    bool addMacro(std::string name, float minValue, float maxValue, float initial, MacroSetter setter);

    [[nodiscard]] ControlParameter* find(std::string_view name) const noexcept;
    [[nodiscard]] bool contains(std::string_view name) const noexcept;

    /// Set a parameter or macro.
    /// @param now Current graph time in seconds
    /// @return false if the name is unknown or the value is NaN
    bool set(std::string_view name, float value, double now, double timeConstant = 0.0);

    /// Set from [0, 1] mapped onto the parameter or macro range.
    bool setNormalized(std::string_view name, float normalized, double now, double timeConstant = 0.0);

    /// Current intrinsic value of a parameter, or last value of a macro.
    [[nodiscard]] std::optional<float> get(std::string_view name) const;

    [[nodiscard]] size_t size() const noexcept { return parameters_.size(); }
    [[nodiscard]] size_t macroCount() const noexcept { return macros_.size(); }
    [[nodiscard]] const std::vector<std::unique_ptr<ControlParameter>>& all() const noexcept { return parameters_; }
    [[nodiscard]] std::vector<std::string> names() const;

private:
    struct Macro {
        std::string name;
        float minValue;
        float maxValue;
        float value;
        MacroSetter setter;
    };

    [[nodiscard]] const Macro* findMacro(std::string_view name) const noexcept;
    [[nodiscard]] Macro* findMacro(std::string_view name) noexcept;

    size_t blockSize_;
    std::vector<std::unique_ptr<ControlParameter>> parameters_;
    std::vector<Macro> macros_;
};

} // namespace Patchwork::Engine
