#include "parameters/parameter_set.h"

#include <failsafe/failsafe.hh>

#include <patchwork/dsp/core/db_utils.h>

#include <algorithm>
#include <utility>

namespace Patchwork::Engine {

ParameterSet::ParameterSet(size_t blockSize)
    : blockSize_(blockSize)
{
}

ControlParameter& ParameterSet::add(const ParameterDescriptor& descriptor) {
    if (ControlParameter* existing = find(descriptor.name)) {
        return *existing;
    }
    parameters_.push_back(std::make_unique<ControlParameter>(descriptor, blockSize_));
    return *parameters_.back();
}

bool ParameterSet::addMacro(std::string name, float minValue, float maxValue, float initial, MacroSetter setter) {
    if (name.empty() || !setter || contains(name)) {
        LOG_WARN("params", "cannot add macro", name);
        return false;
    }
    const float lo = std::min(minValue, maxValue);
    const float hi = std::max(minValue, maxValue);
    macros_.push_back({std::move(name), lo, hi, std::clamp(initial, lo, hi), std::move(setter)});
    return true;
}

ControlParameter* ParameterSet::find(std::string_view name) const noexcept {
    for (const auto& param : parameters_) {
        if (param->name() == name) return param.get();
    }
    return nullptr;
}

const ParameterSet::Macro* ParameterSet::findMacro(std::string_view name) const noexcept {
    for (const auto& macro : macros_) {
        if (macro.name == name) return &macro;
    }
    return nullptr;
}

ParameterSet::Macro* ParameterSet::findMacro(std::string_view name) noexcept {
    for (auto& macro : macros_) {
        if (macro.name == name) return &macro;
    }
    return nullptr;
}

bool ParameterSet::contains(std::string_view name) const noexcept {
    return find(name) != nullptr || findMacro(name) != nullptr;
}

bool ParameterSet::set(std::string_view name, float value, double now, double timeConstant) {
    if (DSP::detail::isNaN(value)) {
        LOG_WARN("params", "ignoring NaN for", name);
        return false;
    }

    if (ControlParameter* param = find(name)) {
        if (timeConstant > 0.0) {
            return param->setTargetAtTime(value, now, timeConstant);
        }
        param->setValue(value);
        return true;
    }

    if (Macro* macro = findMacro(name)) {
        macro->value = std::clamp(value, macro->minValue, macro->maxValue);
        macro->setter(macro->value, timeConstant);
        return true;
    }

    LOG_WARN("params", "unknown parameter", name);
    return false;
}

bool ParameterSet::setNormalized(std::string_view name, float normalized, double now, double timeConstant) {
    if (DSP::detail::isNaN(normalized)) return false;
    normalized = std::clamp(normalized, 0.0f, 1.0f);

    if (const ControlParameter* param = find(name)) {
        const float value = param->minValue() + normalized * (param->maxValue() - param->minValue());
        return set(name, value, now, timeConstant);
    }
    if (const Macro* macro = findMacro(name)) {
        const float value = macro->minValue + normalized * (macro->maxValue - macro->minValue);
        return set(name, value, now, timeConstant);
    }

    LOG_WARN("params", "unknown parameter", name);
    return false;
}

std::optional<float> ParameterSet::get(std::string_view name) const {
    if (const ControlParameter* param = find(name)) return param->value();
    if (const Macro* macro = findMacro(name)) return macro->value;
    return std::nullopt;
}

std::vector<std::string> ParameterSet::names() const {
    std::vector<std::string> result;
    result.reserve(parameters_.size() + macros_.size());
    for (const auto& param : parameters_) result.push_back(param->name());
    for (const auto& macro : macros_) result.push_back(macro.name);
    return result;
}

} // namespace Patchwork::Engine
