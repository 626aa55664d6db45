/// @file src/core/parameter.cpp
/// @brief ParameterDescriptor construction and domain checks.

#include "gwreparam/parameter.hpp"
#include "gwreparam/errors.hpp"

#include <fmt/format.h>

#include <cmath>
#include <utility>

namespace gwreparam {

const char* to_string(Topology t) noexcept {
    switch (t) {
        case Topology::Linear:     return "linear";
        case Topology::Bounded:    return "bounded";
        case Topology::Periodic:   return "periodic";
        case Topology::Reflective: return "reflective";
        case Topology::Composite:  return "composite";
    }
    return "unknown";
}

// ─── Construction ─────────────────────────────────────────────────────────────

ParameterDescriptor::ParameterDescriptor(std::string name,
                                         std::optional<double> lower,
                                         std::optional<double> upper,
                                         Topology topology,
                                         std::vector<std::string> partners)
    : name_(std::move(name)),
      lower_(lower),
      upper_(upper),
      topology_(topology),
      partners_(std::move(partners)) {
    if (name_.empty()) {
        throw ConfigurationError("parameter descriptor requires a non-empty name");
    }
    if ((lower_ && !std::isfinite(*lower_)) || (upper_ && !std::isfinite(*upper_))) {
        throw ConfigurationError(
            fmt::format("parameter '{}' has a non-finite bound", name_));
    }
    if (lower_ && upper_ && !(*lower_ < *upper_)) {
        throw ConfigurationError(
            fmt::format("parameter '{}' requires lower < upper, got [{}, {}]",
                        name_, *lower_, *upper_));
    }
    if (topology_ != Topology::Linear && !(lower_ && upper_)) {
        throw ConfigurationError(
            fmt::format("parameter '{}' with {} topology requires both bounds",
                        name_, to_string(topology_)));
    }
    if (topology_ == Topology::Composite && partners_.empty()) {
        throw ConfigurationError(
            fmt::format("composite parameter '{}' must name its partners", name_));
    }
}

// ─── Factories ────────────────────────────────────────────────────────────────

ParameterDescriptor ParameterDescriptor::linear(std::string name) {
    return ParameterDescriptor(std::move(name), std::nullopt, std::nullopt, Topology::Linear);
}

ParameterDescriptor ParameterDescriptor::bounded(std::string name, double lower, double upper) {
    return ParameterDescriptor(std::move(name), lower, upper, Topology::Bounded);
}

ParameterDescriptor ParameterDescriptor::periodic(std::string name, double lower, double upper) {
    return ParameterDescriptor(std::move(name), lower, upper, Topology::Periodic);
}

ParameterDescriptor ParameterDescriptor::reflective(std::string name, double lower, double upper) {
    return ParameterDescriptor(std::move(name), lower, upper, Topology::Reflective);
}

ParameterDescriptor ParameterDescriptor::composite(std::string name, double lower, double upper,
                                                   std::vector<std::string> partners) {
    return ParameterDescriptor(std::move(name), lower, upper, Topology::Composite,
                               std::move(partners));
}

// ─── Queries ──────────────────────────────────────────────────────────────────

bool ParameterDescriptor::is_bounded() const noexcept {
    return lower_.has_value() && upper_.has_value();
}

double ParameterDescriptor::width() const noexcept {
    return *upper_ - *lower_;
}

bool ParameterDescriptor::contains(double value) const noexcept {
    if (!std::isfinite(value)) {
        return false;
    }
    if (lower_ && value < *lower_) {
        return false;
    }
    if (upper_) {
        // Periodic domains are half-open: upper is identified with lower.
        if (topology_ == Topology::Periodic) {
            return value < *upper_;
        }
        return value <= *upper_;
    }
    return true;
}

const ParameterDescriptor*
find_parameter(const ParameterSet& parameters, std::string_view name) noexcept {
    for (const auto& p : parameters) {
        if (p.name() == name) {
            return &p;
        }
    }
    return nullptr;
}

} // namespace gwreparam
