/// @file src/reparam/reparameterisation.cpp
/// @brief Reparameterisation base behaviour and the Identity transform.

#include "gwreparam/reparameterisation.hpp"
#include "gwreparam/errors.hpp"
#include "gwreparam/point.hpp"

#include <cmath>
#include <utility>

namespace gwreparam {

Reparameterisation::Reparameterisation(ParameterNames inputs,
                                       ParameterNames outputs,
                                       ParameterNames required,
                                       ParameterNames auxiliary)
    : inputs_(std::move(inputs)),
      outputs_(std::move(outputs)),
      required_(std::move(required)),
      auxiliary_(std::move(auxiliary)) {}

// ─── Standalone maps ──────────────────────────────────────────────────────────

TransformResult Reparameterisation::forward(const Point& physical) const {
    Point transformed = physical;
    for (const auto& name : inputs_) {
        transformed.erase(name);
    }
    const double log_j = forward_into(physical, transformed);
    return {std::move(transformed), log_j};
}

TransformResult Reparameterisation::inverse(const Point& transformed) const {
    Point physical = transformed;
    for (const auto& name : outputs_) {
        physical.erase(name);
    }
    const double log_j = inverse_into(transformed, physical);
    return {std::move(physical), log_j};
}

std::shared_ptr<const Reparameterisation>
Reparameterisation::refit(std::span<const Point>) const {
    return nullptr;
}

double Reparameterisation::log_prior_auxiliary(const Point&) const {
    return 0.0;
}

void Reparameterisation::draw_auxiliary(Point&, std::mt19937_64&) const {}

// ─── Helpers ──────────────────────────────────────────────────────────────────

double Reparameterisation::checked_jacobian(double log_jacobian,
                                            const std::string& parameter,
                                            double value) {
    if (!std::isfinite(log_jacobian)) {
        throw DomainError(parameter, value, "log-Jacobian is not finite");
    }
    return log_jacobian;
}

void Reparameterisation::check_domain(const ParameterDescriptor& descriptor, double value) {
    if (!descriptor.contains(value)) {
        throw DomainError(descriptor.name(), value, "outside prior bounds");
    }
}

// ─── Identity ─────────────────────────────────────────────────────────────────

Identity::Identity(ParameterDescriptor parameter)
    : Reparameterisation({parameter.name()}, {parameter.name()}),
      parameter_(std::move(parameter)) {}

double Identity::forward_into(const Point& physical, Point& transformed) const {
    const double x = value_of(physical, parameter_.name());
    check_domain(parameter_, x);
    transformed[parameter_.name()] = x;
    return 0.0;
}

double Identity::inverse_into(const Point& transformed, Point& physical) const {
    const double x = value_of(transformed, parameter_.name());
    check_domain(parameter_, x);
    physical[parameter_.name()] = x;
    return 0.0;
}

} // namespace gwreparam
