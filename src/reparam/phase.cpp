/// @file src/reparam/phase.cpp
/// @brief DeltaPhase transform.

#include "gwreparam/phase.hpp"
#include "gwreparam/constants.hpp"
#include "gwreparam/errors.hpp"
#include "gwreparam/point.hpp"

#include "transform_math.hpp"

#include <fmt/format.h>

#include <cmath>
#include <utility>

namespace gwreparam {

using constants::TWO_PI;

DeltaPhase::DeltaPhase(ParameterDescriptor phase,
                       std::string psi,
                       std::string theta_jn,
                       std::string output)
    : Reparameterisation({phase.name()}, {std::move(output)}, {psi, theta_jn}),
      phase_(std::move(phase)),
      psi_(std::move(psi)),
      theta_jn_(std::move(theta_jn)) {
    if (!phase_.is_bounded() ||
        std::abs(phase_.width() - TWO_PI) > constants::BOUNDS_MATCH_TOLERANCE) {
        throw ConfigurationError(
            fmt::format("delta-phase transform requires '{}' to span 2*pi", phase_.name()));
    }
}

double DeltaPhase::shift(const Point& physical) const {
    const double psi = value_of(physical, psi_);
    const double theta_jn = value_of(physical, theta_jn_);
    if (!std::isfinite(psi)) {
        throw DomainError(psi_, psi, "non-finite value");
    }
    if (!std::isfinite(theta_jn)) {
        throw DomainError(theta_jn_, theta_jn, "non-finite value");
    }
    const double c = std::cos(theta_jn);
    const double sign = c > 0.0 ? 1.0 : (c < 0.0 ? -1.0 : 0.0);
    return sign * psi;
}

double DeltaPhase::forward_into(const Point& physical, Point& transformed) const {
    const double phase = value_of(physical, phase_.name());
    check_domain(phase_, phase);
    transformed[output_parameters().front()] = phase + shift(physical);
    return 0.0;
}

double DeltaPhase::inverse_into(const Point& transformed, Point& physical) const {
    const auto& out = output_parameters().front();
    const double dp = value_of(transformed, out);
    if (!std::isfinite(dp)) {
        throw DomainError(out, dp, "non-finite value");
    }
    physical[phase_.name()] =
        detail::TransformMath::wrap(dp - shift(physical), *phase_.lower(), TWO_PI);
    return 0.0;
}

} // namespace gwreparam
