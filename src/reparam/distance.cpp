/// @file src/reparam/distance.cpp
/// @brief Power-law prior CDF transform for luminosity distance.

#include "gwreparam/distance.hpp"
#include "gwreparam/errors.hpp"
#include "gwreparam/point.hpp"

#include "transform_math.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <utility>

namespace gwreparam {

Distance::Distance(ParameterDescriptor parameter,
                   double power,
                   std::optional<ReflectBoundaries> reflect)
    : Reparameterisation({parameter.name()}, {parameter.name() + "_prime"}),
      parameter_(std::move(parameter)),
      power_(power),
      reflect_(reflect),
      d_min_(0.0),
      d_max_(0.0),
      norm_(0.0) {
    if (!parameter_.is_bounded()) {
        throw ConfigurationError(
            fmt::format("distance transform for '{}' requires both prior bounds",
                        parameter_.name()));
    }
    if (!std::isfinite(power_)) {
        throw ConfigurationError(
            fmt::format("distance power for '{}' must be finite", parameter_.name()));
    }
    d_min_ = *parameter_.lower();
    d_max_ = *parameter_.upper();
    if (d_min_ < 0.0) {
        throw ConfigurationError(
            fmt::format("distance '{}' requires a non-negative lower bound, got {}",
                        parameter_.name(), d_min_));
    }
    if (power_ <= -1.0 && d_min_ == 0.0) {
        throw ConfigurationError(
            fmt::format("distance '{}' with power {} requires a positive lower bound",
                        parameter_.name(), power_));
    }
    norm_ = logarithmic()
        ? std::log(d_max_ / d_min_)
        : std::pow(d_max_, power_ + 1.0) - std::pow(d_min_, power_ + 1.0);
    if (!std::isfinite(norm_) || norm_ == 0.0) {
        throw ConfigurationError(
            fmt::format("distance '{}' prior CDF is not normalisable on [{}, {}]",
                        parameter_.name(), d_min_, d_max_));
    }
}

bool Distance::logarithmic() const noexcept {
    return power_ == -1.0;
}

// ─── CDF pair ─────────────────────────────────────────────────────────────────

double Distance::to_uniform(double d) const noexcept {
    if (logarithmic()) {
        return std::log(d / d_min_) / norm_;
    }
    return (std::pow(d, power_ + 1.0) - std::pow(d_min_, power_ + 1.0)) / norm_;
}

double Distance::from_uniform(double u) const noexcept {
    if (logarithmic()) {
        return d_min_ * std::exp(u * norm_);
    }
    const double k = power_ + 1.0;
    return std::pow(u * norm_ + std::pow(d_min_, k), 1.0 / k);
}

double Distance::log_density(double d) const noexcept {
    if (logarithmic()) {
        return -std::log(d) - std::log(norm_);
    }
    // (α + 1) and norm_ share a sign, so the ratio is positive.
    return std::log((power_ + 1.0) / norm_) + power_ * std::log(d);
}

// ─── Maps ─────────────────────────────────────────────────────────────────────

double Distance::forward_into(const Point& physical, Point& transformed) const {
    const double d = value_of(physical, parameter_.name());
    check_domain(parameter_, d);
    const double u = std::clamp(to_uniform(d), 0.0, 1.0);
    transformed[output_parameters().front()] = u;
    return checked_jacobian(log_density(d), parameter_.name(), d);
}

double Distance::inverse_into(const Point& transformed, Point& physical) const {
    const auto& out = output_parameters().front();
    double u = value_of(transformed, out);
    if (!std::isfinite(u)) {
        throw DomainError(out, u, "non-finite value");
    }
    if (reflect_) {
        switch (*reflect_) {
            case ReflectBoundaries::Both:  u = detail::TransformMath::fold_unit(u); break;
            case ReflectBoundaries::Lower: if (u < 0.0) { u = -u; } break;
            case ReflectBoundaries::Upper: if (u > 1.0) { u = 2.0 - u; } break;
        }
    }
    if (u < 0.0 || u > 1.0) {
        throw DomainError(out, u, "outside the unit interval");
    }
    const double d = std::clamp(from_uniform(u), d_min_, d_max_);
    physical[parameter_.name()] = d;
    return checked_jacobian(-log_density(d), parameter_.name(), d);
}

} // namespace gwreparam
