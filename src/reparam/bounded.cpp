/// @file src/reparam/bounded.cpp
/// @brief RescaleToBounds, Logit and Reflective transforms.

#include "gwreparam/bounded.hpp"
#include "gwreparam/errors.hpp"
#include "gwreparam/point.hpp"

#include "transform_math.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <limits>
#include <utility>

namespace gwreparam {

using detail::TransformMath;

namespace {

void require_bounds(const ParameterDescriptor& parameter, std::string_view kind) {
    if (!parameter.is_bounded()) {
        throw ConfigurationError(
            fmt::format("{} transform for '{}' requires both prior bounds",
                        kind, parameter.name()));
    }
}

std::string primed(const std::string& name) { return name + "_prime"; }

} // namespace

const char* to_string(ReflectBoundaries b) noexcept {
    switch (b) {
        case ReflectBoundaries::Lower: return "lower";
        case ReflectBoundaries::Upper: return "upper";
        case ReflectBoundaries::Both:  return "both";
    }
    return "unknown";
}

// ─── RescaleToBounds ──────────────────────────────────────────────────────────

RescaleToBounds::RescaleToBounds(ParameterDescriptor parameter,
                                 bool update_bounds,
                                 std::optional<ReflectBoundaries> inversion)
    : Reparameterisation({parameter.name()}, {primed(parameter.name())}),
      parameter_(std::move(parameter)),
      update_bounds_(update_bounds),
      inversion_(inversion),
      lower_(0.0),
      upper_(0.0) {
    require_bounds(parameter_, "rescale");
    lower_ = *parameter_.lower();
    upper_ = *parameter_.upper();
}

double RescaleToBounds::forward_into(const Point& physical, Point& transformed) const {
    const double x = value_of(physical, parameter_.name());
    check_domain(parameter_, x);
    const double width = upper_ - lower_;
    transformed[output_parameters().front()] = 2.0 * (x - lower_) / width - 1.0;
    return checked_jacobian(std::log(2.0 / width), parameter_.name(), x);
}

double RescaleToBounds::inverse_into(const Point& transformed, Point& physical) const {
    const auto& out = output_parameters().front();
    const double y = value_of(transformed, out);
    if (!std::isfinite(y)) {
        throw DomainError(out, y, "non-finite value");
    }
    const double width = upper_ - lower_;
    double x = lower_ + 0.5 * (y + 1.0) * width;
    if (inversion_) {
        const double lo = *parameter_.lower();
        const double hi = *parameter_.upper();
        switch (*inversion_) {
            case ReflectBoundaries::Both:
                x = lo + TransformMath::fold_unit((x - lo) / (hi - lo)) * (hi - lo);
                break;
            case ReflectBoundaries::Lower: if (x < lo) { x = 2.0 * lo - x; } break;
            case ReflectBoundaries::Upper: if (x > hi) { x = 2.0 * hi - x; } break;
        }
    }
    check_domain(parameter_, x);
    physical[parameter_.name()] = x;
    return checked_jacobian(std::log(0.5 * width), parameter_.name(), x);
}

std::shared_ptr<const Reparameterisation>
RescaleToBounds::refit(std::span<const Point> live_points) const {
    if (!update_bounds_) {
        return nullptr;
    }
    auto refitted = std::make_shared<RescaleToBounds>(*this);
    double lo = std::numeric_limits<double>::infinity();
    double hi = -std::numeric_limits<double>::infinity();
    for (const auto& p : live_points) {
        const double x = value_of(p, parameter_.name());
        lo = std::min(lo, x);
        hi = std::max(hi, x);
    }
    if (std::isfinite(lo) && std::isfinite(hi) && lo < hi) {
        refitted->lower_ = lo;
        refitted->upper_ = hi;
    }
    return refitted;
}

// ─── Logit ────────────────────────────────────────────────────────────────────

Logit::Logit(ParameterDescriptor parameter)
    : Reparameterisation({parameter.name()}, {primed(parameter.name())}),
      parameter_(std::move(parameter)) {
    require_bounds(parameter_, "logit");
}

double Logit::forward_into(const Point& physical, Point& transformed) const {
    const double x = value_of(physical, parameter_.name());
    check_domain(parameter_, x);
    const double width = parameter_.width();
    const double s = (x - *parameter_.lower()) / width;
    const auto y = TransformMath::logit(s);
    if (!y) {
        throw DomainError(parameter_.name(), x, "logit is undefined at the prior bounds");
    }
    transformed[output_parameters().front()] = *y;
    const double log_j = -std::log(width) - std::log(s) - std::log1p(-s);
    return checked_jacobian(log_j, parameter_.name(), x);
}

double Logit::inverse_into(const Point& transformed, Point& physical) const {
    const auto& out = output_parameters().front();
    const double y = value_of(transformed, out);
    if (!std::isfinite(y)) {
        throw DomainError(out, y, "non-finite value");
    }
    const double s = TransformMath::sigmoid(y);
    if (!(s > 0.0 && s < 1.0)) {
        throw DomainError(out, y, "sigmoid saturates to a prior bound");
    }
    const double x = *parameter_.lower() + s * parameter_.width();
    check_domain(parameter_, x);
    physical[parameter_.name()] = x;
    const double log_j = std::log(parameter_.width())
                       + TransformMath::log_sigmoid(y)
                       + TransformMath::log_sigmoid(-y);
    return checked_jacobian(log_j, out, y);
}

// ─── Reflective ───────────────────────────────────────────────────────────────

Reflective::Reflective(ParameterDescriptor parameter, ReflectBoundaries boundaries)
    : Reparameterisation({parameter.name()}, {primed(parameter.name())}),
      parameter_(std::move(parameter)),
      boundaries_(boundaries) {
    require_bounds(parameter_, "reflective");
}

std::optional<double> Reflective::fold_unit(double s) const noexcept {
    if (!std::isfinite(s)) {
        return std::nullopt;
    }
    switch (boundaries_) {
        case ReflectBoundaries::Both:
            return TransformMath::fold_unit(s);
        case ReflectBoundaries::Lower:
            if (s < 0.0) {
                s = -s;
            }
            break;
        case ReflectBoundaries::Upper:
            if (s > 1.0) {
                s = 2.0 - s;
            }
            break;
    }
    if (s < 0.0 || s > 1.0) {
        return std::nullopt;
    }
    return s;
}

double Reflective::fold(double x) const {
    const double lower = *parameter_.lower();
    const double width = parameter_.width();
    const auto s = fold_unit((x - lower) / width);
    if (!s) {
        throw DomainError(parameter_.name(), x,
                          fmt::format("past a non-reflecting bound (reflects at {})",
                                      to_string(boundaries_)));
    }
    return std::clamp(lower + *s * width, lower, *parameter_.upper());
}

double Reflective::forward_into(const Point& physical, Point& transformed) const {
    const double x = fold(value_of(physical, parameter_.name()));
    transformed[output_parameters().front()] = (x - *parameter_.lower()) / parameter_.width();
    // Fold contributes log|±1| = 0.
    return checked_jacobian(-std::log(parameter_.width()), parameter_.name(), x);
}

double Reflective::inverse_into(const Point& transformed, Point& physical) const {
    const auto& out = output_parameters().front();
    const double y = value_of(transformed, out);
    const auto s = fold_unit(y);
    if (!s) {
        throw DomainError(out, y, "past a non-reflecting bound");
    }
    const double x = std::clamp(*parameter_.lower() + *s * parameter_.width(),
                                *parameter_.lower(), *parameter_.upper());
    physical[parameter_.name()] = x;
    return checked_jacobian(std::log(parameter_.width()), out, y);
}

} // namespace gwreparam
