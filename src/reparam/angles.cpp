/// @file src/reparam/angles.cpp
/// @brief Angle, SineAngle and SkyPair transforms.

#include "gwreparam/angles.hpp"
#include "gwreparam/constants.hpp"
#include "gwreparam/errors.hpp"
#include "gwreparam/point.hpp"

#include "transform_math.hpp"

#include <fmt/format.h>

#include <cmath>
#include <random>
#include <utility>

namespace gwreparam {

using detail::TransformMath;
using constants::BOUNDS_MATCH_TOLERANCE;
using constants::MIN_EMBEDDING_RADIUS;
using constants::PI;
using constants::TWO_PI;

namespace {

bool within(double value, double lo, double hi) noexcept {
    return value >= lo - BOUNDS_MATCH_TOLERANCE && value <= hi + BOUNDS_MATCH_TOLERANCE;
}

double finite_component(const Point& point, const std::string& name) {
    const double v = value_of(point, name);
    if (!std::isfinite(v)) {
        throw DomainError(name, v, "non-finite value");
    }
    return v;
}

double radial_component(const Point& point, const std::string& name) {
    const double r = value_of(point, name);
    if (!std::isfinite(r) || !(r > 0.0)) {
        throw DomainError(name, r, "radial coordinate must be finite and positive");
    }
    return r;
}

double log_radial_prior(const Point& point, const std::string& name, int dof) {
    return TransformMath::log_chi(radial_component(point, name), dof);
}

/// r ~ χ_k as the square root of a χ²_k draw.
void draw_radial(Point& point, const std::string& name, int dof, std::mt19937_64& rng) {
    if (point.count(name) != 0) {
        return;
    }
    std::chi_squared_distribution<double> chi2(static_cast<double>(dof));
    double r2 = 0.0;
    while (!(r2 > 0.0)) {
        r2 = chi2(rng);
    }
    point[name] = std::sqrt(r2);
}

} // namespace

const char* to_string(SkyConvention c) noexcept {
    switch (c) {
        case SkyConvention::RaDec: return "ra-dec";
        case SkyConvention::AzZen: return "az-zen";
    }
    return "unknown";
}

// ─── Angle ────────────────────────────────────────────────────────────────────

Angle::Angle(ParameterDescriptor parameter)
    : Reparameterisation({parameter.name(), parameter.name() + "_radial"},
                         {parameter.name() + "_x", parameter.name() + "_y"},
                         {},
                         {parameter.name() + "_radial"}),
      parameter_(std::move(parameter)) {
    if (!parameter_.is_bounded()) {
        throw ConfigurationError(
            fmt::format("angle transform for '{}' requires both prior bounds",
                        parameter_.name()));
    }
}

double Angle::forward_into(const Point& physical, Point& transformed) const {
    const double theta = value_of(physical, parameter_.name());
    // Half-open domain: the upper bound is the same angle as the lower.
    if (!parameter_.contains(theta) || theta >= *parameter_.upper()) {
        throw DomainError(parameter_.name(), theta, "outside [lower, upper)");
    }
    const double r = radial_component(physical, radial_name());
    const double period = parameter_.width();
    const double phi = TWO_PI * (theta - *parameter_.lower()) / period;
    transformed[output_parameters()[0]] = r * std::cos(phi);
    transformed[output_parameters()[1]] = r * std::sin(phi);
    return checked_jacobian(std::log(r) + std::log(TWO_PI / period), parameter_.name(), theta);
}

double Angle::inverse_into(const Point& transformed, Point& physical) const {
    const double x = finite_component(transformed, output_parameters()[0]);
    const double y = finite_component(transformed, output_parameters()[1]);
    const double r = std::hypot(x, y);
    if (r < MIN_EMBEDDING_RADIUS) {
        throw DomainError(parameter_.name(), 0.0, "embedding point at the origin has no angle");
    }
    const double period = parameter_.width();
    const double phi = TransformMath::wrap(std::atan2(y, x), 0.0, TWO_PI);
    const double theta = TransformMath::wrap(*parameter_.lower() + phi * period / TWO_PI,
                                             *parameter_.lower(), period);
    physical[parameter_.name()] = theta;
    physical[radial_name()] = r;
    return checked_jacobian(-std::log(r) - std::log(TWO_PI / period), parameter_.name(), theta);
}

double Angle::log_prior_auxiliary(const Point& physical) const {
    return log_radial_prior(physical, radial_name(), 2);
}

void Angle::draw_auxiliary(Point& physical, std::mt19937_64& rng) const {
    draw_radial(physical, radial_name(), 2, rng);
}

// ─── SineAngle ────────────────────────────────────────────────────────────────

SineAngle::SineAngle(ParameterDescriptor parameter)
    : Reparameterisation({parameter.name()}, {"cos_" + parameter.name()}),
      parameter_(std::move(parameter)) {
    if (!parameter_.is_bounded() ||
        !within(*parameter_.lower(), 0.0, PI) || !within(*parameter_.upper(), 0.0, PI)) {
        throw ConfigurationError(
            fmt::format("sine-angle transform for '{}' requires bounds within [0, pi]",
                        parameter_.name()));
    }
}

double SineAngle::forward_into(const Point& physical, Point& transformed) const {
    const double theta = value_of(physical, parameter_.name());
    check_domain(parameter_, theta);
    transformed[output_parameters().front()] = std::cos(theta);
    return checked_jacobian(std::log(std::sin(theta)), parameter_.name(), theta);
}

double SineAngle::inverse_into(const Point& transformed, Point& physical) const {
    const auto& out = output_parameters().front();
    const double c = finite_component(transformed, out);
    if (c < -1.0 || c > 1.0) {
        throw DomainError(out, c, "cosine outside [-1, 1]");
    }
    const double theta = std::acos(c);
    check_domain(parameter_, theta);
    physical[parameter_.name()] = theta;
    return checked_jacobian(-std::log(std::sin(theta)), out, c);
}

// ─── SkyPair ──────────────────────────────────────────────────────────────────

SkyPair::SkyPair(ParameterDescriptor longitude,
                 ParameterDescriptor latitude,
                 SkyConvention convention)
    : Reparameterisation(
          {longitude.name(), latitude.name(), longitude.name() + "_" + latitude.name() + "_radial"},
          {longitude.name() + "_" + latitude.name() + "_x",
           longitude.name() + "_" + latitude.name() + "_y",
           longitude.name() + "_" + latitude.name() + "_z"},
          {},
          {longitude.name() + "_" + latitude.name() + "_radial"}),
      longitude_(std::move(longitude)),
      latitude_(std::move(latitude)),
      convention_(convention) {
    if (!longitude_.is_bounded() ||
        std::abs(longitude_.width() - TWO_PI) > BOUNDS_MATCH_TOLERANCE) {
        throw ConfigurationError(
            fmt::format("sky longitude '{}' must span 2*pi", longitude_.name()));
    }
    const double lat_lo = convention_ == SkyConvention::RaDec ? -0.5 * PI : 0.0;
    const double lat_hi = convention_ == SkyConvention::RaDec ? 0.5 * PI : PI;
    if (!latitude_.is_bounded() ||
        !within(*latitude_.lower(), lat_lo, lat_hi) ||
        !within(*latitude_.upper(), lat_lo, lat_hi)) {
        throw ConfigurationError(
            fmt::format("sky latitude '{}' must lie within [{}, {}] for the {} convention",
                        latitude_.name(), lat_lo, lat_hi, to_string(convention_)));
    }
}

JacobianMatrix SkyPair::jacobian(double lon, double lat, double radial) const {
    JacobianMatrix j(3, 3);
    const double cl = std::cos(lon);
    const double sl = std::sin(lon);
    const double cb = std::cos(lat);
    const double sb = std::sin(lat);
    const double r = radial;
    if (convention_ == SkyConvention::RaDec) {
        // r (cos δ cos α, cos δ sin α, sin δ)
        j << -r * cb * sl, -r * sb * cl, cb * cl,
              r * cb * cl, -r * sb * sl, cb * sl,
              0.0,          r * cb,      sb;
    } else {
        // r (sin ζ cos a, sin ζ sin a, cos ζ)
        j << -r * sb * sl,  r * cb * cl, sb * cl,
              r * sb * cl,  r * cb * sl, sb * sl,
              0.0,         -r * sb,      cb;
    }
    return j;
}

double SkyPair::log_volume(double lon, double lat, double radial) const {
    const auto log_det = TransformMath::log_abs_det(jacobian(lon, lat, radial));
    if (!log_det) {
        throw DomainError(latitude_.name(), lat, "sky embedding is singular at the pole");
    }
    return *log_det;
}

double SkyPair::forward_into(const Point& physical, Point& transformed) const {
    const double lon = value_of(physical, longitude_.name());
    const double lat = value_of(physical, latitude_.name());
    check_domain(longitude_, lon);
    check_domain(latitude_, lat);
    const double r = radial_component(physical, radial_name());

    const double cb = std::cos(lat);
    const double sb = std::sin(lat);
    const double planar = r * (convention_ == SkyConvention::RaDec ? cb : sb);
    const auto& out = output_parameters();
    transformed[out[0]] = planar * std::cos(lon);
    transformed[out[1]] = planar * std::sin(lon);
    transformed[out[2]] = r * (convention_ == SkyConvention::RaDec ? sb : cb);
    return log_volume(lon, lat, r);
}

double SkyPair::inverse_into(const Point& transformed, Point& physical) const {
    const auto& out = output_parameters();
    const double x = finite_component(transformed, out[0]);
    const double y = finite_component(transformed, out[1]);
    const double z = finite_component(transformed, out[2]);
    const double r = std::hypot(x, y, z);
    if (r < MIN_EMBEDDING_RADIUS) {
        throw DomainError(latitude_.name(), 0.0, "embedding point at the origin has no direction");
    }

    // atan2 of the planar radius stays accurate at the poles.
    const double planar = std::hypot(x, y);
    const double lon = TransformMath::wrap(std::atan2(y, x), *longitude_.lower(), TWO_PI);
    const double lat = convention_ == SkyConvention::RaDec ? std::atan2(z, planar)
                                                           : std::atan2(planar, z);
    check_domain(latitude_, lat);
    check_domain(longitude_, lon);

    physical[longitude_.name()] = lon;
    physical[latitude_.name()] = lat;
    physical[radial_name()] = r;
    return checked_jacobian(-log_volume(lon, lat, r), latitude_.name(), lat);
}

double SkyPair::log_prior_auxiliary(const Point& physical) const {
    return log_radial_prior(physical, radial_name(), 3);
}

void SkyPair::draw_auxiliary(Point& physical, std::mt19937_64& rng) const {
    draw_radial(physical, radial_name(), 3, rng);
}

} // namespace gwreparam
