#pragma once

/// @file include/gwreparam/distance.hpp
/// @brief Distance — maps a luminosity distance to its power-law prior CDF.
///
/// # Module: Distance Transform
///
/// For a prior p(d) ∝ d^α on [d_min, d_max] the map
///
///   u(d) = (d^(α+1) − d_min^(α+1)) / (d_max^(α+1) − d_min^(α+1))   (α ≠ −1)
///   u(d) = log(d / d_min) / log(d_max / d_min)                       (α = −1)
///
/// sends the prior to Uniform[0, 1]. α = 2 (uniform in Euclidean volume) is
/// the default. The output stays on [0, 1] rather than being rescaled to
/// [−1, 1]; an extra affine step would only cost precision near d_min.
///
/// ## Guarantees
/// - Forward rejects distances outside [d_min, d_max] with DomainError
/// - Inverse mirrors u back across the reflecting bounds (upper by default)
///   before mapping, so a base proposal may spill past u = 1
/// - log|J| = log du/dd; forward and inverse cancel exactly

#include "gwreparam/bounded.hpp"
#include "gwreparam/constants.hpp"
#include "gwreparam/reparameterisation.hpp"

#include <optional>

namespace gwreparam {

class Distance final : public Reparameterisation {
public:
    /// # Arguments
    /// * `parameter` — bounded distance descriptor, d_min ≥ 0
    /// * `power`     — prior power α
    /// * `reflect`   — bounds of u mirrored on inverse; nullopt disables
    ///
    /// # Throws
    /// ConfigurationError if the parameter is unbounded, d_min < 0, or
    /// α ≤ −1 with d_min = 0 (the CDF is not normalisable).
    explicit Distance(ParameterDescriptor parameter,
                      double power = constants::DEFAULT_DISTANCE_POWER,
                      std::optional<ReflectBoundaries> reflect = ReflectBoundaries::Upper);

    double forward_into(const Point& physical, Point& transformed) const override;
    double inverse_into(const Point& transformed, Point& physical) const override;

    [[nodiscard]] std::string_view kind() const noexcept override { return "distance"; }

    [[nodiscard]] double power() const noexcept { return power_; }

    /// Prior CDF u(d). Precondition: d ∈ [d_min, d_max].
    [[nodiscard]] double to_uniform(double d) const noexcept;

    /// Inverse CDF d(u). Precondition: u ∈ [0, 1].
    [[nodiscard]] double from_uniform(double u) const noexcept;

    /// log du/dd at d.
    [[nodiscard]] double log_density(double d) const noexcept;

private:
    [[nodiscard]] bool logarithmic() const noexcept;

    ParameterDescriptor              parameter_;
    double                           power_;
    std::optional<ReflectBoundaries> reflect_;
    double                           d_min_;
    double                           d_max_;
    double                           norm_;  ///< d_max^(α+1) − d_min^(α+1), or log(d_max/d_min)
};

} // namespace gwreparam
