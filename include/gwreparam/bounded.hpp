#pragma once

/// @file include/gwreparam/bounded.hpp
/// @brief Transforms for parameters with hard or reflective bounds.
///
/// # Module: Bounded Transforms
///
/// ## Responsibility
/// - RescaleToBounds: affine map [l, u] → [−1, 1], optionally refitting the
///   rescale interval to the live points on every update
/// - Logit: [l, u] → ℝ via logit((x − l)/(u − l))
/// - Reflective: fold values past the allowed bounds back into [l, u], then
///   map to the unit interval
///
/// ## Guarantees
/// - Non-reflective transforms reject values outside [l, u] with DomainError
/// - Logit rejects the bounds themselves (infinite Jacobian)
/// - The reflective fold has unit absolute derivative; its log-Jacobian
///   correction is exactly 0

#include "gwreparam/reparameterisation.hpp"

#include <optional>

namespace gwreparam {

/// Which bounds of a reflective parameter mirror values back into range.
enum class ReflectBoundaries {
    Lower,
    Upper,
    Both,
};

[[nodiscard]] const char* to_string(ReflectBoundaries b) noexcept;

// ─── RescaleToBounds ──────────────────────────────────────────────────────────

/// `x → x_prime = 2(x − l′)/(u′ − l′) − 1`, where [l′, u′] starts as the
/// prior bounds and, with `update_bounds`, is refitted to the min/max of the
/// live points. log|J| = log(2/(u′ − l′)).
///
/// With an `inversion` side, the inverse mirrors a value that lands past
/// that prior bound back inside it (x → 2u − x at the upper bound). The
/// mirror has unit derivative, so log|J| is unchanged.
class RescaleToBounds final : public Reparameterisation {
public:
    /// # Throws
    /// ConfigurationError if `parameter` is not bounded.
    explicit RescaleToBounds(ParameterDescriptor parameter,
                             bool update_bounds = false,
                             std::optional<ReflectBoundaries> inversion = std::nullopt);

    double forward_into(const Point& physical, Point& transformed) const override;
    double inverse_into(const Point& transformed, Point& physical) const override;

    [[nodiscard]] std::string_view kind() const noexcept override { return "rescale"; }
    [[nodiscard]] bool is_fitted() const noexcept override { return update_bounds_; }

    /// Refit [l′, u′] to the live-point range. Fewer than two distinct live
    /// values leave the current interval in place.
    [[nodiscard]] std::shared_ptr<const Reparameterisation>
    refit(std::span<const Point> live_points) const override;

    [[nodiscard]] double rescale_lower() const noexcept { return lower_; }
    [[nodiscard]] double rescale_upper() const noexcept { return upper_; }
    [[nodiscard]] std::optional<ReflectBoundaries> inversion() const noexcept { return inversion_; }

private:
    ParameterDescriptor              parameter_;
    bool                             update_bounds_;
    std::optional<ReflectBoundaries> inversion_;
    double                           lower_;
    double                           upper_;
};

// ─── Logit ────────────────────────────────────────────────────────────────────

class Logit final : public Reparameterisation {
public:
    /// # Throws
    /// ConfigurationError if `parameter` is not bounded.
    explicit Logit(ParameterDescriptor parameter);

    double forward_into(const Point& physical, Point& transformed) const override;
    double inverse_into(const Point& transformed, Point& physical) const override;

    [[nodiscard]] std::string_view kind() const noexcept override { return "logit"; }

private:
    ParameterDescriptor parameter_;
};

// ─── Reflective ───────────────────────────────────────────────────────────────

/// Fold into [l, u] across the allowed bounds, then `x_prime = (x − l)/(u − l)`.
/// The inverse folds `x_prime` back into [0, 1] the same way, so draws a base
/// proposal places past an allowed bound are mirrored rather than rejected.
class Reflective final : public Reparameterisation {
public:
    /// # Throws
    /// ConfigurationError if `parameter` is not bounded.
    explicit Reflective(ParameterDescriptor parameter,
                        ReflectBoundaries boundaries = ReflectBoundaries::Both);

    double forward_into(const Point& physical, Point& transformed) const override;
    double inverse_into(const Point& transformed, Point& physical) const override;

    [[nodiscard]] std::string_view kind() const noexcept override { return "reflective"; }

    /// Fold `x` into [l, u] across the allowed bounds.
    ///
    /// # Throws
    /// DomainError if `x` is non-finite or lies past a bound that does not
    /// reflect (or folds past it).
    [[nodiscard]] double fold(double x) const;

    [[nodiscard]] ReflectBoundaries boundaries() const noexcept { return boundaries_; }

private:
    /// Fold in unit coordinates; nullopt if the value lands past a
    /// non-reflecting bound.
    [[nodiscard]] std::optional<double> fold_unit(double s) const noexcept;

    ParameterDescriptor parameter_;
    ReflectBoundaries   boundaries_;
};

} // namespace gwreparam
