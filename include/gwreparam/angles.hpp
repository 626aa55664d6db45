#pragma once

/// @file include/gwreparam/angles.hpp
/// @brief Angular transforms: periodic angles, sine-distributed polar angles
///        and joint sky-position pairs.
///
/// # Module: Angle Transforms
///
/// ## Responsibility
/// - Angle:     periodic θ ∈ [l, u) with radius r → (θ_x, θ_y) = r(cos φ, sin φ)
/// - SineAngle: polar θ ∈ [l, u] ⊆ [0, π] → cos θ
/// - SkyPair:   (longitude, latitude, r) → r times a point on the unit sphere
///
/// ## Radial coordinates
/// A periodic angle alone has nowhere to go in the plane except the unit
/// circle, and a base proposal drawing in the whole plane puts no mass
/// there. The embeddings therefore carry a radius as an auxiliary physical
/// coordinate (`<θ>_radial`, `<lon>_<lat>_radial`) with a χ_k prior, k being
/// the dimension of the embedding space. The map is then a bijection onto
/// ℝ^k minus the origin, and a standard normal in ℝ^k corresponds exactly to
/// a uniform angle (or isotropic sky) times χ_k in the radius.
///
/// ## Guarantees
/// - Forward and inverse log-Jacobians cancel exactly
/// - The inverse of an embedding rejects the origin (no defined angle)
///   with DomainError; forward rejects a radius that is not positive
/// - SkyPair computes its Jacobian from the joint 3×3 matrix, never from
///   per-coordinate marginals

#include "gwreparam/reparameterisation.hpp"

namespace gwreparam {

// ─── Angle ────────────────────────────────────────────────────────────────────

/// (θ, r) → (`<θ>_x`, `<θ>_y`) = r(cos φ, sin φ), φ = 2π(θ − l)/(u − l).
/// log|J| = log r + log(2π/(u − l)); r ~ χ₂ a priori.
class Angle final : public Reparameterisation {
public:
    /// # Throws
    /// ConfigurationError if `parameter` is not bounded.
    explicit Angle(ParameterDescriptor parameter);

    double forward_into(const Point& physical, Point& transformed) const override;
    double inverse_into(const Point& transformed, Point& physical) const override;

    [[nodiscard]] std::string_view kind() const noexcept override { return "angle"; }

    double log_prior_auxiliary(const Point& physical) const override;
    void draw_auxiliary(Point& physical, std::mt19937_64& rng) const override;

    [[nodiscard]] const std::string& radial_name() const noexcept {
        return auxiliary_parameters().front();
    }

private:
    ParameterDescriptor parameter_;
};

// ─── SineAngle ────────────────────────────────────────────────────────────────

/// θ → `cos_<θ>`; log|J| = log sin θ. Intended for angles with a sin θ prior
/// (inclinations, tilts), which map to a uniform density on [−1, 1].
class SineAngle final : public Reparameterisation {
public:
    /// # Throws
    /// ConfigurationError if the bounds do not lie within [0, π].
    explicit SineAngle(ParameterDescriptor parameter);

    double forward_into(const Point& physical, Point& transformed) const override;
    double inverse_into(const Point& transformed, Point& physical) const override;

    [[nodiscard]] std::string_view kind() const noexcept override { return "angle-sine"; }

private:
    ParameterDescriptor parameter_;
};

// ─── SkyPair ──────────────────────────────────────────────────────────────────

/// Latitude convention of a sky pair.
///   - RaDec: latitude is declination δ ∈ [−π/2, π/2], z = sin δ
///   - AzZen: latitude is zenith ζ ∈ [0, π],           z = cos ζ
enum class SkyConvention {
    RaDec,
    AzZen,
};

[[nodiscard]] const char* to_string(SkyConvention c) noexcept;

/// (lon, lat, r) → (`<lon>_<lat>_x`, `_y`, `_z`) = r·û(lon, lat), where û is
/// the unit vector of the convention. r ~ χ₃ a priori.
class SkyPair final : public Reparameterisation {
public:
    /// # Throws
    /// ConfigurationError if the longitude does not span 2π or the latitude
    /// bounds fall outside the range of `convention`.
    SkyPair(ParameterDescriptor longitude,
            ParameterDescriptor latitude,
            SkyConvention convention = SkyConvention::RaDec);

    double forward_into(const Point& physical, Point& transformed) const override;
    double inverse_into(const Point& transformed, Point& physical) const override;

    [[nodiscard]] std::string_view kind() const noexcept override { return "sky"; }
    [[nodiscard]] SkyConvention convention() const noexcept { return convention_; }

    double log_prior_auxiliary(const Point& physical) const override;
    void draw_auxiliary(Point& physical, std::mt19937_64& rng) const override;

    [[nodiscard]] const std::string& radial_name() const noexcept {
        return auxiliary_parameters().front();
    }

    /// 3×3 Jacobian ∂(x, y, z)/∂(lon, lat, r).
    [[nodiscard]] JacobianMatrix jacobian(double lon, double lat, double radial) const;

private:
    [[nodiscard]] double log_volume(double lon, double lat, double radial) const;

    ParameterDescriptor longitude_;
    ParameterDescriptor latitude_;
    SkyConvention       convention_;
};

} // namespace gwreparam
