#pragma once

/// @file include/gwreparam/reparameterisation.hpp
/// @brief Reparameterisation — polymorphic, Jacobian-tracking transform over
///        a subset of parameters.
///
/// # Module: Reparameterisation
///
/// ## Responsibility
/// Map the values of its `input_parameters` (physical space) to its
/// `output_parameters` (transformed space) and back, reporting log|det J| of
/// each map. A transform may read `required_parameters`: physical parameters
/// it does not consume (the delta-phase transform reads `psi`, `theta_jn`).
///
/// Embeddings add `auxiliary_parameters` to physical space: coordinates such
/// as the radius of a point on the circle, which make the map a bijection
/// between spaces of equal dimension. They are inputs like any other but are
/// not prior parameters of the model; each carries its own prior
/// (`log_prior_auxiliary`) and is drawn from it when a point lacks it
/// (`draw_auxiliary`).
///
/// ## Guarantees
/// - Forward is pure; so is inverse, except for transforms that choose a
///   discrete mode at random (LisaExtrinsicSymmetry without a mode index)
/// - log_jacobian(forward(x)) = −log_jacobian(inverse(forward(x)))
/// - Out-of-domain inputs and non-finite Jacobians raise DomainError
/// - Fitted transforms never change in place; `refit` returns a new instance
///
/// ## NOT Responsible For
/// - Ordering transforms or checking coverage (see CompositeReparameterisation)

#include "gwreparam/parameter.hpp"
#include "gwreparam/types.hpp"

#include <memory>
#include <random>
#include <span>
#include <string_view>

namespace gwreparam {

class Reparameterisation {
public:
    virtual ~Reparameterisation() = default;

    Reparameterisation(const Reparameterisation&) = default;
    Reparameterisation& operator=(const Reparameterisation&) = delete;

    // ── Standalone maps ──────────────────────────────────────────────────────

    /// Map a physical point. Inputs are replaced by outputs; every other
    /// entry of `physical` is passed through untouched.
    ///
    /// # Throws
    /// DomainError if an input is missing or out of domain, or the Jacobian
    /// is not finite.
    [[nodiscard]] TransformResult forward(const Point& physical) const;

    /// Map a transformed point back. Outputs are replaced by inputs; other
    /// entries (including required physical parameters) pass through.
    [[nodiscard]] TransformResult inverse(const Point& transformed) const;

    // ── Composable maps ──────────────────────────────────────────────────────

    /// Read inputs and requirements from `physical`, write outputs into
    /// `transformed`. Returns the forward log-Jacobian.
    virtual double forward_into(const Point& physical, Point& transformed) const = 0;

    /// Read outputs from `transformed` and requirements from `physical`,
    /// write inputs into `physical`. Returns the inverse log-Jacobian.
    virtual double inverse_into(const Point& transformed, Point& physical) const = 0;

    // ── Introspection ────────────────────────────────────────────────────────

    [[nodiscard]] virtual std::string_view kind() const noexcept = 0;

    [[nodiscard]] const ParameterNames& input_parameters() const noexcept { return inputs_; }
    [[nodiscard]] const ParameterNames& output_parameters() const noexcept { return outputs_; }
    [[nodiscard]] const ParameterNames& required_parameters() const noexcept { return required_; }
    [[nodiscard]] const ParameterNames& auxiliary_parameters() const noexcept { return auxiliary_; }

    /// Log prior density of the auxiliary coordinates in `physical`
    /// (0 without any).
    ///
    /// # Throws
    /// DomainError if an auxiliary coordinate is missing or out of domain.
    [[nodiscard]] virtual double log_prior_auxiliary(const Point& physical) const;

    /// Draw each auxiliary coordinate missing from `physical` from its
    /// prior. Coordinates already present are kept.
    virtual void draw_auxiliary(Point& physical, std::mt19937_64& rng) const;

    /// True for transforms whose state is re-fitted from live points.
    [[nodiscard]] virtual bool is_fitted() const noexcept { return false; }

    /// Return a copy re-fitted to `live_points` (physical space), or nullptr
    /// when the transform has no fitted state.
    [[nodiscard]] virtual std::shared_ptr<const Reparameterisation>
    refit(std::span<const Point> live_points) const;

protected:
    /// Every name in `auxiliary` must also appear in `inputs`.
    Reparameterisation(ParameterNames inputs,
                       ParameterNames outputs,
                       ParameterNames required = {},
                       ParameterNames auxiliary = {});

    /// Throw DomainError for `parameter` unless `log_jacobian` is finite.
    static double checked_jacobian(double log_jacobian,
                                   const std::string& parameter,
                                   double value);

    /// Throw DomainError unless `descriptor.contains(value)`.
    static void check_domain(const ParameterDescriptor& descriptor, double value);

private:
    ParameterNames inputs_;
    ParameterNames outputs_;
    ParameterNames required_;
    ParameterNames auxiliary_;
};

using ReparameterisationPtr = std::shared_ptr<const Reparameterisation>;

// ─── Identity ─────────────────────────────────────────────────────────────────

/// x → x. Domain checked against the descriptor; log|J| = 0.
class Identity final : public Reparameterisation {
public:
    explicit Identity(ParameterDescriptor parameter);

    double forward_into(const Point& physical, Point& transformed) const override;
    double inverse_into(const Point& transformed, Point& physical) const override;

    [[nodiscard]] std::string_view kind() const noexcept override { return "identity"; }

private:
    ParameterDescriptor parameter_;
};

} // namespace gwreparam
