#pragma once

/// @file src/reparam/transform_math.hpp
/// @brief Scalar and matrix kernels shared by the reparameterisations.
///
/// # Module: Transform Math
///
/// ## Responsibility
/// Pure numeric building blocks: logit/sigmoid pairs, reflective folding,
/// periodic wrapping, log-determinants of Jacobian matrices and log-sum-exp.
///
/// ## Guarantees
/// - All functions are noexcept
/// - Fallible operations return std::optional (empty on non-finite results)
/// - Static methods only, no mutable state
///
/// ## NOT Responsible For
/// - Parameter names, bounds or error reporting (see the reparameterisation
///   classes, which turn an empty optional into a DomainError)

#include "gwreparam/types.hpp"

#include <optional>
#include <span>

namespace gwreparam::detail {

class TransformMath {
public:
    TransformMath() = delete;

    // ── Logistic pair ────────────────────────────────────────────────────────

    /// logit(s) = log(s / (1 − s)).
    ///
    /// # Returns
    /// - `Some(y)` for s ∈ (0, 1)
    /// - `None` for s outside the open interval or non-finite
    [[nodiscard]] static std::optional<double> logit(double s) noexcept;

    /// σ(y) = 1 / (1 + e^−y), evaluated without overflow for large |y|.
    [[nodiscard]] static double sigmoid(double y) noexcept;

    /// log σ(y) = −log(1 + e^−y), stable for large |y|.
    [[nodiscard]] static double log_sigmoid(double y) noexcept;

    // ── Folding & wrapping ───────────────────────────────────────────────────

    /// Triangle-wave fold of v onto [0, 1]: reflect at 0 and at 1 as many
    /// times as needed. Identity on [0, 1]. |d fold / dv| = 1 everywhere it
    /// is differentiable.
    [[nodiscard]] static double fold_unit(double v) noexcept;

    /// Wrap x into [lower, lower + period).
    [[nodiscard]] static double wrap(double x, double lower, double period) noexcept;

    // ── Determinants ─────────────────────────────────────────────────────────

    /// log|det J| for a square Jacobian.
    ///
    /// # Returns
    /// - `Some(log_det)` when the determinant is strictly positive and finite
    /// - `None` for a singular or non-square J, or non-finite input
    [[nodiscard]] static std::optional<double>
    log_abs_det(const JacobianMatrix& jacobian) noexcept;

    // ── Reductions ───────────────────────────────────────────────────────────

    /// log Σ exp(v_i), −∞ for an empty span.
    [[nodiscard]] static double log_sum_exp(std::span<const double> values) noexcept;

    /// Standard-normal log-density of each component, summed.
    [[nodiscard]] static double log_standard_normal(std::span<const double> values) noexcept;

    // ── Radial prior ─────────────────────────────────────────────────────────

    /// Log-density of the chi distribution with `dof` degrees of freedom,
    /// the law of the norm of a `dof`-dimensional standard normal vector:
    ///
    ///   log χ_k(r) = (k − 1) log r − r²/2 − (k/2 − 1) log 2 − log Γ(k/2)
    ///
    /// −∞ for r ≤ 0 or non-finite r.
    [[nodiscard]] static double log_chi(double r, int dof) noexcept;
};

} // namespace gwreparam::detail
