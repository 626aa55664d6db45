/// @file src/reparam/transform_math.cpp
/// @brief Numeric kernels shared by the reparameterisations.

#include "transform_math.hpp"

#include "gwreparam/constants.hpp"

#include <Eigen/LU>

#include <algorithm>
#include <cmath>
#include <limits>

namespace gwreparam::detail {

// ─── Logistic pair ────────────────────────────────────────────────────────────

std::optional<double> TransformMath::logit(double s) noexcept {
    if (!std::isfinite(s) || s <= 0.0 || s >= 1.0) {
        return std::nullopt;
    }
    const double y = std::log(s) - std::log1p(-s);
    if (!std::isfinite(y)) {
        return std::nullopt;
    }
    return y;
}

double TransformMath::sigmoid(double y) noexcept {
    // Branch on sign so exp() never overflows.
    if (y >= 0.0) {
        return 1.0 / (1.0 + std::exp(-y));
    }
    const double e = std::exp(y);
    return e / (1.0 + e);
}

double TransformMath::log_sigmoid(double y) noexcept {
    if (y >= 0.0) {
        return -std::log1p(std::exp(-y));
    }
    return y - std::log1p(std::exp(y));
}

// ─── Folding & wrapping ───────────────────────────────────────────────────────

double TransformMath::fold_unit(double v) noexcept {
    // Period-2 triangle wave: |v| mod 2, then mirror the (1, 2) half.
    const double r = std::fmod(std::abs(v), 2.0);
    return r > 1.0 ? 2.0 - r : r;
}

double TransformMath::wrap(double x, double lower, double period) noexcept {
    double r = std::fmod(x - lower, period);
    if (r < 0.0) {
        r += period;
    }
    // fmod can return `period` itself after the correction for tiny negatives.
    if (r >= period) {
        r = 0.0;
    }
    return lower + r;
}

// ─── Determinants ─────────────────────────────────────────────────────────────

std::optional<double>
TransformMath::log_abs_det(const JacobianMatrix& jacobian) noexcept {
    if (jacobian.size() == 0 || !jacobian.allFinite() ||
        jacobian.rows() != jacobian.cols()) {
        return std::nullopt;
    }

    Eigen::FullPivLU<JacobianMatrix> lu(jacobian);
    const double det = std::abs(lu.determinant());
    if (!(det > 0.0) || !std::isfinite(det)) {
        return std::nullopt;
    }
    const double log_det = std::log(det);
    if (!std::isfinite(log_det)) {
        return std::nullopt;
    }
    return log_det;
}

// ─── Reductions ───────────────────────────────────────────────────────────────

double TransformMath::log_sum_exp(std::span<const double> values) noexcept {
    if (values.empty()) {
        return -std::numeric_limits<double>::infinity();
    }
    const double m = *std::max_element(values.begin(), values.end());
    if (!std::isfinite(m)) {
        return m;
    }
    double acc = 0.0;
    for (double v : values) {
        acc += std::exp(v - m);
    }
    return m + std::log(acc);
}

double TransformMath::log_standard_normal(std::span<const double> values) noexcept {
    double acc = 0.0;
    for (double v : values) {
        acc += -0.5 * v * v - constants::LOG_SQRT_TWO_PI;
    }
    return acc;
}

// ─── Radial prior ─────────────────────────────────────────────────────────────

double TransformMath::log_chi(double r, int dof) noexcept {
    if (!std::isfinite(r) || !(r > 0.0) || dof < 1) {
        return -std::numeric_limits<double>::infinity();
    }
    const double k = static_cast<double>(dof);
    return (k - 1.0) * std::log(r) - 0.5 * r * r
         - (0.5 * k - 1.0) * std::log(2.0) - std::lgamma(0.5 * k);
}

} // namespace gwreparam::detail
