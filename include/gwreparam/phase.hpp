#pragma once

/// @file include/gwreparam/phase.hpp
/// @brief DeltaPhase — replaces the orbital phase by the combination that
///        is well measured for quadrupole-dominated signals.
///
/// `delta_phase = phase + sign(cos θ_jn) · ψ`. The map has unit Jacobian.
/// It reads ψ and θ_jn without consuming them, so the composite must
/// reconstruct both before inverting this transform.

#include "gwreparam/reparameterisation.hpp"

#include <string>

namespace gwreparam {

class DeltaPhase final : public Reparameterisation {
public:
    /// # Throws
    /// ConfigurationError if the phase is not bounded with a width of 2π.
    explicit DeltaPhase(ParameterDescriptor phase,
                        std::string psi = "psi",
                        std::string theta_jn = "theta_jn",
                        std::string output = "delta_phase");

    double forward_into(const Point& physical, Point& transformed) const override;

    /// phase = (delta_phase − sign(cos θ_jn) · ψ) wrapped into [l, l + 2π).
    double inverse_into(const Point& transformed, Point& physical) const override;

    [[nodiscard]] std::string_view kind() const noexcept override { return "delta-phase"; }

private:
    [[nodiscard]] double shift(const Point& physical) const;

    ParameterDescriptor phase_;
    std::string         psi_;
    std::string         theta_jn_;
};

} // namespace gwreparam
