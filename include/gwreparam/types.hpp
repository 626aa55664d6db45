#pragma once

/// @file include/gwreparam/types.hpp
/// @brief Shared value types for gwreparam.
///
/// A `Point` is keyed by parameter name rather than position. Transformed
/// space routinely has a different parameter set from physical space (a sky
/// pair becomes three Cartesian coordinates, a phase becomes a delta phase,
/// augmented variants append latent dimensions), so positional vectors would
/// silently misalign.

#include <Eigen/Dense>

#include <map>
#include <string>
#include <vector>

namespace gwreparam {

/// One sample in physical or transformed space: parameter name → value.
using Point = std::map<std::string, double>;

/// Ordered list of parameter names.
using ParameterNames = std::vector<std::string>;

/// Dense Jacobian ∂(outputs)/∂(inputs), rows = outputs, cols = inputs.
using JacobianMatrix = Eigen::MatrixXd;

// ─── TransformResult ──────────────────────────────────────────────────────────

/// Result of mapping a point through a reparameterisation.
struct TransformResult {
    Point  point;         ///< Mapped point
    double log_jacobian;  ///< log|det J| of the map that was applied
};

// ─── Draw ─────────────────────────────────────────────────────────────────────

/// A physical-space candidate returned by a proposal.
struct Draw {
    Point  point;     ///< Candidate in physical space
    double log_prob;  ///< Proposal log-density in physical-space units
};

} // namespace gwreparam
