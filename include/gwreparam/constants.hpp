#pragma once

#include <cstddef>
#include <cstdint>
#include <numbers>

/// @file include/gwreparam/constants.hpp
/// @brief Numerical constants and configuration defaults for gwreparam.

namespace gwreparam::constants {

// ─── Geometry ─────────────────────────────────────────────────────────────────

static constexpr double PI     = std::numbers::pi;
static constexpr double TWO_PI = 2.0 * std::numbers::pi;
static constexpr double HALF_PI = 0.5 * std::numbers::pi;

/// log(√(2π)), normalisation of the standard normal density.
static constexpr double LOG_SQRT_TWO_PI = 0.91893853320467274178;

// ─── Numerical Tolerances ─────────────────────────────────────────────────────

/// Relative tolerance for forward/inverse round trips.
static constexpr double ROUND_TRIP_TOLERANCE = 1e-8;

/// Tolerance used when validating that prior bounds match a required range
/// (e.g. a sky longitude must span 2π).
static constexpr double BOUNDS_MATCH_TOLERANCE = 1e-8;

/// Below this radius a point in the embedding plane/sphere has no defined
/// angle (removable singularity of the polar map).
static constexpr double MIN_EMBEDDING_RADIUS = 1e-300;

/// Diagonal jitter added to fitted covariance matrices.
static constexpr double COVARIANCE_JITTER = 1e-10;

// ─── Proposal Defaults ────────────────────────────────────────────────────────

/// Number of domain failures tolerated by a single `sample` call.
static constexpr std::size_t DEFAULT_RETRY_LIMIT = 100;

/// Default seed for the per-instance random engine.
static constexpr std::uint64_t DEFAULT_SEED = 1234;

/// Power α of the default distance prior p(d) ∝ d^α (uniform in volume).
static constexpr double DEFAULT_DISTANCE_POWER = 2.0;

/// Augmented variant: number of auxiliary latent dimensions.
static constexpr std::size_t DEFAULT_AUGMENT_DIMS = 1;

/// Augmented variant: draws used when marginalising the auxiliary dims.
static constexpr std::size_t DEFAULT_N_MARG = 50;

/// Clustering variant defaults.
static constexpr std::size_t DEFAULT_N_CLUSTERS       = 2;
static constexpr std::size_t DEFAULT_MIN_CLUSTER_SIZE = 10;
static constexpr std::size_t DEFAULT_KMEANS_ITERATIONS = 100;

/// MCMC-refinement defaults.
static constexpr std::size_t DEFAULT_MCMC_STEPS      = 10;
static constexpr double      DEFAULT_MCMC_STEP_SCALE = 0.1;

} // namespace gwreparam::constants
