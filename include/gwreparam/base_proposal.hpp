#pragma once

/// @file include/gwreparam/base_proposal.hpp
/// @brief BaseProposal — the density model wrapped by GWFlowProposal.
///
/// A base proposal lives entirely in transformed space: it is trained on
/// transformed live points, draws transformed candidates and evaluates their
/// log-density. It never sees physical coordinates. In a nested-sampling
/// host this is the normalising flow; GaussianProposal is a reference
/// implementation.
///
/// Implementations own their random state; `sample_transformed` is therefore
/// non-const. Each instance is used by one thread at a time.

#include "gwreparam/types.hpp"

#include <cstddef>
#include <functional>
#include <memory>
#include <span>
#include <vector>

namespace gwreparam {

class BaseProposal {
public:
    virtual ~BaseProposal() = default;

    /// Draw up to `n` points in transformed space. Returning fewer (or none)
    /// is allowed; the wrapper retries.
    [[nodiscard]] virtual std::vector<Point> sample_transformed(std::size_t n) = 0;

    /// log q(x′) of a transformed point.
    [[nodiscard]] virtual double log_prob_transformed(const Point& point) const = 0;

    /// Train on transformed points.
    virtual void fit(std::span<const Point> points) = 0;
};

/// Creates a fresh, untrained base proposal (one per cluster).
using BaseProposalFactory = std::function<std::unique_ptr<BaseProposal>()>;

/// Likelihood constraint evaluated on a physical point: true if the point
/// lies inside the current contour.
using ConstraintPredicate = std::function<bool(const Point&)>;

} // namespace gwreparam
