#pragma once

/// @file include/gwreparam/gaussian_proposal.hpp
/// @brief GaussianProposal — full-covariance multivariate normal base
///        proposal fitted to transformed live points.
///
/// Reference BaseProposal for hosts without a flow model and for tests. The
/// covariance is the sample covariance of the training points, inflated by
/// `scale²` and regularised with a diagonal jitter before the Cholesky
/// factorisation.

#include "gwreparam/base_proposal.hpp"
#include "gwreparam/constants.hpp"
#include "gwreparam/types.hpp"

#include <Eigen/Cholesky>
#include <Eigen/Dense>

#include <cstdint>
#include <random>

namespace gwreparam {

class GaussianProposal final : public BaseProposal {
public:
    /// Unfitted proposal; `fit` must be called before sampling.
    ///
    /// # Throws
    /// ConfigurationError if `scale` is not finite and positive.
    explicit GaussianProposal(std::uint64_t seed = constants::DEFAULT_SEED, double scale = 1.0);

    /// Proposal with explicit moments.
    ///
    /// # Throws
    /// ConfigurationError on mismatched sizes or a covariance that is not
    /// positive definite.
    GaussianProposal(ParameterNames names,
                     Eigen::VectorXd mean,
                     Eigen::MatrixXd covariance,
                     std::uint64_t seed = constants::DEFAULT_SEED);

    [[nodiscard]] std::vector<Point> sample_transformed(std::size_t n) override;
    [[nodiscard]] double log_prob_transformed(const Point& point) const override;

    /// Fit mean and covariance. Dimensions are the keys of the first point.
    ///
    /// # Throws
    /// ConfigurationError if `points` is empty; DomainError if a point lacks
    /// one of the dimensions.
    void fit(std::span<const Point> points) override;

    [[nodiscard]] bool is_fitted() const noexcept { return !names_.empty(); }
    [[nodiscard]] const ParameterNames& names() const noexcept { return names_; }
    [[nodiscard]] const Eigen::VectorXd& mean() const noexcept { return mean_; }
    [[nodiscard]] Eigen::MatrixXd covariance() const;

private:
    void set_moments(ParameterNames names, Eigen::VectorXd mean, const Eigen::MatrixXd& covariance);

    double                      scale_;
    ParameterNames              names_;
    Eigen::VectorXd             mean_;
    Eigen::LLT<Eigen::MatrixXd> llt_;
    double                      log_norm_ = 0.0;  ///< −½ log det Σ − d log √(2π)
    std::mt19937_64             rng_;
};

} // namespace gwreparam
