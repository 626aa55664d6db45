/// @file src/proposal/gaussian_proposal.cpp
/// @brief Multivariate normal base proposal.

#include "gwreparam/gaussian_proposal.hpp"
#include "gwreparam/errors.hpp"
#include "gwreparam/point.hpp"

#include <fmt/format.h>

#include <cmath>
#include <utility>

namespace gwreparam {

GaussianProposal::GaussianProposal(std::uint64_t seed, double scale)
    : scale_(scale), rng_(seed) {
    if (!std::isfinite(scale_) || scale_ <= 0.0) {
        throw ConfigurationError(
            fmt::format("Gaussian proposal scale must be finite and positive, got {}", scale_));
    }
}

GaussianProposal::GaussianProposal(ParameterNames names,
                                   Eigen::VectorXd mean,
                                   Eigen::MatrixXd covariance,
                                   std::uint64_t seed)
    : scale_(1.0), rng_(seed) {
    set_moments(std::move(names), std::move(mean), covariance);
}

void GaussianProposal::set_moments(ParameterNames names,
                                   Eigen::VectorXd mean,
                                   const Eigen::MatrixXd& covariance) {
    const auto d = static_cast<Eigen::Index>(names.size());
    if (d == 0 || mean.size() != d || covariance.rows() != d || covariance.cols() != d) {
        throw ConfigurationError(
            fmt::format("Gaussian proposal moments do not match {} dimensions", names.size()));
    }
    Eigen::LLT<Eigen::MatrixXd> llt(covariance);
    if (llt.info() != Eigen::Success) {
        throw ConfigurationError("Gaussian proposal covariance is not positive definite");
    }
    const double log_det = 2.0 * llt.matrixLLT().diagonal().array().log().sum();

    names_ = std::move(names);
    mean_ = std::move(mean);
    llt_ = std::move(llt);
    log_norm_ = -0.5 * log_det - static_cast<double>(d) * constants::LOG_SQRT_TWO_PI;
}

// ─── BaseProposal ─────────────────────────────────────────────────────────────

std::vector<Point> GaussianProposal::sample_transformed(std::size_t n) {
    if (!is_fitted()) {
        throw Error("Gaussian proposal sampled before fit");
    }
    std::normal_distribution<double> normal(0.0, 1.0);
    const Eigen::MatrixXd l = llt_.matrixL();
    std::vector<Point> out;
    out.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
        Eigen::VectorXd z(mean_.size());
        for (Eigen::Index j = 0; j < z.size(); ++j) {
            z(j) = normal(rng_);
        }
        out.push_back(to_point(mean_ + l * z, names_));
    }
    return out;
}

double GaussianProposal::log_prob_transformed(const Point& point) const {
    if (!is_fitted()) {
        throw Error("Gaussian proposal evaluated before fit");
    }
    const Eigen::VectorXd diff = to_vector(point, names_) - mean_;
    const Eigen::VectorXd w = llt_.matrixL().solve(diff);
    return log_norm_ - 0.5 * w.squaredNorm();
}

void GaussianProposal::fit(std::span<const Point> points) {
    if (points.empty()) {
        throw ConfigurationError("Gaussian proposal cannot be fitted to zero points");
    }
    ParameterNames names = names_of(points.front());
    const Eigen::MatrixXd x = to_matrix(points, names);
    const auto n = static_cast<double>(x.rows());
    const Eigen::Index d = x.cols();

    Eigen::VectorXd mean = x.colwise().mean().transpose();
    Eigen::MatrixXd cov = Eigen::MatrixXd::Zero(d, d);
    if (x.rows() > 1) {
        const Eigen::MatrixXd centred = x.rowwise() - mean.transpose();
        cov = centred.transpose() * centred / (n - 1.0);
    }
    cov *= scale_ * scale_;
    cov.diagonal().array() += constants::COVARIANCE_JITTER;
    set_moments(std::move(names), std::move(mean), cov);
}

Eigen::MatrixXd GaussianProposal::covariance() const {
    if (!is_fitted()) {
        return {};
    }
    return llt_.reconstructedMatrix();
}

} // namespace gwreparam
