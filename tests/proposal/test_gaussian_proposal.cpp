#include <gtest/gtest.h>
#include "gwreparam/constants.hpp"
#include "gwreparam/errors.hpp"
#include "gwreparam/gaussian_proposal.hpp"
#include <cmath>
#include <random>
#include <vector>

using namespace gwreparam;
using namespace gwreparam::constants;

// ─── Explicit moments ─────────────────────────────────────────────────────────

TEST(GaussianProposal_Explicit, StandardNormal_LogDensityAtMean) {
    const GaussianProposal g({"x"}, Eigen::VectorXd::Zero(1), Eigen::MatrixXd::Identity(1, 1));
    EXPECT_NEAR(g.log_prob_transformed({{"x", 0.0}}), -LOG_SQRT_TWO_PI, 1e-14);
    EXPECT_NEAR(g.log_prob_transformed({{"x", 2.0}}), -2.0 - LOG_SQRT_TWO_PI, 1e-14);
}

TEST(GaussianProposal_Explicit, DiagonalCovariance_Factorises) {
    Eigen::MatrixXd cov = Eigen::MatrixXd::Zero(2, 2);
    cov(0, 0) = 4.0;
    cov(1, 1) = 0.25;
    Eigen::VectorXd mean(2);
    mean << 1.0, -1.0;
    const GaussianProposal g({"a", "b"}, mean, cov);
    // log N(3; 1, 2²) + log N(-1; -1, 0.5²)
    const double expected = (-0.5 - std::log(2.0) - LOG_SQRT_TWO_PI)
                          + (-std::log(0.5) - LOG_SQRT_TWO_PI);
    EXPECT_NEAR(g.log_prob_transformed({{"a", 3.0}, {"b", -1.0}}), expected, 1e-12);
}

TEST(GaussianProposal_Explicit, InvalidMoments_Throw) {
    Eigen::MatrixXd not_pd(2, 2);
    not_pd << 1.0, 2.0,
              2.0, 1.0;
    EXPECT_THROW((GaussianProposal{{"a", "b"}, Eigen::VectorXd::Zero(2), not_pd}),
                 ConfigurationError);
    EXPECT_THROW((GaussianProposal{{"a"}, Eigen::VectorXd::Zero(2), Eigen::MatrixXd::Identity(2, 2)}),
                 ConfigurationError);
    EXPECT_THROW((GaussianProposal{{}, Eigen::VectorXd(), Eigen::MatrixXd()}), ConfigurationError);
}

TEST(GaussianProposal_Construct, NonPositiveScale_Throws) {
    EXPECT_THROW((GaussianProposal{DEFAULT_SEED, 0.0}), ConfigurationError);
    EXPECT_THROW((GaussianProposal{DEFAULT_SEED, -1.0}), ConfigurationError);
}

// ─── Unfitted ─────────────────────────────────────────────────────────────────

TEST(GaussianProposal_Unfitted, SampleAndLogProb_Throw) {
    GaussianProposal g;
    EXPECT_FALSE(g.is_fitted());
    EXPECT_THROW((void)g.sample_transformed(1), Error);
    EXPECT_THROW((void)g.log_prob_transformed({{"x", 0.0}}), Error);
    EXPECT_EQ(g.covariance().size(), 0);
}

TEST(GaussianProposal_Fit, EmptyInput_Throws) {
    GaussianProposal g;
    EXPECT_THROW(g.fit({}), ConfigurationError);
}

// ─── fit ──────────────────────────────────────────────────────────────────────

TEST(GaussianProposal_Fit, RecoversSampleMoments) {
    std::mt19937_64 rng(21);
    std::normal_distribution<double> n01(0.0, 1.0);
    std::vector<Point> points;
    for (int i = 0; i < 5000; ++i) {
        const double z1 = n01(rng);
        const double z2 = n01(rng);
        points.push_back({{"u", 1.0 + 2.0 * z1}, {"v", -3.0 + 0.5 * z1 + 0.5 * z2}});
    }
    GaussianProposal g;
    g.fit(points);
    ASSERT_TRUE(g.is_fitted());
    EXPECT_EQ(g.names(), (ParameterNames{"u", "v"}));
    EXPECT_NEAR(g.mean()(0), 1.0, 0.1);
    EXPECT_NEAR(g.mean()(1), -3.0, 0.05);
    const Eigen::MatrixXd cov = g.covariance();
    EXPECT_NEAR(cov(0, 0), 4.0, 0.3);
    EXPECT_NEAR(cov(0, 1), 1.0, 0.1);
    EXPECT_NEAR(cov(1, 1), 0.5, 0.05);
}

TEST(GaussianProposal_Fit, ScaleInflatesCovariance) {
    std::vector<Point> points = {{{"x", -1.0}}, {{"x", 1.0}}};
    GaussianProposal g(DEFAULT_SEED, 2.0);
    g.fit(points);
    // Sample variance 2, inflated by 2².
    EXPECT_NEAR(g.covariance()(0, 0), 8.0, 1e-8);
}

TEST(GaussianProposal_Fit, MissingDimension_Throws) {
    std::vector<Point> points = {{{"x", 0.0}, {"y", 1.0}}, {{"x", 1.0}}};
    GaussianProposal g;
    EXPECT_THROW(g.fit(points), DomainError);
}

TEST(GaussianProposal_Sample, DrawsCarryFittedNames) {
    GaussianProposal g({"a", "b"}, Eigen::VectorXd::Zero(2), Eigen::MatrixXd::Identity(2, 2), 5);
    const auto draws = g.sample_transformed(10);
    ASSERT_EQ(draws.size(), 10u);
    for (const auto& p : draws) {
        EXPECT_EQ(p.size(), 2u);
        EXPECT_TRUE(std::isfinite(g.log_prob_transformed(p)));
    }
}
