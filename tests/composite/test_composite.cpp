#include <gtest/gtest.h>
#include "gwreparam/angles.hpp"
#include "gwreparam/bounded.hpp"
#include "gwreparam/composite.hpp"
#include "gwreparam/constants.hpp"
#include "gwreparam/errors.hpp"
#include "gwreparam/phase.hpp"
#include <cmath>
#include <memory>
#include <random>
#include <vector>

using namespace gwreparam;
using namespace gwreparam::constants;

namespace {

const ParameterDescriptor X     = ParameterDescriptor::linear("x");
const ParameterDescriptor Y     = ParameterDescriptor::bounded("y", 0.0, 1.0);
const ParameterDescriptor PHASE = ParameterDescriptor::periodic("phase", 0.0, TWO_PI);
const ParameterDescriptor PSI   = ParameterDescriptor::periodic("psi", 0.0, PI);
const ParameterDescriptor THETA = ParameterDescriptor::bounded("theta_jn", 0.0, PI);

CompositeReparameterisation identity_logit() {
    return CompositeReparameterisation({X, Y}, {std::make_shared<Identity>(X),
                                                std::make_shared<Logit>(Y)});
}

} // namespace

// ─── Maps ─────────────────────────────────────────────────────────────────────

TEST(Composite_Forward, EmitsOnlyTransformedNamesAndSumsJacobians) {
    const auto c = identity_logit();
    const auto r = c.forward({{"x", 2.0}, {"y", 0.5}, {"extra", 9.0}});
    EXPECT_EQ(r.point.size(), 2u);
    EXPECT_DOUBLE_EQ(r.point.at("x"), 2.0);
    EXPECT_NEAR(r.point.at("y_prime"), 0.0, 1e-15);
    EXPECT_NEAR(r.log_jacobian, std::log(4.0), 1e-14);
}

TEST(Composite_Inverse, RestoresPhysicalPoint) {
    const auto c = identity_logit();
    const auto r = c.inverse({{"x", 2.0}, {"y_prime", 0.0}});
    EXPECT_EQ(r.point.size(), 2u);
    EXPECT_DOUBLE_EQ(r.point.at("x"), 2.0);
    EXPECT_NEAR(r.point.at("y"), 0.5, 1e-15);
    EXPECT_NEAR(r.log_jacobian, -std::log(4.0), 1e-14);
}

TEST(Composite_Inverse, BadTransformedValue_ThrowsAndStaysUsable) {
    const auto c = identity_logit();
    EXPECT_THROW((void)c.inverse({{"x", 2.0}, {"y_prime", INFINITY}}), DomainError);
    EXPECT_THROW((void)c.inverse({{"x", 2.0}}), DomainError);
    EXPECT_NEAR(c.inverse({{"x", 2.0}, {"y_prime", 0.0}}).point.at("y"), 0.5, 1e-15);
}

TEST(Composite_Forward, JacobianIsSumOfParts) {
    const auto sky = std::make_shared<SkyPair>(
        ParameterDescriptor::periodic("ra", 0.0, TWO_PI),
        ParameterDescriptor::bounded("dec", -HALF_PI, HALF_PI));
    const auto logit = std::make_shared<Logit>(Y);
    const CompositeReparameterisation c(
        {ParameterDescriptor::periodic("ra", 0.0, TWO_PI),
         ParameterDescriptor::bounded("dec", -HALF_PI, HALF_PI), Y},
        {sky, logit});
    const Point p = {{"ra", 1.0}, {"dec", 0.3}, {"ra_dec_radial", 1.0}, {"y", 0.2}};
    const double expected = sky->forward(p).log_jacobian + logit->forward(p).log_jacobian;
    EXPECT_NEAR(c.forward(p).log_jacobian, expected, 1e-14);
    EXPECT_NEAR(c.forward(p).log_jacobian, std::log(std::cos(0.3)) - std::log(0.2 * 0.8), 1e-12);
}

TEST(Composite_Names, PhysicalAndTransformedInOrder) {
    const auto c = identity_logit();
    EXPECT_EQ(c.physical_names(), (ParameterNames{"x", "y"}));
    EXPECT_EQ(c.transformed_names(), (ParameterNames{"x", "y_prime"}));
    EXPECT_EQ(c.parameters().size(), 2u);
}

// ─── Auxiliary coordinates ────────────────────────────────────────────────────

TEST(Composite_Auxiliary, RadialCoordinatesListedAndRoundTrip) {
    const CompositeReparameterisation c({PSI, Y}, {std::make_shared<Angle>(PSI),
                                                   std::make_shared<Logit>(Y)});
    EXPECT_EQ(c.physical_names(), (ParameterNames{"psi", "y"}));
    EXPECT_EQ(c.auxiliary_names(), (ParameterNames{"psi_radial"}));

    const Point p = {{"psi", 2.0}, {"psi_radial", 0.7}, {"y", 0.4}};
    const auto f = c.forward(p);
    const auto b = c.inverse(f.point);
    ASSERT_EQ(b.point.size(), 3u);
    EXPECT_NEAR(b.point.at("psi_radial"), 0.7, 1e-14);
    EXPECT_NEAR(f.log_jacobian + b.log_jacobian, 0.0, 1e-13);
}

TEST(Composite_Auxiliary, MissingRadial_ForwardThrowsUntilCompleted) {
    const CompositeReparameterisation c({PSI}, {std::make_shared<Angle>(PSI)});
    const Point p = {{"psi", 2.0}};
    EXPECT_THROW((void)c.forward(p), DomainError);
    EXPECT_THROW((void)c.log_prior_auxiliary(p), DomainError);

    std::mt19937_64 rng(9);
    const Point completed = c.complete(p, rng);
    EXPECT_EQ(completed.at("psi"), 2.0);
    const double r = completed.at("psi_radial");
    EXPECT_NEAR(c.log_prior_auxiliary(completed), std::log(r) - 0.5 * r * r, 1e-14);
    EXPECT_NO_THROW((void)c.forward(completed));
}

TEST(Composite_Auxiliary, NameShadowingPhysicalParameter_Throws) {
    const auto radial = ParameterDescriptor::linear("psi_radial");
    EXPECT_THROW(CompositeReparameterisation({PSI, radial}, {std::make_shared<Angle>(PSI),
                                                             std::make_shared<Identity>(radial)}),
                 ConfigurationError);
}

TEST(Composite_Auxiliary, NoEmbeddings_PriorIsZero) {
    EXPECT_TRUE(identity_logit().auxiliary_names().empty());
    EXPECT_EQ(identity_logit().log_prior_auxiliary({{"x", 1.0}, {"y", 0.5}}), 0.0);
}

// ─── Coverage validation ──────────────────────────────────────────────────────

TEST(Composite_Coverage, MissingParameter_Throws) {
    EXPECT_THROW(CompositeReparameterisation({X, Y}, {std::make_shared<Identity>(X)}),
                 ConfigurationError);
}

TEST(Composite_Coverage, ParameterClaimedTwice_Throws) {
    EXPECT_THROW(CompositeReparameterisation({X}, {std::make_shared<Identity>(X),
                                                   std::make_shared<Identity>(X)}),
                 ConfigurationError);
}

TEST(Composite_Coverage, UnknownParameter_Throws) {
    EXPECT_THROW(CompositeReparameterisation(
                     {X}, {std::make_shared<Identity>(X),
                           std::make_shared<Identity>(ParameterDescriptor::linear("z"))}),
                 ConfigurationError);
}

TEST(Composite_Coverage, NullTransformOrNoParameters_Throws) {
    EXPECT_THROW(CompositeReparameterisation({X}, {nullptr}), ConfigurationError);
    EXPECT_THROW(CompositeReparameterisation({}, {}), ConfigurationError);
}

TEST(Composite_Coverage, DuplicateDeclaration_Throws) {
    EXPECT_THROW(CompositeReparameterisation({X, X}, {std::make_shared<Identity>(X)}),
                 ConfigurationError);
}

TEST(Composite_Coverage, DuplicateOutput_Throws) {
    const auto a = ParameterDescriptor::bounded("a", 0.0, 1.0);
    const auto a_prime = ParameterDescriptor::linear("a_prime");
    EXPECT_THROW(CompositeReparameterisation({a, a_prime},
                                             {std::make_shared<RescaleToBounds>(a),
                                              std::make_shared<Identity>(a_prime)}),
                 ConfigurationError);
}

// ─── Dependency ordering ──────────────────────────────────────────────────────

TEST(Composite_Order, RequirerRunsFirstInForwardOrder) {
    const CompositeReparameterisation c(
        {PHASE, PSI, THETA},
        {std::make_shared<Angle>(PSI), std::make_shared<SineAngle>(THETA),
         std::make_shared<DeltaPhase>(PHASE)});
    ASSERT_EQ(c.transforms().size(), 3u);
    EXPECT_EQ(c.transforms()[0]->kind(), "delta-phase");
    EXPECT_EQ(c.transforms()[1]->kind(), "angle");
    EXPECT_EQ(c.transforms()[2]->kind(), "angle-sine");

    const Point p = {{"phase", 1.0}, {"psi", 0.5}, {"psi_radial", 1.3}, {"theta_jn", 2.0}};
    const auto f = c.forward(p);
    EXPECT_NEAR(f.point.at("delta_phase"), 0.5, 1e-15);
    const auto b = c.inverse(f.point);
    EXPECT_NEAR(b.point.at("phase"), 1.0, 1e-12);
    EXPECT_NEAR(b.point.at("psi"), 0.5, 1e-12);
    EXPECT_NEAR(b.point.at("theta_jn"), 2.0, 1e-12);
    EXPECT_NEAR(f.log_jacobian + b.log_jacobian, 0.0, 1e-12);
}

TEST(Composite_Order, IndependentTransformsKeepGivenOrder) {
    const CompositeReparameterisation c({Y, X}, {std::make_shared<Logit>(Y),
                                                 std::make_shared<Identity>(X)});
    EXPECT_EQ(c.transforms()[0]->kind(), "logit");
    EXPECT_EQ(c.transforms()[1]->kind(), "identity");
}

TEST(Composite_Order, RequirementNotPhysical_Throws) {
    EXPECT_THROW(CompositeReparameterisation({PHASE, PSI}, {std::make_shared<Angle>(PSI),
                                                            std::make_shared<DeltaPhase>(PHASE)}),
                 ConfigurationError);
}

TEST(Composite_Order, RequirementConsumedBySelf_Throws) {
    const auto p = ParameterDescriptor::periodic("p", 0.0, TWO_PI);
    EXPECT_THROW(CompositeReparameterisation({p, THETA},
                                             {std::make_shared<DeltaPhase>(p, "p"),
                                              std::make_shared<SineAngle>(THETA)}),
                 ConfigurationError);
}

TEST(Composite_Order, CyclicRequirements_Throw) {
    const auto a = ParameterDescriptor::periodic("a", 0.0, TWO_PI);
    const auto b = ParameterDescriptor::periodic("b", 0.0, TWO_PI);
    const auto c = ParameterDescriptor::linear("c");
    EXPECT_THROW(CompositeReparameterisation(
                     {a, b, c},
                     {std::make_shared<DeltaPhase>(a, "b", "c", "a_dp"),
                      std::make_shared<DeltaPhase>(b, "a", "c", "b_dp"),
                      std::make_shared<Identity>(c)}),
                 ConfigurationError);
}

// ─── Refit ────────────────────────────────────────────────────────────────────

TEST(Composite_Refit, ReturnsNewCompositeAndLeavesOriginal) {
    const auto t = ParameterDescriptor::bounded("geocent_time", -1.0, 1.0);
    const CompositeReparameterisation c({X, t}, {std::make_shared<Identity>(X),
                                                 std::make_shared<RescaleToBounds>(t, true)});
    EXPECT_TRUE(c.has_fitted());
    const std::vector<Point> live = {{{"x", 0.0}, {"geocent_time", 0.0}},
                                     {{"x", 1.0}, {"geocent_time", 0.5}}};
    const auto refitted = c.refit(live);
    const Point p = {{"x", 0.0}, {"geocent_time", 0.25}};
    EXPECT_NEAR(refitted.forward(p).point.at("geocent_time_prime"), 0.0, 1e-15);
    EXPECT_NEAR(c.forward(p).point.at("geocent_time_prime"), 0.25, 1e-15);
    // The unfitted identity is shared, not copied.
    EXPECT_EQ(refitted.transforms()[0], c.transforms()[0]);
}

TEST(Composite_Refit, NothingFitted_HasFittedIsFalse) {
    EXPECT_FALSE(identity_logit().has_fitted());
}
