#include <gtest/gtest.h>
#include "gwreparam/bounded.hpp"
#include "gwreparam/errors.hpp"
#include <cmath>
#include <limits>
#include <vector>

using namespace gwreparam;

namespace {

const ParameterDescriptor UNIT = ParameterDescriptor::bounded("x", 0.0, 1.0);
const ParameterDescriptor TEN  = ParameterDescriptor::bounded("x", 0.0, 10.0);
const ParameterDescriptor TWO  = ParameterDescriptor::reflective("x", 0.0, 2.0);

} // namespace

// ─── Identity ─────────────────────────────────────────────────────────────────

TEST(Identity_Forward, CopiesValueAndKeepsOtherKeys) {
    const Identity t(ParameterDescriptor::linear("x"));
    const auto r = t.forward({{"x", 1.5}, {"other", 3.0}});
    EXPECT_DOUBLE_EQ(r.point.at("x"), 1.5);
    EXPECT_DOUBLE_EQ(r.point.at("other"), 3.0);
    EXPECT_DOUBLE_EQ(r.log_jacobian, 0.0);
    EXPECT_EQ(t.kind(), "identity");
}

TEST(Identity_Forward, BoundedDescriptor_OutsideThrows) {
    const Identity t(UNIT);
    EXPECT_THROW((void)t.forward({{"x", 1.5}}), DomainError);
}

TEST(Identity_Forward, MissingParameter_Throws) {
    const Identity t(UNIT);
    EXPECT_THROW((void)t.forward({{"y", 0.5}}), DomainError);
}

// ─── RescaleToBounds ──────────────────────────────────────────────────────────

TEST(Rescale_Forward, MapsBoundsToMinusOneAndOne) {
    const RescaleToBounds t(TEN);
    EXPECT_NEAR(t.forward({{"x", 0.0}}).point.at("x_prime"), -1.0, 1e-15);
    EXPECT_NEAR(t.forward({{"x", 10.0}}).point.at("x_prime"), 1.0, 1e-15);
    const auto mid = t.forward({{"x", 5.0}});
    EXPECT_NEAR(mid.point.at("x_prime"), 0.0, 1e-15);
    EXPECT_NEAR(mid.log_jacobian, std::log(0.2), 1e-15);
    EXPECT_EQ(mid.point.count("x"), 0u);
}

TEST(Rescale_Inverse, RecoversValueWithOppositeJacobian) {
    const RescaleToBounds t(TEN);
    const auto r = t.inverse({{"x_prime", 0.5}});
    EXPECT_NEAR(r.point.at("x"), 7.5, 1e-14);
    EXPECT_NEAR(r.log_jacobian, std::log(5.0), 1e-15);
}

TEST(Rescale_Domain, OutsideBounds_Throws) {
    const RescaleToBounds t(TEN);
    try {
        (void)t.forward({{"x", 11.0}});
        FAIL() << "expected DomainError";
    } catch (const DomainError& e) {
        EXPECT_EQ(e.parameter(), "x");
        EXPECT_DOUBLE_EQ(e.value(), 11.0);
    }
    EXPECT_THROW((void)t.inverse({{"x_prime", 1.5}}), DomainError);
    EXPECT_THROW((void)t.inverse({{"x_prime", std::numeric_limits<double>::quiet_NaN()}}),
                 DomainError);
}

TEST(Rescale_Construct, UnboundedParameter_Throws) {
    EXPECT_THROW(RescaleToBounds{ParameterDescriptor::linear("x")}, ConfigurationError);
}

TEST(Rescale_Refit, UpdateBounds_UsesLiveRangeAndLeavesOriginal) {
    const RescaleToBounds t(TEN, true);
    EXPECT_TRUE(t.is_fitted());
    const std::vector<Point> live = {{{"x", 2.0}}, {{"x", 4.0}}, {{"x", 6.0}}};
    const auto refitted = t.refit(live);
    ASSERT_NE(refitted, nullptr);
    EXPECT_NEAR(refitted->forward({{"x", 4.0}}).point.at("x_prime"), 0.0, 1e-15);
    EXPECT_NEAR(t.forward({{"x", 4.0}}).point.at("x_prime"), -0.2, 1e-15);
    EXPECT_DOUBLE_EQ(t.rescale_lower(), 0.0);
}

TEST(Rescale_Refit, DegenerateLiveRange_KeepsPriorBounds) {
    const RescaleToBounds t(TEN, true);
    const std::vector<Point> live = {{{"x", 3.0}}, {{"x", 3.0}}};
    const auto refitted = t.refit(live);
    ASSERT_NE(refitted, nullptr);
    EXPECT_NEAR(refitted->forward({{"x", 5.0}}).point.at("x_prime"), 0.0, 1e-15);
}

TEST(Rescale_Refit, WithoutUpdateBounds_ReturnsNull) {
    const RescaleToBounds t(TEN);
    EXPECT_FALSE(t.is_fitted());
    const std::vector<Point> live = {{{"x", 2.0}}, {{"x", 4.0}}};
    EXPECT_EQ(t.refit(live), nullptr);
}

TEST(Rescale_Inversion, UpperOnly_MirrorsPastPriorUpperBound) {
    const RescaleToBounds t(TEN, true, ReflectBoundaries::Upper);
    const std::vector<Point> live = {{{"x", 6.0}}, {{"x", 9.0}}};
    const auto refitted = t.refit(live);
    ASSERT_NE(refitted, nullptr);
    // Inside the prior nothing changes.
    EXPECT_NEAR(refitted->inverse({{"x_prime", 1.0}}).point.at("x"), 9.0, 1e-14);
    // y = 2 lands on 10.5 and is mirrored to 9.5.
    const auto b = refitted->inverse({{"x_prime", 2.0}});
    EXPECT_NEAR(b.point.at("x"), 9.5, 1e-14);
    EXPECT_NEAR(b.log_jacobian, std::log(1.5), 1e-14);
    // y = −6 lands on −1.5: the lower side is not mirrored.
    EXPECT_THROW((void)refitted->inverse({{"x_prime", -6.0}}), DomainError);
}

TEST(Rescale_Inversion, Both_MirrorsEitherSide) {
    const RescaleToBounds t(TEN, true, ReflectBoundaries::Both);
    const std::vector<Point> live = {{{"x", 6.0}}, {{"x", 9.0}}};
    const auto refitted = t.refit(live);
    ASSERT_NE(refitted, nullptr);
    EXPECT_NEAR(refitted->inverse({{"x_prime", -6.0}}).point.at("x"), 1.5, 1e-12);
    EXPECT_NEAR(refitted->inverse({{"x_prime", 2.0}}).point.at("x"), 9.5, 1e-12);
}

TEST(Rescale_Inversion, WithoutInversion_OverflowThrows) {
    const RescaleToBounds t(TEN);
    EXPECT_FALSE(t.inversion().has_value());
    EXPECT_THROW((void)t.inverse({{"x_prime", 1.2}}), DomainError);
}

// ─── Logit ────────────────────────────────────────────────────────────────────

TEST(Logit_Forward, Midpoint_IsZeroWithLogFourJacobian) {
    const Logit t(UNIT);
    const auto r = t.forward({{"x", 0.5}});
    EXPECT_NEAR(r.point.at("x_prime"), 0.0, 1e-15);
    EXPECT_NEAR(r.log_jacobian, std::log(4.0), 1e-14);
}

TEST(Logit_Forward, AtBounds_Throws) {
    const Logit t(UNIT);
    EXPECT_THROW((void)t.forward({{"x", 0.0}}), DomainError);
    EXPECT_THROW((void)t.forward({{"x", 1.0}}), DomainError);
}

TEST(Logit_Inverse, ZeroMapsToMidpoint) {
    const Logit t(UNIT);
    const auto r = t.inverse({{"x_prime", 0.0}});
    EXPECT_NEAR(r.point.at("x"), 0.5, 1e-15);
    EXPECT_NEAR(r.log_jacobian, -std::log(4.0), 1e-14);
}

TEST(Logit_Inverse, SaturatedSigmoid_Throws) {
    const Logit t(UNIT);
    EXPECT_THROW((void)t.inverse({{"x_prime", 1e3}}), DomainError);
    EXPECT_THROW((void)t.inverse({{"x_prime", std::numeric_limits<double>::quiet_NaN()}}),
                 DomainError);
}

TEST(Logit_RoundTrip, JacobiansCancel) {
    const Logit t(ParameterDescriptor::bounded("x", 0.0, 2.0));
    const auto f = t.forward({{"x", 0.3}});
    const auto b = t.inverse(f.point);
    EXPECT_NEAR(b.point.at("x"), 0.3, 1e-12);
    EXPECT_NEAR(f.log_jacobian + b.log_jacobian, 0.0, 1e-12);
}

// ─── Reflective ───────────────────────────────────────────────────────────────

TEST(Reflective_Fold, BothBoundaries_MirrorsPastEither) {
    const Reflective t(TWO);
    EXPECT_NEAR(t.fold(-0.5), 0.5, 1e-15);
    EXPECT_NEAR(t.fold(2.5), 1.5, 1e-15);
    EXPECT_DOUBLE_EQ(t.fold(1.2), 1.2);
}

TEST(Reflective_Fold, LowerOnly_RejectsPastUpper) {
    const Reflective t(TWO, ReflectBoundaries::Lower);
    EXPECT_NEAR(t.fold(-0.5), 0.5, 1e-15);
    EXPECT_THROW((void)t.fold(2.5), DomainError);
}

TEST(Reflective_Fold, UpperOnly_RejectsPastLower) {
    const Reflective t(TWO, ReflectBoundaries::Upper);
    EXPECT_NEAR(t.fold(2.5), 1.5, 1e-15);
    EXPECT_THROW((void)t.fold(-0.1), DomainError);
}

TEST(Reflective_Forward, ExactlyAtBound_StaysInsideWithFiniteJacobian) {
    const Reflective t(TWO);
    for (double x : {0.0, 2.0, std::nextafter(2.0, 3.0), std::nextafter(0.0, -1.0)}) {
        const auto r = t.forward({{"x", x}});
        const double y = r.point.at("x_prime");
        EXPECT_GE(y, 0.0);
        EXPECT_LE(y, 1.0);
        EXPECT_TRUE(std::isfinite(r.log_jacobian));
    }
}

TEST(Reflective_Forward, PastUpper_FoldsBeforeScaling) {
    const Reflective t(TWO);
    const auto r = t.forward({{"x", 2.5}});
    EXPECT_NEAR(r.point.at("x_prime"), 0.75, 1e-15);
    EXPECT_NEAR(r.log_jacobian, -std::log(2.0), 1e-15);
}

TEST(Reflective_Inverse, OutsideUnit_Folds) {
    const Reflective t(TWO);
    const auto r = t.inverse({{"x_prime", -0.25}});
    EXPECT_NEAR(r.point.at("x"), 0.5, 1e-15);
    EXPECT_NEAR(r.log_jacobian, std::log(2.0), 1e-15);
}

TEST(Reflective_Inverse, UpperOnly_RejectsBelowZero) {
    const Reflective t(TWO, ReflectBoundaries::Upper);
    EXPECT_THROW((void)t.inverse({{"x_prime", -0.25}}), DomainError);
    EXPECT_NEAR(t.inverse({{"x_prime", 1.25}}).point.at("x"), 1.5, 1e-15);
}

TEST(ReflectBoundaries_ToString, NamesEachSide) {
    EXPECT_STREQ(to_string(ReflectBoundaries::Lower), "lower");
    EXPECT_STREQ(to_string(ReflectBoundaries::Upper), "upper");
    EXPECT_STREQ(to_string(ReflectBoundaries::Both), "both");
}
