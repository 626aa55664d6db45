#include <gtest/gtest.h>
#include "gwreparam/angles.hpp"
#include "gwreparam/bounded.hpp"
#include "gwreparam/constants.hpp"
#include "gwreparam/defaults.hpp"
#include "gwreparam/errors.hpp"
#include <algorithm>
#include <map>
#include <memory>
#include <string>

using namespace gwreparam;
using namespace gwreparam::constants;

namespace {

ParameterSet gw_parameters() {
    return {
        ParameterDescriptor::periodic("ra", 0.0, TWO_PI),
        ParameterDescriptor::bounded("dec", -HALF_PI, HALF_PI),
        ParameterDescriptor::bounded("luminosity_distance", 10.0, 1000.0),
        ParameterDescriptor::bounded("theta_jn", 0.0, PI),
        ParameterDescriptor::periodic("psi", 0.0, PI),
        ParameterDescriptor::periodic("phase", 0.0, TWO_PI),
        ParameterDescriptor::bounded("geocent_time", -0.1, 0.1),
        ParameterDescriptor::bounded("chirp_mass", 10.0, 50.0),
        ParameterDescriptor::bounded("mass_ratio", 0.1, 1.0),
        ParameterDescriptor::bounded("a_1", 0.0, 0.99),
        ParameterDescriptor::linear("foo"),
        ParameterDescriptor::bounded("bar", 0.0, 1.0),
        ParameterDescriptor::periodic("baz", 0.0, 1.0),
        ParameterDescriptor::reflective("qux", 0.0, 1.0),
    };
}

// Kind of the transform consuming `name`, or "" if none does.
std::string kind_for(const std::vector<ReparameterisationPtr>& transforms,
                     const std::string& name) {
    for (const auto& t : transforms) {
        const auto& in = t->input_parameters();
        if (std::find(in.begin(), in.end(), name) != in.end()) {
            return std::string(t->kind());
        }
    }
    return "";
}

} // namespace

// ─── Alias table ──────────────────────────────────────────────────────────────

TEST(Defaults_Lookup, CaseInsensitive) {
    const DefaultReparameterisationSet defaults;
    const auto ra = defaults.lookup("RA");
    ASSERT_TRUE(ra.has_value());
    EXPECT_EQ(ra->kind, "sky-ra-dec");
    const auto dl = defaults.lookup("Luminosity_Distance");
    ASSERT_TRUE(dl.has_value());
    EXPECT_EQ(dl->kind, "distance");
    EXPECT_FALSE(defaults.lookup("foo").has_value());
}

TEST(Defaults_Lookup, KnownGravitationalWaveAliases) {
    const auto& table = DefaultReparameterisationSet::aliases();
    EXPECT_EQ(table.at("chirp_mass").kind, "mass");
    EXPECT_EQ(table.at("mass_ratio").kind, "mass_ratio");
    EXPECT_EQ(table.at("tilt_1").kind, "angle-sine");
    EXPECT_EQ(table.at("phi_jl").kind, "angle-2pi");
    EXPECT_EQ(table.at("psi").kind, "angle-pi");
    EXPECT_EQ(table.at("geocent_time").kind, "time");
    EXPECT_EQ(table.at("time_jitter").kind, "periodic");
    EXPECT_EQ(table.at("chi_2").kind, "default");
    EXPECT_EQ(table.at("zenith").kind, "sky-az-zen");
    // Every alias names a registered kind.
    const auto& registry = ReparameterisationRegistry::known();
    for (const auto& [name, alias] : table) {
        EXPECT_TRUE(registry.contains(alias.kind)) << name;
    }
}

// ─── Resolution ───────────────────────────────────────────────────────────────

TEST(Defaults_Resolve, FullGravitationalWaveSet) {
    const DefaultReparameterisationSet defaults;
    const auto transforms = defaults.resolve(gw_parameters());
    EXPECT_EQ(kind_for(transforms, "ra"), "sky");
    EXPECT_EQ(kind_for(transforms, "dec"), "sky");
    EXPECT_EQ(kind_for(transforms, "luminosity_distance"), "distance");
    EXPECT_EQ(kind_for(transforms, "theta_jn"), "angle-sine");
    EXPECT_EQ(kind_for(transforms, "psi"), "angle");
    EXPECT_EQ(kind_for(transforms, "phase"), "angle");
    EXPECT_EQ(kind_for(transforms, "geocent_time"), "rescale");
    EXPECT_EQ(kind_for(transforms, "chirp_mass"), "rescale");
    EXPECT_EQ(kind_for(transforms, "mass_ratio"), "rescale");
    EXPECT_EQ(kind_for(transforms, "a_1"), "rescale");
    EXPECT_EQ(kind_for(transforms, "foo"), "identity");
    EXPECT_EQ(kind_for(transforms, "bar"), "logit");
    EXPECT_EQ(kind_for(transforms, "baz"), "angle");
    EXPECT_EQ(kind_for(transforms, "qux"), "reflective");
    // ra and dec share one transform.
    EXPECT_EQ(transforms.size(), gw_parameters().size() - 1);
}

TEST(Defaults_Build, CompositeCoversEveryParameter) {
    const auto c = DefaultReparameterisationSet().build(gw_parameters());
    EXPECT_EQ(c.physical_names().size(), gw_parameters().size());
    EXPECT_TRUE(c.has_fitted());
    const auto& names = c.transformed_names();
    EXPECT_NE(std::find(names.begin(), names.end(), "ra_dec_z"), names.end());
    EXPECT_NE(std::find(names.begin(), names.end(), "cos_theta_jn"), names.end());
    EXPECT_EQ(c.auxiliary_names().size(), 4u);  // ra_dec, psi, phase, baz
}

TEST(Defaults_Resolve, DecListedFirst_StillPairsWithRa) {
    const ParameterSet set = {ParameterDescriptor::bounded("dec", -HALF_PI, HALF_PI),
                              ParameterDescriptor::periodic("ra", 0.0, TWO_PI)};
    const auto transforms = DefaultReparameterisationSet().resolve(set);
    ASSERT_EQ(transforms.size(), 1u);
    EXPECT_EQ(transforms.front()->output_parameters().front(), "ra_dec_x");
}

TEST(Defaults_Resolve, UppercaseNames_MatchAliasAndPartners) {
    const ParameterSet set = {ParameterDescriptor::periodic("RA", 0.0, TWO_PI),
                              ParameterDescriptor::bounded("DEC", -HALF_PI, HALF_PI)};
    const auto transforms = DefaultReparameterisationSet().resolve(set);
    ASSERT_EQ(transforms.size(), 1u);
    EXPECT_EQ(transforms.front()->input_parameters(), (ParameterNames{"RA", "DEC"}));
}

TEST(Defaults_Resolve, JointAliasWithoutPartner_FallsBackOnTopology) {
    const ParameterSet set = {ParameterDescriptor::periodic("ra", 0.0, TWO_PI)};
    const auto transforms = DefaultReparameterisationSet().resolve(set);
    ASSERT_EQ(transforms.size(), 1u);
    EXPECT_EQ(transforms.front()->kind(), "angle");
}

TEST(Defaults_Resolve, CompositeTopologyWithoutAlias_Throws) {
    const ParameterSet set = {ParameterDescriptor::composite("spin", 0.0, 1.0, {"tilt"})};
    EXPECT_THROW((void)DefaultReparameterisationSet().resolve(set), ConfigurationError);
}

TEST(Defaults_TopologyDefault, OnePerTopology) {
    using D = DefaultReparameterisationSet;
    EXPECT_EQ(D::topology_default(ParameterDescriptor::linear("a"))->kind(), "identity");
    EXPECT_EQ(D::topology_default(ParameterDescriptor::bounded("a", 0.0, 1.0))->kind(), "logit");
    EXPECT_EQ(D::topology_default(ParameterDescriptor::periodic("a", 0.0, 1.0))->kind(), "angle");
    EXPECT_EQ(D::topology_default(ParameterDescriptor::reflective("a", 0.0, 1.0))->kind(),
              "reflective");
}

// ─── Overrides ────────────────────────────────────────────────────────────────

TEST(Defaults_Override, ReplacesDefaultForConsumedParameter) {
    const auto psi = ParameterDescriptor::periodic("psi", 0.0, PI);
    const ReparameterisationOverrides overrides = {{"psi", std::make_shared<Identity>(psi)}};
    const auto transforms = DefaultReparameterisationSet().resolve(gw_parameters(), overrides);
    EXPECT_EQ(kind_for(transforms, "psi"), "identity");
    EXPECT_EQ(kind_for(transforms, "phase"), "angle");
}

TEST(Defaults_Override, SharedJointOverride_AddedOnce) {
    const auto sky = std::make_shared<SkyPair>(ParameterDescriptor::periodic("ra", 0.0, TWO_PI),
                                               ParameterDescriptor::bounded("dec", -HALF_PI, HALF_PI));
    const ReparameterisationOverrides overrides = {{"ra", sky}, {"dec", sky}};
    const auto transforms = DefaultReparameterisationSet().resolve(gw_parameters(), overrides);
    EXPECT_EQ(std::count(transforms.begin(), transforms.end(), sky), 1);
}

TEST(Defaults_Override, ReplacingOnePartner_LeavesOtherOnTopology) {
    const auto dec = ParameterDescriptor::bounded("dec", -HALF_PI, HALF_PI);
    const ReparameterisationOverrides overrides = {{"dec", std::make_shared<Identity>(dec)}};
    const auto transforms = DefaultReparameterisationSet().resolve(gw_parameters(), overrides);
    EXPECT_EQ(kind_for(transforms, "dec"), "identity");
    EXPECT_EQ(kind_for(transforms, "ra"), "angle");
}

TEST(Defaults_Override, DeltaPhaseFromRegistry_BuildsOrderedComposite) {
    const auto phase = ParameterDescriptor::periodic("phase", 0.0, TWO_PI);
    const ReparameterisationOverrides overrides = {
        {"phase", ReparameterisationRegistry::known().create("delta-phase", {phase})}};
    const auto c = DefaultReparameterisationSet().build(gw_parameters(), overrides);
    const auto& names = c.transformed_names();
    EXPECT_NE(std::find(names.begin(), names.end(), "delta_phase"), names.end());
    const Point p = {{"ra", 1.0}, {"dec", 0.2}, {"ra_dec_radial", 1.5},
                     {"luminosity_distance", 400.0}, {"theta_jn", 2.5},
                     {"psi", 1.1}, {"psi_radial", 0.9}, {"phase", 3.0},
                     {"geocent_time", 0.01}, {"chirp_mass", 20.0}, {"mass_ratio", 0.5},
                     {"a_1", 0.3}, {"foo", -4.0}, {"bar", 0.4}, {"baz", 0.6},
                     {"baz_radial", 1.2}, {"qux", 0.7}};
    const auto b = c.inverse(c.forward(p).point);
    EXPECT_NEAR(b.point.at("phase"), 3.0, 1e-10);
    EXPECT_NEAR(b.point.at("psi"), 1.1, 1e-10);
}

TEST(Defaults_Override, InvalidOverrides_Throw) {
    const DefaultReparameterisationSet defaults;
    const auto psi = ParameterDescriptor::periodic("psi", 0.0, PI);
    const auto phase = ParameterDescriptor::periodic("phase", 0.0, TWO_PI);
    EXPECT_THROW((void)defaults.resolve(gw_parameters(), {{"psi", nullptr}}), ConfigurationError);
    EXPECT_THROW((void)defaults.resolve(gw_parameters(),
                                        {{"nope", std::make_shared<Identity>(psi)}}),
                 ConfigurationError);
    EXPECT_THROW((void)defaults.resolve(gw_parameters(),
                                        {{"psi", std::make_shared<Identity>(phase)}}),
                 ConfigurationError);
}
