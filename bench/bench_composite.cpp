/**
 * @file  bench/bench_composite.cpp
 * @brief Google Benchmark suite for composite reparameterisation and the
 *        proposal wrapper.
 *
 * Benchmarks
 * ----------
 *   BM_Composite_Forward / Inverse  — default GW set, one point per call
 *   BM_Composite_Build              — alias resolution plus ordering
 *   BM_Proposal_Sample              — Gaussian base, batch of N draws
 *   BM_Proposal_LogProb             — density of a single physical point
 *
 * Build (CMake):
 *   cmake -DGWREPARAM_BUILD_BENCHMARKS=ON ..
 *   cmake --build build --target bench_composite
 *   ./build/bench_composite --benchmark_format=json
 *
 * Throughput units: items/second (points processed).
 */

#include "benchmark/benchmark.h"

#include "gwreparam/constants.hpp"
#include "gwreparam/defaults.hpp"
#include "gwreparam/gaussian_proposal.hpp"
#include "gwreparam/proposal.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

using namespace gwreparam;
using namespace gwreparam::constants;

// ── Fixture helpers ────────────────────────────────────────────────────────────

static ParameterSet gw_parameters() {
    return {
        ParameterDescriptor::periodic("ra", 0.0, TWO_PI),
        ParameterDescriptor::bounded("dec", -HALF_PI, HALF_PI),
        ParameterDescriptor::bounded("luminosity_distance", 10.0, 5000.0),
        ParameterDescriptor::bounded("theta_jn", 0.0, PI),
        ParameterDescriptor::periodic("psi", 0.0, PI),
        ParameterDescriptor::periodic("phase", 0.0, TWO_PI),
        ParameterDescriptor::bounded("geocent_time", -0.1, 0.1),
        ParameterDescriptor::bounded("chirp_mass", 5.0, 80.0),
        ParameterDescriptor::bounded("mass_ratio", 0.05, 1.0),
        ParameterDescriptor::bounded("a_1", 0.0, 0.99),
        ParameterDescriptor::bounded("a_2", 0.0, 0.99),
    };
}

static Point gw_point() {
    return {{"ra", 1.2}, {"dec", -0.4}, {"luminosity_distance", 800.0},
            {"theta_jn", 1.1}, {"psi", 0.7}, {"phase", 4.0},
            {"geocent_time", 0.02}, {"chirp_mass", 28.0}, {"mass_ratio", 0.6},
            {"a_1", 0.3}, {"a_2", 0.5},
            {"ra_dec_radial", 1.6}, {"psi_radial", 1.2}, {"phase_radial", 0.9}};
}

/// Live points spread along each dimension that the default set fits to.
static std::vector<Point> live_points() {
    std::vector<Point> live(256, gw_point());
    for (std::size_t i = 0; i < live.size(); ++i) {
        const double t = static_cast<double>(i) / static_cast<double>(live.size());
        live[i]["ra"] = t * TWO_PI * 0.99;
        live[i]["dec"] = -1.0 + 2.0 * t;
        live[i]["luminosity_distance"] = 100.0 + 4000.0 * t;
        live[i]["chirp_mass"] = 10.0 + 60.0 * t;
        live[i]["geocent_time"] = -0.05 + 0.1 * t;
    }
    return live;
}

// ── Composite ──────────────────────────────────────────────────────────────────

static void BM_Composite_Forward(benchmark::State& state) {
    const auto c = DefaultReparameterisationSet().build(gw_parameters());
    const Point x = gw_point();
    for (auto _ : state) {
        auto f = c.forward(x);
        benchmark::DoNotOptimize(f.log_jacobian);
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}
BENCHMARK(BM_Composite_Forward)->Unit(benchmark::kMicrosecond);

static void BM_Composite_Inverse(benchmark::State& state) {
    const auto c = DefaultReparameterisationSet().build(gw_parameters());
    const Point y = c.forward(gw_point()).point;
    for (auto _ : state) {
        auto b = c.inverse(y);
        benchmark::DoNotOptimize(b.log_jacobian);
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}
BENCHMARK(BM_Composite_Inverse)->Unit(benchmark::kMicrosecond);

static void BM_Composite_Build(benchmark::State& state) {
    const auto parameters = gw_parameters();
    for (auto _ : state) {
        auto c = DefaultReparameterisationSet().build(parameters);
        benchmark::DoNotOptimize(c.transformed_names().data());
    }
}
BENCHMARK(BM_Composite_Build)->Unit(benchmark::kMicrosecond);

// ── Proposal ───────────────────────────────────────────────────────────────────

static void BM_Proposal_Sample(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    GaussianProposal base(7);
    ProposalConfig config;
    config.parameters = gw_parameters();
    config.retry_limit = 1'000'000;
    GWFlowProposal proposal(config, base);

    proposal.update(live_points());

    for (auto _ : state) {
        auto draws = proposal.sample(n);
        benchmark::DoNotOptimize(draws.data());
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * static_cast<int64_t>(n));
}
BENCHMARK(BM_Proposal_Sample)->RangeMultiplier(4)->Range(16, 1024)->Unit(benchmark::kMillisecond);

static void BM_Proposal_LogProb(benchmark::State& state) {
    GaussianProposal base(7);
    ProposalConfig config;
    config.parameters = gw_parameters();
    GWFlowProposal proposal(config, base);
    const Point x = gw_point();
    proposal.update(live_points());
    for (auto _ : state) {
        benchmark::DoNotOptimize(proposal.log_prob(x));
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}
BENCHMARK(BM_Proposal_LogProb)->Unit(benchmark::kMicrosecond);

BENCHMARK_MAIN();
