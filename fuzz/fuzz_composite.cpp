/**
 * @file  fuzz_composite.cpp
 * @brief libFuzzer target for CompositeReparameterisation forward / inverse
 *
 * Build:
 *   cmake -DGWREPARAM_BUILD_FUZZERS=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_composite
 *
 * Run for 60 seconds:
 *   ./fuzz_composite -max_total_time=60
 *
 * Safety invariants verified on every input:
 *   1. No crash, no UB, no abort. Invalid coordinates raise DomainError
 *      and nothing else.
 *   2. If forward succeeds, the log-Jacobian is finite and every
 *      transformed value is finite.
 *   3. If inverse succeeds, every physical value lies inside its prior
 *      (periodic longitudes in [lower, upper)).
 *   4. forward(inverse(y′)) succeeds whenever inverse(y′) does.
 *
 * Fuzzer strategy:
 *   The input bytes are interpreted as raw doubles via memcpy and fed to
 *   both directions of the default GW composite, exercising every
 *   IEEE 754 bit pattern (NaN, ±Inf, ±0, denormals) on every coordinate.
 */

#include <cassert>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "gwreparam/constants.hpp"
#include "gwreparam/defaults.hpp"
#include "gwreparam/errors.hpp"

using namespace gwreparam;
using namespace gwreparam::constants;

namespace {

const ParameterSet& parameters() {
    static const ParameterSet set = {
        ParameterDescriptor::periodic("ra", 0.0, TWO_PI),
        ParameterDescriptor::bounded("dec", -HALF_PI, HALF_PI),
        ParameterDescriptor::bounded("luminosity_distance", 10.0, 1000.0),
        ParameterDescriptor::bounded("theta_jn", 0.0, PI),
        ParameterDescriptor::periodic("psi", 0.0, PI),
        ParameterDescriptor::bounded("mass_ratio", 0.1, 1.0),
        ParameterDescriptor::bounded("bar", 0.0, 1.0),
    };
    return set;
}

const CompositeReparameterisation& composite() {
    static const CompositeReparameterisation c = DefaultReparameterisationSet().build(parameters());
    return c;
}

} // namespace

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const size_t n_doubles = size / sizeof(double);
    std::vector<double> values;
    values.reserve(n_doubles);
    for (size_t i = 0; i < n_doubles; ++i) {
        double val{};
        __builtin_memcpy(&val, data + i * sizeof(double), sizeof(double));
        values.push_back(val);
    }

    const auto& c = composite();

    // ── Physical → transformed ──────────────────────────────────────────────
    // Physical parameters followed by the radial coordinates of the embeddings.
    ParameterNames inputs;
    for (const auto& d : parameters()) {
        inputs.push_back(d.name());
    }
    for (const auto& name : c.auxiliary_names()) {
        inputs.push_back(name);
    }
    Point physical;
    for (std::size_t i = 0; i < inputs.size(); ++i) {
        physical[inputs[i]] = i < values.size() ? values[i] : 0.5;
    }
    try {
        const auto f = c.forward(physical);
        assert(std::isfinite(f.log_jacobian));
        for (const auto& [name, value] : f.point) {
            assert(std::isfinite(value));
        }
    } catch (const DomainError&) {
        // Coordinates outside the transform domains are rejected.
    }

    // ── Transformed → physical ──────────────────────────────────────────────
    Point transformed;
    const auto& names = c.transformed_names();
    for (std::size_t i = 0; i < names.size(); ++i) {
        transformed[names[i]] = i < values.size() ? values[values.size() - 1 - i] : 0.5;
    }
    try {
        const auto b = c.inverse(transformed);
        for (const auto& d : parameters()) {
            const double v = b.point.at(d.name());
            assert(std::isfinite(v));
            assert(v >= *d.lower());
            assert(d.topology() == Topology::Periodic ? v < *d.upper() : v <= *d.upper());
        }
        for (const auto& name : c.auxiliary_names()) {
            assert(b.point.at(name) > 0.0);
        }
        const auto again = c.forward(b.point);
        assert(std::isfinite(again.log_jacobian));
    } catch (const DomainError&) {
    }

    return 0;
}
