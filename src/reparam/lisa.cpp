/// @file src/reparam/lisa.cpp
/// @brief LISA extrinsic-parameter folding.

#include "gwreparam/lisa.hpp"
#include "gwreparam/constants.hpp"
#include "gwreparam/errors.hpp"
#include "gwreparam/point.hpp"

#include "transform_math.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <array>
#include <cmath>
#include <memory>
#include <random>
#include <set>
#include <utility>
#include <vector>

namespace gwreparam {

using detail::TransformMath;
using constants::BOUNDS_MATCH_TOLERANCE;
using constants::HALF_PI;
using constants::PI;
using constants::TWO_PI;

namespace {

constexpr std::array<const char*, 2> LAMBDA_NAMES = {"eclipticlongitude", "lambda"};
constexpr std::array<const char*, 2> BETA_NAMES   = {"eclipticlatitude", "beta"};
constexpr std::array<const char*, 2> PSI_NAMES    = {"polarization", "psi"};
constexpr std::array<const char*, 2> IOTA_NAMES   = {"iota", "inclination"};
constexpr std::array<const char*, 2> PHASE_NAMES  = {"phase", "coa_phase"};

std::optional<std::string> infer_role(const ParameterSet& parameters,
                                      const std::array<const char*, 2>& known,
                                      std::string_view role,
                                      bool required) {
    std::vector<std::string> matches;
    for (const char* name : known) {
        if (find_parameter(parameters, name) != nullptr) {
            matches.emplace_back(name);
        }
    }
    if (matches.size() > 1) {
        throw ConfigurationError(
            fmt::format("LISA {} parameter is ambiguous: '{}' and '{}' both present",
                        role, matches[0], matches[1]));
    }
    if (matches.empty()) {
        if (required) {
            throw ConfigurationError(
                fmt::format("LISA {} parameter could not be inferred", role));
        }
        return std::nullopt;
    }
    return matches.front();
}

const ParameterDescriptor& lookup(const ParameterSet& parameters, const std::string& name) {
    const auto* p = find_parameter(parameters, name);
    if (p == nullptr) {
        throw ConfigurationError(
            fmt::format("LISA parameter '{}' is not in the parameter set", name));
    }
    return *p;
}

void require_range(const ParameterDescriptor& p, double lo, double hi) {
    if (!p.is_bounded() ||
        std::abs(*p.lower() - lo) > BOUNDS_MATCH_TOLERANCE ||
        std::abs(*p.upper() - hi) > BOUNDS_MATCH_TOLERANCE) {
        throw ConfigurationError(
            fmt::format("LISA parameter '{}' requires prior bounds [{}, {}]", p.name(), lo, hi));
    }
}

ParameterNames role_order(const LisaParameterNames& r) {
    ParameterNames names = {*r.lambda, *r.beta, *r.psi, *r.iota};
    if (r.phase) {
        names.push_back(*r.phase);
    }
    return names;
}

ParameterNames folded_names(const LisaParameterNames& r, bool include_mode_index) {
    ParameterNames names;
    for (const auto& n : role_order(r)) {
        names.push_back(n + "_folded");
    }
    if (include_mode_index) {
        names.emplace_back("mode_index");
    }
    return names;
}

void validate(const LisaOptions& o) {
    if (o.estimate_mode_weights && o.include_mode_index) {
        throw ConfigurationError("LISA mode weights cannot be estimated when the mode index is included");
    }
    if (o.minimum_mode_weight &&
        !(*o.minimum_mode_weight >= 0.0 && *o.minimum_mode_weight < 1.0)) {
        throw ConfigurationError(
            fmt::format("LISA minimum mode weight {} outside [0, 1)", *o.minimum_mode_weight));
    }
}

/// Bin of `x` in equal-width bins of size `width` starting at 0, clamped
/// so the closed upper bound lands in the last bin.
int bin_of(double x, double width, int n_bins) noexcept {
    const int b = static_cast<int>(std::floor(x / width));
    return std::clamp(b, 0, n_bins - 1);
}

} // namespace

// ─── Construction ─────────────────────────────────────────────────────────────

LisaParameterNames LisaExtrinsicSymmetry::resolve(const ParameterSet& parameters,
                                                  const LisaParameterNames& names) {
    LisaParameterNames r = names;
    if (!r.lambda) r.lambda = infer_role(parameters, LAMBDA_NAMES, "lambda", true);
    if (!r.beta)   r.beta   = infer_role(parameters, BETA_NAMES, "beta", true);
    if (!r.psi)    r.psi    = infer_role(parameters, PSI_NAMES, "psi", true);
    if (!r.iota)   r.iota   = infer_role(parameters, IOTA_NAMES, "iota", true);
    if (!r.phase)  r.phase  = infer_role(parameters, PHASE_NAMES, "phase", false);

    const auto ordered = role_order(r);
    const std::set<std::string> unique(ordered.begin(), ordered.end());
    if (unique.size() != ordered.size()) {
        throw ConfigurationError("LISA parameter roles must name distinct parameters");
    }
    for (const auto& p : parameters) {
        if (unique.count(p.name()) == 0) {
            throw ConfigurationError(
                fmt::format("LISA symmetry has no role for parameter '{}'", p.name()));
        }
    }
    return r;
}

LisaExtrinsicSymmetry::LisaExtrinsicSymmetry(const ParameterSet& parameters,
                                             const LisaParameterNames& names,
                                             const LisaOptions& options)
    : LisaExtrinsicSymmetry(resolve(parameters, names), parameters, options) {}

LisaExtrinsicSymmetry::LisaExtrinsicSymmetry(const LisaParameterNames& resolved,
                                             const ParameterSet& parameters,
                                             const LisaOptions& options)
    : Reparameterisation(role_order(resolved), folded_names(resolved, options.include_mode_index)),
      lambda_(*resolved.lambda),
      beta_(*resolved.beta),
      psi_(*resolved.psi),
      iota_(*resolved.iota),
      phase_(resolved.phase),
      options_(options),
      rng_(options.seed) {
    validate(options_);
    const auto& lambda = lookup(parameters, lambda_);
    const auto& beta = lookup(parameters, beta_);
    const auto& psi = lookup(parameters, psi_);
    const auto& iota = lookup(parameters, iota_);
    require_range(lambda, 0.0, TWO_PI);
    require_range(beta, -HALF_PI, HALF_PI);
    require_range(psi, 0.0, PI);
    require_range(iota, 0.0, PI);
    descriptors_ = {lambda, beta, psi, iota};
    if (phase_) {
        const auto& phase = lookup(parameters, *phase_);
        require_range(phase, 0.0, TWO_PI);
        descriptors_.push_back(phase);
    }
    weights_.assign(static_cast<std::size_t>(n_modes()), 1.0 / n_modes());
}

// ─── Modes ────────────────────────────────────────────────────────────────────

LisaMode LisaExtrinsicSymmetry::determine_mode(const Point& physical) const {
    LisaMode m{};
    m.long_num = bin_of(value_of(physical, lambda_), HALF_PI, 4);
    m.lat_num = value_of(physical, beta_) >= 0.0 ? 1 : 0;
    m.phase_num = phase_ ? bin_of(value_of(physical, *phase_), PI, 2) : 0;
    m.index = m.long_num + 4 * m.lat_num + 8 * m.phase_num;
    return m;
}

LisaMode LisaExtrinsicSymmetry::unfold_mode(int index) noexcept {
    LisaMode m{};
    m.index = index;
    m.phase_num = index / 8;
    const int rest = index - 8 * m.phase_num;
    m.long_num = rest % 4;
    m.lat_num = rest / 4;
    return m;
}

double LisaExtrinsicSymmetry::log_mode_weight(int index) const {
    const double w = weights_[static_cast<std::size_t>(index)];
    if (w <= 0.0) {
        throw DomainError("mode_index", index, "mode has zero weight");
    }
    return std::log(w);
}

std::shared_ptr<const Reparameterisation>
LisaExtrinsicSymmetry::refit(std::span<const Point> live_points) const {
    if (!options_.estimate_mode_weights) {
        return nullptr;
    }
    auto refitted = std::make_shared<LisaExtrinsicSymmetry>(*this);
    if (live_points.empty()) {
        return refitted;
    }
    std::vector<double> counts(weights_.size(), 0.0);
    for (const auto& p : live_points) {
        counts[static_cast<std::size_t>(determine_mode(p).index)] += 1.0;
    }
    double total = 0.0;
    for (auto& c : counts) {
        c /= static_cast<double>(live_points.size());
        if (options_.minimum_mode_weight) {
            c = std::max(c, *options_.minimum_mode_weight);
        }
        total += c;
    }
    for (auto& c : counts) {
        c /= total;
    }
    refitted->weights_ = std::move(counts);
    return refitted;
}

// ─── Maps ─────────────────────────────────────────────────────────────────────

double LisaExtrinsicSymmetry::forward_into(const Point& physical, Point& transformed) const {
    for (const auto& d : descriptors_) {
        check_domain(d, value_of(physical, d.name()));
    }
    const LisaMode m = determine_mode(physical);
    const bool north = m.lat_num != 0;
    const double shift = m.long_num * HALF_PI;

    const double psi = TransformMath::wrap(value_of(physical, psi_) - shift, 0.0, PI);
    transformed[psi_ + "_folded"] = north ? psi : PI - psi;

    const double iota = value_of(physical, iota_);
    transformed[iota_ + "_folded"] = north ? iota : PI - iota;

    const double beta = value_of(physical, beta_);
    transformed[beta_ + "_folded"] = north ? beta : -beta;

    transformed[lambda_ + "_folded"] =
        TransformMath::wrap(value_of(physical, lambda_) - shift, 0.0, TWO_PI);

    if (phase_) {
        transformed[*phase_ + "_folded"] =
            TransformMath::wrap(value_of(physical, *phase_), 0.0, PI);
    }
    if (options_.include_mode_index) {
        transformed["mode_index"] = static_cast<double>(m.index);
        return 0.0;
    }
    return log_mode_weight(m.index);
}

int LisaExtrinsicSymmetry::mode_of(const Point& transformed) const {
    if (!options_.include_mode_index) {
        std::discrete_distribution<int> pick(weights_.begin(), weights_.end());
        return pick(rng_);
    }
    const double raw_index = value_of(transformed, "mode_index");
    if (!std::isfinite(raw_index)) {
        throw DomainError("mode_index", raw_index, "non-finite value");
    }
    const long rounded = std::lround(raw_index);
    if (rounded < 0 || rounded >= n_modes()) {
        throw DomainError("mode_index", raw_index,
                          fmt::format("outside [0, {})", n_modes()));
    }
    return static_cast<int>(rounded);
}

double LisaExtrinsicSymmetry::inverse_into(const Point& transformed, Point& physical) const {
    const LisaMode m = unfold_mode(mode_of(transformed));
    const bool north = m.lat_num != 0;
    const double shift = m.long_num * HALF_PI;

    const double lambda_f = value_of(transformed, lambda_ + "_folded");
    const double beta_f = value_of(transformed, beta_ + "_folded");
    const double iota_f = value_of(transformed, iota_ + "_folded");
    const double psi_f = value_of(transformed, psi_ + "_folded");

    physical[lambda_] = TransformMath::wrap(lambda_f + shift, 0.0, TWO_PI);
    physical[beta_] = north ? beta_f : -beta_f;
    physical[iota_] = north ? iota_f : PI - iota_f;
    physical[psi_] = TransformMath::wrap((north ? psi_f : PI - psi_f) + shift, 0.0, PI);
    if (phase_) {
        physical[*phase_] = value_of(transformed, *phase_ + "_folded") + m.phase_num * PI;
    }

    for (const auto& d : descriptors_) {
        check_domain(d, physical[d.name()]);
    }
    return options_.include_mode_index ? 0.0 : -log_mode_weight(m.index);
}

} // namespace gwreparam
