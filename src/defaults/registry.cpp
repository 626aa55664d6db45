/// @file src/defaults/registry.cpp
/// @brief Built-in reparameterisation kinds.

#include "gwreparam/registry.hpp"
#include "gwreparam/distance.hpp"
#include "gwreparam/errors.hpp"
#include "gwreparam/lisa.hpp"
#include "gwreparam/phase.hpp"

#include <fmt/format.h>

#include <cmath>
#include <memory>
#include <utility>

namespace gwreparam {

namespace {

const ParameterDescriptor& single(const ParameterSet& parameters, std::string_view kind) {
    if (parameters.size() != 1) {
        throw ConfigurationError(
            fmt::format("'{}' reparameterisation takes exactly one parameter, got {}",
                        kind, parameters.size()));
    }
    return parameters.front();
}

/// Sky pairs may be listed latitude-first (the alias for `dec` names `ra` as
/// its partner); the longitude is the parameter spanning 2π.
ReparameterisationPtr make_sky_pair(const ParameterSet& parameters,
                                    const ReparameterisationOptions& options,
                                    std::string_view kind) {
    if (parameters.size() != 2) {
        throw ConfigurationError(
            fmt::format("'{}' reparameterisation takes exactly two parameters, got {}",
                        kind, parameters.size()));
    }
    const auto spans_circle = [](const ParameterDescriptor& p) {
        return p.is_bounded() &&
               std::abs(p.width() - constants::TWO_PI) <= constants::BOUNDS_MATCH_TOLERANCE;
    };
    const bool swap = !spans_circle(parameters[0]) && spans_circle(parameters[1]);
    const auto& lon = swap ? parameters[1] : parameters[0];
    const auto& lat = swap ? parameters[0] : parameters[1];
    return std::make_shared<SkyPair>(lon, lat, options.sky);
}

ReparameterisationRegistry build_known() {
    ReparameterisationRegistry r;

    const auto identity = [](const ParameterSet& ps, const ReparameterisationOptions&) {
        return std::make_shared<Identity>(single(ps, "identity"));
    };
    r.add("identity", identity);
    r.add("none", identity);

    const auto rescale = [](const ParameterSet& ps, const ReparameterisationOptions& o) {
        return std::make_shared<RescaleToBounds>(single(ps, "rescale"), o.update_bounds, o.reflect);
    };
    r.add("rescale", rescale);
    r.add("default", rescale);
    r.add("time", rescale, {.update_bounds = true});
    r.add("mass", rescale, {.update_bounds = true});
    r.add("mass_ratio", rescale, {.update_bounds = true, .reflect = ReflectBoundaries::Upper});

    const auto logit = [](const ParameterSet& ps, const ReparameterisationOptions&) {
        return std::make_shared<Logit>(single(ps, "logit"));
    };
    r.add("logit", logit);
    r.add("bounded", logit);

    const auto reflective = [](const ParameterSet& ps, const ReparameterisationOptions& o) {
        return std::make_shared<Reflective>(single(ps, "reflective"),
                                            o.reflect.value_or(ReflectBoundaries::Both));
    };
    r.add("reflective", reflective, {.reflect = ReflectBoundaries::Both});

    const auto angle = [](const ParameterSet& ps, const ReparameterisationOptions&) {
        return std::make_shared<Angle>(single(ps, "angle"));
    };
    r.add("periodic", angle);
    r.add("angle-2pi", angle);
    r.add("angle-pi", angle);

    r.add("angle-sine", [](const ParameterSet& ps, const ReparameterisationOptions&) {
        return std::make_shared<SineAngle>(single(ps, "angle-sine"));
    });

    r.add("sky-ra-dec",
          [](const ParameterSet& ps, const ReparameterisationOptions& o) {
              return make_sky_pair(ps, o, "sky-ra-dec");
          },
          {.sky = SkyConvention::RaDec});
    r.add("sky-az-zen",
          [](const ParameterSet& ps, const ReparameterisationOptions& o) {
              return make_sky_pair(ps, o, "sky-az-zen");
          },
          {.sky = SkyConvention::AzZen});

    r.add("distance",
          [](const ParameterSet& ps, const ReparameterisationOptions& o) {
              return std::make_shared<Distance>(single(ps, "distance"), o.distance_power, o.reflect);
          },
          {.reflect = ReflectBoundaries::Upper});

    const auto delta_phase = [](const ParameterSet& ps, const ReparameterisationOptions&) {
        return std::make_shared<DeltaPhase>(single(ps, "delta-phase"));
    };
    r.add("delta_phase", delta_phase);
    r.add("delta-phase", delta_phase);

    r.add("lisa-extrinsic", [](const ParameterSet& ps, const ReparameterisationOptions& o) {
        return std::make_shared<LisaExtrinsicSymmetry>(ps, LisaParameterNames{}, o.lisa);
    });

    return r;
}

} // namespace

// ─── Registry ─────────────────────────────────────────────────────────────────

void ReparameterisationRegistry::add(std::string kind,
                                     ReparameterisationFactory factory,
                                     ReparameterisationOptions defaults) {
    if (kind.empty() || !factory) {
        throw ConfigurationError("registry entries require a key and a factory");
    }
    entries_.insert_or_assign(std::move(kind), Entry{std::move(factory), defaults});
}

bool ReparameterisationRegistry::contains(std::string_view kind) const {
    return entries_.find(kind) != entries_.end();
}

const ReparameterisationRegistry::Entry&
ReparameterisationRegistry::entry(std::string_view kind) const {
    const auto it = entries_.find(kind);
    if (it == entries_.end()) {
        throw ConfigurationError(fmt::format("unknown reparameterisation kind '{}'", kind));
    }
    return it->second;
}

const ReparameterisationOptions&
ReparameterisationRegistry::defaults(std::string_view kind) const {
    return entry(kind).defaults;
}

ReparameterisationPtr
ReparameterisationRegistry::create(std::string_view kind, const ParameterSet& parameters) const {
    const auto& e = entry(kind);
    return e.factory(parameters, e.defaults);
}

ReparameterisationPtr
ReparameterisationRegistry::create(std::string_view kind,
                                   const ParameterSet& parameters,
                                   const ReparameterisationOptions& options) const {
    return entry(kind).factory(parameters, options);
}

std::vector<std::string> ReparameterisationRegistry::kinds() const {
    std::vector<std::string> keys;
    keys.reserve(entries_.size());
    for (const auto& [key, _] : entries_) {
        keys.push_back(key);
    }
    return keys;
}

const ReparameterisationRegistry& ReparameterisationRegistry::known() {
    static const ReparameterisationRegistry registry = build_known();
    return registry;
}

} // namespace gwreparam
