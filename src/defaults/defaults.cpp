/// @file src/defaults/defaults.cpp
/// @brief Alias table and default transform resolution.

#include "gwreparam/defaults.hpp"
#include "gwreparam/angles.hpp"
#include "gwreparam/bounded.hpp"
#include "gwreparam/errors.hpp"
#include "gwreparam/log.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <algorithm>
#include <cctype>
#include <memory>
#include <set>
#include <utility>

namespace gwreparam {

namespace {

std::string lowercase(std::string_view name) {
    std::string out(name);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::map<std::string, ParameterAlias> build_aliases() {
    std::map<std::string, ParameterAlias> a;
    a["chirp_mass"] = {"mass", {}};
    a["mass_ratio"] = {"mass_ratio", {}};
    a["ra"]         = {"sky-ra-dec", {"DEC", "dec", "Dec"}};
    a["dec"]        = {"sky-ra-dec", {"RA", "ra"}};
    a["azimuth"]    = {"sky-az-zen", {"zenith", "zen", "Zen", "Zenith"}};
    a["zenith"]     = {"sky-az-zen", {"azimuth", "az", "Az", "Azimuth"}};
    for (const char* name : {"theta_1", "theta_2", "tilt_1", "tilt_2", "theta_jn", "iota"}) {
        a[name] = {"angle-sine", {}};
    }
    for (const char* name : {"phi_jl", "phi_12", "phase"}) {
        a[name] = {"angle-2pi", {}};
    }
    a["psi"]          = {"angle-pi", {}};
    a["geocent_time"] = {"time", {}};
    a["time_jitter"]  = {"periodic", {}};
    for (const char* name : {"a_1", "a_2", "chi_1", "chi_2"}) {
        a[name] = {"default", {}};
    }
    a["luminosity_distance"] = {"distance", {}};
    return a;
}

} // namespace

DefaultReparameterisationSet::DefaultReparameterisationSet(
    const ReparameterisationRegistry& registry, bool verbose)
    : registry_(registry), verbose_(verbose) {}

const std::map<std::string, ParameterAlias>& DefaultReparameterisationSet::aliases() {
    static const std::map<std::string, ParameterAlias> table = build_aliases();
    return table;
}

std::optional<ParameterAlias> DefaultReparameterisationSet::lookup(std::string_view name) const {
    const auto& table = aliases();
    const auto it = table.find(lowercase(name));
    if (it == table.end()) {
        return std::nullopt;
    }
    return it->second;
}

ReparameterisationPtr
DefaultReparameterisationSet::topology_default(const ParameterDescriptor& parameter) {
    switch (parameter.topology()) {
        case Topology::Linear:     return std::make_shared<Identity>(parameter);
        case Topology::Bounded:    return std::make_shared<Logit>(parameter);
        case Topology::Periodic:   return std::make_shared<Angle>(parameter);
        case Topology::Reflective: return std::make_shared<Reflective>(parameter);
        case Topology::Composite:  break;
    }
    throw ConfigurationError(
        fmt::format("composite parameter '{}' has no known joint transform; supply an override",
                    parameter.name()));
}

// ─── Resolution ───────────────────────────────────────────────────────────────

std::vector<ReparameterisationPtr>
DefaultReparameterisationSet::resolve(const ParameterSet& parameters,
                                      const ReparameterisationOverrides& overrides) const {
    const Logger logger("defaults", verbose_);
    std::vector<ReparameterisationPtr> chosen;
    std::set<std::string> covered;

    std::set<const Reparameterisation*> seen;
    for (const auto& [key, transform] : overrides) {
        if (!transform) {
            throw ConfigurationError(fmt::format("override for '{}' is null", key));
        }
        if (find_parameter(parameters, key) == nullptr) {
            throw ConfigurationError(
                fmt::format("override keyed by unknown parameter '{}'", key));
        }
        const auto& inputs = transform->input_parameters();
        if (std::find(inputs.begin(), inputs.end(), key) == inputs.end()) {
            throw ConfigurationError(
                fmt::format("override for '{}' ({} transform) does not consume it",
                            key, transform->kind()));
        }
        if (seen.insert(transform.get()).second) {
            logger.info("using override {} for {}", transform->kind(), inputs);
            chosen.push_back(transform);
            covered.insert(inputs.begin(), inputs.end());
        }
    }

    for (const auto& p : parameters) {
        if (covered.count(p.name()) != 0) {
            continue;
        }
        const auto alias = lookup(p.name());
        if (alias) {
            ParameterSet group = {p};
            for (const auto& partner : alias->partners) {
                const auto* q = find_parameter(parameters, partner);
                if (q != nullptr && covered.count(partner) == 0 && partner != p.name()) {
                    group.push_back(*q);
                }
            }
            const bool joint = !alias->partners.empty();
            if (!joint || group.size() > 1) {
                auto transform = registry_.create(alias->kind, group);
                logger.info("adding {} ({}) for {}", alias->kind, transform->kind(),
                            transform->input_parameters());
                for (const auto& d : group) {
                    covered.insert(d.name());
                }
                chosen.push_back(std::move(transform));
                continue;
            }
            logger.debug("joint alias {} for '{}' has no partner present", alias->kind, p.name());
        }
        auto transform = topology_default(p);
        logger.debug("'{}' falls back on {} topology: {}", p.name(), to_string(p.topology()),
                     transform->kind());
        covered.insert(p.name());
        chosen.push_back(std::move(transform));
    }
    return chosen;
}

CompositeReparameterisation
DefaultReparameterisationSet::build(const ParameterSet& parameters,
                                    const ReparameterisationOverrides& overrides) const {
    return CompositeReparameterisation(parameters, resolve(parameters, overrides));
}

} // namespace gwreparam
