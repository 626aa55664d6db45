/// @file src/composite/composite.cpp
/// @brief CompositeReparameterisation validation, ordering and maps.

#include "gwreparam/composite.hpp"
#include "gwreparam/errors.hpp"
#include "gwreparam/point.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <map>
#include <set>
#include <string>
#include <utility>

namespace gwreparam {

CompositeReparameterisation::CompositeReparameterisation(
    ParameterSet parameters,
    std::vector<ReparameterisationPtr> transforms)
    : parameters_(std::move(parameters)),
      transforms_(std::move(transforms)) {
    if (parameters_.empty()) {
        throw ConfigurationError("composite reparameterisation requires at least one parameter");
    }
    for (const auto& t : transforms_) {
        if (!t) {
            throw ConfigurationError("composite reparameterisation contains a null transform");
        }
    }
    for (const auto& p : parameters_) {
        physical_names_.push_back(p.name());
    }
    validate_coverage();
    sort_by_dependencies();
    for (const auto& t : transforms_) {
        const auto& out = t->output_parameters();
        transformed_names_.insert(transformed_names_.end(), out.begin(), out.end());
        const auto& aux = t->auxiliary_parameters();
        auxiliary_names_.insert(auxiliary_names_.end(), aux.begin(), aux.end());
    }
}

// ─── Validation ───────────────────────────────────────────────────────────────

void CompositeReparameterisation::validate_coverage() const {
    std::set<std::string> physical;
    for (const auto& name : physical_names_) {
        if (!physical.insert(name).second) {
            throw ConfigurationError(fmt::format("parameter '{}' is declared twice", name));
        }
    }

    std::set<std::string> covered;
    std::set<std::string> outputs;
    for (const auto& t : transforms_) {
        const auto& aux = t->auxiliary_parameters();
        for (const auto& name : aux) {
            if (physical.count(name) != 0) {
                throw ConfigurationError(
                    fmt::format("{} transform adds auxiliary '{}', which is a physical parameter",
                                t->kind(), name));
            }
        }
        for (const auto& name : t->input_parameters()) {
            const bool own_auxiliary = std::find(aux.begin(), aux.end(), name) != aux.end();
            if (physical.count(name) == 0 && !own_auxiliary) {
                throw ConfigurationError(
                    fmt::format("{} transform consumes unknown parameter '{}'", t->kind(), name));
            }
            if (!covered.insert(name).second) {
                throw ConfigurationError(
                    fmt::format("parameter '{}' is consumed by more than one transform", name));
            }
        }
        for (const auto& name : t->output_parameters()) {
            if (!outputs.insert(name).second) {
                throw ConfigurationError(
                    fmt::format("transformed parameter '{}' is produced more than once", name));
            }
        }
        const auto& inputs = t->input_parameters();
        for (const auto& name : t->required_parameters()) {
            if (physical.count(name) == 0) {
                throw ConfigurationError(
                    fmt::format("{} transform requires '{}', which is not a physical parameter",
                                t->kind(), name));
            }
            if (std::find(inputs.begin(), inputs.end(), name) != inputs.end()) {
                throw ConfigurationError(
                    fmt::format("{} transform requires '{}', which it also consumes",
                                t->kind(), name));
            }
        }
    }

    for (const auto& name : physical_names_) {
        if (covered.count(name) == 0) {
            throw ConfigurationError(
                fmt::format("parameter '{}' is not covered by any transform", name));
        }
    }
}

void CompositeReparameterisation::sort_by_dependencies() {
    const std::size_t n = transforms_.size();

    std::map<std::string, std::size_t> consumer;
    for (std::size_t i = 0; i < n; ++i) {
        for (const auto& name : transforms_[i]->input_parameters()) {
            consumer[name] = i;
        }
    }

    // Edge i → j: transform i requires a parameter consumed by j, so i must
    // come first in sequence order.
    std::vector<std::set<std::size_t>> successors(n);
    std::vector<std::size_t> pending(n, 0);
    for (std::size_t i = 0; i < n; ++i) {
        for (const auto& name : transforms_[i]->required_parameters()) {
            const std::size_t j = consumer.at(name);
            if (successors[i].insert(j).second) {
                ++pending[j];
            }
        }
    }

    // Kahn's algorithm, always taking the lowest ready index (stable).
    std::set<std::size_t> ready;
    for (std::size_t i = 0; i < n; ++i) {
        if (pending[i] == 0) {
            ready.insert(i);
        }
    }
    std::vector<ReparameterisationPtr> ordered;
    ordered.reserve(n);
    while (!ready.empty()) {
        const std::size_t i = *ready.begin();
        ready.erase(ready.begin());
        ordered.push_back(transforms_[i]);
        for (std::size_t j : successors[i]) {
            if (--pending[j] == 0) {
                ready.insert(j);
            }
        }
    }
    if (ordered.size() != n) {
        throw ConfigurationError("transform requirements form a dependency cycle");
    }
    transforms_ = std::move(ordered);
}

// ─── Maps ─────────────────────────────────────────────────────────────────────

TransformResult CompositeReparameterisation::forward(const Point& physical) const {
    Point transformed;
    double log_j = 0.0;
    for (const auto& t : transforms_) {
        log_j += t->forward_into(physical, transformed);
    }
    if (!std::isfinite(log_j)) {
        throw DomainError(physical_names_.front(), log_j, "summed log-Jacobian is not finite");
    }
    return {std::move(transformed), log_j};
}

TransformResult CompositeReparameterisation::inverse(const Point& transformed) const {
    Point physical;
    double log_j = 0.0;
    for (auto it = transforms_.rbegin(); it != transforms_.rend(); ++it) {
        log_j += (*it)->inverse_into(transformed, physical);
    }
    // Auxiliary coordinates are validated by the transform that writes them.
    for (const auto& p : parameters_) {
        const double x = value_of(physical, p.name());
        if (!p.contains(x)) {
            throw DomainError(p.name(), x, "reconstructed value outside prior bounds");
        }
    }
    if (!std::isfinite(log_j)) {
        throw DomainError(physical_names_.front(), log_j, "summed log-Jacobian is not finite");
    }
    return {std::move(physical), log_j};
}

Point CompositeReparameterisation::complete(const Point& physical, std::mt19937_64& rng) const {
    Point completed = physical;
    for (const auto& t : transforms_) {
        t->draw_auxiliary(completed, rng);
    }
    return completed;
}

double CompositeReparameterisation::log_prior_auxiliary(const Point& physical) const {
    double log_p = 0.0;
    for (const auto& t : transforms_) {
        log_p += t->log_prior_auxiliary(physical);
    }
    return log_p;
}

CompositeReparameterisation
CompositeReparameterisation::refit(std::span<const Point> live_points) const {
    std::vector<ReparameterisationPtr> refitted;
    refitted.reserve(transforms_.size());
    for (const auto& t : transforms_) {
        auto fresh = t->refit(live_points);
        refitted.push_back(fresh ? std::move(fresh) : t);
    }
    return CompositeReparameterisation(parameters_, std::move(refitted));
}

bool CompositeReparameterisation::has_fitted() const noexcept {
    return std::any_of(transforms_.begin(), transforms_.end(),
                       [](const ReparameterisationPtr& t) { return t->is_fitted(); });
}

} // namespace gwreparam
