#pragma once

/// @file include/gwreparam/defaults.hpp
/// @brief DefaultReparameterisationSet — recommended transforms for
///        well-known gravitational-wave parameters.
///
/// # Module: Default Reparameterisation Set
///
/// ## Responsibility
/// Given the physical parameter set and optional caller overrides, choose a
/// transform for every parameter:
///   1. An override consuming the parameter wins outright (no merging).
///   2. Otherwise the parameter name is looked up, case-insensitively, in the
///      alias table. Joint kinds pull in whichever listed partners are
///      present; a joint kind with no partner present falls through to 3.
///   3. Otherwise the descriptor's topology decides: linear → identity,
///      bounded → logit, periodic → angle, reflective → reflective.
///      A composite parameter with no joint alias is a ConfigurationError.
///
/// ## Guarantees
/// - The resulting set covers every parameter exactly once, so it always
///   forms a valid CompositeReparameterisation unless an override conflicts

#include "gwreparam/composite.hpp"
#include "gwreparam/parameter.hpp"
#include "gwreparam/registry.hpp"
#include "gwreparam/reparameterisation.hpp"

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace gwreparam {

/// Caller-supplied transforms keyed by a parameter each one consumes. The
/// same instance may appear under several keys (e.g. a sky pair under both
/// `ra` and `dec`).
using ReparameterisationOverrides = std::map<std::string, ReparameterisationPtr>;

/// Alias table entry: registry kind plus candidate joint partners.
struct ParameterAlias {
    std::string              kind;
    std::vector<std::string> partners;
};

class DefaultReparameterisationSet {
public:
    explicit DefaultReparameterisationSet(
        const ReparameterisationRegistry& registry = ReparameterisationRegistry::known(),
        bool verbose = false);

    /// Case-insensitive alias lookup.
    [[nodiscard]] std::optional<ParameterAlias> lookup(std::string_view name) const;

    /// Choose one transform per parameter (in parameter order, overrides
    /// first).
    ///
    /// # Throws
    /// ConfigurationError for an override keyed by an unknown parameter, by
    /// a parameter the override does not consume, a null override, or a
    /// composite parameter without a joint transform.
    [[nodiscard]] std::vector<ReparameterisationPtr>
    resolve(const ParameterSet& parameters,
            const ReparameterisationOverrides& overrides = {}) const;

    /// `resolve` then build the composite.
    [[nodiscard]] CompositeReparameterisation
    build(const ParameterSet& parameters,
          const ReparameterisationOverrides& overrides = {}) const;

    /// Transform chosen from topology alone.
    [[nodiscard]] static ReparameterisationPtr topology_default(const ParameterDescriptor& parameter);

    /// The built-in alias table, keys lowercase.
    [[nodiscard]] static const std::map<std::string, ParameterAlias>& aliases();

private:
    const ReparameterisationRegistry& registry_;
    bool                              verbose_;
};

} // namespace gwreparam
