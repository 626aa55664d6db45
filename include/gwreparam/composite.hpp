#pragma once

/// @file include/gwreparam/composite.hpp
/// @brief CompositeReparameterisation — ordered chain of reparameterisations
///        covering the full physical parameter vector.
///
/// # Module: Composite Reparameterisation
///
/// ## Responsibility
/// Validate that a sequence of transforms covers every physical parameter
/// exactly once, order it so that required parameters are available on the
/// inverse pass, and map whole points between physical and transformed space
/// with the summed log-Jacobian.
///
/// ## Ordering
/// Forward reads every input from the untouched physical point, so the order
/// only matters for the inverse, which runs in reverse sequence order and
/// reads required parameters from the partially reconstructed physical point.
/// The constructor therefore stable-sorts the sequence so that a transform
/// requiring `q` precedes the transform consuming `q`. Transforms with no
/// dependency between them keep their given order.
///
/// ## Auxiliary coordinates
/// Embeddings (Angle, SkyPair) add radial coordinates to physical space. The
/// physical points the composite maps are the model parameters plus these
/// auxiliary names; `complete` draws any that a point is missing from their
/// χ priors, and `log_prior_auxiliary` is the log-density the host adds to
/// its prior so the target covers the same space as the proposal.
///
/// ## Guarantees
/// - Coverage, output uniqueness and dependency acyclicity are checked once,
///   at construction (ConfigurationError)
/// - `forward` and `inverse` never partially mutate: on DomainError the
///   caller's data is untouched and no result is returned
/// - Points may carry extra keys; they are ignored
/// - Immutable: `refit` returns a new composite
///
/// ## NOT Responsible For
/// - Choosing transforms (see DefaultReparameterisationSet)

#include "gwreparam/parameter.hpp"
#include "gwreparam/reparameterisation.hpp"
#include "gwreparam/types.hpp"

#include <random>
#include <span>
#include <vector>

namespace gwreparam {

class CompositeReparameterisation {
public:
    /// # Throws
    /// ConfigurationError on a null transform, an input that is neither a
    /// physical parameter nor the transform's own auxiliary coordinate, an
    /// input consumed twice, an auxiliary name shadowing a physical one, a parameter left uncovered,
    /// a duplicated output name, a requirement that is not a physical
    /// parameter (or is consumed by the requiring transform itself), or a
    /// dependency cycle.
    CompositeReparameterisation(ParameterSet parameters,
                                std::vector<ReparameterisationPtr> transforms);

    /// Physical → transformed. Result holds exactly `transformed_names()`.
    ///
    /// # Throws
    /// DomainError from any transform, or if the summed log-Jacobian is not
    /// finite.
    [[nodiscard]] TransformResult forward(const Point& physical) const;

    /// Transformed → physical. Result holds exactly `physical_names()`, each
    /// checked against its descriptor, and `auxiliary_names()`.
    [[nodiscard]] TransformResult inverse(const Point& transformed) const;

    /// Copy of `physical` with every missing auxiliary coordinate drawn from
    /// its prior.
    [[nodiscard]] Point complete(const Point& physical, std::mt19937_64& rng) const;

    /// Summed log prior density of the auxiliary coordinates (0 without any).
    ///
    /// # Throws
    /// DomainError if an auxiliary coordinate is missing or invalid.
    [[nodiscard]] double log_prior_auxiliary(const Point& physical) const;

    /// Copy with every fitted transform re-fitted to `live_points`
    /// (physical space).
    [[nodiscard]] CompositeReparameterisation refit(std::span<const Point> live_points) const;

    [[nodiscard]] const ParameterSet& parameters() const noexcept { return parameters_; }

    /// Transforms in sequence (forward) order after dependency sorting.
    [[nodiscard]] const std::vector<ReparameterisationPtr>& transforms() const noexcept {
        return transforms_;
    }

    [[nodiscard]] const ParameterNames& physical_names() const noexcept { return physical_names_; }
    [[nodiscard]] const ParameterNames& transformed_names() const noexcept { return transformed_names_; }
    [[nodiscard]] const ParameterNames& auxiliary_names() const noexcept { return auxiliary_names_; }

    /// True if any transform is re-fitted on update.
    [[nodiscard]] bool has_fitted() const noexcept;

private:
    void validate_coverage() const;
    void sort_by_dependencies();

    ParameterSet                       parameters_;
    std::vector<ReparameterisationPtr> transforms_;
    ParameterNames                     physical_names_;
    ParameterNames                     transformed_names_;
    ParameterNames                     auxiliary_names_;
};

} // namespace gwreparam
