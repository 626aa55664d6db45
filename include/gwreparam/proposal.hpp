#pragma once

/// @file include/gwreparam/proposal.hpp
/// @brief GWFlowProposal — wraps a base proposal with a composite
///        reparameterisation so that draws and densities are physical.
///
/// # Module: Proposal Wrapper
///
/// ## Responsibility
/// Translate between the physical space the nested-sampling engine works in
/// and the transformed space the base proposal is trained in:
///
///   sample:   x′ ~ q′   →   x = T⁻¹(x′),  log q(x) = log q′(x′) − log|J_T⁻¹(x′)|
///   log_prob: x         →   log q′(T(x)) + log|J_T(x)|
///   update:   live x    →   refit T, train q′ on T(x)
///
/// ## Variants
///   - Plain      — delegate to the base proposal
///   - Augmented  — append N(0, 1) latent dimensions e_0… for training and
///                  sampling; the density is taken at e = 0 or marginalised
///                  over them
///   - Clustering — k-means on transformed live points, one base proposal
///                  per cluster, mixture density
///   - Mcmc       — refine each base draw with random-walk Metropolis steps
///                  restricted to the likelihood constraint
///
/// ## Guarantees
/// - `sample` retries domain failures up to `retry_limit` in total, then
///   throws ProposalExhaustedError
/// - `log_prob` propagates DomainError
/// - `update` commits nothing unless every step succeeds
///
/// ## NOT Responsible For
/// - Accepting draws against the likelihood contour (the host engine)
/// - The base density model itself (see BaseProposal)

#include "gwreparam/base_proposal.hpp"
#include "gwreparam/composite.hpp"
#include "gwreparam/constants.hpp"
#include "gwreparam/defaults.hpp"
#include "gwreparam/log.hpp"
#include "gwreparam/parameter.hpp"
#include "gwreparam/types.hpp"

#include <Eigen/Dense>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <random>
#include <span>
#include <string_view>
#include <variant>
#include <vector>

namespace gwreparam {

// ─── Variants ─────────────────────────────────────────────────────────────────

enum class ProposalVariant {
    Plain,
    Augmented,
    Clustering,
    Mcmc,
};

/// Registry key of a variant: gwflowproposal, augmentedgwflowproposal,
/// clusteringgwflowproposal, mcmcgwflowproposal.
[[nodiscard]] const char* to_string(ProposalVariant v) noexcept;

/// Resolve a registry key (case-insensitive).
///
/// # Throws
/// ConfigurationError for an unknown key.
[[nodiscard]] ProposalVariant proposal_variant_from_string(std::string_view key);

// ─── ProposalConfig ───────────────────────────────────────────────────────────

struct AugmentedOptions {
    /// Number of auxiliary latent dimensions e_0 … e_{k−1}.
    std::size_t augment_dims = constants::DEFAULT_AUGMENT_DIMS;

    /// If true, `log_prob` averages q′(x′, e)/N(e) over `n_marg` fresh draws
    /// of e, so repeated queries of one point return different estimates.
    /// Otherwise e is fixed at 0 and log q(x′) = log q′(x′, 0) − log N(0):
    /// repeatable, and exact when the base proposal keeps e independent of
    /// x′ and N(0, 1). Draws from `sample` use the same estimator.
    bool marginalise = false;

    std::size_t n_marg = constants::DEFAULT_N_MARG;
};

struct ClusteringOptions {
    std::size_t n_clusters       = constants::DEFAULT_N_CLUSTERS;
    std::size_t min_cluster_size = constants::DEFAULT_MIN_CLUSTER_SIZE;
    std::size_t max_iterations   = constants::DEFAULT_KMEANS_ITERATIONS;
};

struct McmcOptions {
    std::size_t n_steps    = constants::DEFAULT_MCMC_STEPS;

    /// Per-dimension step = step_scale × live-point standard deviation in
    /// transformed space (step_scale alone before the first update).
    double      step_scale = constants::DEFAULT_MCMC_STEP_SCALE;
};

/// Configuration for GWFlowProposal. The base proposal itself is passed to
/// the constructor by reference.
struct ProposalConfig {
    /// Physical parameters, supplied by the host.
    ParameterSet parameters{};

    /// Caller transforms replacing the defaults for the parameters they consume.
    ReparameterisationOverrides overrides{};

    ProposalVariant variant = ProposalVariant::Plain;

    /// Domain failures tolerated per `sample` call.
    std::size_t retry_limit = constants::DEFAULT_RETRY_LIMIT;

    /// Seed for the wrapper's own random engine.
    std::uint64_t seed = constants::DEFAULT_SEED;

    /// Clustering only: makes one base proposal per cluster.
    BaseProposalFactory base_factory{};

    /// MCMC only: likelihood constraint in physical space.
    ConstraintPredicate constraint{};

    AugmentedOptions  augmented{};
    ClusteringOptions clustering{};
    McmcOptions       mcmc{};

    /// If true, log resolution and update details to stderr.
    bool verbose = false;
};

/// Metropolis–Hastings bookkeeping of the MCMC variant.
struct McmcStats {
    std::size_t proposed = 0;
    std::size_t accepted = 0;

    [[nodiscard]] double acceptance_rate() const noexcept {
        return proposed == 0 ? 0.0
                             : static_cast<double>(accepted) / static_cast<double>(proposed);
    }
};

// ─── GWFlowProposal ───────────────────────────────────────────────────────────

class GWFlowProposal {
public:
    /// Build the composite reparameterisation from `config.parameters` and
    /// `config.overrides`, and bind `base`, which must outlive the wrapper.
    ///
    /// # Throws
    /// ConfigurationError on an invalid reparameterisation set, or when the
    /// variant's options are unusable (no factory for clustering, no
    /// constraint for MCMC, zero dims or draws, latent names colliding with
    /// transformed names).
    GWFlowProposal(ProposalConfig config, BaseProposal& base);

    /// Draw `n` physical points with their proposal log-densities.
    ///
    /// # Throws
    /// ProposalExhaustedError once more than `retry_limit` candidates (or
    /// empty batches) have failed within this call.
    [[nodiscard]] std::vector<Draw> sample(std::size_t n);

    /// Proposal log-density of a physical point. The point must carry the
    /// auxiliary coordinates of the reparameterisation (every point from
    /// `sample` does; complete others with `reparameterisation().complete`).
    ///
    /// # Throws
    /// DomainError if the point is outside the transform domains or lacks an
    /// auxiliary coordinate.
    [[nodiscard]] double log_prob(const Point& physical) const;

    /// Refit fitted transforms and the base proposal(s) to `live_points`
    /// (physical space). Live points missing an auxiliary coordinate get one
    /// drawn from its prior. An empty snapshot leaves the state untouched.
    ///
    /// # Throws
    /// DomainError if a live point cannot be transformed; errors from the
    /// base proposal's `fit` propagate. Either way the previous state stays.
    void update(std::span<const Point> live_points);

    [[nodiscard]] const CompositeReparameterisation& reparameterisation() const noexcept {
        return composite_;
    }
    [[nodiscard]] ProposalVariant variant() const noexcept { return config_.variant; }
    [[nodiscard]] const ProposalConfig& config() const noexcept { return config_; }

    /// Names of the latent dimensions (augmented variant; empty otherwise).
    [[nodiscard]] const ParameterNames& latent_names() const noexcept { return latent_names_; }

    /// Active mixture components (clustering variant; 0 before the first update).
    [[nodiscard]] std::size_t n_components() const noexcept;

    /// Acceptance counts since construction (MCMC variant).
    [[nodiscard]] McmcStats mcmc_stats() const noexcept;

private:
    struct PlainState {};

    struct ClusterState {
        std::vector<std::unique_ptr<BaseProposal>> components;
        std::vector<double>                        log_weights;
    };

    struct McmcState {
        Eigen::VectorXd step;  ///< per transformed dimension
        McmcStats       stats;
    };

    using VariantState = std::variant<PlainState, ClusterState, McmcState>;

    /// Candidate in transformed space with its transformed log-density.
    struct Candidate {
        Point  point;
        double log_q;
    };

    void validate_config() const;
    [[nodiscard]] VariantState initial_state() const;

    [[nodiscard]] std::vector<Candidate> draw_candidates(std::size_t n);
    [[nodiscard]] std::vector<Candidate> draw_augmented(std::size_t n);
    [[nodiscard]] std::vector<Candidate> draw_clustered(std::size_t n, const ClusterState& state);
    [[nodiscard]] std::vector<Candidate> draw_mcmc(std::size_t n, McmcState& state);

    [[nodiscard]] double log_prob_transformed(const Point& transformed) const;
    [[nodiscard]] double log_prob_augmented(const Point& transformed) const;

    [[nodiscard]] std::vector<Point> augment(std::span<const Point> transformed) const;
    [[nodiscard]] VariantState fit_clusters(std::span<const Point> transformed) const;
    [[nodiscard]] VariantState fit_mcmc(std::span<const Point> transformed) const;

    [[nodiscard]] double mixture_log_prob(const ClusterState& state, const Point& transformed) const;

    ProposalConfig              config_;
    BaseProposal&               base_;
    CompositeReparameterisation composite_;
    ParameterNames              latent_names_;
    VariantState                state_;
    mutable std::mt19937_64     rng_;
    Logger                      logger_;
};

/// Build a GWFlowProposal by registry key, overriding `config.variant`.
///
/// # Throws
/// ConfigurationError for an unknown key or an invalid configuration.
[[nodiscard]] std::unique_ptr<GWFlowProposal>
make_proposal(std::string_view key, ProposalConfig config, BaseProposal& base);

} // namespace gwreparam
