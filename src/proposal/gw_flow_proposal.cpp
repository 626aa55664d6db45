/// @file src/proposal/gw_flow_proposal.cpp
/// @brief GWFlowProposal construction, sampling, density and update.

#include "gwreparam/proposal.hpp"
#include "gwreparam/errors.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <algorithm>
#include <cmath>
#include <string>
#include <utility>

namespace gwreparam {

namespace {

CompositeReparameterisation build_composite(const ProposalConfig& config) {
    return DefaultReparameterisationSet(ReparameterisationRegistry::known(), config.verbose)
        .build(config.parameters, config.overrides);
}

} // namespace

// ─── Construction ─────────────────────────────────────────────────────────────

GWFlowProposal::GWFlowProposal(ProposalConfig config, BaseProposal& base)
    : config_(std::move(config)),
      base_(base),
      composite_(build_composite(config_)),
      rng_(config_.seed),
      logger_(to_string(config_.variant), config_.verbose) {
    validate_config();
    if (config_.variant == ProposalVariant::Augmented) {
        for (std::size_t i = 0; i < config_.augmented.augment_dims; ++i) {
            latent_names_.push_back(fmt::format("e_{}", i));
        }
        const auto& names = composite_.transformed_names();
        for (const auto& e : latent_names_) {
            if (std::find(names.begin(), names.end(), e) != names.end()) {
                throw ConfigurationError(
                    fmt::format("latent dimension '{}' collides with a transformed parameter", e));
            }
        }
    }
    state_ = initial_state();
    logger_.info("transformed space: {}", composite_.transformed_names());
}

void GWFlowProposal::validate_config() const {
    switch (config_.variant) {
        case ProposalVariant::Plain:
            break;
        case ProposalVariant::Augmented:
            if (config_.augmented.augment_dims == 0) {
                throw ConfigurationError("augmented proposal requires augment_dims >= 1");
            }
            if (config_.augmented.n_marg == 0) {
                throw ConfigurationError("augmented proposal requires n_marg >= 1");
            }
            break;
        case ProposalVariant::Clustering:
            if (!config_.base_factory) {
                throw ConfigurationError("clustering proposal requires a base proposal factory");
            }
            if (config_.clustering.n_clusters == 0 || config_.clustering.max_iterations == 0) {
                throw ConfigurationError(
                    "clustering proposal requires n_clusters >= 1 and max_iterations >= 1");
            }
            break;
        case ProposalVariant::Mcmc:
            if (!config_.constraint) {
                throw ConfigurationError("MCMC proposal requires a likelihood constraint");
            }
            if (!(config_.mcmc.step_scale > 0.0) || !std::isfinite(config_.mcmc.step_scale)) {
                throw ConfigurationError(
                    fmt::format("MCMC step_scale must be finite and positive, got {}",
                                config_.mcmc.step_scale));
            }
            break;
    }
}

GWFlowProposal::VariantState GWFlowProposal::initial_state() const {
    switch (config_.variant) {
        case ProposalVariant::Clustering:
            return ClusterState{};
        case ProposalVariant::Mcmc: {
            const auto d = static_cast<Eigen::Index>(composite_.transformed_names().size());
            return McmcState{Eigen::VectorXd::Constant(d, config_.mcmc.step_scale), {}};
        }
        case ProposalVariant::Plain:
        case ProposalVariant::Augmented:
            break;
    }
    return PlainState{};
}

// ─── Sampling ─────────────────────────────────────────────────────────────────

std::vector<GWFlowProposal::Candidate> GWFlowProposal::draw_candidates(std::size_t n) {
    if (config_.variant == ProposalVariant::Augmented) {
        return draw_augmented(n);
    }
    if (auto* clusters = std::get_if<ClusterState>(&state_);
        clusters != nullptr && !clusters->components.empty()) {
        return draw_clustered(n, *clusters);
    }
    if (auto* mcmc = std::get_if<McmcState>(&state_)) {
        return draw_mcmc(n, *mcmc);
    }
    std::vector<Candidate> out;
    for (auto& p : base_.sample_transformed(n)) {
        const double log_q = base_.log_prob_transformed(p);
        out.push_back({std::move(p), log_q});
    }
    return out;
}

std::vector<Draw> GWFlowProposal::sample(std::size_t n) {
    std::vector<Draw> draws;
    draws.reserve(n);
    std::size_t failures = 0;
    std::string last_failure;

    const auto fail = [&](std::string reason) {
        ++failures;
        last_failure = std::move(reason);
        if (failures > config_.retry_limit) {
            logger_.warn("sample exhausted after {} failures: {}", failures, last_failure);
            throw ProposalExhaustedError(config_.retry_limit, last_failure);
        }
    };

    while (draws.size() < n) {
        auto batch = draw_candidates(n - draws.size());
        if (batch.empty()) {
            fail("base proposal returned no candidates");
            continue;
        }
        for (auto& c : batch) {
            if (draws.size() == n) {
                break;
            }
            try {
                auto physical = composite_.inverse(c.point);
                if (config_.variant == ProposalVariant::Mcmc && !config_.constraint(physical.point)) {
                    fail("MCMC chain ended outside the likelihood constraint");
                    continue;
                }
                draws.push_back({std::move(physical.point), c.log_q - physical.log_jacobian});
            } catch (const DomainError& e) {
                logger_.debug("discarding candidate: {}", e.what());
                fail(e.what());
            }
        }
    }
    return draws;
}

// ─── Density ──────────────────────────────────────────────────────────────────

double GWFlowProposal::log_prob_transformed(const Point& transformed) const {
    if (config_.variant == ProposalVariant::Augmented) {
        return log_prob_augmented(transformed);
    }
    if (const auto* clusters = std::get_if<ClusterState>(&state_);
        clusters != nullptr && !clusters->components.empty()) {
        return mixture_log_prob(*clusters, transformed);
    }
    return base_.log_prob_transformed(transformed);
}

double GWFlowProposal::log_prob(const Point& physical) const {
    const auto forward = composite_.forward(physical);
    return log_prob_transformed(forward.point) + forward.log_jacobian;
}

// ─── Update ───────────────────────────────────────────────────────────────────

void GWFlowProposal::update(std::span<const Point> live_points) {
    if (live_points.empty()) {
        logger_.warn("update called with no live points; keeping previous state");
        return;
    }

    std::vector<Point> completed;
    completed.reserve(live_points.size());
    for (const auto& p : live_points) {
        completed.push_back(composite_.complete(p, rng_));
    }

    CompositeReparameterisation refitted = composite_.refit(completed);
    std::vector<Point> transformed;
    transformed.reserve(completed.size());
    for (const auto& p : completed) {
        transformed.push_back(refitted.forward(p).point);
    }

    // Everything below writes into locals (or the external base proposal)
    // and is committed only at the end.
    VariantState next = PlainState{};
    switch (config_.variant) {
        case ProposalVariant::Plain:
            base_.fit(transformed);
            break;
        case ProposalVariant::Augmented:
            base_.fit(augment(transformed));
            break;
        case ProposalVariant::Clustering:
            next = fit_clusters(transformed);
            break;
        case ProposalVariant::Mcmc:
            next = fit_mcmc(transformed);
            base_.fit(transformed);
            break;
    }

    composite_ = std::move(refitted);
    state_ = std::move(next);
    logger_.info("updated with {} live points", live_points.size());
}

// ─── Introspection ────────────────────────────────────────────────────────────

std::size_t GWFlowProposal::n_components() const noexcept {
    if (const auto* clusters = std::get_if<ClusterState>(&state_)) {
        return clusters->components.size();
    }
    return 0;
}

McmcStats GWFlowProposal::mcmc_stats() const noexcept {
    if (const auto* mcmc = std::get_if<McmcState>(&state_)) {
        return mcmc->stats;
    }
    return {};
}

} // namespace gwreparam
