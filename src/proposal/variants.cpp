/// @file src/proposal/variants.cpp
/// @brief Augmented, clustering and MCMC-refinement behaviour of GWFlowProposal.

#include "gwreparam/proposal.hpp"
#include "gwreparam/errors.hpp"
#include "gwreparam/kmeans.hpp"
#include "gwreparam/point.hpp"

#include "../reparam/transform_math.hpp"

#include <fmt/format.h>

#include <cmath>
#include <utility>

namespace gwreparam {

using detail::TransformMath;

// ─── Augmented ────────────────────────────────────────────────────────────────

std::vector<Point> GWFlowProposal::augment(std::span<const Point> transformed) const {
    std::normal_distribution<double> normal(0.0, 1.0);
    std::vector<Point> out;
    out.reserve(transformed.size());
    for (const auto& p : transformed) {
        Point q = p;
        for (const auto& e : latent_names_) {
            q[e] = normal(rng_);
        }
        out.push_back(std::move(q));
    }
    return out;
}

double GWFlowProposal::log_prob_augmented(const Point& transformed) const {
    std::vector<double> e(latent_names_.size(), 0.0);
    if (!config_.augmented.marginalise) {
        Point joint = transformed;
        for (const auto& name : latent_names_) {
            joint[name] = 0.0;
        }
        return base_.log_prob_transformed(joint) - TransformMath::log_standard_normal(e);
    }

    // Importance-sampling estimate of q(x′) = E_{e ~ N(0,1)}[q(x′, e) / N(e)].
    const std::size_t m = config_.augmented.n_marg;
    std::normal_distribution<double> normal(0.0, 1.0);
    std::vector<double> terms;
    terms.reserve(m);
    for (std::size_t i = 0; i < m; ++i) {
        Point joint = transformed;
        for (std::size_t k = 0; k < latent_names_.size(); ++k) {
            e[k] = normal(rng_);
            joint[latent_names_[k]] = e[k];
        }
        terms.push_back(base_.log_prob_transformed(joint) - TransformMath::log_standard_normal(e));
    }
    return TransformMath::log_sum_exp(terms) - std::log(static_cast<double>(m));
}

std::vector<GWFlowProposal::Candidate> GWFlowProposal::draw_augmented(std::size_t n) {
    std::vector<Candidate> out;
    for (auto& joint : base_.sample_transformed(n)) {
        for (const auto& name : latent_names_) {
            joint.erase(name);
        }
        // Same estimator as log_prob, so a draw's density matches a later query.
        const double log_q = log_prob_augmented(joint);
        out.push_back({std::move(joint), log_q});
    }
    return out;
}

// ─── Clustering ───────────────────────────────────────────────────────────────

GWFlowProposal::VariantState
GWFlowProposal::fit_clusters(std::span<const Point> transformed) const {
    const auto& names = composite_.transformed_names();
    const Eigen::MatrixXd data = to_matrix(transformed, names);

    const KMeans kmeans(config_.clustering.n_clusters, config_.clustering.max_iterations);
    const KMeansResult raw = kmeans.fit(data, rng_);
    const KMeansResult clusters =
        KMeans::dissolve_small(data, raw, config_.clustering.min_cluster_size);
    logger_.info("k-means: {} clusters after {} iterations, {} kept",
                 raw.counts.size(), raw.iterations, clusters.counts.size());

    std::vector<std::vector<Point>> members(clusters.counts.size());
    for (std::size_t i = 0; i < transformed.size(); ++i) {
        members[clusters.labels[i]].push_back(transformed[i]);
    }

    ClusterState state;
    const auto total = static_cast<double>(transformed.size());
    for (std::size_t k = 0; k < members.size(); ++k) {
        auto component = config_.base_factory();
        if (!component) {
            throw ConfigurationError("base proposal factory returned null");
        }
        component->fit(members[k]);
        state.components.push_back(std::move(component));
        state.log_weights.push_back(std::log(static_cast<double>(members[k].size()) / total));
    }
    return state;
}

double GWFlowProposal::mixture_log_prob(const ClusterState& state, const Point& transformed) const {
    std::vector<double> terms;
    terms.reserve(state.components.size());
    for (std::size_t k = 0; k < state.components.size(); ++k) {
        terms.push_back(state.log_weights[k] + state.components[k]->log_prob_transformed(transformed));
    }
    return TransformMath::log_sum_exp(terms);
}

std::vector<GWFlowProposal::Candidate>
GWFlowProposal::draw_clustered(std::size_t n, const ClusterState& state) {
    std::vector<double> weights;
    weights.reserve(state.log_weights.size());
    for (double lw : state.log_weights) {
        weights.push_back(std::exp(lw));
    }
    std::discrete_distribution<std::size_t> pick(weights.begin(), weights.end());
    std::vector<std::size_t> counts(state.components.size(), 0);
    for (std::size_t i = 0; i < n; ++i) {
        ++counts[pick(rng_)];
    }

    std::vector<Candidate> out;
    out.reserve(n);
    for (std::size_t k = 0; k < counts.size(); ++k) {
        if (counts[k] == 0) {
            continue;
        }
        for (auto& p : state.components[k]->sample_transformed(counts[k])) {
            const double log_q = mixture_log_prob(state, p);
            out.push_back({std::move(p), log_q});
        }
    }
    return out;
}

// ─── MCMC refinement ──────────────────────────────────────────────────────────

GWFlowProposal::VariantState
GWFlowProposal::fit_mcmc(std::span<const Point> transformed) const {
    const auto& names = composite_.transformed_names();
    const Eigen::MatrixXd data = to_matrix(transformed, names);
    McmcState state;
    state.stats = mcmc_stats();
    state.step = Eigen::VectorXd::Constant(data.cols(), config_.mcmc.step_scale);
    if (data.rows() > 1) {
        const Eigen::RowVectorXd mean = data.colwise().mean();
        const Eigen::MatrixXd centred = data.rowwise() - mean;
        for (Eigen::Index j = 0; j < data.cols(); ++j) {
            const double sd = std::sqrt(centred.col(j).squaredNorm() /
                                        static_cast<double>(data.rows() - 1));
            if (sd > 0.0 && std::isfinite(sd)) {
                state.step(j) = config_.mcmc.step_scale * sd;
            }
        }
    }
    return state;
}

std::vector<GWFlowProposal::Candidate>
GWFlowProposal::draw_mcmc(std::size_t n, McmcState& state) {
    const auto& names = composite_.transformed_names();
    std::normal_distribution<double> normal(0.0, 1.0);
    std::uniform_real_distribution<double> uniform(0.0, 1.0);

    // A state is admissible if it maps back into the prior and satisfies the
    // likelihood constraint.
    const auto admissible = [&](const Point& x) {
        try {
            return config_.constraint(composite_.inverse(x).point);
        } catch (const DomainError&) {
            return false;
        }
    };

    std::vector<Candidate> out;
    for (auto& start : base_.sample_transformed(n)) {
        Point current = std::move(start);
        double current_log_q = base_.log_prob_transformed(current);
        bool current_ok = admissible(current);

        for (std::size_t step = 0; step < config_.mcmc.n_steps; ++step) {
            Point trial = current;
            for (std::size_t j = 0; j < names.size(); ++j) {
                trial[names[j]] += state.step(static_cast<Eigen::Index>(j)) * normal(rng_);
            }
            ++state.stats.proposed;
            if (!admissible(trial)) {
                continue;
            }
            const double trial_log_q = base_.log_prob_transformed(trial);
            // Symmetric random walk: accept with min(1, q(trial)/q(current)).
            // Any admissible state is accepted while the chain is outside.
            if (!current_ok || std::log(uniform(rng_)) < trial_log_q - current_log_q) {
                current = std::move(trial);
                current_log_q = trial_log_q;
                current_ok = true;
                ++state.stats.accepted;
            }
        }
        out.push_back({std::move(current), current_log_q});
    }
    return out;
}

} // namespace gwreparam
