/// @file src/proposal/kmeans.cpp
/// @brief k-means++ seeding, Lloyd iterations and small-cluster dissolution.

#include "gwreparam/kmeans.hpp"
#include "gwreparam/errors.hpp"

#include <algorithm>
#include <limits>
#include <utility>

namespace gwreparam {

namespace {

/// Index of the centroid nearest to `row` and its squared distance.
std::pair<std::size_t, double> nearest(const Eigen::MatrixXd& centroids,
                                       const Eigen::RowVectorXd& row) {
    std::size_t best = 0;
    double best_d2 = std::numeric_limits<double>::infinity();
    for (Eigen::Index c = 0; c < centroids.rows(); ++c) {
        const double d2 = (centroids.row(c) - row).squaredNorm();
        if (d2 < best_d2) {
            best_d2 = d2;
            best = static_cast<std::size_t>(c);
        }
    }
    return {best, best_d2};
}

/// Recompute centroids and counts from labels. Empty clusters keep their
/// previous centroid.
void recompute(const Eigen::MatrixXd& data, KMeansResult& r) {
    const auto k = static_cast<std::size_t>(r.centroids.rows());
    Eigen::MatrixXd sums = Eigen::MatrixXd::Zero(r.centroids.rows(), data.cols());
    r.counts.assign(k, 0);
    for (Eigen::Index i = 0; i < data.rows(); ++i) {
        const std::size_t c = r.labels[static_cast<std::size_t>(i)];
        sums.row(static_cast<Eigen::Index>(c)) += data.row(i);
        ++r.counts[c];
    }
    for (std::size_t c = 0; c < k; ++c) {
        if (r.counts[c] > 0) {
            r.centroids.row(static_cast<Eigen::Index>(c)) =
                sums.row(static_cast<Eigen::Index>(c)) / static_cast<double>(r.counts[c]);
        }
    }
}

/// Drop clusters with no members and renumber labels densely.
KMeansResult compact(const Eigen::MatrixXd& data, const KMeansResult& r) {
    std::vector<std::size_t> remap(r.counts.size(), 0);
    std::vector<Eigen::Index> kept;
    for (std::size_t c = 0; c < r.counts.size(); ++c) {
        if (r.counts[c] > 0) {
            remap[c] = kept.size();
            kept.push_back(static_cast<Eigen::Index>(c));
        }
    }
    KMeansResult out;
    out.iterations = r.iterations;
    out.centroids.resize(static_cast<Eigen::Index>(kept.size()), data.cols());
    for (std::size_t j = 0; j < kept.size(); ++j) {
        out.centroids.row(static_cast<Eigen::Index>(j)) = r.centroids.row(kept[j]);
    }
    out.labels.reserve(r.labels.size());
    for (std::size_t label : r.labels) {
        out.labels.push_back(remap[label]);
    }
    out.counts.reserve(kept.size());
    for (Eigen::Index c : kept) {
        out.counts.push_back(r.counts[static_cast<std::size_t>(c)]);
    }
    return out;
}

} // namespace

KMeans::KMeans(std::size_t n_clusters, std::size_t max_iterations)
    : n_clusters_(n_clusters), max_iterations_(max_iterations) {
    if (n_clusters_ == 0) {
        throw ConfigurationError("k-means requires at least one cluster");
    }
    if (max_iterations_ == 0) {
        throw ConfigurationError("k-means requires at least one iteration");
    }
}

// ─── Seeding ──────────────────────────────────────────────────────────────────

Eigen::MatrixXd KMeans::seed(const Eigen::MatrixXd& data,
                             std::size_t k,
                             std::mt19937_64& rng) const {
    const Eigen::Index n = data.rows();
    Eigen::MatrixXd centroids(static_cast<Eigen::Index>(k), data.cols());

    std::uniform_int_distribution<Eigen::Index> first(0, n - 1);
    centroids.row(0) = data.row(first(rng));

    // k-means++: pick each further centre with probability ∝ D(x)².
    std::vector<double> d2(static_cast<std::size_t>(n));
    for (std::size_t c = 1; c < k; ++c) {
        const Eigen::MatrixXd placed = centroids.topRows(static_cast<Eigen::Index>(c));
        double total = 0.0;
        for (Eigen::Index i = 0; i < n; ++i) {
            d2[static_cast<std::size_t>(i)] = nearest(placed, data.row(i)).second;
            total += d2[static_cast<std::size_t>(i)];
        }
        Eigen::Index pick = 0;
        if (total > 0.0) {
            std::discrete_distribution<Eigen::Index> choose(d2.begin(), d2.end());
            pick = choose(rng);
        } else {
            pick = first(rng);
        }
        centroids.row(static_cast<Eigen::Index>(c)) = data.row(pick);
    }
    return centroids;
}

// ─── Lloyd ────────────────────────────────────────────────────────────────────

KMeansResult KMeans::fit(const Eigen::MatrixXd& data, std::mt19937_64& rng) const {
    if (data.rows() == 0 || data.cols() == 0) {
        throw ConfigurationError("k-means requires a non-empty data matrix");
    }
    if (!data.allFinite()) {
        throw ConfigurationError("k-means data contains non-finite values");
    }
    const std::size_t k = std::min(n_clusters_, static_cast<std::size_t>(data.rows()));

    KMeansResult r;
    r.centroids = seed(data, k, rng);
    r.labels.assign(static_cast<std::size_t>(data.rows()), 0);
    r.iterations = 0;

    for (std::size_t it = 0; it < max_iterations_; ++it) {
        bool changed = it == 0;
        for (Eigen::Index i = 0; i < data.rows(); ++i) {
            const std::size_t c = nearest(r.centroids, data.row(i)).first;
            if (r.labels[static_cast<std::size_t>(i)] != c) {
                r.labels[static_cast<std::size_t>(i)] = c;
                changed = true;
            }
        }
        recompute(data, r);
        r.iterations = it + 1;
        if (!changed) {
            break;
        }
    }
    return compact(data, r);
}

// ─── Dissolution ──────────────────────────────────────────────────────────────

KMeansResult KMeans::dissolve_small(const Eigen::MatrixXd& data,
                                    const KMeansResult& result,
                                    std::size_t min_size) {
    const auto largest = static_cast<std::size_t>(
        std::max_element(result.counts.begin(), result.counts.end()) - result.counts.begin());

    std::vector<Eigen::Index> survivors;
    for (std::size_t c = 0; c < result.counts.size(); ++c) {
        if (result.counts[c] >= min_size || c == largest) {
            survivors.push_back(static_cast<Eigen::Index>(c));
        }
    }
    if (survivors.size() == result.counts.size()) {
        return result;
    }

    KMeansResult r;
    r.iterations = result.iterations;
    r.centroids.resize(static_cast<Eigen::Index>(survivors.size()), data.cols());
    for (std::size_t j = 0; j < survivors.size(); ++j) {
        r.centroids.row(static_cast<Eigen::Index>(j)) = result.centroids.row(survivors[j]);
    }
    r.labels.resize(result.labels.size());
    for (Eigen::Index i = 0; i < data.rows(); ++i) {
        r.labels[static_cast<std::size_t>(i)] = nearest(r.centroids, data.row(i)).first;
    }
    recompute(data, r);
    return compact(data, r);
}

} // namespace gwreparam
