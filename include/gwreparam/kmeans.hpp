#pragma once

/// @file include/gwreparam/kmeans.hpp
/// @brief KMeans — k-means++ seeding plus Lloyd iterations over Eigen rows.

#include "gwreparam/constants.hpp"

#include <Eigen/Dense>

#include <cstddef>
#include <random>
#include <vector>

namespace gwreparam {

struct KMeansResult {
    Eigen::MatrixXd          centroids;   ///< k × d
    std::vector<std::size_t> labels;      ///< cluster of each row
    std::vector<std::size_t> counts;      ///< members per cluster
    std::size_t              iterations;  ///< Lloyd iterations performed
};

class KMeans {
public:
    /// # Throws
    /// ConfigurationError if `n_clusters` or `max_iterations` is zero.
    explicit KMeans(std::size_t n_clusters,
                    std::size_t max_iterations = constants::DEFAULT_KMEANS_ITERATIONS);

    /// Cluster the rows of `data`. At most `data.rows()` clusters are formed;
    /// every returned cluster has at least one member.
    ///
    /// # Throws
    /// ConfigurationError if `data` is empty or contains non-finite values.
    [[nodiscard]] KMeansResult fit(const Eigen::MatrixXd& data, std::mt19937_64& rng) const;

    /// Dissolve clusters with fewer than `min_size` members into the nearest
    /// surviving centroid, then recompute centroids. The largest cluster
    /// always survives. Labels are renumbered 0..k′−1.
    [[nodiscard]] static KMeansResult dissolve_small(const Eigen::MatrixXd& data,
                                                     const KMeansResult& result,
                                                     std::size_t min_size);

    [[nodiscard]] std::size_t n_clusters() const noexcept { return n_clusters_; }

private:
    [[nodiscard]] Eigen::MatrixXd seed(const Eigen::MatrixXd& data,
                                       std::size_t k,
                                       std::mt19937_64& rng) const;

    std::size_t n_clusters_;
    std::size_t max_iterations_;
};

} // namespace gwreparam
