#pragma once

/** \file kmeans.hpp
 *  \brief K-means clustering used to learn product-quantizer sub-codebooks.
 *
 * k-means++ seeding followed by Lloyd iterations with relative-inertia early stop.
 * Empty clusters are re-seeded from the point farthest from its centroid.
 *
 * Thread-safety: pure functions; assignment is parallelized with OpenMP when enabled.
 * Determinism: a fixed seed produces reproducible centroids.
 */

#include <cstdint>
#include <expected>
#include <span>
#include <vector>

#include "quiver/error.hpp"

namespace quiver::index {

/** \brief K-means clustering parameters. */
struct KmeansParams {
    std::uint32_t k{256};                /**< Number of clusters */
    std::uint32_t max_iter{25};          /**< Maximum Lloyd iterations */
    float epsilon{1e-4f};                /**< Relative inertia change that counts as converged */
    std::uint32_t seed{42};              /**< Random seed */
};

/** \brief K-means clustering result. */
struct KmeansResult {
    std::vector<std::vector<float>> centroids;  /**< Cluster centers [k x dim] */
    std::vector<std::uint32_t> assignments;     /**< Point assignments [n] */
    float inertia{0.0f};                        /**< Sum of squared distances */
    std::uint32_t iterations{0};                /**< Iterations performed */
};

/** \brief Partition data into k clusters minimizing within-cluster variance.
 *
 * \param data Input vectors [n x dim]
 * \param n Number of vectors
 * \param dim Vector dimensionality
 * \param params Clustering parameters
 * \return Clustering result, or insufficient_samples when n < k
 *
 * Complexity: O(n * k * dim * iterations)
 */
auto kmeans_cluster(const float* data, std::size_t n, std::size_t dim,
                    const KmeansParams& params)
    -> std::expected<KmeansResult, core::error>;

/** \brief k-means++ seeding: picks centroids with probability proportional to D^2. */
auto kmeans_plusplus_init(const float* data, std::size_t n, std::size_t dim,
                          std::uint32_t k, std::uint32_t seed)
    -> std::vector<std::vector<float>>;

/** \brief Assign each point to its nearest centroid; returns total inertia. */
auto kmeans_assign(const float* data, std::size_t n, std::size_t dim,
                   const std::vector<std::vector<float>>& centroids,
                   std::span<std::uint32_t> assignments) -> float;

} // namespace quiver::index
