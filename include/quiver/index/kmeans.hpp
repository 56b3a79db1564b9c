#pragma once

/** \file kmeans.hpp
 *  \brief K-means clustering for the IVF coarse quantizer.
 *
 * k-means++ initialization followed by Lloyd iterations with early stopping
 * on relative inertia change.
 *
 * Thread-safety: assignment is parallelized with OpenMP when available;
 * the functions themselves hold no shared state.
 * Determinism: a fixed seed produces reproducible results.
 */

#include <cstdint>
#include <expected>
#include <span>
#include <vector>

#include "quiver/error.hpp"

namespace quiver::index {

/** \brief K-means clustering parameters. */
struct KmeansParams {
    std::uint32_t k{100};                /**< Number of clusters */
    std::uint32_t max_iter{25};          /**< Maximum iterations */
    float epsilon{1e-4f};                /**< Relative inertia change to stop */
    std::uint32_t seed{42};              /**< Random seed */
};

/** \brief K-means clustering result. */
struct KmeansResult {
    std::vector<std::vector<float>> centroids;  /**< Cluster centers [k x dim] */
    std::vector<std::uint32_t> assignments;     /**< Point assignments [n] */
    std::vector<std::uint32_t> cluster_sizes;   /**< Points per cluster [k] */
    float inertia{0.0f};                        /**< Sum of squared distances */
    std::uint32_t iterations{0};                /**< Iterations performed */
};

/** \brief Partition data into k clusters minimizing within-cluster variance.
 *
 * \param data Input vectors [n x dim], row-major
 * Preconditions: n >= k > 0; data contains finite values
 * Complexity: O(n * k * dim * iterations)
 */
auto kmeans_cluster(const float* data, std::size_t n, std::size_t dim,
                    const KmeansParams& params)
    -> std::expected<KmeansResult, core::error>;

/** \brief k-means++ seeding: D^2-weighted sampling of initial centroids. */
auto kmeans_plusplus_init(const float* data, std::size_t n, std::size_t dim,
                          std::uint32_t k, std::uint32_t seed)
    -> std::vector<std::vector<float>>;

/** \brief Assign points to nearest centroids; returns total inertia. */
auto kmeans_assign(const float* data, std::size_t n,
                   const std::vector<std::vector<float>>& centroids,
                   std::span<std::uint32_t> assignments) -> float;

/** \brief Recompute centroids as cluster means; empty clusters keep their previous centroid. */
auto kmeans_update_centroids(const float* data, std::size_t n, std::size_t dim,
                             std::span<const std::uint32_t> assignments,
                             std::uint32_t k,
                             std::vector<std::vector<float>>& centroids) -> void;

} // namespace quiver::index
