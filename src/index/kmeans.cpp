#include "quiver/index/kmeans.hpp"
#include "quiver/kernels/distance.hpp"
#include "quiver/core/platform_utils.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <iostream>
#include <limits>
#include <random>

namespace quiver::index {

namespace {

inline auto compute_distance(const float* a, const float* b, std::size_t dim) -> float {
    return kernels::l2_sq(std::span(a, dim), std::span(b, dim));
}

/** \brief Find nearest centroid for a point (lowest index wins ties). */
auto find_nearest_centroid(const float* point,
                           const std::vector<std::vector<float>>& centroids,
                           std::size_t dim) -> std::pair<std::uint32_t, float> {
    std::uint32_t best_idx = 0;
    float best_dist = std::numeric_limits<float>::max();

    for (std::uint32_t i = 0; i < centroids.size(); ++i) {
        const float dist = compute_distance(point, centroids[i].data(), dim);
        if (dist < best_dist) {
            best_dist = dist;
            best_idx = i;
        }
    }

    return {best_idx, best_dist};
}

} // anonymous namespace

auto kmeans_plusplus_init(const float* data, std::size_t n, std::size_t dim,
                          std::uint32_t k, std::uint32_t seed)
    -> std::vector<std::vector<float>> {
    std::vector<std::vector<float>> centroids;
    centroids.reserve(k);

    std::mt19937 gen(seed);

    std::uniform_int_distribution<std::size_t> first_dist(0, n - 1);
    const std::size_t first_idx = first_dist(gen);
    centroids.emplace_back(data + first_idx * dim, data + (first_idx + 1) * dim);

    std::vector<float> min_distances(n, std::numeric_limits<float>::max());

    for (std::uint32_t c = 1; c < k; ++c) {
        const auto& last_centroid = centroids.back();

        #pragma omp parallel for
        for (long i = 0; i < static_cast<long>(n); ++i) {
            const float dist = compute_distance(data + static_cast<std::size_t>(i) * dim, last_centroid.data(), dim);
            min_distances[static_cast<std::size_t>(i)] = std::min(min_distances[static_cast<std::size_t>(i)], dist);
        }

        std::vector<double> cumsum(n);
        cumsum[0] = min_distances[0];
        for (std::size_t i = 1; i < n; ++i) {
            cumsum[i] = cumsum[i - 1] + min_distances[i];
        }

        std::size_t idx = 0;
        if (cumsum.back() > 0.0) {
            std::uniform_real_distribution<double> sample_dist(0.0, cumsum.back());
            const double target = sample_dist(gen);
            const auto it = std::lower_bound(cumsum.begin(), cumsum.end(), target);
            idx = std::min<std::size_t>(static_cast<std::size_t>(std::distance(cumsum.begin(), it)), n - 1);
        } else {
            // All points coincide with existing centroids
            std::uniform_int_distribution<std::size_t> any(0, n - 1);
            idx = any(gen);
        }

        centroids.emplace_back(data + idx * dim, data + (idx + 1) * dim);
    }

    return centroids;
}

auto kmeans_assign(const float* data, std::size_t n,
                   const std::vector<std::vector<float>>& centroids,
                   std::span<std::uint32_t> assignments) -> float {
    const std::size_t dim = centroids[0].size();
    double total_inertia = 0.0;

    #pragma omp parallel for reduction(+:total_inertia)
    for (long i = 0; i < static_cast<long>(n); ++i) {
        const auto [idx, dist] = find_nearest_centroid(data + static_cast<std::size_t>(i) * dim, centroids, dim);
        assignments[static_cast<std::size_t>(i)] = idx;
        total_inertia += dist;
    }

    return static_cast<float>(total_inertia);
}

auto kmeans_update_centroids(const float* data, std::size_t n, std::size_t dim,
                             std::span<const std::uint32_t> assignments,
                             std::uint32_t k,
                             std::vector<std::vector<float>>& centroids) -> void {
    std::vector<std::vector<double>> sums(k, std::vector<double>(dim, 0.0));
    std::vector<std::uint32_t> counts(k, 0);

    for (std::size_t i = 0; i < n; ++i) {
        const std::uint32_t cluster = assignments[i];
        counts[cluster]++;

        const float* point = data + i * dim;
        for (std::size_t d = 0; d < dim; ++d) {
            sums[cluster][d] += point[d];
        }
    }

    for (std::uint32_t c = 0; c < k; ++c) {
        if (counts[c] > 0) {
            for (std::size_t d = 0; d < dim; ++d) {
                centroids[c][d] = static_cast<float>(sums[c][d] / counts[c]);
            }
        }
    }
}

auto kmeans_cluster(const float* data, std::size_t n, std::size_t dim,
                    const KmeansParams& params)
    -> std::expected<KmeansResult, core::error> {
    using core::error;
    using core::error_code;

    if (params.k == 0) {
        return std::unexpected(error{error_code::precondition_failed, "k must be > 0", "index.kmeans"});
    }
    if (n < params.k) {
        return std::unexpected(error{error_code::precondition_failed,
                                     "Not enough data points for k clusters", "index.kmeans"});
    }
    if (dim == 0) {
        return std::unexpected(error{error_code::precondition_failed, "dim must be > 0", "index.kmeans"});
    }

    const auto start_time = std::chrono::steady_clock::now();

    auto centroids = kmeans_plusplus_init(data, n, dim, params.k, params.seed);
    std::vector<std::uint32_t> assignments(n);
    float prev_inertia = std::numeric_limits<float>::max();
    float inertia = 0.0f;
    std::uint32_t iter = 0;

    // Lloyd's algorithm
    for (; iter < params.max_iter; ++iter) {
        inertia = kmeans_assign(data, n, centroids, assignments);

        const float change = std::abs(prev_inertia - inertia) / (prev_inertia + 1e-10f);
        if (change < params.epsilon) {
            break;
        }
        prev_inertia = inertia;

        kmeans_update_centroids(data, n, dim, assignments, params.k, centroids);
    }

    // Centroids must correspond to the returned assignments
    kmeans_update_centroids(data, n, dim, assignments, params.k, centroids);
    inertia = kmeans_assign(data, n, centroids, assignments);

    std::vector<std::uint32_t> cluster_sizes(params.k, 0);
    for (std::uint32_t a : assignments) {
        cluster_sizes[a]++;
    }

    if (core::debug_enabled()) {
        const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_time).count();
        std::cerr << "[quiver][index.kmeans] k=" << params.k << " n=" << n
                  << " iterations=" << iter << " inertia=" << inertia
                  << " time_ms=" << ms << "\n";
    }

    return KmeansResult{
        .centroids = std::move(centroids),
        .assignments = std::move(assignments),
        .cluster_sizes = std::move(cluster_sizes),
        .inertia = inertia,
        .iterations = iter
    };
}

} // namespace quiver::index
