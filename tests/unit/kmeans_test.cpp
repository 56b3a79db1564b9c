/** \file kmeans_test.cpp
 *  \brief K-means used to train the IVF coarse quantizer.
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "quiver/index/kmeans.hpp"
#include "support/test_helpers.hpp"

#include <algorithm>
#include <numeric>

using namespace quiver::index;
using Catch::Matchers::WithinAbs;

namespace {

// Three tight blobs around (0,0), (10,0), (0,10).
std::vector<float> three_blobs(std::size_t per_blob) {
    const float centers[3][2] = {{0.0f, 0.0f}, {10.0f, 0.0f}, {0.0f, 10.0f}};
    auto noise = quiver::test::random_vectors(per_blob * 3, 2, 7);
    std::vector<float> data;
    for (std::size_t i = 0; i < per_blob * 3; ++i) {
        const auto& c = centers[i / per_blob];
        data.push_back(c[0] + 0.1f * noise[i][0]);
        data.push_back(c[1] + 0.1f * noise[i][1]);
    }
    return data;
}

} // namespace

TEST_CASE("kmeans separates well-spaced clusters", "[kmeans]") {
    const std::size_t per_blob = 50;
    auto data = three_blobs(per_blob);

    KmeansParams params;
    params.k = 3;
    params.seed = 1;
    auto result = kmeans_cluster(data.data(), per_blob * 3, 2, params);
    REQUIRE(result.has_value());
    REQUIRE(result->centroids.size() == 3);
    REQUIRE(result->assignments.size() == per_blob * 3);

    // Every blob maps to exactly one cluster.
    for (std::size_t b = 0; b < 3; ++b) {
        const auto label = result->assignments[b * per_blob];
        for (std::size_t i = 0; i < per_blob; ++i) {
            REQUIRE(result->assignments[b * per_blob + i] == label);
        }
    }
    REQUIRE(std::accumulate(result->cluster_sizes.begin(), result->cluster_sizes.end(), 0u) == per_blob * 3);
    REQUIRE(result->inertia < 10.0f);
}

TEST_CASE("kmeans is deterministic for a fixed seed", "[kmeans]") {
    auto data = quiver::test::flatten(quiver::test::random_vectors(200, 8, 3));
    KmeansParams params;
    params.k = 5;
    auto a = kmeans_cluster(data.data(), 200, 8, params);
    auto b = kmeans_cluster(data.data(), 200, 8, params);
    REQUIRE(a.has_value());
    REQUIRE(b.has_value());
    REQUIRE(a->assignments == b->assignments);
    REQUIRE(a->centroids == b->centroids);
}

TEST_CASE("kmeans preconditions", "[kmeans]") {
    std::vector<float> data(10, 1.0f);
    KmeansParams params;

    params.k = 0;
    REQUIRE_FALSE(kmeans_cluster(data.data(), 5, 2, params).has_value());

    params.k = 6;
    REQUIRE_FALSE(kmeans_cluster(data.data(), 5, 2, params).has_value());

    params.k = 2;
    REQUIRE_FALSE(kmeans_cluster(data.data(), 5, 0, params).has_value());
}

TEST_CASE("kmeans++ seeding survives identical points", "[kmeans]") {
    std::vector<float> data(20, 3.0f);
    auto centroids = kmeans_plusplus_init(data.data(), 10, 2, 4, 42);
    REQUIRE(centroids.size() == 4);
    for (const auto& c : centroids) {
        REQUIRE_THAT(c[0], WithinAbs(3.0, 1e-6));
        REQUIRE_THAT(c[1], WithinAbs(3.0, 1e-6));
    }
}
