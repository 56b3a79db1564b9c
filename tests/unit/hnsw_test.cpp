/** \file hnsw_test.cpp
 *  \brief HNSW graph backend: recall, soft delete, re-insert, persistence.
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "quiver/index/hnsw.hpp"
#include "quiver/io/binary_file.hpp"
#include "quiver/kernels/distance.hpp"
#include "support/test_helpers.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <set>

using namespace quiver;
using namespace quiver::index;
using Catch::Matchers::WithinAbs;
using quiver::core::error_code;

namespace {

std::unique_ptr<HnswIndex> make_index(std::size_t dim, DistanceMetric metric = DistanceMetric::L2) {
    HnswBuildParams build;
    build.M = 8;
    build.max_M = 8;
    build.max_M0 = 16;
    build.efConstruction = 64;
    auto idx = HnswIndex::create(dim, metric, build, HnswSearchParams{64});
    REQUIRE(idx.has_value());
    return std::move(*idx);
}

std::vector<std::string> brute_force(const std::vector<std::vector<float>>& data,
                                     const std::vector<float>& q, std::size_t k) {
    std::vector<std::pair<float, std::size_t>> d;
    for (std::size_t i = 0; i < data.size(); ++i) d.emplace_back(kernels::l2_sq(data[i], q), i);
    std::sort(d.begin(), d.end());
    std::vector<std::string> out;
    for (std::size_t i = 0; i < k; ++i) out.push_back("v" + std::to_string(d[i].second));
    return out;
}

} // namespace

TEST_CASE("HnswIndex configuration validation", "[hnsw]") {
    HnswBuildParams ok;
    REQUIRE(HnswIndex::create(4, DistanceMetric::L2, ok, {}).has_value());

    REQUIRE(HnswIndex::create(0, DistanceMetric::L2, ok, {}).error().code == error_code::config_invalid);

    HnswBuildParams bad = ok;
    bad.M = 1;
    REQUIRE(HnswIndex::create(4, DistanceMetric::L2, bad, {}).error().code == error_code::config_invalid);

    bad = ok;
    bad.efConstruction = 4;
    REQUIRE(HnswIndex::create(4, DistanceMetric::L2, bad, {}).error().code == error_code::config_invalid);
}

TEST_CASE("HnswIndex recall against brute force", "[hnsw]") {
    const std::size_t n = 500, dim = 16, k = 10;
    auto data = test::random_vectors(n, dim, 11);
    auto index = make_index(dim);
    for (std::size_t i = 0; i < n; ++i) {
        REQUIRE(index->insert("v" + std::to_string(i), data[i]).has_value());
    }
    REQUIRE(index->size() == n);

    auto queries = test::random_vectors(20, dim, 99);
    std::size_t hits = 0;
    for (const auto& q : queries) {
        auto res = index->search(q, k, DistanceMetric::L2);
        REQUIRE(res.has_value());
        REQUIRE(res->size() == k);
        REQUIRE(std::is_sorted(res->begin(), res->end(),
                               [](const Neighbor& a, const Neighbor& b) { return a.distance < b.distance; }));
        auto truth = brute_force(data, q, k);
        std::set<std::string> truth_set(truth.begin(), truth.end());
        for (const auto& nb : *res) hits += truth_set.count(nb.id);
    }
    REQUIRE(static_cast<double>(hits) / (20.0 * k) >= 0.9);
}

TEST_CASE("HnswIndex self retrieval and distances", "[hnsw]") {
    auto index = make_index(3);
    REQUIRE(index->insert("a", std::vector<float>{1, 0, 0}).has_value());
    REQUIRE(index->insert("b", std::vector<float>{0, 3, 4}).has_value());

    auto res = index->search(std::vector<float>{1, 0, 0}, 2, DistanceMetric::L2);
    REQUIRE(res.has_value());
    REQUIRE(res->size() == 2);
    REQUIRE((*res)[0].id == "a");
    REQUIRE_THAT((*res)[0].distance, WithinAbs(0.0, 1e-6));
    // Euclidean, not squared: |(1,-3,-4)| = sqrt(26)
    REQUIRE_THAT((*res)[1].distance, WithinAbs(std::sqrt(26.0), 1e-4));
}

TEST_CASE("HnswIndex soft delete and re-insert", "[hnsw]") {
    auto data = test::random_vectors(100, 8, 5);
    auto index = make_index(8);
    for (std::size_t i = 0; i < data.size(); ++i) {
        REQUIRE(index->insert("v" + std::to_string(i), data[i]).has_value());
    }

    REQUIRE(index->remove("v0"));
    REQUIRE_FALSE(index->remove("v0"));
    REQUIRE_FALSE(index->contains("v0"));
    REQUIRE(index->size() == 99);
    REQUIRE(index->tombstones() == 1);

    auto res = index->search(data[0], 100, DistanceMetric::L2);
    REQUIRE(res.has_value());
    REQUIRE(std::none_of(res->begin(), res->end(), [](const Neighbor& nb) { return nb.id == "v0"; }));

    // Re-insert under an existing id: exactly one reachable entry.
    REQUIRE(index->insert("v1", data[0]).has_value());
    REQUIRE(index->size() == 99);
    auto again = index->search(data[0], 100, DistanceMetric::L2);
    REQUIRE(again.has_value());
    REQUIRE(std::count_if(again->begin(), again->end(), [](const Neighbor& nb) { return nb.id == "v1"; }) == 1);
    REQUIRE(again->front().id == "v1");
    REQUIRE(index->tombstone_ratio() > 0.0);
}

TEST_CASE("HnswIndex k beyond the graph size returns every live entry", "[hnsw]") {
    auto data = test::random_vectors(20, 8, 9);
    auto index = make_index(8);
    for (std::size_t i = 0; i < data.size(); ++i) {
        REQUIRE(index->insert("v" + std::to_string(i), data[i]).has_value());
    }

    auto small = index->search(data[3], 100, DistanceMetric::L2);
    REQUIRE(small.has_value());
    REQUIRE(small->size() == 20);

    auto huge = index->search(data[3], std::size_t{1} << 32, DistanceMetric::L2);
    REQUIRE(huge.has_value());
    REQUIRE(huge->size() == 20);
    REQUIRE(huge->front().id == "v3");

    REQUIRE(index->remove("v0"));
    auto all = index->search(data[3], std::numeric_limits<std::size_t>::max(), DistanceMetric::L2);
    REQUIRE(all.has_value());
    REQUIRE(all->size() == 19);
    REQUIRE(std::none_of(all->begin(), all->end(), [](const Neighbor& nb) { return nb.id == "v0"; }));
}

TEST_CASE("HnswIndex cosine metric", "[hnsw]") {
    auto index = make_index(2, DistanceMetric::Cosine);
    REQUIRE(index->insert("x", std::vector<float>{2, 0}).has_value());
    REQUIRE(index->insert("y", std::vector<float>{0, 5}).has_value());

    auto zero = index->insert("z", std::vector<float>{0, 0});
    REQUIRE(zero.error().code == error_code::validation_failed);

    auto res = index->search(std::vector<float>{1, 0}, 2, DistanceMetric::Cosine);
    REQUIRE(res.has_value());
    REQUIRE((*res)[0].id == "x");
    REQUIRE_THAT((*res)[0].distance, WithinAbs(0.0, 1e-5));
    REQUIRE_THAT((*res)[1].distance, WithinAbs(1.0, 1e-5));

    REQUIRE(index->search(std::vector<float>{1, 0}, 2, DistanceMetric::L2).error().code ==
            error_code::invalid_argument);
}

TEST_CASE("HnswIndex rejects malformed input", "[hnsw]") {
    auto index = make_index(3);
    REQUIRE(index->insert("a", std::vector<float>{1, 2}).error().code == error_code::validation_failed);
    REQUIRE(index->search(std::vector<float>{1, 2}, 1, DistanceMetric::L2).error().code ==
            error_code::validation_failed);

    auto empty = index->search(std::vector<float>{1, 2, 3}, 5, DistanceMetric::L2);
    REQUIRE(empty.has_value());
    REQUIRE(empty->empty());
}

TEST_CASE("HnswIndex save and load", "[hnsw][persistence]") {
    test::TempDir dir;
    const auto path = dir.path() / "graph.bin";
    const io::Magic magic = {'T', 'E', 'S', 'T', 'H', 'N', 'S', 'W'};

    auto data = test::random_vectors(64, 4, 21);
    auto index = make_index(4);
    for (std::size_t i = 0; i < data.size(); ++i) {
        REQUIRE(index->insert("v" + std::to_string(i), data[i]).has_value());
    }
    REQUIRE(index->remove("v3"));

    io::BinaryWriter out(magic, 1, 0);
    index->save(out);
    REQUIRE(out.commit(path).has_value());

    auto in = io::BinaryReader::open(path, magic, 1);
    REQUIRE(in.has_value());
    HnswBuildParams build;
    build.M = 8;
    build.max_M = 8;
    build.max_M0 = 16;
    build.efConstruction = 64;
    auto loaded = HnswIndex::load(4, DistanceMetric::L2, build, HnswSearchParams{64}, *in);
    REQUIRE(loaded.has_value());
    REQUIRE((*loaded)->size() == index->size());
    REQUIRE_FALSE((*loaded)->contains("v3"));

    for (std::size_t i = 0; i < 5; ++i) {
        auto a = index->search(data[i], 5, DistanceMetric::L2);
        auto b = (*loaded)->search(data[i], 5, DistanceMetric::L2);
        REQUIRE(a.has_value());
        REQUIRE(b.has_value());
        REQUIRE(a->size() == b->size());
        for (std::size_t j = 0; j < a->size(); ++j) REQUIRE((*a)[j].id == (*b)[j].id);
    }
}

TEST_CASE("robust_prune keeps the nearest candidate", "[hnsw]") {
    std::vector<std::pair<float, std::uint32_t>> candidates = {{3.0f, 3}, {1.0f, 1}, {2.0f, 2}, {4.0f, 4}};
    auto [selected, discarded] = robust_prune(candidates, 2, false);
    REQUIRE_FALSE(selected.empty());
    REQUIRE(selected.size() <= 2);
    REQUIRE(selected.front() == 1);
    REQUIRE(selected.size() + discarded.size() == 4);
}
