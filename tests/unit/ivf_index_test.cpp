/** \file ivf_index_test.cpp
 *  \brief IVF-Flat backend: exact mode, training, in-place removal.
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "quiver/index/ivf_index.hpp"
#include "quiver/io/binary_file.hpp"
#include "support/test_helpers.hpp"

#include <algorithm>
#include <set>

using namespace quiver;
using namespace quiver::index;
using Catch::Matchers::WithinAbs;
using quiver::core::error_code;

namespace {

IvfParams small_params() {
    IvfParams p;
    p.nlist = 4;
    p.nprobe = 4;
    p.min_points_per_list = 8;
    return p;
}

} // namespace

TEST_CASE("IvfIndex configuration validation", "[ivf]") {
    REQUIRE(IvfIndex::create(4, DistanceMetric::L2, small_params()).has_value());
    REQUIRE(IvfIndex::create(0, DistanceMetric::L2, small_params()).error().code == error_code::config_invalid);

    auto p = small_params();
    p.nlist = 0;
    REQUIRE(IvfIndex::create(4, DistanceMetric::L2, p).error().code == error_code::config_invalid);
    p = small_params();
    p.min_points_per_list = 0;
    REQUIRE(IvfIndex::create(4, DistanceMetric::L2, p).error().code == error_code::config_invalid);
}

TEST_CASE("IvfIndex untrained search is exact", "[ivf]") {
    auto idx = IvfIndex::create(2, DistanceMetric::L2, small_params());
    REQUIRE(idx.has_value());
    auto& index = **idx;

    REQUIRE(index.insert("a", std::vector<float>{0, 0}).has_value());
    REQUIRE(index.insert("b", std::vector<float>{3, 4}).has_value());
    REQUIRE(index.insert("c", std::vector<float>{1, 0}).has_value());
    REQUIRE_FALSE(index.is_trained());

    auto res = index.search(std::vector<float>{0, 0}, 3, DistanceMetric::L2);
    REQUIRE(res.has_value());
    REQUIRE(res->size() == 3);
    REQUIRE((*res)[0].id == "a");
    REQUIRE((*res)[1].id == "c");
    REQUIRE((*res)[2].id == "b");
    REQUIRE_THAT((*res)[2].distance, WithinAbs(5.0, 1e-5));
}

TEST_CASE("IvfIndex equal distances tie-break by id", "[ivf]") {
    auto idx = IvfIndex::create(2, DistanceMetric::L2, small_params());
    REQUIRE(idx.has_value());
    REQUIRE((*idx)->insert("z", std::vector<float>{1, 0}).has_value());
    REQUIRE((*idx)->insert("m", std::vector<float>{0, 1}).has_value());
    REQUIRE((*idx)->insert("a", std::vector<float>{-1, 0}).has_value());

    auto res = (*idx)->search(std::vector<float>{0, 0}, 3, DistanceMetric::L2);
    REQUIRE(res.has_value());
    REQUIRE((*res)[0].id == "a");
    REQUIRE((*res)[1].id == "m");
    REQUIRE((*res)[2].id == "z");
}

TEST_CASE("IvfIndex training threshold and wants_training", "[ivf]") {
    const auto params = small_params();   // threshold = 4 * 8 = 32
    auto data = test::random_vectors(40, 8, 17);
    auto flat = test::flatten(data);

    SECTION("below threshold training is a no-op") {
        auto idx = IvfIndex::create(8, DistanceMetric::L2, params);
        REQUIRE(idx.has_value());
        REQUIRE((*idx)->train(std::span(flat.data(), 10 * 8), 10).has_value());
        REQUIRE_FALSE((*idx)->is_trained());
    }

    SECTION("untrained index grows past threshold") {
        auto idx = IvfIndex::create(8, DistanceMetric::L2, params);
        REQUIRE(idx.has_value());
        for (std::size_t i = 0; i < 31; ++i) {
            REQUIRE((*idx)->insert("v" + std::to_string(i), data[i]).has_value());
        }
        REQUIRE_FALSE((*idx)->wants_training());
        REQUIRE((*idx)->insert("v31", data[31]).has_value());
        REQUIRE((*idx)->wants_training());

        // Training a populated index is refused.
        REQUIRE((*idx)->train(flat, 40).error().code == error_code::precondition_failed);
    }

    SECTION("trained index keeps recall with full probing") {
        auto idx = IvfIndex::create(8, DistanceMetric::L2, params);
        REQUIRE(idx.has_value());
        REQUIRE((*idx)->train(flat, 40).has_value());
        REQUIRE((*idx)->is_trained());
        REQUIRE((*idx)->list_count() == 4);
        for (std::size_t i = 0; i < data.size(); ++i) {
            REQUIRE((*idx)->insert("v" + std::to_string(i), data[i]).has_value());
        }
        REQUIRE_FALSE((*idx)->wants_training());

        for (std::size_t i = 0; i < 5; ++i) {
            auto res = (*idx)->search(data[i], 1, std::uint32_t{4});
            REQUIRE(res.has_value());
            REQUIRE((*res)[0].id == "v" + std::to_string(i));
        }
    }
}

TEST_CASE("IvfIndex empty_like carries the quantizer", "[ivf]") {
    auto data = test::random_vectors(40, 8, 19);
    auto flat = test::flatten(data);

    auto untrained = IvfIndex::create(8, DistanceMetric::L2, small_params());
    REQUIRE(untrained.has_value());
    REQUIRE((*untrained)->insert("v0", data[0]).has_value());
    auto plain = (*untrained)->empty_like();
    REQUIRE(plain.has_value());
    REQUIRE((*plain)->size() == 0);
    REQUIRE((*plain)->backend() == IndexBackend::IVF);
    REQUIRE_FALSE(dynamic_cast<const IvfIndex&>(**plain).is_trained());

    auto trained = IvfIndex::create(8, DistanceMetric::L2, small_params());
    REQUIRE(trained.has_value());
    REQUIRE((*trained)->train(flat, 40).has_value());
    auto copy = (*trained)->empty_like();
    REQUIRE(copy.has_value());
    const auto& copied = dynamic_cast<const IvfIndex&>(**copy);
    REQUIRE(copied.is_trained());
    REQUIRE(copied.list_count() == 4);
    REQUIRE(copied.size() == 0);

    for (std::size_t i = 0; i < data.size(); ++i) {
        REQUIRE((*trained)->insert("v" + std::to_string(i), data[i]).has_value());
        REQUIRE((*copy)->insert("v" + std::to_string(i), data[i]).has_value());
    }
    for (std::size_t i = 0; i < 10; ++i) {
        auto a = (*trained)->search(data[i], 5, std::uint32_t{1});
        auto b = copied.search(data[i], 5, std::uint32_t{1});
        REQUIRE(a.has_value());
        REQUIRE(b.has_value());
        REQUIRE(a->size() == b->size());
        for (std::size_t j = 0; j < a->size(); ++j) REQUIRE((*a)[j].id == (*b)[j].id);
    }
}

TEST_CASE("IvfIndex removal is in place", "[ivf]") {
    auto idx = IvfIndex::create(2, DistanceMetric::L2, small_params());
    REQUIRE(idx.has_value());
    auto& index = **idx;
    for (int i = 0; i < 5; ++i) {
        REQUIRE(index.insert("v" + std::to_string(i), std::vector<float>{float(i), 0}).has_value());
    }
    REQUIRE(index.remove("v1"));
    REQUIRE_FALSE(index.remove("v1"));
    REQUIRE(index.size() == 4);
    REQUIRE(index.tombstones() == 0);
    REQUIRE(index.tombstone_ratio() == 0.0);

    // Re-insert moves the entry rather than duplicating it.
    REQUIRE(index.insert("v4", std::vector<float>{1, 0}).has_value());
    REQUIRE(index.size() == 4);
    auto res = index.search(std::vector<float>{1, 0}, 4, DistanceMetric::L2);
    REQUIRE(res.has_value());
    REQUIRE((*res)[0].id == "v4");
    REQUIRE(std::count_if(res->begin(), res->end(), [](const Neighbor& n) { return n.id == "v4"; }) == 1);
}

TEST_CASE("IvfIndex save and load", "[ivf][persistence]") {
    test::TempDir dir;
    const io::Magic magic = {'T', 'E', 'S', 'T', 'I', 'V', 'F', '0'};
    auto data = test::random_vectors(40, 8, 23);
    auto flat = test::flatten(data);

    auto idx = IvfIndex::create(8, DistanceMetric::Cosine, small_params());
    REQUIRE(idx.has_value());
    REQUIRE((*idx)->train(flat, 40).has_value());
    for (std::size_t i = 0; i < data.size(); ++i) {
        REQUIRE((*idx)->insert("v" + std::to_string(i), data[i]).has_value());
    }

    io::BinaryWriter out(magic, 1, 0);
    (*idx)->save(out);
    REQUIRE(out.commit(dir.path() / "ivf.bin").has_value());

    auto in = io::BinaryReader::open(dir.path() / "ivf.bin", magic, 1);
    REQUIRE(in.has_value());
    auto loaded = IvfIndex::load(8, DistanceMetric::Cosine, small_params(), *in);
    REQUIRE(loaded.has_value());
    REQUIRE((*loaded)->is_trained());
    REQUIRE((*loaded)->size() == 40);

    auto a = (*idx)->search(data[7], 5, DistanceMetric::Cosine);
    auto b = (*loaded)->search(data[7], 5, DistanceMetric::Cosine);
    REQUIRE(a.has_value());
    REQUIRE(b.has_value());
    for (std::size_t j = 0; j < a->size(); ++j) REQUIRE((*a)[j].id == (*b)[j].id);
}
