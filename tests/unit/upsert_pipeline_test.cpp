/** \file upsert_pipeline_test.cpp
 *  \brief Write path: change detection, versions, index consistency.
 */

#include <catch2/catch_test_macros.hpp>

#include "quiver/engine/upsert_pipeline.hpp"

#include <algorithm>
#include <atomic>
#include <limits>
#include <thread>

using namespace quiver;
using namespace quiver::engine;
using quiver::core::error_code;

namespace {

constexpr const char* TAG = "m";

struct Fixture {
    store::RecordStore store;
    std::unique_ptr<index::VectorIndexManager> vectors;
    index::BM25Index lexical;
    std::unique_ptr<UpsertPipeline> pipeline;

    explicit Fixture(index::DistanceMetric metric = index::DistanceMetric::Cosine) {
        index::VectorIndexConfig cfg;
        cfg.dimension = 3;
        cfg.metric = metric;
        auto mgr = index::VectorIndexManager::create(cfg);
        REQUIRE(mgr.has_value());
        vectors = std::move(*mgr);
        REQUIRE(store.register_partition(TAG, 3).has_value());
        pipeline = std::make_unique<UpsertPipeline>(store, *vectors, lexical, TAG);
    }
};

UpsertRequest request(std::string id, std::string content, std::optional<std::vector<float>> vec) {
    UpsertRequest r;
    r.id = std::move(id);
    r.model_tag = TAG;
    r.content = std::move(content);
    r.vector = std::move(vec);
    return r;
}

} // namespace

TEST_CASE("UpsertPipeline insert, skip, update", "[pipeline]") {
    Fixture fx;
    auto& p = *fx.pipeline;

    auto first = p.upsert(request("x", "hello world", std::vector<float>{1, 0, 0}));
    REQUIRE(first.has_value());
    REQUIRE(first->status == UpsertStatus::Inserted);
    REQUIRE(first->version == 1);
    REQUIRE(fx.vectors->contains("x"));
    REQUIRE(fx.lexical.contains("x"));

    SECTION("identical content is skipped without a vector") {
        auto again = p.upsert(request("x", "  hello   world\n", std::nullopt));
        REQUIRE(again.has_value());
        REQUIRE(again->status == UpsertStatus::Skipped);
        REQUIRE(again->version == 1);
        REQUIRE(p.skipped_upserts() == 1);
        REQUIRE(p.total_upserts() == 2);
        REQUIRE(fx.store.get("x", TAG)->version == 1);
    }

    SECTION("changed content bumps the version and replaces index entries") {
        auto upd = p.upsert(request("x", "goodbye moon", std::vector<float>{0, 1, 0}));
        REQUIRE(upd.has_value());
        REQUIRE(upd->status == UpsertStatus::Updated);
        REQUIRE(upd->version == 2);

        auto hello = fx.lexical.search("hello", 10);
        REQUIRE(hello.has_value());
        REQUIRE(hello->empty());
        auto moon = fx.lexical.search("moon", 10);
        REQUIRE(moon.has_value());
        REQUIRE(moon->size() == 1);

        auto near = fx.vectors->search(std::vector<float>{0, 1, 0}, 10);
        REQUIRE(near.has_value());
        REQUIRE(near->size() == 1);
        REQUIRE((*near)[0].id == "x");
        REQUIRE((*near)[0].distance < 1e-5f);
    }

    SECTION("changed content without a vector is refused") {
        auto miss = p.upsert(request("x", "other text", std::nullopt));
        REQUIRE_FALSE(miss.has_value());
        REQUIRE(miss.error().code == error_code::missing_vector);
        REQUIRE(fx.store.get("x", TAG)->text == "hello world");
    }
}

TEST_CASE("UpsertPipeline validation happens before mutation", "[pipeline]") {
    Fixture fx;
    auto& p = *fx.pipeline;

    REQUIRE(p.upsert(request("", "t", std::vector<float>{1, 0, 0})).error().code == error_code::validation_failed);
    REQUIRE(p.upsert(request("a", "t", std::vector<float>{1, 0})).error().code == error_code::validation_failed);
    REQUIRE(p.upsert(request("a", "t", std::vector<float>{0, 0, 0})).error().code == error_code::validation_failed);
    REQUIRE(p.upsert(request("a", "t", std::vector<float>{std::numeric_limits<float>::quiet_NaN(), 0, 1}))
                .error().code == error_code::validation_failed);
    REQUIRE(p.upsert(request("a", "t", std::nullopt)).error().code == error_code::missing_vector);

    auto wrong_tag = request("a", "t", std::vector<float>{1, 0, 0});
    wrong_tag.model_tag = "other";
    REQUIRE(p.upsert(wrong_tag).error().code == error_code::invalid_argument);

    REQUIRE(fx.store.size(TAG) == 0);
    REQUIRE(fx.vectors->size() == 0);
    REQUIRE(fx.lexical.size() == 0);
}

TEST_CASE("UpsertPipeline zero vector is fine under L2", "[pipeline]") {
    Fixture fx(index::DistanceMetric::L2);
    auto r = fx.pipeline->upsert(request("z", "zero", std::vector<float>{0, 0, 0}));
    REQUIRE(r.has_value());
    REQUIRE(r->status == UpsertStatus::Inserted);
}

TEST_CASE("UpsertPipeline delete", "[pipeline]") {
    Fixture fx;
    auto& p = *fx.pipeline;
    REQUIRE(p.upsert(request("d", "to be removed", std::vector<float>{1, 1, 0})).has_value());

    auto del = p.remove("d");
    REQUIRE(del.has_value());
    REQUIRE(del->status == DeleteStatus::Deleted);
    REQUIRE_FALSE(fx.store.get("d", TAG).has_value());
    REQUIRE_FALSE(fx.vectors->contains("d"));
    REQUIRE_FALSE(fx.lexical.contains("d"));

    auto again = p.remove("d");
    REQUIRE(again.has_value());
    REQUIRE(again->status == DeleteStatus::NotFound);
    REQUIRE(p.remove("ghost")->status == DeleteStatus::NotFound);
    REQUIRE(p.remove("").error().code == error_code::validation_failed);

    REQUIRE(to_string(DeleteStatus::NotFound) == "not_found");
    REQUIRE(to_string(UpsertStatus::Skipped) == "skipped");
}

TEST_CASE("UpsertPipeline repair re-derives index entries from the store", "[pipeline]") {
    Fixture fx;
    auto& p = *fx.pipeline;
    REQUIRE(p.upsert(request("r", "repair me", std::vector<float>{0, 0, 1})).has_value());

    // Simulate drift in both directions.
    REQUIRE(fx.vectors->remove("r").has_value());
    fx.lexical.remove("r");
    REQUIRE(fx.lexical.insert("stray", "not in the store").has_value());

    REQUIRE(p.repair("r").has_value());
    REQUIRE(p.repair("stray").has_value());
    REQUIRE(fx.vectors->contains("r"));
    REQUIRE(fx.lexical.contains("r"));
    REQUIRE_FALSE(fx.lexical.contains("stray"));
}

TEST_CASE("UpsertPipeline same-key writes linearize", "[pipeline][concurrency]") {
    Fixture fx;
    auto& p = *fx.pipeline;

    constexpr int kThreads = 8;
    std::atomic<int> failures{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&p, &failures, t] {
            auto r = p.upsert(request("hot", "content " + std::to_string(t),
                                      std::vector<float>{1.0f, static_cast<float>(t), 0.0f}));
            if (!r) failures.fetch_add(1);
        });
    }
    for (auto& th : threads) th.join();
    REQUIRE(failures.load() == 0);

    auto rec = fx.store.get("hot", TAG);
    REQUIRE(rec.has_value());
    REQUIRE(rec->version == kThreads);
    REQUIRE(fx.vectors->size() == 1);
    REQUIRE(fx.lexical.size() == 1);

    // The surviving index entries belong to the last writer.
    auto hits = fx.lexical.search(rec->text, 1);
    REQUIRE(hits.has_value());
    REQUIRE(hits->size() == 1);
    REQUIRE((*hits)[0].id == "hot");
}
