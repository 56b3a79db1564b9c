/** \file engine_persistence_test.cpp
 *  \brief Save, reopen and recovery from missing, stale or corrupt artifacts.
 */

#include <catch2/catch_test_macros.hpp>

#include "quiver/engine/engine.hpp"
#include "support/test_helpers.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <utility>
#include <vector>

using namespace quiver;
using namespace quiver::engine;
using quiver::core::error_code;
using namespace std::chrono_literals;
namespace fs = std::filesystem;

namespace {

constexpr const char* TAG = "e5";
constexpr std::size_t DIM = 8;

EngineConfig config_for(const fs::path& dir, index::IndexBackend backend = index::IndexBackend::HNSW) {
    EngineConfig cfg;
    cfg.data_dir = dir;
    ModelSpec spec;
    spec.model_tag = TAG;
    spec.dimension = DIM;
    spec.backend = backend;
    spec.ivf.nlist = 4;
    spec.ivf.nprobe = 4;
    cfg.models.push_back(spec);
    return cfg;
}

std::unique_ptr<EmbeddingEngine> open_ok(const EngineConfig& cfg) {
    auto engine = EmbeddingEngine::open(cfg);
    REQUIRE(engine.has_value());
    return std::move(*engine);
}

void populate(EmbeddingEngine& engine, std::size_t from, std::size_t to) {
    auto data = test::random_vectors(to, DIM, 314);
    for (std::size_t i = from; i < to; ++i) {
        UpsertRequest r;
        r.id = "doc" + std::to_string(i);
        r.model_tag = TAG;
        r.content = "persisted text number " + std::to_string(i) + (i % 2 ? " odd" : " even");
        r.vector = data[i];
        r.metadata["n"] = static_cast<std::int64_t>(i);
        REQUIRE(engine.upsert(r).has_value());
    }
}

QueryRequest sample_query() {
    QueryRequest q;
    q.model_tag = TAG;
    q.text = "odd number";
    q.vector = test::random_vectors(1, DIM, 7)[0];
    q.k = 5;
    return q;
}

std::vector<std::string> top_ids(const EmbeddingEngine& engine) {
    auto hits = engine.query(sample_query());
    REQUIRE(hits.has_value());
    std::vector<std::string> ids;
    for (const auto& h : *hits) ids.push_back(h.id);
    return ids;
}

void flip_byte(const fs::path& path, std::streamoff offset) {
    std::fstream f(path, std::ios::in | std::ios::out | std::ios::binary);
    REQUIRE(f.is_open());
    f.seekg(offset);
    char c = 0;
    f.read(&c, 1);
    f.seekp(offset);
    c = static_cast<char>(c ^ 0x5A);
    f.write(&c, 1);
}

} // namespace

TEST_CASE("Reopen restores identical query results", "[engine][persistence]") {
    test::TempDir dir;
    for (auto backend : {index::IndexBackend::HNSW, index::IndexBackend::IVF}) {
        const auto cfg = config_for(dir.path() / std::string(index::to_string(backend)), backend);
        std::vector<std::string> expected;
        {
            auto engine = open_ok(cfg);
            populate(*engine, 0, 40);
            REQUIRE(engine->remove("doc3", TAG)->status == DeleteStatus::Deleted);
            expected = top_ids(*engine);
            REQUIRE(engine->save().has_value());
        }
        REQUIRE(fs::exists(cfg.data_dir / TAG / "records.qrs"));
        REQUIRE(fs::exists(cfg.data_dir / TAG / "vectors.qvi"));
        REQUIRE(fs::exists(cfg.data_dir / TAG / "lexical.qlx"));

        auto engine = open_ok(cfg);
        auto stats = engine->stats(TAG);
        REQUIRE(stats->index_available);
        REQUIRE(stats->record_count == 39);
        REQUIRE(top_ids(*engine) == expected);

        auto rec = engine->get("doc5", TAG);
        REQUIRE(rec.has_value());
        REQUIRE(rec->version == 1);
        REQUIRE(std::get<std::int64_t>(rec->metadata.at("n")) == 5);
        REQUIRE(engine->get("doc3", TAG).error().code == error_code::not_found);

        // Unchanged content is still recognized after a restart.
        auto again = engine->upsert([] {
            UpsertRequest r;
            r.id = "doc5";
            r.model_tag = TAG;
            r.content = "persisted text number 5 odd";
            return r;
        }());
        REQUIRE(again.has_value());
        REQUIRE(again->status == UpsertStatus::Skipped);
    }
}

TEST_CASE("Missing or stale vector artifact is rebuilt before serving", "[engine][persistence][recovery]") {
    test::TempDir dir;
    const auto cfg = config_for(dir.path());
    const auto vectors = cfg.data_dir / TAG / "vectors.qvi";
    std::vector<std::string> expected;
    {
        auto engine = open_ok(cfg);
        populate(*engine, 0, 30);
        REQUIRE(engine->save().has_value());
        fs::copy_file(vectors, dir.path() / "old.qvi");
        populate(*engine, 30, 40);
        expected = top_ids(*engine);
        REQUIRE(engine->save().has_value());
    }

    SECTION("missing") {
        fs::remove(vectors);
    }
    SECTION("stale") {
        fs::copy_file(dir.path() / "old.qvi", vectors, fs::copy_options::overwrite_existing);
    }
    SECTION("corrupt") {
        flip_byte(vectors, 24);
    }

    auto engine = open_ok(cfg);
    // Until the rebuild publishes, queries fail rather than scan the store.
    auto early = engine->query(sample_query());
    if (!early) REQUIRE(early.error().code == error_code::index_unavailable);

    auto done = engine->wait_for_rebuild(TAG, 30s);
    REQUIRE(done.has_value());
    REQUIRE(*done);
    REQUIRE(engine->stats(TAG)->index_available);
    REQUIRE(engine->stats(TAG)->vector_live == 40);
    REQUIRE(top_ids(*engine) == expected);
}

TEST_CASE("Blocking recovery serves immediately after open", "[engine][persistence][recovery]") {
    test::TempDir dir;
    auto cfg = config_for(dir.path());
    std::vector<std::string> expected;
    {
        auto engine = open_ok(cfg);
        populate(*engine, 0, 25);
        expected = top_ids(*engine);
        REQUIRE(engine->save().has_value());
    }
    fs::remove(cfg.data_dir / TAG / "vectors.qvi");

    cfg.blocking_recovery = true;
    auto engine = open_ok(cfg);
    REQUIRE(engine->stats(TAG)->index_available);
    REQUIRE_FALSE(engine->stats(TAG)->rebuild_in_progress);
    REQUIRE(top_ids(*engine) == expected);
}

TEST_CASE("Corrupt lexical artifact is rebuilt from records", "[engine][persistence][recovery]") {
    test::TempDir dir;
    const auto cfg = config_for(dir.path());
    std::vector<std::string> expected;
    {
        auto engine = open_ok(cfg);
        populate(*engine, 0, 20);
        expected = top_ids(*engine);
        REQUIRE(engine->save().has_value());
    }
    std::ofstream(cfg.data_dir / TAG / "lexical.qlx", std::ios::trunc) << "garbage";

    auto engine = open_ok(cfg);
    REQUIRE(engine->stats(TAG)->lexical_documents == 20);
    REQUIRE(top_ids(*engine) == expected);

    auto report = engine->verify(TAG);
    REQUIRE(report.has_value());
    REQUIRE(report->consistent);
}

TEST_CASE("Corrupt record artifact fails open", "[engine][persistence][recovery]") {
    test::TempDir dir;
    const auto cfg = config_for(dir.path());
    {
        auto engine = open_ok(cfg);
        populate(*engine, 0, 5);
        REQUIRE(engine->save().has_value());
    }
    flip_byte(cfg.data_dir / TAG / "records.qrs", 20);

    auto engine = EmbeddingEngine::open(cfg);
    REQUIRE_FALSE(engine.has_value());
    REQUIRE(engine.error().code == error_code::data_integrity);
}

TEST_CASE("Fresh data directory starts empty and available", "[engine][persistence]") {
    test::TempDir dir;
    auto engine = open_ok(config_for(dir.path() / "new"));
    auto stats = engine->stats(TAG);
    REQUIRE(stats.has_value());
    REQUIRE(stats->record_count == 0);
    REQUIRE(stats->index_available);

    auto hits = engine->query(sample_query());
    REQUIRE(hits.has_value());
    REQUIRE(hits->empty());
}

TEST_CASE("verify repairs a vector artifact that disagrees with the records", "[engine][persistence][verify]") {
    test::TempDir dir;
    const auto cfg = config_for(dir.path() / "main");
    const auto other = config_for(dir.path() / "other");
    auto data = test::random_vectors(3, DIM, 77);
    auto put = [&](EmbeddingEngine& engine, const std::string& id, std::size_t row) {
        UpsertRequest r;
        r.id = id;
        r.model_tag = TAG;
        r.content = "content of " + id;
        r.vector = data[row];
        REQUIRE(engine.upsert(r)->status == UpsertStatus::Inserted);
    };
    {
        auto engine = open_ok(cfg);
        put(*engine, "a", 0);
        put(*engine, "b", 1);
        REQUIRE(engine->save().has_value());
    }
    {
        auto engine = open_ok(other);
        put(*engine, "a", 0);
        put(*engine, "c", 2);
        REQUIRE(engine->save().has_value());
    }
    // Same mutation_seq, different ids: the artifact is installed as current.
    fs::copy_file(other.data_dir / TAG / "vectors.qvi", cfg.data_dir / TAG / "vectors.qvi",
                  fs::copy_options::overwrite_existing);

    auto engine = open_ok(cfg);
    REQUIRE(engine->stats(TAG)->index_available);

    auto report = engine->verify(TAG);
    REQUIRE(report.has_value());
    REQUIRE_FALSE(report->consistent);
    REQUIRE(report->repaired_ids == std::vector<std::string>{"b", "c"});
    REQUIRE(report->record_count == 2);
    REQUIRE(report->vector_count == 2);
    REQUIRE(report->lexical_count == 2);

    QueryRequest q;
    q.model_tag = TAG;
    q.vector = data[1];
    q.k = 1;
    auto hits = engine->query(q);
    REQUIRE(hits.has_value());
    REQUIRE(hits->size() == 1);
    REQUIRE(hits->front().id == "b");

    q.vector = data[2];
    q.k = 5;
    hits = engine->query(q);
    REQUIRE(hits.has_value());
    for (const auto& h : *hits) REQUIRE(h.id != "c");

    auto second = engine->verify(TAG);
    REQUIRE(second.has_value());
    REQUIRE(second->consistent);
    REQUIRE(second->repaired_ids.empty());
}

TEST_CASE("A failed recovery rebuild is retried once the cause is removed", "[engine][persistence][recovery]") {
    test::TempDir dir;
    auto cfg = config_for(dir.path());
    cfg.models[0].metric = index::DistanceMetric::L2;
    {
        auto engine = open_ok(cfg);
        const std::vector<std::pair<std::string, std::vector<float>>> rows{
            {"zero", std::vector<float>(DIM, 0.0f)},
            {"a", [] { std::vector<float> v(DIM, 0.0f); v[0] = 1.0f; return v; }()},
            {"b", [] { std::vector<float> v(DIM, 0.0f); v[1] = 1.0f; return v; }()},
        };
        for (const auto& [id, vec] : rows) {
            UpsertRequest r;
            r.id = id;
            r.model_tag = TAG;
            r.content = "row " + id;
            r.vector = vec;
            REQUIRE(engine->upsert(r).has_value());
        }
        REQUIRE(engine->save().has_value());
    }

    // Under cosine the artifact no longer matches and the zero vector cannot be indexed.
    cfg.models[0].metric = index::DistanceMetric::Cosine;
    cfg.blocking_recovery = false;
    cfg.rebuild_retry_interval = 0ms;
    auto engine = open_ok(cfg);
    REQUIRE(*engine->wait_for_rebuild(TAG, 30s));
    REQUIRE_FALSE(engine->stats(TAG)->index_available);

    QueryRequest q;
    q.model_tag = TAG;
    q.vector = std::vector<float>(DIM, 0.0f);
    (*q.vector)[0] = 1.0f;
    q.k = 1;
    auto early = engine->query(q);
    REQUIRE_FALSE(early.has_value());
    REQUIRE(early.error().code == error_code::index_unavailable);
    // The query started a retry, which fails again on the same record.
    REQUIRE(*engine->wait_for_rebuild(TAG, 30s));
    REQUIRE_FALSE(engine->stats(TAG)->index_available);

    REQUIRE(engine->remove("zero", TAG)->status == DeleteStatus::Deleted);
    REQUIRE(*engine->wait_for_rebuild(TAG, 30s));

    auto stats = engine->stats(TAG);
    REQUIRE(stats->index_available);
    REQUIRE(stats->vector_live == 2);
    auto hits = engine->query(q);
    REQUIRE(hits.has_value());
    REQUIRE(hits->size() == 1);
    REQUIRE(hits->front().id == "a");
}
