/**
 * Hybrid search example using Quiver
 *
 * This example demonstrates:
 * - Opening an engine with one embedding model
 * - Upserting records with precomputed vectors and metadata
 * - Change detection on re-upsert
 * - Hybrid (vector + BM25) queries with a metadata filter
 * - Persisting to disk
 */

#include <quiver/engine/engine.hpp>

#include <cmath>
#include <iostream>
#include <random>
#include <vector>

// Generate random vectors for demonstration
std::vector<float> generate_random_vector(std::size_t dim, std::uint32_t seed) {
    std::mt19937 gen(seed);
    std::uniform_real_distribution<float> dist(-1.0f, 1.0f);

    std::vector<float> vec(dim);
    for (auto& v : vec) {
        v = dist(gen);
    }
    return vec;
}

int main(int argc, char** argv) {
    using namespace quiver;

    engine::EngineConfig base;
    if (argc > 1) base.data_dir = argv[1];

    engine::ModelSpec model;
    model.model_tag = "demo-embed-64";
    model.dimension = 64;
    model.metric = index::DistanceMetric::Cosine;
    model.backend = index::IndexBackend::HNSW;
    base.models.push_back(model);

    // QUIVER_* variables override the defaults above
    auto config = engine::EngineConfig::from_env(base);
    if (!config) {
        std::cerr << "Invalid configuration: " << config.error().message << std::endl;
        return 1;
    }

    auto opened = engine::EmbeddingEngine::open(*config);
    if (!opened) {
        std::cerr << "Failed to open engine: " << opened.error().message << std::endl;
        return 1;
    }
    auto& eng = **opened;

    const std::vector<std::pair<std::string, std::string>> corpus = {
        {"guide-1", "Getting started with vector databases"},
        {"guide-2", "Tuning HNSW graphs for recall and latency"},
        {"guide-3", "BM25 ranking explained with examples"},
        {"note-1", "Shopping list: apples, bread, coffee"},
        {"note-2", "Vector search meets keyword search in hybrid retrieval"},
    };

    std::cout << "Upserting " << corpus.size() << " records..." << std::endl;
    for (std::size_t i = 0; i < corpus.size(); ++i) {
        engine::UpsertRequest req;
        req.id = corpus[i].first;
        req.model_tag = model.model_tag;
        req.content = corpus[i].second;
        req.vector = generate_random_vector(model.dimension, static_cast<std::uint32_t>(i));
        req.metadata["kind"] = std::string(req.id.starts_with("guide") ? "guide" : "note");
        req.metadata["position"] = static_cast<std::int64_t>(i);

        auto res = eng.upsert(req);
        if (!res) {
            std::cerr << "Upsert of " << req.id << " failed: " << res.error().message << std::endl;
            return 1;
        }
        std::cout << "  " << req.id << ": " << engine::to_string(res->status)
                  << " (version " << res->version << ")" << std::endl;
    }

    // Same content again: no vector needed, nothing is re-indexed
    engine::UpsertRequest again;
    again.id = "guide-2";
    again.model_tag = model.model_tag;
    again.content = "Tuning HNSW graphs   for recall and latency\n";
    auto skipped = eng.upsert(again);
    if (skipped) {
        std::cout << "Re-upsert of guide-2: " << engine::to_string(skipped->status) << std::endl;
    }

    engine::QueryRequest query;
    query.model_tag = model.model_tag;
    query.text = "hybrid vector search";
    query.vector = generate_random_vector(model.dimension, 4);
    query.k = 3;

    auto hits = eng.query(query);
    if (!hits) {
        std::cerr << "Query failed: " << hits.error().message << std::endl;
        return 1;
    }
    std::cout << "\nTop " << hits->size() << " hybrid results:" << std::endl;
    for (const auto& hit : *hits) {
        std::cout << "  " << hit.id << "  final=" << hit.final_score
                  << " vector=" << hit.vector_score << " lexical=" << hit.lexical_score
                  << "  \"" << hit.text << "\"" << std::endl;
    }

    // Restrict to guides only
    query.filter = filter_expr{term{"kind", std::string("guide")}};
    auto guides = eng.query(query);
    if (guides) {
        std::cout << "\nGuides only:" << std::endl;
        for (const auto& hit : *guides) {
            std::cout << "  " << hit.id << "  final=" << hit.final_score << std::endl;
        }
    }

    auto removed = eng.remove("ghost", model.model_tag);
    if (removed) {
        std::cout << "\nDelete of 'ghost': " << engine::to_string(removed->status) << std::endl;
    }

    if (!eng.config().data_dir.empty()) {
        if (auto saved = eng.save(); !saved) {
            std::cerr << "Save failed: " << saved.error().message << std::endl;
            return 1;
        }
        std::cout << "Saved to " << eng.config().data_dir << std::endl;
    }

    if (auto stats = eng.stats(model.model_tag)) {
        std::cout << "\nRecords: " << stats->record_count
                  << ", vocabulary: " << stats->vocabulary_size
                  << ", skipped upserts: " << stats->skipped_upserts << std::endl;
    }
    return 0;
}
