/** \file hybrid_search_bench.cpp
 *  \brief Micro benchmarks for the lexical index, fusion, and end-to-end hybrid queries.
 */

#include <benchmark/benchmark.h>
#include "quiver/engine/engine.hpp"
#include "quiver/index/bm25.hpp"
#include "quiver/search/fusion_algorithms.hpp"

#include <algorithm>
#include <cmath>
#include <random>
#include <string>
#include <vector>
#include <memory>

using namespace quiver;
using namespace quiver::index;
using namespace quiver::search::fusion;

namespace {

// Generate random text documents
std::vector<std::string> generate_documents(std::size_t n_docs,
                                            std::size_t avg_length,
                                            std::size_t vocab_size) {
    std::vector<std::string> docs;
    std::mt19937 gen(42);
    std::uniform_int_distribution<std::size_t> word_dist(0, vocab_size - 1);
    std::normal_distribution<> len_dist(static_cast<double>(avg_length), avg_length / 4.0);

    for (std::size_t i = 0; i < n_docs; ++i) {
        std::string doc;
        int doc_len = std::max(1, static_cast<int>(len_dist(gen)));
        for (int j = 0; j < doc_len; ++j) {
            if (j > 0) doc += " ";
            doc += "word" + std::to_string(word_dist(gen));
        }
        docs.push_back(doc);
    }
    return docs;
}

// Generate unit-norm random embeddings
std::vector<std::vector<float>> generate_embeddings(std::size_t n_vecs, std::size_t dim) {
    std::vector<std::vector<float>> embeddings;
    std::mt19937 gen(42);
    std::normal_distribution<float> dist(0.0f, 1.0f);

    for (std::size_t i = 0; i < n_vecs; ++i) {
        std::vector<float> vec(dim);
        float norm = 0.0f;
        for (auto& val : vec) {
            val = dist(gen);
            norm += val * val;
        }
        norm = std::sqrt(norm);
        for (auto& val : vec) val /= norm;
        embeddings.push_back(std::move(vec));
    }
    return embeddings;
}

std::unique_ptr<engine::EmbeddingEngine> populated_engine(std::size_t n_docs, std::size_t dim,
                                                          IndexBackend backend) {
    engine::EngineConfig cfg;
    engine::ModelSpec spec;
    spec.model_tag = "bench";
    spec.dimension = dim;
    spec.backend = backend;
    cfg.models.push_back(spec);
    cfg.auto_rebuild = false;

    auto opened = engine::EmbeddingEngine::open(cfg);
    if (!opened) return nullptr;
    auto eng = std::move(*opened);

    auto text_docs = generate_documents(n_docs, 50, 5000);
    auto embeddings = generate_embeddings(n_docs, dim);
    for (std::size_t i = 0; i < n_docs; ++i) {
        engine::UpsertRequest r;
        r.id = "doc" + std::to_string(i);
        r.model_tag = "bench";
        r.content = text_docs[i];
        r.vector = embeddings[i];
        if (!eng->upsert(r)) return nullptr;
    }
    if (backend == IndexBackend::IVF) {
        if (!eng->train_index("bench")) return nullptr;
        (void)eng->wait_for_rebuild("bench");
    }
    return eng;
}

} // namespace

// BM25 Benchmarks

static void BM_BM25_Insert(benchmark::State& state) {
    const auto n_docs = static_cast<std::size_t>(state.range(0));
    auto docs = generate_documents(n_docs, 100, 10000);

    for (auto _ : state) {
        BM25Index index;
        for (std::size_t i = 0; i < n_docs; ++i) {
            auto result = index.insert("doc" + std::to_string(i), docs[i]);
            benchmark::DoNotOptimize(result);
        }
    }
    state.SetItemsProcessed(state.iterations() * static_cast<std::int64_t>(n_docs));
}
BENCHMARK(BM_BM25_Insert)->Range(100, 10000);

static void BM_BM25_Search(benchmark::State& state) {
    const auto n_docs = static_cast<std::size_t>(state.range(0));
    BM25Index index;
    auto docs = generate_documents(n_docs, 100, 10000);
    for (std::size_t i = 0; i < n_docs; ++i) {
        (void)index.insert("doc" + std::to_string(i), docs[i]);
    }

    std::vector<std::string> queries = {"word42", "word100 word200", "word1 word2 word3"};
    std::size_t query_idx = 0;
    for (auto _ : state) {
        auto results = index.search(queries[query_idx % queries.size()], 10);
        benchmark::DoNotOptimize(results);
        query_idx++;
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_BM25_Search)->Range(1000, 100000);

// Fusion Benchmarks

static void BM_WeightedFusion(benchmark::State& state) {
    const auto n_results = static_cast<std::size_t>(state.range(0));
    std::vector<Neighbor> dense;
    std::vector<LexicalHit> sparse;
    for (std::size_t i = 0; i < n_results; ++i) {
        dense.push_back({"doc" + std::to_string(i), 0.01f * static_cast<float>(i)});
        sparse.push_back({"doc" + std::to_string(i + n_results / 2), 10.0f - 0.01f * static_cast<float>(i)});
    }

    for (auto _ : state) {
        auto fused = weighted_fuse(dense, sparse, FusionWeights{}, 10);
        benchmark::DoNotOptimize(fused);
    }
    state.SetItemsProcessed(state.iterations() * static_cast<std::int64_t>(n_results) * 2);
}
BENCHMARK(BM_WeightedFusion)->Range(10, 1000);

// End-to-end Hybrid Query Benchmarks

static void BM_HybridQuery(benchmark::State& state) {
    const auto n_docs = static_cast<std::size_t>(state.range(0));
    const auto backend = state.range(1) == 0 ? IndexBackend::HNSW : IndexBackend::IVF;
    const std::size_t dim = 128;

    auto eng = populated_engine(n_docs, dim, backend);
    if (!eng) {
        state.SkipWithError("engine setup failed");
        return;
    }

    engine::QueryRequest query;
    query.model_tag = "bench";
    query.text = "word100 word200";
    query.vector = generate_embeddings(1, dim)[0];
    query.k = 10;

    for (auto _ : state) {
        auto results = eng->query(query);
        benchmark::DoNotOptimize(results);
    }
    state.SetItemsProcessed(state.iterations());
    state.SetLabel(std::string(to_string(backend)));
}
BENCHMARK(BM_HybridQuery)->Args({1000, 0})->Args({10000, 0})->Args({1000, 1})->Args({10000, 1});

static void BM_Upsert_Skip(benchmark::State& state) {
    auto eng = populated_engine(1000, 64, IndexBackend::HNSW);
    if (!eng) {
        state.SkipWithError("engine setup failed");
        return;
    }
    auto text_docs = generate_documents(1000, 50, 5000);

    // Unchanged content exercises hashing and the store lookup only.
    std::size_t i = 0;
    for (auto _ : state) {
        engine::UpsertRequest r;
        r.id = "doc" + std::to_string(i % 1000);
        r.model_tag = "bench";
        r.content = text_docs[i % 1000];
        auto result = eng->upsert(r);
        benchmark::DoNotOptimize(result);
        ++i;
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_Upsert_Skip);

BENCHMARK_MAIN();
