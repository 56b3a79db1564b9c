#pragma once

/** \file hybrid_searcher.hpp
 *  \brief Hybrid query over one model partition: vector ANN and BM25 run in
 *         parallel, then fuse into a single ranked list.
 *
 * Candidate request size per signal is `max(k, overfetch)`, multiplied by
 * `filter_overfetch` when a metadata filter is present, and saturates at the
 * size of the larger index. Filters are applied to each candidate set before
 * normalization.
 *
 * Thread-safety: search() is safe to call concurrently with itself and with
 * writers of the underlying indexes and store.
 */

#include <atomic>
#include <chrono>
#include <cstdint>
#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "quiver/error.hpp"
#include "quiver/filter_expr.hpp"
#include "quiver/index/bm25.hpp"
#include "quiver/index/index_manager.hpp"
#include "quiver/metadata/metadata_value.hpp"
#include "quiver/search/fusion_algorithms.hpp"
#include "quiver/store/record_store.hpp"

namespace quiver::search {

/** \brief Query: text, vector, or both. */
struct HybridQuery {
    std::string text;                     /**< lexical query; empty skips BM25 */
    std::vector<float> vector;            /**< query embedding; empty skips ANN */
    std::optional<filter_expr> filter;    /**< optional metadata predicate */
};

/** \brief Per-query configuration. */
struct HybridSearchConfig {
    std::size_t k{10};                    /**< results to return */
    fusion::FusionWeights weights;        /**< 0.7 / 0.3 by default */
    std::size_t overfetch{50};            /**< minimum candidates per signal */
    std::size_t filter_overfetch{4};      /**< multiplier when filtering */
    float min_score{0.0f};                /**< drop fused results below this */
    std::optional<std::chrono::steady_clock::time_point> deadline;
};

/** \brief One ranked hit with its record payload. */
struct HybridResult {
    std::string id;
    float final_score{0.0f};
    float vector_score{0.0f};
    float lexical_score{0.0f};
    std::uint64_t version{0};
    std::string text;
    metadata::MetadataMap metadata;
};

/** \brief Point-in-time copy of searcher counters. */
struct HybridSearchStats {
    std::size_t total_queries{0};
    std::size_t vector_searches{0};
    std::size_t lexical_searches{0};
    std::size_t timeouts{0};
    std::size_t total_latency_us{0};
};

class HybridSearcher {
public:
    /** \brief Bind the searcher to one partition; all referents must outlive it. */
    HybridSearcher(const index::VectorIndexManager& vectors,
                   const index::BM25Index& lexical,
                   const store::RecordStore& store,
                   std::string model_tag);
    ~HybridSearcher();

    /** \brief Ranked hits for `query`.
     *
     * Errors:
     * - validation_failed: no text and no vector, k == 0, bad weights,
     *   vector dimension mismatch
     * - index_unavailable: the ANN structure has not been (re)built
     * - timeout: `config.deadline` passed; no partial list is returned
     *
     * No matches is an empty vector, never an error.
     */
    auto search(const HybridQuery& query, const HybridSearchConfig& config) const
        -> std::expected<std::vector<HybridResult>, core::error>;

    auto get_stats() const noexcept -> HybridSearchStats;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace quiver::search
