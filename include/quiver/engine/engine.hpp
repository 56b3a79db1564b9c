#pragma once

/** \file engine.hpp
 *  \brief Embedding storage and hybrid retrieval engine.
 *
 * One engine hosts any number of model partitions (one per model tag). Each
 * partition owns its canonical records, an ANN index, a BM25 index, a write
 * pipeline and a hybrid searcher; partitions share nothing.
 *
 * Persistence (when EngineConfig::data_dir is set), per model tag:
 *
 *   <data_dir>/<model_tag>/records.qrs   canonical records
 *   <data_dir>/<model_tag>/vectors.qvi   ANN structure
 *   <data_dir>/<model_tag>/lexical.qlx   BM25 structure
 *
 * Index artifacts carry the record-set mutation sequence they were derived
 * from. On open, a missing/corrupt/stale lexical artifact is rebuilt inline;
 * a missing/corrupt/stale ANN artifact is rebuilt in the background and
 * queries fail with index_unavailable until it is published. A failed
 * rebuild of an unavailable index is retried on later writes and queries,
 * at most once per EngineConfig::rebuild_retry_interval.
 *
 * Thread-safety: every method may be called concurrently. Queries never wait
 * for writers; save() and verify() briefly exclude writers of the partition.
 */

#include <chrono>
#include <cstdint>
#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "quiver/engine/engine_config.hpp"
#include "quiver/engine/upsert_pipeline.hpp"
#include "quiver/error.hpp"
#include "quiver/filter_expr.hpp"
#include "quiver/index/index_manager.hpp"
#include "quiver/search/fusion_algorithms.hpp"
#include "quiver/search/hybrid_searcher.hpp"
#include "quiver/store/record_store.hpp"

namespace quiver::engine {

struct QueryRequest {
    std::string model_tag;
    std::string text;                                       /**< empty: vector only */
    std::optional<std::vector<float>> vector;               /**< absent: text only */
    std::size_t k{10};
    std::optional<search::fusion::FusionWeights> weights;   /**< engine default if absent */
    std::optional<filter_expr> filter;
    float min_score{0.0f};
    std::optional<std::chrono::milliseconds> timeout;       /**< deadline relative to call */
};

using QueryHit = search::HybridResult;

/** \brief Outcome of a consistency check. */
struct VerifyReport {
    std::size_t record_count{0};
    std::size_t vector_count{0};
    std::size_t lexical_count{0};
    std::vector<std::string> repaired_ids;   /**< ids that diverged and were re-derived */
    bool consistent{true};                   /**< true when nothing needed repair */
};

struct PartitionStats {
    std::size_t record_count{0};
    std::size_t vector_live{0};
    std::size_t vector_tombstoned{0};
    std::size_t lexical_documents{0};
    std::size_t vocabulary_size{0};
    std::uint64_t mutation_seq{0};
    bool rebuild_in_progress{false};
    bool index_available{false};
    bool training_recommended{false};   /**< train_index would switch IVF to partitioned search */
    std::size_t total_queries{0};
    std::size_t total_upserts{0};
    std::size_t skipped_upserts{0};
    double avg_query_latency_us{0.0};
    index::IndexBackend backend{index::IndexBackend::HNSW};
};

class EmbeddingEngine {
public:
    /** \brief Create an engine, register `config.models`, recover persisted state.
     *
     * Errors: config_invalid, data_integrity (corrupt record artifact),
     * io_failed.
     */
    static auto open(EngineConfig config) -> std::expected<std::unique_ptr<EmbeddingEngine>, core::error>;

    ~EmbeddingEngine();
    EmbeddingEngine(const EmbeddingEngine&) = delete;
    EmbeddingEngine& operator=(const EmbeddingEngine&) = delete;

    /** \brief Add a partition. Identical re-registration is a no-op; a
     *  conflicting one (dimension, metric or backend) is config_invalid. */
    auto register_model(const ModelSpec& spec) -> std::expected<void, core::error>;

    auto upsert(const UpsertRequest& request) -> std::expected<UpsertResult, core::error>;

    /** \brief Upsert each request in order; one outcome per request.
     *
     * A failed item does not stop the rest. Requests may target different
     * model tags; an unknown tag fails only its own items with not_found.
     */
    auto upsert_batch(const std::vector<UpsertRequest>& requests)
        -> std::vector<std::expected<UpsertResult, core::error>>;

    auto remove(std::string_view id, std::string_view model_tag) -> std::expected<DeleteResult, core::error>;
    auto query(const QueryRequest& request) const -> std::expected<std::vector<QueryHit>, core::error>;
    auto get(std::string_view id, std::string_view model_tag) const
        -> std::expected<store::EmbeddingRecord, core::error>;

    /** \brief Start a background ANN rebuild from the canonical records.
     *
     * The rebuilt index keeps the current trained state, so an unchanged
     * record set answers queries exactly as before.
     */
    auto rebuild_index(std::string_view model_tag, bool force = false)
        -> std::expected<index::RebuildStatus, core::error>;

    /** \brief Start a background rebuild that fits the IVF quantizer on the
     *  current records. Below the training threshold the index stays exact;
     *  for HNSW this is an ordinary rebuild. */
    auto train_index(std::string_view model_tag) -> std::expected<index::RebuildStatus, core::error>;

    /** \brief Block until the partition has no rebuild running; false on timeout. */
    auto wait_for_rebuild(std::string_view model_tag,
                          std::optional<std::chrono::milliseconds> timeout = std::nullopt) const
        -> std::expected<bool, core::error>;

    /** \brief Compare store and index id sets; repair divergence once. */
    auto verify(std::string_view model_tag) -> std::expected<VerifyReport, core::error>;

    /** \brief Persist every partition. Errors: precondition_failed without data_dir. */
    auto save() -> std::expected<void, core::error>;

    auto stats(std::string_view model_tag) const -> std::expected<PartitionStats, core::error>;
    auto model_tags() const -> std::vector<std::string>;
    auto config() const -> const EngineConfig&;

private:
    explicit EmbeddingEngine(EngineConfig config);

    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace quiver::engine
