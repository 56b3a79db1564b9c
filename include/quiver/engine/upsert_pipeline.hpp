#pragma once

/** \file upsert_pipeline.hpp
 *  \brief Write path of one model partition: change detection, canonical
 *         store, then both indexes.
 *
 * Upsert states:
 *
 *   Received -> HashChecked -> Skipped
 *                           -> Stored -> IndexesUpdated -> Acknowledged
 *
 * Validation (id, vector presence, dimension, finiteness, cosine norm) runs
 * before anything is mutated. On Update the old entry is removed from both
 * indexes before the new one is inserted, so an id is never reachable twice.
 * Index updates are idempotent and retried; if they keep failing the entry is
 * re-derived from the store once, and only then is index_inconsistency
 * surfaced.
 *
 * Per-key linearization: calls for the same id serialize on a striped lock;
 * different ids proceed in parallel.
 */

#include <array>
#include <atomic>
#include <cstdint>
#include <expected>
#include <functional>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "quiver/error.hpp"
#include "quiver/index/bm25.hpp"
#include "quiver/index/index_manager.hpp"
#include "quiver/metadata/metadata_value.hpp"
#include "quiver/store/change_detector.hpp"
#include "quiver/store/record_store.hpp"

namespace quiver::engine {

enum class UpsertStatus : std::uint8_t { Inserted, Updated, Skipped };
enum class DeleteStatus : std::uint8_t { Deleted, NotFound };

auto to_string(UpsertStatus s) noexcept -> std::string_view;
auto to_string(DeleteStatus s) noexcept -> std::string_view;

struct UpsertRequest {
    std::string id;
    std::string model_tag;
    std::string content;                       /**< raw source text */
    std::optional<std::vector<float>> vector;  /**< precomputed embedding */
    metadata::MetadataMap metadata;
};

struct UpsertResult {
    UpsertStatus status{UpsertStatus::Inserted};
    std::uint64_t version{0};
};

struct DeleteResult {
    DeleteStatus status{DeleteStatus::Deleted};
};

class UpsertPipeline {
public:
    /** \brief Pipeline for partition `model_tag`; all referents must outlive it. */
    UpsertPipeline(store::RecordStore& store, index::VectorIndexManager& vectors,
                   index::BM25Index& lexical, std::string model_tag,
                   std::uint32_t index_retry_attempts = 3);

    /** \brief Errors: validation_failed, missing_vector (no mutation for
     *  either), index_inconsistency after a failed repair. */
    auto upsert(const UpsertRequest& request) -> std::expected<UpsertResult, core::error>;

    /** \brief NotFound is a status, not an error. */
    auto remove(std::string_view id) -> std::expected<DeleteResult, core::error>;

    /** \brief Make both indexes agree with the store for `id`.
     *
     * Present in the store: (re)inserted. Absent: removed.
     */
    auto repair(std::string_view id) -> std::expected<void, core::error>;

    auto total_upserts() const noexcept -> std::size_t { return total_upserts_.load(); }
    auto skipped_upserts() const noexcept -> std::size_t { return skipped_upserts_.load(); }

private:
    auto validate(const UpsertRequest& request) const -> std::expected<void, core::error>;
    auto apply_indexes(std::string_view id, bool had_previous, std::span<const float> vec,
                       std::string_view text) -> std::expected<void, core::error>;
    auto drop_from_indexes(std::string_view id) -> std::expected<void, core::error>;
    auto with_retries(std::string_view id, std::string_view what,
                      const std::function<std::expected<void, core::error>()>& step)
        -> std::expected<void, core::error>;
    auto stripe(std::string_view id) -> std::mutex&;

    static constexpr std::size_t kStripes = 64;

    store::RecordStore& store_;
    index::VectorIndexManager& vectors_;
    index::BM25Index& lexical_;
    store::ChangeDetector detector_;
    std::string model_tag_;
    std::uint32_t retry_attempts_;

    std::array<std::mutex, kStripes> stripes_;
    std::atomic<std::size_t> total_upserts_{0};
    std::atomic<std::size_t> skipped_upserts_{0};
};

} // namespace quiver::engine
