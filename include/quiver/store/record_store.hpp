#pragma once

/** \file record_store.hpp
 *  \brief Canonical, authoritative embedding records partitioned by model tag.
 *
 * The store is the single source of truth; vector and lexical indexes hold
 * derived references back to record ids and can always be re-derived from
 * a partition snapshot.
 *
 * Thread-safety: each partition has its own reader-writer lock; put/remove
 * are atomic per call and serialize per partition, so concurrent puts to the
 * same key are linearized (last writer by submission order wins and observes
 * the previous winner's version).
 */

#include <cstdint>
#include <expected>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "quiver/core/content_hash.hpp"
#include "quiver/error.hpp"
#include "quiver/metadata/metadata_value.hpp"

namespace quiver::store {

/** \brief One stored content unit. */
struct EmbeddingRecord {
    std::string id;                     /**< external identifier, immutable */
    std::string model_tag;              /**< embedding model / partition */
    core::ContentHash content_hash{};   /**< SHA-256 of normalized content */
    std::vector<float> vector;          /**< length == partition dimension */
    std::string text;                   /**< normalized text */
    metadata::MetadataMap metadata;     /**< pass-through attributes */
    std::uint64_t version{0};           /**< 1 on insert, +1 per update */
};

class RecordStore {
public:
    RecordStore();
    ~RecordStore();
    RecordStore(const RecordStore&) = delete;
    RecordStore& operator=(const RecordStore&) = delete;

    /** \brief Create the partition for `model_tag` with a fixed dimension.
     *
     * Idempotent for the same dimension; config_invalid otherwise.
     */
    auto register_partition(std::string_view model_tag, std::size_t dimension)
        -> std::expected<void, core::error>;

    auto has_partition(std::string_view model_tag) const -> bool;
    auto dimension(std::string_view model_tag) const -> std::expected<std::size_t, core::error>;

    /** \brief Errors: not_found for an unknown tag or absent id. */
    auto get(std::string_view id, std::string_view model_tag) const
        -> std::expected<EmbeddingRecord, core::error>;

    /** \brief Insert or replace; assigns record.version = previous + 1 (or 1).
     *
     * \return previous version, or nullopt if the key was absent
     * Errors: validation_failed (empty id, dimension mismatch, non-finite
     * component); not_found for an unknown tag. Nothing is mutated on error.
     */
    auto put(EmbeddingRecord record) -> std::expected<std::optional<std::uint64_t>, core::error>;

    /** \brief Hard delete. Errors: not_found for an unknown tag or absent id. */
    auto remove(std::string_view id, std::string_view model_tag) -> std::expected<void, core::error>;

    /** \brief Copy of every live record in `model_tag`, sorted by id. */
    auto snapshot(std::string_view model_tag) const
        -> std::expected<std::vector<EmbeddingRecord>, core::error>;

    /** \brief Live ids in `model_tag` (unordered). */
    auto ids(std::string_view model_tag) const -> std::expected<std::vector<std::string>, core::error>;

    auto size(std::string_view model_tag) const -> std::size_t;

    /** \brief Count of successful mutations ever applied to the partition. */
    auto mutation_seq(std::string_view model_tag) const -> std::uint64_t;

    auto tags() const -> std::vector<std::string>;

    /** \brief Durably write the partition to `path`. */
    auto save(std::string_view model_tag, const std::filesystem::path& path) const
        -> std::expected<void, core::error>;

    /** \brief Replace the partition contents with the artifact at `path`.
     *
     * The stored tag and dimension must match the registered partition.
     * Errors: not_found (missing file), data_integrity (corrupt or mismatched).
     */
    auto load(std::string_view model_tag, const std::filesystem::path& path)
        -> std::expected<void, core::error>;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace quiver::store
