#pragma once

/** \file index_manager.hpp
 *  \brief Owns the live ANN structure of one model partition and rebuilds it
 *         without blocking readers (build-then-swap).
 *
 * The active structure is published through an atomic shared_ptr. Searches
 * load it once and keep it alive for their whole duration, so a swap never
 * frees a structure with an outstanding reader.
 *
 * Rebuild:
 * 1. Under the swap lock: bump the generation, clear and enable the journal.
 * 2. Background thread: take a snapshot of live records and insert
 *    everything into a fresh structure. An ordinary rebuild starts from
 *    VectorIndex::empty_like() of the live structure, so trained state
 *    carries over and results on an unchanged record set do not move. A
 *    training rebuild fits the backend's quantizer on the snapshot first.
 * 3. Under the swap lock: replay the journal (writes that raced the build)
 *    onto the fresh structure, publish it, disable the journal.
 * A newer generation supersedes an older build, which notices and discards
 * its partial structure without publishing.
 *
 * Writers (insert/remove) apply to the live structure when one exists and
 * append to the journal while a rebuild is in flight.
 */

#include <chrono>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "quiver/error.hpp"
#include "quiver/index/hnsw.hpp"
#include "quiver/index/ivf_index.hpp"
#include "quiver/index/vector_index.hpp"

namespace quiver::index {

/** \brief Full configuration of one vector index instance. */
struct VectorIndexConfig {
    std::size_t dimension{0};
    DistanceMetric metric{DistanceMetric::L2};
    IndexBackend backend{IndexBackend::HNSW};
    HnswBuildParams hnsw;
    HnswSearchParams hnsw_search;
    IvfParams ivf;
};

/** \brief Construct an empty index for `config`. Errors: config_invalid. */
auto make_vector_index(const VectorIndexConfig& config)
    -> std::expected<std::unique_ptr<VectorIndex>, core::error>;

/** \brief (id, vector) pair fed to a rebuild. */
struct VectorEntry {
    std::string id;
    std::vector<float> vector;
};

/** \brief Build a populated index from `entries`.
 *
 * With `like`, the index starts from like->empty_like() and keeps its
 * trained state; otherwise it starts untrained.
 */
auto build_vector_index(const VectorIndexConfig& config, const std::vector<VectorEntry>& entries,
                        const VectorIndex* like = nullptr)
    -> std::expected<std::unique_ptr<VectorIndex>, core::error>;

/** \brief Build a populated index from `entries`, fitting its quantizer on them first. */
auto train_vector_index(const VectorIndexConfig& config, const std::vector<VectorEntry>& entries)
    -> std::expected<std::unique_ptr<VectorIndex>, core::error>;

/** \brief Source of live records for a rebuild; called on the rebuild thread. */
using SnapshotFn = std::function<std::expected<std::vector<VectorEntry>, core::error>()>;

enum class RebuildStatus : std::uint8_t {
    Started,
    AlreadyInProgress,
};

enum class RebuildMode : std::uint8_t {
    Preserve,   /**< Keep the live structure's trained state */
    Retrain,    /**< Refit the quantizer on the snapshot */
};

/** \brief Index artifact read back from disk. */
struct LoadedIndex {
    std::unique_ptr<VectorIndex> index;
    std::uint64_t source_seq{0};   /**< record-set mutation sequence it was derived from */
};

class VectorIndexManager {
public:
    /** \brief Manager serving an empty, immediately available structure. */
    static auto create(const VectorIndexConfig& config)
        -> std::expected<std::unique_ptr<VectorIndexManager>, core::error>;

    /** \brief Manager with no structure; search fails with index_unavailable
     *  until install() or a completed rebuild.
     *
     * A Preserve rebuild with no live structure starts from `shape`'s trained
     * state when one is given (a stale artifact), otherwise untrained.
     */
    static auto create_unavailable(const VectorIndexConfig& config,
                                   const VectorIndex* shape = nullptr)
        -> std::expected<std::unique_ptr<VectorIndexManager>, core::error>;

    ~VectorIndexManager();
    VectorIndexManager(const VectorIndexManager&) = delete;
    VectorIndexManager& operator=(const VectorIndexManager&) = delete;

    auto config() const -> const VectorIndexConfig&;

    /** \brief Publish `index` as the live structure (recovery path). */
    auto install(std::unique_ptr<VectorIndex> index) -> std::expected<void, core::error>;

    /** \brief Idempotent upsert of `id`. */
    auto insert(std::string_view id, std::span<const float> vec) -> std::expected<void, core::error>;

    /** \brief Remove `id`; absent ids are a no-op. */
    auto remove(std::string_view id) -> std::expected<void, core::error>;

    /** \brief k nearest live entries of the current structure.
     *
     * Errors: index_unavailable while no structure has been built; otherwise
     * as VectorIndex::search.
     */
    auto search(std::span<const float> query, std::size_t k) const
        -> std::expected<std::vector<Neighbor>, core::error>;

    /** \brief Start a background rebuild.
     *
     * Returns AlreadyInProgress if one is running and `force` is false. With
     * `force`, a running build is superseded and abandoned.
     */
    auto rebuild(SnapshotFn snapshot, bool force = false, RebuildMode mode = RebuildMode::Preserve)
        -> std::expected<RebuildStatus, core::error>;

    /** \brief Block until no rebuild is running; false on timeout. */
    auto wait_for_rebuild(std::optional<std::chrono::milliseconds> timeout = std::nullopt) const -> bool;

    auto is_available() const -> bool;
    auto is_rebuilding() const -> bool;

    /** \brief Error of the most recent failed rebuild, cleared by a successful one. */
    auto last_rebuild_error() const -> std::optional<core::error>;

    /** \brief True when tombstones exceed `tombstone_ratio`. */
    auto needs_rebuild(double tombstone_ratio) const -> bool;

    /** \brief True when a Retrain rebuild would change how search behaves. */
    auto training_recommended() const -> bool;

    auto contains(std::string_view id) const -> bool;
    auto ids() const -> std::vector<std::string>;
    auto size() const -> std::size_t;
    auto tombstones() const -> std::size_t;

    /** \brief Durably write the live structure tagged with `source_seq`.
     *
     * Errors: index_unavailable when there is no structure to save.
     */
    auto save(const std::filesystem::path& path, std::uint64_t source_seq) const
        -> std::expected<void, core::error>;

    /** \brief Read an artifact written by save(); backend, metric and
     *  dimension must match `config`, otherwise data_integrity. */
    static auto load(const VectorIndexConfig& config, const std::filesystem::path& path)
        -> std::expected<LoadedIndex, core::error>;

private:
    explicit VectorIndexManager(const VectorIndexConfig& config);

    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace quiver::index
