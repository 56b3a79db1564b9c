#pragma once

/** \file vector_index.hpp
 *  \brief Abstract approximate nearest-neighbor index over string ids.
 *
 * One instance serves one model partition: fixed dimensionality, fixed
 * metric. Backends (HNSW graph, IVF partitions) are interchangeable behind
 * this interface; index_manager.hpp constructs and persists them.
 *
 * Thread-safety: all methods are safe to call concurrently; each backend
 * guards its structure with a reader-writer lock.
 */

#include <cstdint>
#include <expected>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "quiver/error.hpp"

namespace quiver::io {
class BinaryWriter;
class BinaryReader;
}

namespace quiver::index {

/** \brief Distance metric, fixed per index instance. */
enum class DistanceMetric : std::uint8_t {
    L2 = 0,       /**< Euclidean distance */
    Cosine = 1,   /**< 1 - cosine similarity */
};

/** \brief One search result. */
struct Neighbor {
    std::string id;
    float distance{0.0f};
};

/** \brief Available backends. */
enum class IndexBackend : std::uint8_t {
    HNSW = 0,   /**< Layered proximity graph */
    IVF = 1,    /**< Coarse-quantized inverted lists */
};

auto to_string(DistanceMetric m) noexcept -> std::string_view;
auto to_string(IndexBackend b) noexcept -> std::string_view;

/** \brief Interface implemented by every ANN backend. */
class VectorIndex {
public:
    virtual ~VectorIndex() = default;

    virtual auto backend() const noexcept -> IndexBackend = 0;
    virtual auto dimension() const noexcept -> std::size_t = 0;
    virtual auto metric() const noexcept -> DistanceMetric = 0;

    /** \brief Insert or replace the vector stored under `id`.
     *
     * Idempotent: re-inserting an existing id leaves exactly one reachable
     * entry. Errors: validation_failed on dimension mismatch or, for cosine,
     * a zero-norm vector.
     */
    virtual auto insert(std::string_view id, std::span<const float> vec)
        -> std::expected<void, core::error> = 0;

    /** \brief Remove `id`; removing an absent id is a no-op. Returns true if removed. */
    virtual auto remove(std::string_view id) -> bool = 0;

    /** \brief k nearest live entries, ascending by distance, ties by id.
     *
     * `metric` must equal the index metric; a mismatch is invalid_argument.
     * Distances are Euclidean for L2 and 1 - cos for Cosine.
     */
    virtual auto search(std::span<const float> query, std::size_t k, DistanceMetric metric) const
        -> std::expected<std::vector<Neighbor>, core::error> = 0;

    virtual auto contains(std::string_view id) const -> bool = 0;

    /** \brief Live entry count. */
    virtual auto size() const -> std::size_t = 0;

    /** \brief Removed entries still occupying the structure. */
    virtual auto tombstones() const -> std::size_t = 0;

    /** \brief All live ids (unordered). */
    virtual auto ids() const -> std::vector<std::string> = 0;

    /** \brief Fit the trained component on every vector [n x dim] before they are inserted.
     *
     * Called only by an explicit training build. The default does nothing.
     */
    virtual auto train(std::span<const float> samples, std::size_t n) -> std::expected<void, core::error> {
        (void)samples;
        (void)n;
        return {};
    }

    /** \brief True when train() would change how search behaves (e.g. untrained quantizer). */
    virtual auto wants_training() const -> bool { return false; }

    /** \brief Empty structure with the same parameters and trained state.
     *
     * Filling it with the same entries reproduces this index's search behavior.
     */
    virtual auto empty_like() const -> std::expected<std::unique_ptr<VectorIndex>, core::error> = 0;

    virtual auto save(io::BinaryWriter& out) const -> void = 0;

    /** \brief tombstones / (live + tombstones), 0 for an empty index. */
    auto tombstone_ratio() const -> double {
        const auto dead = tombstones();
        const auto total = dead + size();
        return total == 0 ? 0.0 : static_cast<double>(dead) / static_cast<double>(total);
    }
};

} // namespace quiver::index
