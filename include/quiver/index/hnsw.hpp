#pragma once

/** \file hnsw.hpp
 *  \brief Hierarchical Navigable Small World graph backend.
 *
 * Incremental construction (Malkov & Yashunin, Algorithm 1) with heuristic
 * neighbor selection. Removal is a soft delete: the node stays traversable
 * so the graph remains connected, but is never returned. Re-inserting an id
 * retires the old node and links a fresh one. Tombstoned nodes are reclaimed
 * only by a rebuild.
 *
 * Thread-safety: one reader-writer lock; searches share it, mutations are
 * exclusive.
 */

#include <cstdint>
#include <expected>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "quiver/error.hpp"
#include "quiver/index/vector_index.hpp"

namespace quiver::index {

/** \brief HNSW build parameters. */
struct HnswBuildParams {
    std::uint32_t M{16};                    /**< Max connections per node */
    std::uint32_t efConstruction{200};      /**< Beam width during construction */
    std::uint32_t seed{42};                 /**< Random seed for level assignment */
    bool extend_candidates{true};           /**< Refill from discarded candidates when under M */
    std::uint32_t max_M{16};                /**< Max connections for level > 0 */
    std::uint32_t max_M0{32};               /**< Max connections for level 0 (2x M) */
};

/** \brief HNSW search parameters. */
struct HnswSearchParams {
    std::uint32_t efSearch{100};            /**< Beam width during search */
};

/** \brief HNSW graph statistics. */
struct HnswStats {
    std::size_t n_nodes{0};                 /**< Nodes including tombstones */
    std::size_t n_live{0};                  /**< Nodes that can be returned */
    std::size_t n_edges{0};                 /**< Directed edges over all levels */
    std::size_t n_levels{0};                /**< Number of hierarchy levels */
    float avg_degree{0.0f};                 /**< Average base-layer degree */
};

class HnswIndex final : public VectorIndex {
public:
    /** \brief Create an empty graph.
     *
     * Errors: config_invalid if dim == 0, M < 2, or efConstruction < M.
     */
    static auto create(std::size_t dim, DistanceMetric metric,
                       const HnswBuildParams& build, const HnswSearchParams& search)
        -> std::expected<std::unique_ptr<HnswIndex>, core::error>;

    /** \brief Restore a graph written by save(). */
    static auto load(std::size_t dim, DistanceMetric metric,
                     const HnswBuildParams& build, const HnswSearchParams& search,
                     io::BinaryReader& in)
        -> std::expected<std::unique_ptr<HnswIndex>, core::error>;

    ~HnswIndex() override;
    HnswIndex(const HnswIndex&) = delete;
    HnswIndex& operator=(const HnswIndex&) = delete;

    auto backend() const noexcept -> IndexBackend override { return IndexBackend::HNSW; }
    auto dimension() const noexcept -> std::size_t override;
    auto metric() const noexcept -> DistanceMetric override;

    auto insert(std::string_view id, std::span<const float> vec)
        -> std::expected<void, core::error> override;
    auto remove(std::string_view id) -> bool override;
    auto search(std::span<const float> query, std::size_t k, DistanceMetric metric) const
        -> std::expected<std::vector<Neighbor>, core::error> override;

    /** \brief Search with an explicit beam width (efSearch is raised to k if smaller). */
    auto search(std::span<const float> query, std::size_t k, const HnswSearchParams& params) const
        -> std::expected<std::vector<Neighbor>, core::error>;

    auto contains(std::string_view id) const -> bool override;
    auto size() const -> std::size_t override;
    auto tombstones() const -> std::size_t override;
    auto ids() const -> std::vector<std::string> override;
    auto empty_like() const -> std::expected<std::unique_ptr<VectorIndex>, core::error> override;
    auto save(io::BinaryWriter& out) const -> void override;

    auto get_stats() const -> HnswStats;

private:
    HnswIndex();

    class Impl;
    std::unique_ptr<Impl> impl_;
};

/** \brief Select-Neighbors-Heuristic (HNSW paper, Algorithm 4).
 *
 * Sorts `candidates` ascending, always keeps the nearest, accepts freely up
 * to M/2 and afterwards rejects candidates too close to the nearest. With
 * `extend_candidates` the remaining slots are refilled from the discarded set.
 * Returns (selected, discarded).
 */
auto robust_prune(std::vector<std::pair<float, std::uint32_t>>& candidates,
                  std::uint32_t M, bool extend_candidates)
    -> std::pair<std::vector<std::uint32_t>, std::vector<std::uint32_t>>;

} // namespace quiver::index
