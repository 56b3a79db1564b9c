#pragma once

/** \file ivf_index.hpp
 *  \brief Inverted-file (IVF-Flat) backend.
 *
 * Vectors are bucketed by their nearest coarse centroid; a query scans the
 * nprobe lists whose centroids are closest. Until the quantizer is trained
 * every vector lives in one list and search is exact. Training happens only
 * in train(), on an explicit training build, and needs at least
 * nlist * min_points_per_list vectors; wants_training() reports when an
 * untrained index has grown past that point. empty_like() carries the
 * centroids over, so an ordinary rebuild keeps the current search mode.
 *
 * Removal is in place (swap-remove within a list), so this backend never
 * accumulates tombstones.
 *
 * Thread-safety: one reader-writer lock; searches share it.
 */

#include <cstdint>
#include <expected>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "quiver/error.hpp"
#include "quiver/index/kmeans.hpp"
#include "quiver/index/vector_index.hpp"

namespace quiver::index {

/** \brief IVF parameters. */
struct IvfParams {
    std::uint32_t nlist{100};               /**< Number of coarse lists */
    std::uint32_t nprobe{10};               /**< Lists scanned per query */
    std::uint32_t min_points_per_list{8};   /**< Training threshold per list */
    std::uint32_t max_iter{25};             /**< k-means iterations */
    std::uint32_t seed{42};                 /**< k-means seed */
};

class IvfIndex final : public VectorIndex {
public:
    /** \brief Create an empty, untrained index.
     *
     * Errors: config_invalid if dim == 0 or nlist, nprobe or min_points_per_list is 0.
     */
    static auto create(std::size_t dim, DistanceMetric metric, const IvfParams& params)
        -> std::expected<std::unique_ptr<IvfIndex>, core::error>;

    static auto load(std::size_t dim, DistanceMetric metric, const IvfParams& params,
                     io::BinaryReader& in)
        -> std::expected<std::unique_ptr<IvfIndex>, core::error>;

    ~IvfIndex() override;
    IvfIndex(const IvfIndex&) = delete;
    IvfIndex& operator=(const IvfIndex&) = delete;

    auto backend() const noexcept -> IndexBackend override { return IndexBackend::IVF; }
    auto dimension() const noexcept -> std::size_t override;
    auto metric() const noexcept -> DistanceMetric override;

    /** \brief Fit the coarse quantizer; must be called on an empty index.
     *
     * Below the training threshold this is a no-op and the index stays exact.
     * Errors: precondition_failed if entries were already inserted.
     */
    auto train(std::span<const float> samples, std::size_t n) -> std::expected<void, core::error> override;

    auto insert(std::string_view id, std::span<const float> vec)
        -> std::expected<void, core::error> override;
    auto remove(std::string_view id) -> bool override;
    auto search(std::span<const float> query, std::size_t k, DistanceMetric metric) const
        -> std::expected<std::vector<Neighbor>, core::error> override;

    /** \brief Search with an explicit probe count (clamped to the list count). */
    auto search(std::span<const float> query, std::size_t k, std::uint32_t nprobe) const
        -> std::expected<std::vector<Neighbor>, core::error>;

    auto contains(std::string_view id) const -> bool override;
    auto size() const -> std::size_t override;
    auto tombstones() const -> std::size_t override { return 0; }
    auto ids() const -> std::vector<std::string> override;
    auto wants_training() const -> bool override;
    auto empty_like() const -> std::expected<std::unique_ptr<VectorIndex>, core::error> override;
    auto save(io::BinaryWriter& out) const -> void override;

    auto is_trained() const -> bool;
    auto list_count() const -> std::size_t;

private:
    IvfIndex();

    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace quiver::index
