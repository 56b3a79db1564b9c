#pragma once

/** \file engine_config.hpp
 *  \brief Model partition definitions and engine-wide tunables.
 *
 * Every field has a usable default. EngineConfig::from_env() overlays
 * QUIVER_* environment variables on top of a base configuration.
 */

#include <chrono>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <string>
#include <vector>

#include "quiver/error.hpp"
#include "quiver/index/bm25.hpp"
#include "quiver/index/hnsw.hpp"
#include "quiver/index/ivf_index.hpp"
#include "quiver/index/vector_index.hpp"
#include "quiver/search/fusion_algorithms.hpp"

namespace quiver::engine {

/** \brief One embedding model; owns one partition of records and indexes. */
struct ModelSpec {
    std::string model_tag;
    std::size_t dimension{0};
    index::DistanceMetric metric{index::DistanceMetric::Cosine};
    index::IndexBackend backend{index::IndexBackend::HNSW};
    index::HnswBuildParams hnsw;
    index::HnswSearchParams hnsw_search;
    index::IvfParams ivf;
    index::BM25Params bm25;

    /** \brief Errors: config_invalid for an empty tag, a tag that is not a
     *  safe directory name, or dimension == 0. */
    auto validate() const -> std::expected<void, core::error>;
};

struct EngineConfig {
    std::filesystem::path data_dir;              /**< empty: in-memory only */
    std::vector<ModelSpec> models;               /**< registered by open() */

    search::fusion::FusionWeights weights;       /**< default query weighting */
    std::size_t overfetch{50};                   /**< min candidates per signal */
    std::size_t filter_overfetch{4};             /**< multiplier when filtering */

    double rebuild_tombstone_ratio{0.3};         /**< auto-rebuild threshold */
    bool auto_rebuild{true};
    std::uint32_t index_retry_attempts{3};       /**< before repair from store */
    bool blocking_recovery{false};               /**< rebuild ANN on open before returning */
    std::chrono::milliseconds rebuild_retry_interval{1000};  /**< between retries of a failed rebuild */

    auto validate() const -> std::expected<void, core::error>;

    /** \brief `base` with QUIVER_DATA_DIR, QUIVER_VECTOR_WEIGHT,
     *  QUIVER_LEXICAL_WEIGHT, QUIVER_OVERFETCH, QUIVER_REBUILD_TOMBSTONE_RATIO,
     *  QUIVER_INDEX_RETRY_ATTEMPTS and QUIVER_BLOCKING_RECOVERY applied.
     *
     * Errors: config_invalid naming the variable whose value does not parse.
     */
    static auto from_env(EngineConfig base) -> std::expected<EngineConfig, core::error>;
    static auto from_env() -> std::expected<EngineConfig, core::error> {
        return from_env(EngineConfig{});
    }
};

} // namespace quiver::engine
