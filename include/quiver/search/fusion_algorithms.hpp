#pragma once

/** \file fusion_algorithms.hpp
 *  \brief Weighted fusion of vector and lexical candidate sets.
 *
 * Each candidate set is min-max normalized over itself (not against a
 * global constant), vector distances are turned into similarities with
 * `1 - normalized_distance`, and the two signals are combined linearly:
 *
 *   final = w_v * vector_similarity + w_l * lexical_score
 *
 * An id found by only one signal scores 0 for the other. Output is ordered
 * by final score descending, ties by id ascending.
 */

#include <cstddef>
#include <expected>
#include <string>
#include <vector>

#include "quiver/error.hpp"
#include "quiver/index/bm25.hpp"
#include "quiver/index/vector_index.hpp"

namespace quiver::search::fusion {

/** \brief Linear weights. Not renormalized; callers pass what they mean. */
struct FusionWeights {
    float vector{0.7f};
    float lexical{0.3f};
};

/** \brief Errors: validation_failed if a weight is negative or non-finite,
 *  or both are zero. */
auto validate(const FusionWeights& weights) -> std::expected<void, core::error>;

/** \brief One fused candidate. */
struct FusedResult {
    std::string id;
    float vector_score{0.0f};    /**< normalized similarity in [0,1], 0 if absent */
    float lexical_score{0.0f};   /**< normalized BM25 in [0,1], 0 if absent */
    float final_score{0.0f};
    bool from_vector{false};
    bool from_lexical{false};
};

/** \brief Min-max normalize `values` into [0,1] in place.
 *
 * A degenerate set (one element, or all equal) maps every value to 1.
 */
auto min_max_normalize(std::vector<float>& values) -> void;

/** \brief Fuse two candidate sets into at most `top_k` results.
 *
 * \param min_score drop results with final score below this before truncation
 *
 * Two empty inputs give an empty result.
 */
auto weighted_fuse(const std::vector<index::Neighbor>& vector_hits,
                   const std::vector<index::LexicalHit>& lexical_hits,
                   const FusionWeights& weights,
                   std::size_t top_k,
                   float min_score = 0.0f) -> std::vector<FusedResult>;

} // namespace quiver::search::fusion
