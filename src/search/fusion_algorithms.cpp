#include "quiver/search/fusion_algorithms.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <unordered_map>

namespace quiver::search::fusion {

auto validate(const FusionWeights& weights) -> std::expected<void, core::error> {
    const bool finite = std::isfinite(weights.vector) && std::isfinite(weights.lexical);
    if (!finite || weights.vector < 0.0f || weights.lexical < 0.0f) {
        return std::unexpected(core::error{core::error_code::validation_failed,
                                           "fusion weights must be finite and non-negative", "search.fusion"});
    }
    if (weights.vector == 0.0f && weights.lexical == 0.0f) {
        return std::unexpected(core::error{core::error_code::validation_failed,
                                           "at least one fusion weight must be positive", "search.fusion"});
    }
    return {};
}

auto min_max_normalize(std::vector<float>& values) -> void {
    if (values.empty()) return;

    float lo = std::numeric_limits<float>::max();
    float hi = std::numeric_limits<float>::lowest();
    for (float v : values) {
        lo = std::min(lo, v);
        hi = std::max(hi, v);
    }

    const float range = hi - lo;
    if (!(range > 0.0f)) {
        std::fill(values.begin(), values.end(), 1.0f);
        return;
    }
    for (float& v : values) {
        v = (v - lo) / range;
    }
}

auto weighted_fuse(const std::vector<index::Neighbor>& vector_hits,
                   const std::vector<index::LexicalHit>& lexical_hits,
                   const FusionWeights& weights,
                   std::size_t top_k,
                   float min_score) -> std::vector<FusedResult> {
    if (top_k == 0 || (vector_hits.empty() && lexical_hits.empty())) return {};

    std::unordered_map<std::string, FusedResult> merged;
    merged.reserve(vector_hits.size() + lexical_hits.size());

    // Normalizing negated distances yields 1 - normalized_distance directly,
    // and a degenerate set maps to full similarity.
    std::vector<float> dense(vector_hits.size());
    for (std::size_t i = 0; i < vector_hits.size(); ++i) dense[i] = -vector_hits[i].distance;
    min_max_normalize(dense);
    for (std::size_t i = 0; i < vector_hits.size(); ++i) {
        auto& r = merged[vector_hits[i].id];
        r.id = vector_hits[i].id;
        r.vector_score = dense[i];
        r.from_vector = true;
    }

    std::vector<float> sparse(lexical_hits.size());
    for (std::size_t i = 0; i < lexical_hits.size(); ++i) sparse[i] = lexical_hits[i].score;
    min_max_normalize(sparse);
    for (std::size_t i = 0; i < lexical_hits.size(); ++i) {
        auto& r = merged[lexical_hits[i].id];
        r.id = lexical_hits[i].id;
        r.lexical_score = sparse[i];
        r.from_lexical = true;
    }

    std::vector<FusedResult> results;
    results.reserve(merged.size());
    for (auto& [id, r] : merged) {
        r.final_score = weights.vector * r.vector_score + weights.lexical * r.lexical_score;
        if (r.final_score < min_score) continue;
        results.push_back(std::move(r));
    }

    std::sort(results.begin(), results.end(), [](const FusedResult& a, const FusedResult& b) {
        if (a.final_score != b.final_score) return a.final_score > b.final_score;
        return a.id < b.id;
    });

    if (results.size() > top_k) results.resize(top_k);
    return results;
}

} // namespace quiver::search::fusion
