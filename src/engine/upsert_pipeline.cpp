#include "quiver/engine/upsert_pipeline.hpp"
#include "quiver/core/platform_utils.hpp"
#include "quiver/kernels/distance.hpp"

#include <algorithm>
#include <cmath>
#include <functional>
#include <iostream>

namespace quiver::engine {

using core::error;
using core::error_code;

auto to_string(UpsertStatus s) noexcept -> std::string_view {
    switch (s) {
        case UpsertStatus::Inserted: return "inserted";
        case UpsertStatus::Updated: return "updated";
        case UpsertStatus::Skipped: return "skipped";
    }
    return "unknown";
}

auto to_string(DeleteStatus s) noexcept -> std::string_view {
    switch (s) {
        case DeleteStatus::Deleted: return "deleted";
        case DeleteStatus::NotFound: return "not_found";
    }
    return "unknown";
}

UpsertPipeline::UpsertPipeline(store::RecordStore& store, index::VectorIndexManager& vectors,
                               index::BM25Index& lexical, std::string model_tag,
                               std::uint32_t index_retry_attempts)
    : store_(store)
    , vectors_(vectors)
    , lexical_(lexical)
    , detector_(store)
    , model_tag_(std::move(model_tag))
    , retry_attempts_(std::max<std::uint32_t>(index_retry_attempts, 1)) {}

auto UpsertPipeline::stripe(std::string_view id) -> std::mutex& {
    return stripes_[std::hash<std::string_view>{}(id) % kStripes];
}

auto UpsertPipeline::validate(const UpsertRequest& request) const -> std::expected<void, core::error> {
    if (request.id.empty()) {
        return std::unexpected(error{error_code::validation_failed, "record id must not be empty", "engine.pipeline"});
    }
    if (!request.vector) return {};

    const auto& vec = *request.vector;
    const auto& cfg = vectors_.config();
    if (vec.size() != cfg.dimension) {
        return std::unexpected(error{error_code::validation_failed,
                                     "vector has " + std::to_string(vec.size()) + " components, partition '" +
                                         model_tag_ + "' expects " + std::to_string(cfg.dimension),
                                     "engine.pipeline"});
    }
    if (!std::all_of(vec.begin(), vec.end(), [](float v) { return std::isfinite(v); })) {
        return std::unexpected(error{error_code::validation_failed, "non-finite vector component", "engine.pipeline"});
    }
    if (cfg.metric == index::DistanceMetric::Cosine && kernels::l2_norm(vec) == 0.0f) {
        return std::unexpected(error{error_code::validation_failed, "zero-norm vector under cosine metric",
                                     "engine.pipeline"});
    }
    return {};
}

auto UpsertPipeline::with_retries(std::string_view id, std::string_view what,
                                  const std::function<std::expected<void, core::error>()>& step)
    -> std::expected<void, core::error> {
    std::expected<void, core::error> last;
    for (std::uint32_t attempt = 1; attempt <= retry_attempts_; ++attempt) {
        last = step();
        if (last) return last;
        if (core::debug_enabled()) {
            std::cerr << "[quiver][engine.pipeline] " << what << " of '" << id << "' failed (attempt "
                      << attempt << "/" << retry_attempts_ << "): " << last.error().message << "\n";
        }
    }

    std::cerr << "[quiver][engine.pipeline] index_inconsistency: " << what << " of '" << id
              << "' failed after " << retry_attempts_ << " attempts; repairing from store\n";
    if (auto r = repair(id); r) return r;

    return std::unexpected(error{error_code::index_inconsistency,
                                 std::string(what) + " of '" + std::string(id) + "' failed and repair did not converge: " +
                                     last.error().message,
                                 "engine.pipeline"});
}

auto UpsertPipeline::drop_from_indexes(std::string_view id) -> std::expected<void, core::error> {
    if (auto r = vectors_.remove(id); !r) return r;
    lexical_.remove(id);
    return {};
}

auto UpsertPipeline::apply_indexes(std::string_view id, bool had_previous, std::span<const float> vec,
                                   std::string_view text) -> std::expected<void, core::error> {
    // Old entries leave both indexes before the new ones arrive.
    if (had_previous) {
        if (auto r = drop_from_indexes(id); !r) return r;
    }
    if (auto r = vectors_.insert(id, vec); !r) return r;
    if (auto r = lexical_.insert(id, text); !r) return r;
    return {};
}

auto UpsertPipeline::repair(std::string_view id) -> std::expected<void, core::error> {
    auto rec = store_.get(id, model_tag_);
    if (!rec) {
        if (rec.error().code != error_code::not_found) return std::unexpected(rec.error());
        return drop_from_indexes(id);
    }
    return apply_indexes(id, true, rec->vector, rec->text);
}

auto UpsertPipeline::upsert(const UpsertRequest& request) -> std::expected<UpsertResult, core::error> {
    // Received
    if (request.model_tag != model_tag_) {
        return std::unexpected(error{error_code::invalid_argument,
                                     "request for '" + request.model_tag + "' routed to '" + model_tag_ + "'",
                                     "engine.pipeline"});
    }
    if (auto v = validate(request); !v) return std::unexpected(v.error());

    std::lock_guard key_lock(stripe(request.id));
    total_upserts_.fetch_add(1);

    // HashChecked
    auto decision = detector_.decide(request.id, model_tag_, request.content);
    if (!decision) return std::unexpected(decision.error());

    if (decision->action == store::ChangeAction::Skip) {
        skipped_upserts_.fetch_add(1);
        return UpsertResult{UpsertStatus::Skipped, decision->current_version.value_or(0)};
    }

    // The core never embeds: content that changed needs a caller-supplied vector.
    if (!request.vector) {
        return std::unexpected(error{error_code::missing_vector,
                                     "upsert of '" + request.id + "' needs a precomputed vector",
                                     "engine.pipeline"});
    }

    // Stored
    store::EmbeddingRecord record;
    record.id = request.id;
    record.model_tag = model_tag_;
    record.content_hash = decision->content_hash;
    record.vector = *request.vector;
    record.text = decision->normalized_text;
    record.metadata = request.metadata;

    auto previous = store_.put(std::move(record));
    if (!previous) return std::unexpected(previous.error());
    const bool had_previous = previous->has_value();
    const std::uint64_t version = had_previous ? **previous + 1 : 1;

    // IndexesUpdated
    const auto& vec = *request.vector;
    const auto& text = decision->normalized_text;
    bool first = true;
    auto applied = with_retries(request.id, "index update", [&]() -> std::expected<void, core::error> {
        // A retry cannot know how far the previous attempt got; clear first.
        const bool clear = had_previous || !first;
        first = false;
        return apply_indexes(request.id, clear, vec, text);
    });
    if (!applied) return std::unexpected(applied.error());

    return UpsertResult{had_previous ? UpsertStatus::Updated : UpsertStatus::Inserted, version};
}

auto UpsertPipeline::remove(std::string_view id) -> std::expected<DeleteResult, core::error> {
    if (id.empty()) {
        return std::unexpected(error{error_code::validation_failed, "record id must not be empty", "engine.pipeline"});
    }
    std::lock_guard key_lock(stripe(id));

    if (auto r = store_.remove(id, model_tag_); !r) {
        if (r.error().code == error_code::not_found) return DeleteResult{DeleteStatus::NotFound};
        return std::unexpected(r.error());
    }

    auto dropped = with_retries(id, "index removal", [&] { return drop_from_indexes(id); });
    if (!dropped) return std::unexpected(dropped.error());
    return DeleteResult{DeleteStatus::Deleted};
}

} // namespace quiver::engine
