#include "quiver/search/hybrid_searcher.hpp"
#include "quiver/filter_eval.hpp"

#include <algorithm>
#include <future>
#include <system_error>
#include <unordered_map>

namespace quiver::search {

namespace {

auto timed_out() -> std::unexpected<core::error> {
    return std::unexpected(core::error{core::error_code::timeout, "query deadline exceeded", "search.hybrid"});
}

auto past(const std::optional<std::chrono::steady_clock::time_point>& deadline) -> bool {
    return deadline && std::chrono::steady_clock::now() >= *deadline;
}

/** \brief Wait for `f` until the deadline; false if it is still running. */
template <typename T>
auto ready_by(std::future<T>& f, const std::optional<std::chrono::steady_clock::time_point>& deadline) -> bool {
    if (!f.valid()) return true;
    if (!deadline) {
        f.wait();
        return true;
    }
    return f.wait_until(*deadline) == std::future_status::ready;
}

} // anonymous namespace

class HybridSearcher::Impl {
public:
    Impl(const index::VectorIndexManager& vectors, const index::BM25Index& lexical,
         const store::RecordStore& store, std::string model_tag)
        : vectors_(vectors), lexical_(lexical), store_(store), model_tag_(std::move(model_tag)) {}

    auto search(const HybridQuery& query, const HybridSearchConfig& config)
        -> std::expected<std::vector<HybridResult>, core::error>;

    /** \brief Keep candidates whose record exists and passes the filter. */
    template <typename Hit>
    auto admit(std::vector<Hit>& hits, const std::optional<filter_expr>& filter,
               std::unordered_map<std::string, store::EmbeddingRecord>& records) const -> void;

    const index::VectorIndexManager& vectors_;
    const index::BM25Index& lexical_;
    const store::RecordStore& store_;
    std::string model_tag_;

    std::atomic<std::size_t> total_queries_{0};
    std::atomic<std::size_t> vector_searches_{0};
    std::atomic<std::size_t> lexical_searches_{0};
    std::atomic<std::size_t> timeouts_{0};
    std::atomic<std::size_t> total_latency_us_{0};
};

template <typename Hit>
auto HybridSearcher::Impl::admit(std::vector<Hit>& hits, const std::optional<filter_expr>& filter,
                                 std::unordered_map<std::string, store::EmbeddingRecord>& records) const -> void {
    std::erase_if(hits, [&](const Hit& h) {
        auto it = records.find(h.id);
        if (it == records.end()) {
            auto rec = store_.get(h.id, model_tag_);
            // Deleted between index lookup and now.
            if (!rec) return true;
            it = records.emplace(h.id, std::move(*rec)).first;
        }
        return filter && !filter_eval::matches(*filter, it->second.metadata);
    });
}

auto HybridSearcher::Impl::search(const HybridQuery& query, const HybridSearchConfig& config)
    -> std::expected<std::vector<HybridResult>, core::error> {
    using core::error;
    using core::error_code;

    const auto start = std::chrono::steady_clock::now();

    const bool want_vector = !query.vector.empty();
    const bool want_lexical = !query.text.empty();
    if (!want_vector && !want_lexical) {
        return std::unexpected(error{error_code::validation_failed,
                                     "query needs text, a vector, or both", "search.hybrid"});
    }
    if (config.k == 0) {
        return std::unexpected(error{error_code::validation_failed, "k must be positive", "search.hybrid"});
    }
    if (auto v = fusion::validate(config.weights); !v) return std::unexpected(v.error());
    if (want_vector && query.vector.size() != vectors_.config().dimension) {
        return std::unexpected(error{error_code::validation_failed,
                                     "query vector dimension mismatch", "search.hybrid"});
    }
    // No brute-force fallback over the store while rebuilding.
    if (!vectors_.is_available()) {
        return std::unexpected(error{error_code::index_unavailable,
                                     "vector index for '" + model_tag_ + "' is rebuilding", "search.hybrid"});
    }

    // Neither sub-index can return more than it holds; saturate there.
    const std::size_t limit = std::max<std::size_t>({vectors_.size(), lexical_.size(), 1});
    std::size_t fetch = std::min(std::max(config.k, config.overfetch), limit);
    if (query.filter) {
        const std::size_t factor = std::max<std::size_t>(config.filter_overfetch, 1);
        fetch = fetch > limit / factor ? limit : fetch * factor;
    }

    std::future<std::expected<std::vector<index::Neighbor>, error>> dense_future;
    std::future<std::expected<std::vector<index::LexicalHit>, error>> sparse_future;
    try {
        if (want_vector) {
            dense_future = std::async(std::launch::async, [&] { return vectors_.search(query.vector, fetch); });
        }
        if (want_lexical) {
            sparse_future = std::async(std::launch::async, [&] { return lexical_.search(query.text, fetch); });
        }
    } catch (const std::system_error& e) {
        return std::unexpected(error{error_code::resource_exhausted,
                                     std::string("cannot launch sub-search: ") + e.what(), "search.hybrid"});
    }

    // Both futures are joined before returning. Partial results are discarded on timeout.
    const bool dense_ready = ready_by(dense_future, config.deadline);
    const bool sparse_ready = ready_by(sparse_future, config.deadline);
    if (!dense_ready || !sparse_ready) {
        if (dense_future.valid()) dense_future.wait();
        if (sparse_future.valid()) sparse_future.wait();
        timeouts_.fetch_add(1);
        return timed_out();
    }

    std::vector<index::Neighbor> dense;
    std::vector<index::LexicalHit> sparse;
    if (want_vector) {
        auto r = dense_future.get();
        if (!r) return std::unexpected(r.error());
        dense = std::move(*r);
        vector_searches_.fetch_add(1);
    }
    if (want_lexical) {
        auto r = sparse_future.get();
        if (!r) return std::unexpected(r.error());
        sparse = std::move(*r);
        lexical_searches_.fetch_add(1);
    }

    std::unordered_map<std::string, store::EmbeddingRecord> records;
    admit(dense, query.filter, records);
    admit(sparse, query.filter, records);

    auto fused = fusion::weighted_fuse(dense, sparse, config.weights, config.k, config.min_score);

    if (past(config.deadline)) {
        timeouts_.fetch_add(1);
        return timed_out();
    }

    std::vector<HybridResult> results;
    results.reserve(fused.size());
    for (auto& f : fused) {
        auto it = records.find(f.id);
        if (it == records.end()) continue;
        HybridResult hit;
        hit.id = std::move(f.id);
        hit.final_score = f.final_score;
        hit.vector_score = f.vector_score;
        hit.lexical_score = f.lexical_score;
        hit.version = it->second.version;
        hit.text = std::move(it->second.text);
        hit.metadata = std::move(it->second.metadata);
        results.push_back(std::move(hit));
    }

    const auto latency = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - start);
    total_queries_.fetch_add(1);
    total_latency_us_.fetch_add(static_cast<std::size_t>(latency.count()));
    return results;
}

HybridSearcher::HybridSearcher(const index::VectorIndexManager& vectors,
                               const index::BM25Index& lexical,
                               const store::RecordStore& store,
                               std::string model_tag)
    : impl_(std::make_unique<Impl>(vectors, lexical, store, std::move(model_tag))) {}

HybridSearcher::~HybridSearcher() = default;

auto HybridSearcher::search(const HybridQuery& query, const HybridSearchConfig& config) const
    -> std::expected<std::vector<HybridResult>, core::error> {
    return impl_->search(query, config);
}

auto HybridSearcher::get_stats() const noexcept -> HybridSearchStats {
    return HybridSearchStats{
        impl_->total_queries_.load(),
        impl_->vector_searches_.load(),
        impl_->lexical_searches_.load(),
        impl_->timeouts_.load(),
        impl_->total_latency_us_.load(),
    };
}

} // namespace quiver::search
