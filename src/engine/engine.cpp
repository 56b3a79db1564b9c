#include "quiver/engine/engine.hpp"
#include "quiver/core/platform_utils.hpp"
#include "quiver/io/binary_file.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <iostream>
#include <iterator>
#include <map>
#include <mutex>
#include <set>
#include <shared_mutex>

namespace quiver::engine {

using core::error;
using core::error_code;

namespace {

constexpr io::Magic LEXICAL_MAGIC = {'Q', 'V', 'L', 'E', 'X', 'v', '1', '0'};
constexpr std::uint16_t LEXICAL_MAJOR = 1;
constexpr std::uint16_t LEXICAL_MINOR = 0;

constexpr const char* RECORDS_FILE = "records.qrs";
constexpr const char* VECTORS_FILE = "vectors.qvi";
constexpr const char* LEXICAL_FILE = "lexical.qlx";

auto unknown_model(std::string_view tag) -> std::unexpected<error> {
    return std::unexpected(error{error_code::not_found, "unknown model tag '" + std::string(tag) + "'", "engine"});
}

auto index_config(const ModelSpec& spec) -> index::VectorIndexConfig {
    index::VectorIndexConfig cfg;
    cfg.dimension = spec.dimension;
    cfg.metric = spec.metric;
    cfg.backend = spec.backend;
    cfg.hnsw = spec.hnsw;
    cfg.hnsw_search = spec.hnsw_search;
    cfg.ivf = spec.ivf;
    return cfg;
}

auto make_snapshot_fn(const store::RecordStore& store, std::string tag) -> index::SnapshotFn {
    return [&store, tag = std::move(tag)]() -> std::expected<std::vector<index::VectorEntry>, error> {
        auto records = store.snapshot(tag);
        if (!records) return std::unexpected(records.error());
        std::vector<index::VectorEntry> entries;
        entries.reserve(records->size());
        for (auto& r : *records) {
            entries.push_back(index::VectorEntry{std::move(r.id), std::move(r.vector)});
        }
        return entries;
    };
}

/** \brief Lexical artifact: u64 source_seq | BM25 body. */
auto load_lexical(const std::filesystem::path& path)
    -> std::expected<std::pair<index::BM25Index, std::uint64_t>, error> {
    auto reader = io::BinaryReader::open(path, LEXICAL_MAGIC, LEXICAL_MAJOR);
    if (!reader) return std::unexpected(reader.error());
    auto seq = reader->get<std::uint64_t>();
    if (!seq) return std::unexpected(seq.error());
    auto bm25 = index::BM25Index::load(*reader);
    if (!bm25) return std::unexpected(bm25.error());
    if (reader->remaining() != 0) {
        return std::unexpected(error{error_code::data_integrity, "trailing bytes in lexical artifact", "engine"});
    }
    return std::pair<index::BM25Index, std::uint64_t>{std::move(*bm25), *seq};
}

} // anonymous namespace

/** \brief Everything one model tag owns. */
struct Partition {
    ModelSpec spec;
    std::unique_ptr<index::VectorIndexManager> vectors;
    index::BM25Index lexical;
    std::unique_ptr<UpsertPipeline> pipeline;
    std::unique_ptr<search::HybridSearcher> searcher;

    // Upserts and deletes hold it shared; save() and verify() exclusive.
    std::shared_mutex write_gate;

    std::atomic<bool> training_hinted{false};

    std::mutex retry_mutex;
    std::optional<std::chrono::steady_clock::time_point> last_retry;
};

class EmbeddingEngine::Impl {
public:
    explicit Impl(EngineConfig config) : config_(std::move(config)) {}

    ~Impl() {
        // Stop background rebuilds before the store they snapshot goes away.
        std::unique_lock lock(partitions_mutex_);
        partitions_.clear();
    }

    auto find(std::string_view tag) const -> Partition* {
        std::shared_lock lock(partitions_mutex_);
        auto it = partitions_.find(tag);
        return it == partitions_.end() ? nullptr : it->second.get();
    }

    auto partition_dir(std::string_view tag) const -> std::filesystem::path {
        return config_.data_dir / std::string(tag);
    }

    auto register_model(const ModelSpec& spec) -> std::expected<void, error>;
    auto recover(Partition& p) -> std::expected<void, error>;
    auto rebuild_lexical(Partition& p) -> std::expected<void, error>;
    auto start_rebuild(Partition& p, bool force) -> std::expected<index::RebuildStatus, error>;
    auto maybe_auto_rebuild(Partition& p) -> void;
    auto retry_failed_rebuild(Partition& p) -> void;
    auto save_partition(Partition& p) -> std::expected<void, error>;
    auto divergent_ids(Partition& p) const -> std::expected<std::set<std::string>, error>;

    EngineConfig config_;
    // Declared before the partitions: rebuild threads read it until joined.
    store::RecordStore store_;

    mutable std::shared_mutex partitions_mutex_;
    std::map<std::string, std::unique_ptr<Partition>, std::less<>> partitions_;
};

auto EmbeddingEngine::Impl::register_model(const ModelSpec& spec) -> std::expected<void, error> {
    if (auto v = spec.validate(); !v) return v;

    std::unique_lock lock(partitions_mutex_);
    if (auto it = partitions_.find(spec.model_tag); it != partitions_.end()) {
        const auto& existing = it->second->spec;
        if (existing.dimension != spec.dimension || existing.metric != spec.metric ||
            existing.backend != spec.backend) {
            return std::unexpected(error{error_code::config_invalid,
                                         "model '" + spec.model_tag + "' already registered with a different "
                                         "dimension, metric or backend",
                                         "engine"});
        }
        return {};
    }

    if (auto r = store_.register_partition(spec.model_tag, spec.dimension); !r) return r;

    auto p = std::make_unique<Partition>();
    p->spec = spec;
    if (auto r = p->lexical.init(spec.bm25); !r) return r;

    if (config_.data_dir.empty()) {
        auto mgr = index::VectorIndexManager::create(index_config(spec));
        if (!mgr) return std::unexpected(mgr.error());
        p->vectors = std::move(*mgr);
    } else {
        if (auto r = recover(*p); !r) return r;
    }

    p->pipeline = std::make_unique<UpsertPipeline>(store_, *p->vectors, p->lexical, spec.model_tag,
                                                   config_.index_retry_attempts);
    p->searcher = std::make_unique<search::HybridSearcher>(*p->vectors, p->lexical, store_, spec.model_tag);
    partitions_.emplace(spec.model_tag, std::move(p));
    return {};
}

auto EmbeddingEngine::Impl::rebuild_lexical(Partition& p) -> std::expected<void, error> {
    auto records = store_.snapshot(p.spec.model_tag);
    if (!records) return std::unexpected(records.error());
    p.lexical.clear();
    for (const auto& r : *records) {
        if (auto ins = p.lexical.insert(r.id, r.text); !ins) return ins;
    }
    return {};
}

auto EmbeddingEngine::Impl::recover(Partition& p) -> std::expected<void, error> {
    const auto& tag = p.spec.model_tag;
    const auto dir = partition_dir(tag);
    const auto cfg = index_config(p.spec);

    auto loaded = store_.load(tag, dir / RECORDS_FILE);
    if (!loaded) {
        if (loaded.error().code != error_code::not_found) {
            std::cerr << "[quiver][engine] cannot load records for '" << tag << "': "
                      << loaded.error().message << "\n";
            return loaded;
        }
        // Nothing persisted yet: start empty and available.
        if (core::debug_enabled()) {
            std::cerr << "[quiver][engine] no persisted records for '" << tag << "', starting empty\n";
        }
        auto mgr = index::VectorIndexManager::create(cfg);
        if (!mgr) return std::unexpected(mgr.error());
        p.vectors = std::move(*mgr);
        return {};
    }
    const std::uint64_t seq = store_.mutation_seq(tag);

    // Lexical: rebuilt inline when it cannot be trusted.
    auto lexical = load_lexical(dir / LEXICAL_FILE);
    if (lexical && lexical->second == seq) {
        p.lexical = std::move(lexical->first);
    } else {
        std::cerr << "[quiver][engine] lexical artifact for '" << tag << "' is "
                  << (lexical ? "stale" : std::string(core::to_string(lexical.error().code)))
                  << "; rebuilding from records\n";
        if (auto r = rebuild_lexical(p); !r) return r;
    }

    // Vector: installed when current, otherwise rebuilt in the background. A
    // stale artifact still lends its trained state to the rebuild.
    auto vectors = index::VectorIndexManager::load(cfg, dir / VECTORS_FILE);
    const bool current = vectors && vectors->source_seq == seq;
    auto mgr = index::VectorIndexManager::create_unavailable(cfg, vectors && !current ? vectors->index.get() : nullptr);
    if (!mgr) return std::unexpected(mgr.error());
    p.vectors = std::move(*mgr);

    if (current) {
        if (auto r = p.vectors->install(std::move(vectors->index)); !r) return r;
        if (core::debug_enabled()) {
            std::cerr << "[quiver][engine] recovered '" << tag << "' at mutation_seq " << seq << "\n";
        }
        return {};
    }

    std::cerr << "[quiver][engine] vector artifact for '" << tag << "' is "
              << (vectors ? "stale" : std::string(core::to_string(vectors.error().code)))
              << "; rebuilding, queries return index_unavailable until it completes\n";
    auto started = start_rebuild(p, true);
    if (!started) return std::unexpected(started.error());

    if (config_.blocking_recovery) {
        p.vectors->wait_for_rebuild();
        if (auto err = p.vectors->last_rebuild_error()) return std::unexpected(*err);
    }
    return {};
}

auto EmbeddingEngine::Impl::start_rebuild(Partition& p, bool force) -> std::expected<index::RebuildStatus, error> {
    return p.vectors->rebuild(make_snapshot_fn(store_, p.spec.model_tag), force);
}

auto EmbeddingEngine::Impl::retry_failed_rebuild(Partition& p) -> void {
    if (p.vectors->is_available() || p.vectors->is_rebuilding()) return;
    auto failure = p.vectors->last_rebuild_error();
    if (!failure) return;
    {
        std::lock_guard lock(p.retry_mutex);
        const auto now = std::chrono::steady_clock::now();
        if (p.last_retry && now - *p.last_retry < config_.rebuild_retry_interval) return;
        p.last_retry = now;
    }

    std::cerr << "[quiver][engine] vector index for '" << p.spec.model_tag << "' unavailable after a failed rebuild ("
              << failure->message << "); retrying\n";
    auto r = start_rebuild(p, false);
    if (!r) {
        std::cerr << "[quiver][engine] rebuild retry for '" << p.spec.model_tag << "' did not start: "
                  << r.error().message << "; call rebuild_index to try again\n";
    }
}

auto EmbeddingEngine::Impl::maybe_auto_rebuild(Partition& p) -> void {
    if (!p.vectors->is_available()) {
        retry_failed_rebuild(p);
        return;
    }
    if (p.vectors->training_recommended() && !p.training_hinted.exchange(true)) {
        std::cerr << "[quiver][engine] '" << p.spec.model_tag << "' holds " << p.vectors->size()
                  << " vectors; train_index would switch IVF search to the nprobe nearest lists\n";
    }
    if (!config_.auto_rebuild || p.vectors->is_rebuilding()) return;
    if (!p.vectors->needs_rebuild(config_.rebuild_tombstone_ratio)) return;

    if (core::debug_enabled()) {
        std::cerr << "[quiver][engine] '" << p.spec.model_tag << "' degraded ("
                  << p.vectors->tombstones() << " tombstones / " << p.vectors->size()
                  << " live); starting rebuild\n";
    }
    auto r = start_rebuild(p, false);
    if (!r) {
        std::cerr << "[quiver][engine] automatic rebuild of '" << p.spec.model_tag
                  << "' did not start: " << r.error().message << "\n";
    }
}

auto EmbeddingEngine::Impl::save_partition(Partition& p) -> std::expected<void, error> {
    const auto& tag = p.spec.model_tag;
    const auto dir = partition_dir(tag);

    std::unique_lock gate(p.write_gate);
    const std::uint64_t seq = store_.mutation_seq(tag);

    if (auto r = store_.save(tag, dir / RECORDS_FILE); !r) return r;

    io::BinaryWriter lex(LEXICAL_MAGIC, LEXICAL_MAJOR, LEXICAL_MINOR);
    lex.put(seq);
    p.lexical.save(lex);
    if (auto r = lex.commit(dir / LEXICAL_FILE); !r) return r;

    if (!p.vectors->is_available()) {
        // The previous artifact stays stale and is rebuilt on the next open.
        std::cerr << "[quiver][engine] vector index for '" << tag << "' unavailable; not saved\n";
        return {};
    }
    return p.vectors->save(dir / VECTORS_FILE, seq);
}

auto EmbeddingEngine::Impl::divergent_ids(Partition& p) const -> std::expected<std::set<std::string>, error> {
    auto store_ids = store_.ids(p.spec.model_tag);
    if (!store_ids) return std::unexpected(store_ids.error());

    std::set<std::string> s(store_ids->begin(), store_ids->end());
    auto vv = p.vectors->ids();
    auto lv = p.lexical.ids();
    std::set<std::string> v(vv.begin(), vv.end());
    std::set<std::string> l(lv.begin(), lv.end());

    std::set<std::string> out;
    std::set_symmetric_difference(s.begin(), s.end(), v.begin(), v.end(), std::inserter(out, out.end()));
    std::set_symmetric_difference(s.begin(), s.end(), l.begin(), l.end(), std::inserter(out, out.end()));
    return out;
}

EmbeddingEngine::EmbeddingEngine(EngineConfig config) : impl_(std::make_unique<Impl>(std::move(config))) {}

EmbeddingEngine::~EmbeddingEngine() = default;

auto EmbeddingEngine::open(EngineConfig config) -> std::expected<std::unique_ptr<EmbeddingEngine>, error> {
    if (auto v = config.validate(); !v) return std::unexpected(v.error());

    std::unique_ptr<EmbeddingEngine> engine(new EmbeddingEngine(std::move(config)));
    for (const auto& spec : engine->impl_->config_.models) {
        if (auto r = engine->register_model(spec); !r) return std::unexpected(r.error());
    }
    return engine;
}

auto EmbeddingEngine::register_model(const ModelSpec& spec) -> std::expected<void, error> {
    return impl_->register_model(spec);
}

auto EmbeddingEngine::upsert(const UpsertRequest& request) -> std::expected<UpsertResult, error> {
    auto* p = impl_->find(request.model_tag);
    if (!p) return unknown_model(request.model_tag);

    std::expected<UpsertResult, error> result;
    {
        std::shared_lock gate(p->write_gate);
        result = p->pipeline->upsert(request);
    }
    if (result && result->status != UpsertStatus::Skipped) impl_->maybe_auto_rebuild(*p);
    return result;
}

auto EmbeddingEngine::upsert_batch(const std::vector<UpsertRequest>& requests)
    -> std::vector<std::expected<UpsertResult, error>> {
    std::vector<std::expected<UpsertResult, error>> outcomes;
    outcomes.reserve(requests.size());
    std::set<Partition*> touched;
    std::size_t failed = 0;

    for (const auto& request : requests) {
        auto* p = impl_->find(request.model_tag);
        if (!p) {
            outcomes.push_back(unknown_model(request.model_tag));
            ++failed;
            continue;
        }
        {
            std::shared_lock gate(p->write_gate);
            outcomes.push_back(p->pipeline->upsert(request));
        }
        if (!outcomes.back()) {
            ++failed;
        } else if (outcomes.back()->status != UpsertStatus::Skipped) {
            touched.insert(p);
        }
    }
    for (auto* p : touched) impl_->maybe_auto_rebuild(*p);

    if (core::debug_enabled()) {
        std::cerr << "[quiver][engine] batch of " << requests.size() << " upserts, " << failed << " failed\n";
    }
    return outcomes;
}

auto EmbeddingEngine::remove(std::string_view id, std::string_view model_tag) -> std::expected<DeleteResult, error> {
    auto* p = impl_->find(model_tag);
    if (!p) return unknown_model(model_tag);

    std::expected<DeleteResult, error> result;
    {
        std::shared_lock gate(p->write_gate);
        result = p->pipeline->remove(id);
    }
    if (result && result->status == DeleteStatus::Deleted) impl_->maybe_auto_rebuild(*p);
    return result;
}

auto EmbeddingEngine::query(const QueryRequest& request) const -> std::expected<std::vector<QueryHit>, error> {
    auto* p = impl_->find(request.model_tag);
    if (!p) return unknown_model(request.model_tag);

    search::HybridQuery q;
    q.text = request.text;
    if (request.vector) q.vector = *request.vector;
    q.filter = request.filter;

    search::HybridSearchConfig cfg;
    cfg.k = request.k;
    cfg.weights = request.weights.value_or(impl_->config_.weights);
    cfg.overfetch = impl_->config_.overfetch;
    cfg.filter_overfetch = impl_->config_.filter_overfetch;
    cfg.min_score = request.min_score;
    if (request.timeout) cfg.deadline = std::chrono::steady_clock::now() + *request.timeout;

    auto hits = p->searcher->search(q, cfg);
    if (!hits && hits.error().code == error_code::index_unavailable) impl_->retry_failed_rebuild(*p);
    return hits;
}

auto EmbeddingEngine::get(std::string_view id, std::string_view model_tag) const
    -> std::expected<store::EmbeddingRecord, error> {
    if (!impl_->find(model_tag)) return unknown_model(model_tag);
    return impl_->store_.get(id, model_tag);
}

auto EmbeddingEngine::rebuild_index(std::string_view model_tag, bool force)
    -> std::expected<index::RebuildStatus, error> {
    auto* p = impl_->find(model_tag);
    if (!p) return unknown_model(model_tag);
    return impl_->start_rebuild(*p, force);
}

auto EmbeddingEngine::train_index(std::string_view model_tag) -> std::expected<index::RebuildStatus, error> {
    auto* p = impl_->find(model_tag);
    if (!p) return unknown_model(model_tag);
    if (core::debug_enabled()) {
        std::cerr << "[quiver][engine] training rebuild requested for '" << p->spec.model_tag << "'\n";
    }
    return p->vectors->rebuild(make_snapshot_fn(impl_->store_, p->spec.model_tag), false,
                               index::RebuildMode::Retrain);
}

auto EmbeddingEngine::wait_for_rebuild(std::string_view model_tag,
                                       std::optional<std::chrono::milliseconds> timeout) const
    -> std::expected<bool, error> {
    auto* p = impl_->find(model_tag);
    if (!p) return unknown_model(model_tag);
    return p->vectors->wait_for_rebuild(timeout);
}

auto EmbeddingEngine::verify(std::string_view model_tag) -> std::expected<VerifyReport, error> {
    auto* p = impl_->find(model_tag);
    if (!p) return unknown_model(model_tag);
    if (!p->vectors->is_available()) {
        return std::unexpected(error{error_code::index_unavailable,
                                     "vector index for '" + std::string(model_tag) + "' is rebuilding", "engine"});
    }

    std::unique_lock gate(p->write_gate);
    auto divergent = impl_->divergent_ids(*p);
    if (!divergent) return std::unexpected(divergent.error());

    VerifyReport report;
    if (!divergent->empty()) {
        report.consistent = false;
        std::cerr << "[quiver][engine] index_inconsistency: " << divergent->size() << " ids diverge in '"
                  << model_tag << "'; re-deriving from records\n";
        for (const auto& id : *divergent) {
            if (auto r = p->pipeline->repair(id); !r) {
                std::cerr << "[quiver][engine] repair of '" << id << "' failed: " << r.error().message << "\n";
            }
            report.repaired_ids.push_back(id);
        }
        auto again = impl_->divergent_ids(*p);
        if (!again) return std::unexpected(again.error());
        if (!again->empty()) {
            return std::unexpected(error{error_code::index_inconsistency,
                                         std::to_string(again->size()) + " ids still diverge in '" +
                                             std::string(model_tag) + "' after repair",
                                         "engine"});
        }
    }

    report.record_count = impl_->store_.size(model_tag);
    report.vector_count = p->vectors->size();
    report.lexical_count = p->lexical.size();
    return report;
}

auto EmbeddingEngine::save() -> std::expected<void, error> {
    if (impl_->config_.data_dir.empty()) {
        return std::unexpected(error{error_code::precondition_failed, "engine has no data_dir", "engine"});
    }
    for (const auto& tag : model_tags()) {
        auto* p = impl_->find(tag);
        if (!p) continue;
        if (auto r = impl_->save_partition(*p); !r) {
            std::cerr << "[quiver][engine] save of '" << tag << "' failed: " << r.error().message << "\n";
            return r;
        }
    }
    return {};
}

auto EmbeddingEngine::stats(std::string_view model_tag) const -> std::expected<PartitionStats, error> {
    auto* p = impl_->find(model_tag);
    if (!p) return unknown_model(model_tag);

    const auto lex = p->lexical.get_stats();
    const auto search = p->searcher->get_stats();

    PartitionStats s;
    s.record_count = impl_->store_.size(model_tag);
    s.vector_live = p->vectors->size();
    s.vector_tombstoned = p->vectors->tombstones();
    s.lexical_documents = lex.num_documents;
    s.vocabulary_size = lex.vocabulary_size;
    s.mutation_seq = impl_->store_.mutation_seq(model_tag);
    s.rebuild_in_progress = p->vectors->is_rebuilding();
    s.index_available = p->vectors->is_available();
    s.training_recommended = p->vectors->training_recommended();
    s.total_queries = search.total_queries;
    s.total_upserts = p->pipeline->total_upserts();
    s.skipped_upserts = p->pipeline->skipped_upserts();
    s.avg_query_latency_us = search.total_queries == 0
        ? 0.0
        : static_cast<double>(search.total_latency_us) / static_cast<double>(search.total_queries);
    s.backend = p->spec.backend;
    return s;
}

auto EmbeddingEngine::model_tags() const -> std::vector<std::string> {
    std::shared_lock lock(impl_->partitions_mutex_);
    std::vector<std::string> tags;
    tags.reserve(impl_->partitions_.size());
    for (const auto& [tag, _] : impl_->partitions_) tags.push_back(tag);
    return tags;
}

auto EmbeddingEngine::config() const -> const EngineConfig& { return impl_->config_; }

} // namespace quiver::engine
