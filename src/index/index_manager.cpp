#include "quiver/index/index_manager.hpp"
#include "quiver/core/platform_utils.hpp"
#include "quiver/io/binary_file.hpp"

#include <atomic>
#include <condition_variable>
#include <iostream>
#include <mutex>
#include <shared_mutex>
#include <system_error>
#include <thread>

namespace quiver::index {

namespace {

constexpr io::Magic INDEX_MAGIC = {'Q', 'V', 'I', 'D', 'X', 'v', '1', '0'};
constexpr std::uint16_t INDEX_MAJOR = 1;
constexpr std::uint16_t INDEX_MINOR = 0;

/** \brief A write that raced an in-flight rebuild. */
struct JournalOp {
    enum class Kind : std::uint8_t { Insert, Remove } kind;
    std::string id;
    std::vector<float> vector;
};

auto unavailable() -> std::unexpected<core::error> {
    return std::unexpected(core::error{core::error_code::index_unavailable,
                                       "vector index is not built yet", "index.manager"});
}

} // anonymous namespace

auto to_string(DistanceMetric m) noexcept -> std::string_view {
    switch (m) {
        case DistanceMetric::L2: return "l2";
        case DistanceMetric::Cosine: return "cosine";
    }
    return "unknown";
}

auto to_string(IndexBackend b) noexcept -> std::string_view {
    switch (b) {
        case IndexBackend::HNSW: return "hnsw";
        case IndexBackend::IVF: return "ivf";
    }
    return "unknown";
}

auto make_vector_index(const VectorIndexConfig& config)
    -> std::expected<std::unique_ptr<VectorIndex>, core::error> {
    switch (config.backend) {
        case IndexBackend::HNSW: {
            auto idx = HnswIndex::create(config.dimension, config.metric, config.hnsw, config.hnsw_search);
            if (!idx) return std::unexpected(idx.error());
            return std::unique_ptr<VectorIndex>(std::move(*idx));
        }
        case IndexBackend::IVF: {
            auto idx = IvfIndex::create(config.dimension, config.metric, config.ivf);
            if (!idx) return std::unexpected(idx.error());
            return std::unique_ptr<VectorIndex>(std::move(*idx));
        }
    }
    return std::unexpected(core::error{core::error_code::config_invalid, "unknown index backend", "index.manager"});
}

namespace {

auto populate(VectorIndex& index, const std::vector<VectorEntry>& entries) -> std::expected<void, core::error> {
    for (const auto& e : entries) {
        if (auto r = index.insert(e.id, e.vector); !r) return r;
    }
    return {};
}

auto check_dimensions(const VectorIndexConfig& config, const std::vector<VectorEntry>& entries)
    -> std::expected<void, core::error> {
    for (const auto& e : entries) {
        if (e.vector.size() != config.dimension) {
            return std::unexpected(core::error{core::error_code::validation_failed,
                                               "snapshot vector dimension mismatch for '" + e.id + "'",
                                               "index.manager"});
        }
    }
    return {};
}

} // anonymous namespace

auto build_vector_index(const VectorIndexConfig& config, const std::vector<VectorEntry>& entries,
                        const VectorIndex* like)
    -> std::expected<std::unique_ptr<VectorIndex>, core::error> {
    if (auto r = check_dimensions(config, entries); !r) return std::unexpected(r.error());
    auto index = like ? like->empty_like() : make_vector_index(config);
    if (!index) return std::unexpected(index.error());
    if (auto r = populate(**index, entries); !r) return std::unexpected(r.error());
    return index;
}

auto train_vector_index(const VectorIndexConfig& config, const std::vector<VectorEntry>& entries)
    -> std::expected<std::unique_ptr<VectorIndex>, core::error> {
    if (auto r = check_dimensions(config, entries); !r) return std::unexpected(r.error());
    auto index = make_vector_index(config);
    if (!index) return std::unexpected(index.error());

    std::vector<float> samples;
    samples.reserve(entries.size() * config.dimension);
    for (const auto& e : entries) samples.insert(samples.end(), e.vector.begin(), e.vector.end());
    if (auto r = (*index)->train(samples, entries.size()); !r) return std::unexpected(r.error());
    if (auto r = populate(**index, entries); !r) return std::unexpected(r.error());
    return index;
}

class VectorIndexManager::Impl {
public:
    explicit Impl(const VectorIndexConfig& config) : config_(config) {}

    ~Impl() {
        // Supersede any running build, then reap the workers.
        generation_.fetch_add(1);
        std::vector<Worker> workers;
        {
            std::lock_guard lock(workers_mutex_);
            workers.swap(workers_);
        }
        for (auto& w : workers) {
            if (w.thread.joinable()) w.thread.join();
        }
    }

    auto run_rebuild(std::uint64_t generation, SnapshotFn snapshot, RebuildMode mode) -> void;
    auto finish_rebuild(std::uint64_t generation, std::optional<core::error> failure) -> void;
    auto superseded(std::uint64_t generation) const -> bool { return generation_.load() != generation; }

    VectorIndexConfig config_;
    std::atomic<std::shared_ptr<VectorIndex>> active_;
    // Trained state to start from while nothing is live (recovery).
    std::shared_ptr<const VectorIndex> shape_;

    // Writers hold it shared; the publishing swap holds it exclusive.
    mutable std::shared_mutex swap_mutex_;

    std::mutex journal_mutex_;
    bool journaling_{false};
    std::vector<JournalOp> journal_;

    std::atomic<std::uint64_t> generation_{0};
    mutable std::mutex state_mutex_;
    mutable std::condition_variable state_cv_;
    bool rebuilding_{false};
    std::optional<core::error> last_error_;

    struct Worker {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };
    std::mutex workers_mutex_;
    std::vector<Worker> workers_;
};

auto VectorIndexManager::Impl::run_rebuild(std::uint64_t generation, SnapshotFn snapshot, RebuildMode mode)
    -> void {
    const auto start = std::chrono::steady_clock::now();

    auto entries = snapshot();
    if (!entries) {
        finish_rebuild(generation, entries.error());
        return;
    }
    if (superseded(generation)) return;

    std::expected<std::unique_ptr<VectorIndex>, core::error> built;
    if (mode == RebuildMode::Retrain) {
        built = train_vector_index(config_, *entries);
    } else {
        std::shared_ptr<const VectorIndex> like = active_.load();
        if (!like) like = shape_;
        built = build_vector_index(config_, *entries, like.get());
    }
    if (!built) {
        finish_rebuild(generation, built.error());
        return;
    }
    std::shared_ptr<VectorIndex> fresh(std::move(*built));

    {
        std::unique_lock swap(swap_mutex_);
        if (superseded(generation)) {
            if (core::debug_enabled()) {
                std::cerr << "[quiver][index.manager] rebuild generation " << generation
                          << " abandoned (superseded)\n";
            }
            return;
        }
        std::vector<JournalOp> journal;
        {
            std::lock_guard jl(journal_mutex_);
            journal.swap(journal_);
            journaling_ = false;
        }
        for (const auto& op : journal) {
            if (op.kind == JournalOp::Kind::Insert) {
                if (auto r = fresh->insert(op.id, op.vector); !r) {
                    std::cerr << "[quiver][index.manager] journal replay failed for '" << op.id
                              << "': " << r.error().message << "\n";
                }
            } else {
                fresh->remove(op.id);
            }
        }
        active_.store(fresh);
    }

    if (core::debug_enabled()) {
        const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start).count();
        std::cerr << "[quiver][index.manager] rebuild generation " << generation << " published "
                  << fresh->size() << " vectors (" << to_string(config_.backend) << ") in " << ms << " ms\n";
    }
    finish_rebuild(generation, std::nullopt);
}

auto VectorIndexManager::Impl::finish_rebuild(std::uint64_t generation, std::optional<core::error> failure) -> void {
    if (failure) {
        std::cerr << "[quiver][index.manager] rebuild failed: " << failure->message
                  << " (" << core::to_string(failure->code) << ")\n";
        std::unique_lock swap(swap_mutex_);
        if (superseded(generation)) return;
        std::lock_guard jl(journal_mutex_);
        journal_.clear();
        journaling_ = false;
    }
    std::lock_guard lock(state_mutex_);
    if (superseded(generation)) return;
    rebuilding_ = false;
    last_error_ = std::move(failure);
    state_cv_.notify_all();
}

VectorIndexManager::VectorIndexManager(const VectorIndexConfig& config)
    : impl_(std::make_unique<Impl>(config)) {}

VectorIndexManager::~VectorIndexManager() = default;

auto VectorIndexManager::create(const VectorIndexConfig& config)
    -> std::expected<std::unique_ptr<VectorIndexManager>, core::error> {
    auto index = make_vector_index(config);
    if (!index) return std::unexpected(index.error());
    std::unique_ptr<VectorIndexManager> mgr(new VectorIndexManager(config));
    mgr->impl_->active_.store(std::shared_ptr<VectorIndex>(std::move(*index)));
    return mgr;
}

auto VectorIndexManager::create_unavailable(const VectorIndexConfig& config, const VectorIndex* shape)
    -> std::expected<std::unique_ptr<VectorIndexManager>, core::error> {
    // Validate the configuration up front even though nothing is built yet.
    if (auto check = make_vector_index(config); !check) return std::unexpected(check.error());
    std::unique_ptr<VectorIndexManager> mgr(new VectorIndexManager(config));
    if (shape) {
        if (shape->dimension() != config.dimension || shape->metric() != config.metric ||
            shape->backend() != config.backend) {
            return std::unexpected(core::error{core::error_code::invalid_argument,
                                               "shape does not match manager configuration", "index.manager"});
        }
        auto empty = shape->empty_like();
        if (!empty) return std::unexpected(empty.error());
        mgr->impl_->shape_ = std::move(*empty);
    }
    return mgr;
}

auto VectorIndexManager::config() const -> const VectorIndexConfig& { return impl_->config_; }

auto VectorIndexManager::install(std::unique_ptr<VectorIndex> index) -> std::expected<void, core::error> {
    if (!index || index->dimension() != impl_->config_.dimension ||
        index->metric() != impl_->config_.metric || index->backend() != impl_->config_.backend) {
        return std::unexpected(core::error{core::error_code::invalid_argument,
                                           "index does not match manager configuration", "index.manager"});
    }
    std::unique_lock swap(impl_->swap_mutex_);
    impl_->active_.store(std::shared_ptr<VectorIndex>(std::move(index)));
    return {};
}

auto VectorIndexManager::insert(std::string_view id, std::span<const float> vec)
    -> std::expected<void, core::error> {
    std::shared_lock swap(impl_->swap_mutex_);
    if (auto idx = impl_->active_.load()) {
        if (auto r = idx->insert(id, vec); !r) return r;
    } else if (vec.size() != impl_->config_.dimension) {
        return std::unexpected(core::error{core::error_code::validation_failed,
                                           "vector dimension mismatch", "index.manager"});
    }
    std::lock_guard jl(impl_->journal_mutex_);
    if (impl_->journaling_) {
        impl_->journal_.push_back(JournalOp{JournalOp::Kind::Insert, std::string(id),
                                            std::vector<float>(vec.begin(), vec.end())});
    }
    return {};
}

auto VectorIndexManager::remove(std::string_view id) -> std::expected<void, core::error> {
    std::shared_lock swap(impl_->swap_mutex_);
    if (auto idx = impl_->active_.load()) {
        idx->remove(id);
    }
    std::lock_guard jl(impl_->journal_mutex_);
    if (impl_->journaling_) {
        impl_->journal_.push_back(JournalOp{JournalOp::Kind::Remove, std::string(id), {}});
    }
    return {};
}

auto VectorIndexManager::search(std::span<const float> query, std::size_t k) const
    -> std::expected<std::vector<Neighbor>, core::error> {
    auto idx = impl_->active_.load();
    if (!idx) return unavailable();
    return idx->search(query, k, impl_->config_.metric);
}

auto VectorIndexManager::rebuild(SnapshotFn snapshot, bool force, RebuildMode mode)
    -> std::expected<RebuildStatus, core::error> {
    std::uint64_t generation = 0;
    {
        std::lock_guard lock(impl_->state_mutex_);
        if (impl_->rebuilding_ && !force) {
            return RebuildStatus::AlreadyInProgress;
        }
        std::unique_lock swap(impl_->swap_mutex_);
        generation = impl_->generation_.fetch_add(1) + 1;
        {
            std::lock_guard jl(impl_->journal_mutex_);
            impl_->journal_.clear();
            impl_->journaling_ = true;
        }
        impl_->rebuilding_ = true;
    }

    try {
        std::lock_guard wl(impl_->workers_mutex_);
        // Reap finished workers so the list does not grow without bound.
        std::erase_if(impl_->workers_, [](Impl::Worker& w) {
            if (!w.done->load()) return false;
            w.thread.join();
            return true;
        });
        auto done = std::make_shared<std::atomic<bool>>(false);
        std::thread t([impl = impl_.get(), generation, done, mode, snapshot = std::move(snapshot)]() mutable {
            impl->run_rebuild(generation, std::move(snapshot), mode);
            done->store(true);
        });
        impl_->workers_.push_back(Impl::Worker{std::move(t), std::move(done)});
    } catch (const std::system_error& e) {
        impl_->finish_rebuild(generation, core::error{core::error_code::resource_exhausted,
                                                      std::string("cannot start rebuild thread: ") + e.what(),
                                                      "index.manager"});
        return std::unexpected(core::error{core::error_code::resource_exhausted,
                                           "cannot start rebuild thread", "index.manager"});
    }
    return RebuildStatus::Started;
}

auto VectorIndexManager::wait_for_rebuild(std::optional<std::chrono::milliseconds> timeout) const -> bool {
    std::unique_lock lock(impl_->state_mutex_);
    auto done = [&] { return !impl_->rebuilding_; };
    if (timeout) return impl_->state_cv_.wait_for(lock, *timeout, done);
    impl_->state_cv_.wait(lock, done);
    return true;
}

auto VectorIndexManager::is_available() const -> bool {
    return impl_->active_.load() != nullptr;
}

auto VectorIndexManager::is_rebuilding() const -> bool {
    std::lock_guard lock(impl_->state_mutex_);
    return impl_->rebuilding_;
}

auto VectorIndexManager::last_rebuild_error() const -> std::optional<core::error> {
    std::lock_guard lock(impl_->state_mutex_);
    return impl_->last_error_;
}

auto VectorIndexManager::needs_rebuild(double tombstone_ratio) const -> bool {
    auto idx = impl_->active_.load();
    if (!idx) return false;
    return idx->tombstone_ratio() > tombstone_ratio;
}

auto VectorIndexManager::training_recommended() const -> bool {
    auto idx = impl_->active_.load();
    return idx && idx->wants_training();
}

auto VectorIndexManager::contains(std::string_view id) const -> bool {
    auto idx = impl_->active_.load();
    return idx && idx->contains(id);
}

auto VectorIndexManager::ids() const -> std::vector<std::string> {
    auto idx = impl_->active_.load();
    return idx ? idx->ids() : std::vector<std::string>{};
}

auto VectorIndexManager::size() const -> std::size_t {
    auto idx = impl_->active_.load();
    return idx ? idx->size() : 0;
}

auto VectorIndexManager::tombstones() const -> std::size_t {
    auto idx = impl_->active_.load();
    return idx ? idx->tombstones() : 0;
}

// --- Serialization ---
// u8 backend | u8 metric | u64 dim | u64 source_seq | backend body

auto VectorIndexManager::save(const std::filesystem::path& path, std::uint64_t source_seq) const
    -> std::expected<void, core::error> {
    auto idx = impl_->active_.load();
    if (!idx) return unavailable();

    io::BinaryWriter out(INDEX_MAGIC, INDEX_MAJOR, INDEX_MINOR);
    out.put(static_cast<std::uint8_t>(idx->backend()));
    out.put(static_cast<std::uint8_t>(idx->metric()));
    out.put(static_cast<std::uint64_t>(idx->dimension()));
    out.put(source_seq);
    idx->save(out);
    return out.commit(path);
}

auto VectorIndexManager::load(const VectorIndexConfig& config, const std::filesystem::path& path)
    -> std::expected<LoadedIndex, core::error> {
    using core::error;
    using core::error_code;

    auto reader = io::BinaryReader::open(path, INDEX_MAGIC, INDEX_MAJOR);
    if (!reader) return std::unexpected(reader.error());
    auto& in = *reader;

    auto backend = in.get<std::uint8_t>();
    auto metric = in.get<std::uint8_t>();
    auto dim = in.get<std::uint64_t>();
    auto seq = in.get<std::uint64_t>();
    if (!backend || !metric || !dim || !seq) {
        return std::unexpected(error{error_code::data_integrity, "truncated index header", "index.manager"});
    }
    if (*backend != static_cast<std::uint8_t>(config.backend) ||
        *metric != static_cast<std::uint8_t>(config.metric) || *dim != config.dimension) {
        return std::unexpected(error{error_code::data_integrity,
                                     "index artifact does not match configured backend/metric/dimension",
                                     "index.manager"});
    }

    LoadedIndex loaded;
    loaded.source_seq = *seq;
    if (config.backend == IndexBackend::HNSW) {
        auto idx = HnswIndex::load(config.dimension, config.metric, config.hnsw, config.hnsw_search, in);
        if (!idx) return std::unexpected(idx.error());
        loaded.index = std::move(*idx);
    } else {
        auto idx = IvfIndex::load(config.dimension, config.metric, config.ivf, in);
        if (!idx) return std::unexpected(idx.error());
        loaded.index = std::move(*idx);
    }
    if (in.remaining() != 0) {
        return std::unexpected(error{error_code::data_integrity, "trailing bytes in index artifact", "index.manager"});
    }
    return loaded;
}

} // namespace quiver::index
