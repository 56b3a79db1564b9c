#include "quiver/index/hnsw.hpp"
#include "quiver/io/binary_file.hpp"
#include "quiver/kernels/distance.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <queue>
#include <random>
#include <mutex>
#include <shared_mutex>
#include <unordered_map>

namespace quiver::index {

namespace {

constexpr std::uint32_t NO_NODE = std::numeric_limits<std::uint32_t>::max();

} // anonymous namespace

/** \brief Node in HNSW graph. */
struct HnswNode {
    std::string id;
    std::vector<float> data;
    std::vector<std::vector<std::uint32_t>> neighbors;  // Per level
    std::uint32_t level{0};
    bool deleted{false};
};

/** \brief Internal implementation of HNSW index. */
class HnswIndex::Impl {
public:
    std::size_t dim_{0};
    DistanceMetric metric_{DistanceMetric::L2};
    HnswBuildParams params_;
    HnswSearchParams search_params_;
    float level_multiplier_{1.0f / std::log(16.0f)};
    std::mt19937 rng_;

    std::vector<HnswNode> nodes_;
    std::unordered_map<std::string, std::uint32_t> id_to_idx_;  // live nodes only
    std::uint32_t entry_point_{NO_NODE};
    std::uint32_t max_level_{0};
    std::size_t n_deleted_{0};

    mutable std::shared_mutex graph_mutex_;

    auto select_level() -> std::uint32_t;
    auto compute_distance(const float* a, const float* b) const -> float;

    /** \brief Beam search restricted to one layer.
     *
     * Deleted nodes are expanded (they keep the graph connected) but only
     * enter the result set when `include_deleted` is set, which construction
     * uses so new nodes can still link through retired ones.
     */
    auto search_layer(const float* query, std::uint32_t entry_point,
                      std::uint32_t num_closest, std::uint32_t layer,
                      bool include_deleted) const
        -> std::vector<std::pair<float, std::uint32_t>>;

    auto connect_node(std::uint32_t new_idx,
                      std::vector<std::pair<float, std::uint32_t>> candidates,
                      std::uint32_t level) -> void;

    auto add(std::string_view id, std::vector<float> data) -> void;
    auto retire(std::uint32_t idx) -> void;
    auto to_output_distance(float internal) const -> float;
};

auto HnswIndex::Impl::select_level() -> std::uint32_t {
    std::uniform_real_distribution<float> dist(std::numeric_limits<float>::min(), 1.0f);
    const float f = -std::log(dist(rng_)) * level_multiplier_;
    return static_cast<std::uint32_t>(f);
}

auto HnswIndex::Impl::compute_distance(const float* a, const float* b) const -> float {
    const std::span<const float> sa(a, dim_), sb(b, dim_);
    if (metric_ == DistanceMetric::Cosine) {
        // Stored vectors and queries are unit length.
        return 1.0f - kernels::inner_product(sa, sb);
    }
    return kernels::l2_sq(sa, sb);
}

auto HnswIndex::Impl::to_output_distance(float internal) const -> float {
    if (metric_ == DistanceMetric::Cosine) return std::max(0.0f, internal);
    return std::sqrt(std::max(0.0f, internal));
}

auto HnswIndex::Impl::search_layer(const float* query, std::uint32_t entry_point,
                                   std::uint32_t num_closest, std::uint32_t layer,
                                   bool include_deleted) const
    -> std::vector<std::pair<float, std::uint32_t>> {

    std::vector<bool> visited(nodes_.size(), false);
    std::priority_queue<std::pair<float, std::uint32_t>> candidates;  // -dist
    std::priority_queue<std::pair<float, std::uint32_t>> nearest;     // max-heap on dist

    const float entry_dist = compute_distance(query, nodes_[entry_point].data.data());
    candidates.emplace(-entry_dist, entry_point);
    if (include_deleted || !nodes_[entry_point].deleted) {
        nearest.emplace(entry_dist, entry_point);
    }
    visited[entry_point] = true;

    while (!candidates.empty()) {
        const auto [neg_dist, current] = candidates.top();
        const float current_dist = -neg_dist;
        candidates.pop();

        if (nearest.size() >= num_closest && current_dist > nearest.top().first) {
            break;
        }

        const auto& node = nodes_[current];
        if (layer >= node.neighbors.size()) continue;
        for (std::uint32_t neighbor : node.neighbors[layer]) {
            if (visited[neighbor]) continue;
            visited[neighbor] = true;

            const float dist = compute_distance(query, nodes_[neighbor].data.data());
            if (nearest.size() < num_closest || dist < nearest.top().first) {
                candidates.emplace(-dist, neighbor);
                if (include_deleted || !nodes_[neighbor].deleted) {
                    nearest.emplace(dist, neighbor);
                    if (nearest.size() > num_closest) {
                        nearest.pop();
                    }
                }
            }
        }
    }

    std::vector<std::pair<float, std::uint32_t>> result;
    result.reserve(nearest.size());
    while (!nearest.empty()) {
        result.push_back(nearest.top());
        nearest.pop();
    }
    std::sort(result.begin(), result.end());
    return result;
}

auto HnswIndex::Impl::connect_node(std::uint32_t new_idx,
                                   std::vector<std::pair<float, std::uint32_t>> candidates,
                                   std::uint32_t level) -> void {
    const std::uint32_t max_conn = (level == 0) ? params_.max_M0 : params_.max_M;

    auto [selected, discarded] = robust_prune(candidates, params_.M, params_.extend_candidates);
    nodes_[new_idx].neighbors[level] = selected;

    // Reverse edges with back-pruning
    for (std::uint32_t neighbor : selected) {
        auto& neighbor_neighbors = nodes_[neighbor].neighbors[level];
        if (std::find(neighbor_neighbors.begin(), neighbor_neighbors.end(), new_idx) != neighbor_neighbors.end()) {
            continue;
        }
        if (neighbor_neighbors.size() < max_conn) {
            neighbor_neighbors.push_back(new_idx);
            continue;
        }

        const float* neighbor_data = nodes_[neighbor].data.data();
        std::vector<std::pair<float, std::uint32_t>> neighbor_candidates;
        neighbor_candidates.reserve(neighbor_neighbors.size() + 1);
        for (std::uint32_t nn : neighbor_neighbors) {
            neighbor_candidates.emplace_back(compute_distance(neighbor_data, nodes_[nn].data.data()), nn);
        }
        neighbor_candidates.emplace_back(compute_distance(neighbor_data, nodes_[new_idx].data.data()), new_idx);
        neighbor_neighbors = robust_prune(neighbor_candidates, max_conn, params_.extend_candidates).first;
    }
}

auto HnswIndex::Impl::add(std::string_view id, std::vector<float> data) -> void {
    const auto new_idx = static_cast<std::uint32_t>(nodes_.size());
    const std::uint32_t level = select_level();

    HnswNode node;
    node.id = std::string(id);
    node.data = std::move(data);
    node.level = level;
    node.neighbors.resize(level + 1);
    nodes_.push_back(std::move(node));
    id_to_idx_[nodes_.back().id] = new_idx;

    // First node becomes entry point
    if (entry_point_ == NO_NODE) {
        entry_point_ = new_idx;
        max_level_ = level;
        return;
    }

    const float* q = nodes_[new_idx].data.data();
    std::uint32_t curr_nearest = entry_point_;

    // Greedy descent through layers above the new node's level
    for (std::int32_t lc = static_cast<std::int32_t>(max_level_); lc > static_cast<std::int32_t>(level); --lc) {
        auto nearest = search_layer(q, curr_nearest, 1, static_cast<std::uint32_t>(lc), true);
        if (!nearest.empty()) curr_nearest = nearest[0].second;
    }

    for (std::int32_t lc = static_cast<std::int32_t>(std::min(level, max_level_)); lc >= 0; --lc) {
        auto nearest = search_layer(q, curr_nearest, params_.efConstruction,
                                    static_cast<std::uint32_t>(lc), true);
        std::erase_if(nearest, [&](const auto& p) { return p.second == new_idx; });
        if (!nearest.empty()) curr_nearest = nearest[0].second;
        connect_node(new_idx, std::move(nearest), static_cast<std::uint32_t>(lc));
    }

    if (level > max_level_) {
        max_level_ = level;
        entry_point_ = new_idx;
    }
}

auto HnswIndex::Impl::retire(std::uint32_t idx) -> void {
    auto& node = nodes_[idx];
    if (node.deleted) return;
    node.deleted = true;
    ++n_deleted_;
    id_to_idx_.erase(node.id);
}

// HnswIndex public interface

HnswIndex::HnswIndex() : impl_(std::make_unique<Impl>()) {}
HnswIndex::~HnswIndex() = default;

auto HnswIndex::create(std::size_t dim, DistanceMetric metric,
                       const HnswBuildParams& build, const HnswSearchParams& search)
    -> std::expected<std::unique_ptr<HnswIndex>, core::error> {
    using core::error;
    using core::error_code;

    if (dim == 0) {
        return std::unexpected(error{error_code::config_invalid, "dimension must be > 0", "index.hnsw"});
    }
    if (build.M < 2) {
        return std::unexpected(error{error_code::config_invalid, "M must be >= 2", "index.hnsw"});
    }
    if (build.efConstruction < build.M) {
        return std::unexpected(error{error_code::config_invalid, "efConstruction must be >= M", "index.hnsw"});
    }
    if (build.max_M < build.M || build.max_M0 < build.M) {
        return std::unexpected(error{error_code::config_invalid, "max_M and max_M0 must be >= M", "index.hnsw"});
    }

    std::unique_ptr<HnswIndex> index(new HnswIndex());
    auto& impl = *index->impl_;
    impl.dim_ = dim;
    impl.metric_ = metric;
    impl.params_ = build;
    impl.search_params_ = search;
    impl.level_multiplier_ = 1.0f / std::log(static_cast<float>(build.M));
    impl.rng_.seed(build.seed);
    return index;
}

auto HnswIndex::empty_like() const -> std::expected<std::unique_ptr<VectorIndex>, core::error> {
    auto fresh = create(impl_->dim_, impl_->metric_, impl_->params_, impl_->search_params_);
    if (!fresh) return std::unexpected(fresh.error());
    return std::unique_ptr<VectorIndex>(std::move(*fresh));
}

auto HnswIndex::dimension() const noexcept -> std::size_t { return impl_->dim_; }
auto HnswIndex::metric() const noexcept -> DistanceMetric { return impl_->metric_; }

auto HnswIndex::insert(std::string_view id, std::span<const float> vec)
    -> std::expected<void, core::error> {
    using core::error;
    using core::error_code;

    if (vec.size() != impl_->dim_) {
        return std::unexpected(error{error_code::validation_failed,
            "vector dimension " + std::to_string(vec.size()) + " != " + std::to_string(impl_->dim_),
            "index.hnsw"});
    }
    std::vector<float> data(vec.begin(), vec.end());
    if (impl_->metric_ == DistanceMetric::Cosine && kernels::normalize_inplace(data) == 0.0f) {
        return std::unexpected(error{error_code::validation_failed, "zero-norm vector under cosine metric", "index.hnsw"});
    }

    std::unique_lock lock(impl_->graph_mutex_);
    if (auto it = impl_->id_to_idx_.find(std::string(id)); it != impl_->id_to_idx_.end()) {
        impl_->retire(it->second);
    }
    impl_->add(id, std::move(data));
    return {};
}

auto HnswIndex::remove(std::string_view id) -> bool {
    std::unique_lock lock(impl_->graph_mutex_);
    auto it = impl_->id_to_idx_.find(std::string(id));
    if (it == impl_->id_to_idx_.end()) return false;
    impl_->retire(it->second);
    return true;
}

auto HnswIndex::search(std::span<const float> query, std::size_t k, DistanceMetric metric) const
    -> std::expected<std::vector<Neighbor>, core::error> {
    if (metric != impl_->metric_) {
        return std::unexpected(core::error{core::error_code::invalid_argument,
            "metric " + std::string(to_string(metric)) + " does not match index metric " +
            std::string(to_string(impl_->metric_)), "index.hnsw"});
    }
    return search(query, k, impl_->search_params_);
}

auto HnswIndex::search(std::span<const float> query, std::size_t k, const HnswSearchParams& params) const
    -> std::expected<std::vector<Neighbor>, core::error> {
    using core::error;
    using core::error_code;

    if (query.size() != impl_->dim_) {
        return std::unexpected(error{error_code::validation_failed,
            "query dimension " + std::to_string(query.size()) + " != " + std::to_string(impl_->dim_),
            "index.hnsw"});
    }
    std::vector<float> q(query.begin(), query.end());
    if (impl_->metric_ == DistanceMetric::Cosine && kernels::normalize_inplace(q) == 0.0f) {
        return std::unexpected(error{error_code::validation_failed, "zero-norm query under cosine metric", "index.hnsw"});
    }

    std::shared_lock lock(impl_->graph_mutex_);
    std::vector<Neighbor> results;
    if (k == 0 || impl_->id_to_idx_.empty()) return results;

    std::uint32_t curr_nearest = impl_->entry_point_;
    for (std::int32_t lc = static_cast<std::int32_t>(impl_->max_level_); lc > 0; --lc) {
        auto nearest = impl_->search_layer(q.data(), curr_nearest, 1, static_cast<std::uint32_t>(lc), true);
        if (!nearest.empty()) curr_nearest = nearest[0].second;
    }

    // The beam never exceeds the node count, so it fits the layer search's u32.
    // Widen it by the tombstone count so retired nodes cannot crowd out k live ones.
    const std::size_t n_nodes = impl_->nodes_.size();
    const std::size_t beam = std::min(std::max<std::size_t>(params.efSearch, k), n_nodes);
    const std::size_t ef = std::min(beam + std::min(impl_->n_deleted_, 4 * beam), n_nodes);
    auto candidates = impl_->search_layer(q.data(), curr_nearest, static_cast<std::uint32_t>(ef), 0, false);

    results.reserve(std::min(k, candidates.size()));
    for (const auto& [dist, idx] : candidates) {
        results.push_back(Neighbor{impl_->nodes_[idx].id, impl_->to_output_distance(dist)});
    }
    std::sort(results.begin(), results.end(), [](const Neighbor& a, const Neighbor& b) {
        return a.distance != b.distance ? a.distance < b.distance : a.id < b.id;
    });
    if (results.size() > k) results.resize(k);
    return results;
}

auto HnswIndex::contains(std::string_view id) const -> bool {
    std::shared_lock lock(impl_->graph_mutex_);
    return impl_->id_to_idx_.contains(std::string(id));
}

auto HnswIndex::size() const -> std::size_t {
    std::shared_lock lock(impl_->graph_mutex_);
    return impl_->id_to_idx_.size();
}

auto HnswIndex::tombstones() const -> std::size_t {
    std::shared_lock lock(impl_->graph_mutex_);
    return impl_->n_deleted_;
}

auto HnswIndex::ids() const -> std::vector<std::string> {
    std::shared_lock lock(impl_->graph_mutex_);
    std::vector<std::string> out;
    out.reserve(impl_->id_to_idx_.size());
    for (const auto& [id, _] : impl_->id_to_idx_) out.push_back(id);
    return out;
}

auto HnswIndex::get_stats() const -> HnswStats {
    std::shared_lock lock(impl_->graph_mutex_);
    HnswStats stats;
    stats.n_nodes = impl_->nodes_.size();
    stats.n_live = impl_->id_to_idx_.size();
    stats.n_levels = impl_->nodes_.empty() ? 0 : impl_->max_level_ + 1;
    std::size_t base_edges = 0;
    for (const auto& node : impl_->nodes_) {
        for (const auto& level : node.neighbors) stats.n_edges += level.size();
        base_edges += node.neighbors[0].size();
    }
    if (!impl_->nodes_.empty()) {
        stats.avg_degree = static_cast<float>(base_edges) / static_cast<float>(impl_->nodes_.size());
    }
    return stats;
}

// --- Serialization ---
// u64 n_nodes | u32 entry | u32 max_level | u64 rng draws
// per node: id | u8 deleted | u32 level | dim floats | per level: u32 n | n x u32

auto HnswIndex::save(io::BinaryWriter& out) const -> void {
    std::shared_lock lock(impl_->graph_mutex_);
    out.put(static_cast<std::uint64_t>(impl_->nodes_.size()));
    out.put(impl_->entry_point_);
    out.put(impl_->max_level_);
    for (const auto& node : impl_->nodes_) {
        out.put_string(node.id);
        out.put(static_cast<std::uint8_t>(node.deleted ? 1 : 0));
        out.put(node.level);
        out.put_floats(node.data);
        for (const auto& level : node.neighbors) {
            out.put(static_cast<std::uint32_t>(level.size()));
            for (std::uint32_t n : level) out.put(n);
        }
    }
}

auto HnswIndex::load(std::size_t dim, DistanceMetric metric,
                     const HnswBuildParams& build, const HnswSearchParams& search,
                     io::BinaryReader& in)
    -> std::expected<std::unique_ptr<HnswIndex>, core::error> {
    using core::error;
    using core::error_code;

    auto created = create(dim, metric, build, search);
    if (!created) return std::unexpected(created.error());
    auto index = std::move(*created);
    auto& impl = *index->impl_;

    auto corrupt = [](const char* what) {
        return std::unexpected(error{error_code::data_integrity, what, "index.hnsw"});
    };

    auto n_nodes = in.get<std::uint64_t>();
    auto entry = in.get<std::uint32_t>();
    auto max_level = in.get<std::uint32_t>();
    if (!n_nodes || !entry || !max_level) return corrupt("truncated graph header");
    if (*n_nodes > in.remaining()) return corrupt("node count out of range");

    impl.nodes_.resize(static_cast<std::size_t>(*n_nodes));
    for (auto& node : impl.nodes_) {
        auto id = in.get_string();
        auto deleted = in.get<std::uint8_t>();
        auto level = in.get<std::uint32_t>();
        if (!id || !deleted || !level) return corrupt("truncated node");
        if (*level > 64) return corrupt("node level out of range");
        auto data = in.get_floats(dim);
        if (!data) return std::unexpected(data.error());

        node.id = std::move(*id);
        node.deleted = *deleted != 0;
        node.level = *level;
        node.data = std::move(*data);
        node.neighbors.resize(node.level + 1);
        for (auto& links : node.neighbors) {
            auto count = in.get<std::uint32_t>();
            if (!count) return std::unexpected(count.error());
            if (*count > in.remaining() / sizeof(std::uint32_t)) return corrupt("edge count out of range");
            links.resize(*count);
            for (auto& n : links) {
                auto v = in.get<std::uint32_t>();
                if (!v) return std::unexpected(v.error());
                if (*v >= *n_nodes) return corrupt("edge target out of range");
                n = *v;
            }
        }
    }

    for (std::uint32_t i = 0; i < impl.nodes_.size(); ++i) {
        const auto& node = impl.nodes_[i];
        if (node.deleted) {
            ++impl.n_deleted_;
        } else if (!impl.id_to_idx_.emplace(node.id, i).second) {
            return corrupt("duplicate live id");
        }
    }
    if (!impl.nodes_.empty()) {
        if (*entry >= impl.nodes_.size() || *max_level != impl.nodes_[*entry].level) {
            return corrupt("bad entry point");
        }
        impl.entry_point_ = *entry;
        impl.max_level_ = *max_level;
    }
    // Level draws after reload continue from a seed derived from graph size.
    impl.rng_.seed(build.seed + static_cast<std::uint32_t>(impl.nodes_.size()));
    return index;
}

// Select-Neighbors-Heuristic

auto robust_prune(std::vector<std::pair<float, std::uint32_t>>& candidates,
                  std::uint32_t M, bool extend_candidates)
    -> std::pair<std::vector<std::uint32_t>, std::vector<std::uint32_t>> {

    if (candidates.empty() || M == 0) {
        return {{}, {}};
    }

    std::sort(candidates.begin(), candidates.end());

    std::vector<std::uint32_t> R;      // Result set
    std::vector<std::uint32_t> W_d;    // Discarded candidates

    // Always include closest neighbor for connectivity
    R.push_back(candidates[0].second);

    for (std::size_t i = 1; i < candidates.size(); ++i) {
        const auto& [dist_c, c_idx] = candidates[i];

        if (R.size() >= M) {
            W_d.push_back(c_idx);
            continue;
        }

        // Accept freely up to M/2; past that, reject only if too close to nearest
        bool is_diverse = true;
        if (R.size() >= M / 2 && dist_c <= candidates[0].first * 1.5f) {
            is_diverse = false;
        }

        if (is_diverse) {
            R.push_back(c_idx);
        } else {
            W_d.push_back(c_idx);
        }
    }

    if (extend_candidates && R.size() < M && !W_d.empty()) {
        const std::size_t to_add = std::min<std::size_t>(M - R.size(), W_d.size());
        R.insert(R.end(), W_d.begin(), W_d.begin() + static_cast<std::ptrdiff_t>(to_add));
        W_d.erase(W_d.begin(), W_d.begin() + static_cast<std::ptrdiff_t>(to_add));
    }

    return {R, W_d};
}

} // namespace quiver::index
