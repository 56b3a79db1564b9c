#include "quiver/index/ivf_index.hpp"
#include "quiver/io/binary_file.hpp"
#include "quiver/kernels/distance.hpp"
#include "quiver/core/platform_utils.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <mutex>
#include <shared_mutex>
#include <unordered_map>

namespace quiver::index {

namespace {

/** \brief One inverted list: parallel id and row-major vector storage. */
struct InvertedList {
    std::vector<std::string> ids;
    std::vector<float> vectors;
};

struct Location {
    std::uint32_t list{0};
    std::uint32_t offset{0};
};

} // anonymous namespace

class IvfIndex::Impl {
public:
    std::size_t dim_{0};
    DistanceMetric metric_{DistanceMetric::L2};
    IvfParams params_;

    std::vector<std::vector<float>> centroids_;   // empty while untrained
    std::vector<InvertedList> lists_;
    std::unordered_map<std::string, Location> locations_;

    mutable std::shared_mutex mutex_;

    auto internal_distance(const float* a, const float* b) const -> float {
        const std::span<const float> sa(a, dim_), sb(b, dim_);
        if (metric_ == DistanceMetric::Cosine) return 1.0f - kernels::inner_product(sa, sb);
        return kernels::l2_sq(sa, sb);
    }

    auto to_output_distance(float internal) const -> float {
        if (metric_ == DistanceMetric::Cosine) return std::max(0.0f, internal);
        return std::sqrt(std::max(0.0f, internal));
    }

    auto assign(const float* v) const -> std::uint32_t {
        if (centroids_.empty()) return 0;
        std::uint32_t best = 0;
        float best_dist = kernels::l2_sq(std::span(v, dim_), centroids_[0]);
        for (std::uint32_t c = 1; c < centroids_.size(); ++c) {
            const float d = kernels::l2_sq(std::span(v, dim_), centroids_[c]);
            if (d < best_dist) {
                best_dist = d;
                best = c;
            }
        }
        return best;
    }

    auto erase(const Location& loc) -> void {
        auto& list = lists_[loc.list];
        const std::size_t last = list.ids.size() - 1;
        if (loc.offset != last) {
            list.ids[loc.offset] = std::move(list.ids[last]);
            std::copy_n(list.vectors.begin() + static_cast<std::ptrdiff_t>(last * dim_), dim_,
                        list.vectors.begin() + static_cast<std::ptrdiff_t>(loc.offset * dim_));
            locations_[list.ids[loc.offset]] = loc;
        }
        list.ids.pop_back();
        list.vectors.resize(last * dim_);
    }

    auto training_threshold() const -> std::size_t {
        return static_cast<std::size_t>(params_.nlist) * params_.min_points_per_list;
    }
};

IvfIndex::IvfIndex() : impl_(std::make_unique<Impl>()) {}
IvfIndex::~IvfIndex() = default;

auto IvfIndex::create(std::size_t dim, DistanceMetric metric, const IvfParams& params)
    -> std::expected<std::unique_ptr<IvfIndex>, core::error> {
    using core::error;
    using core::error_code;

    if (dim == 0) {
        return std::unexpected(error{error_code::config_invalid, "dimension must be > 0", "index.ivf"});
    }
    if (params.nlist == 0 || params.nprobe == 0 || params.min_points_per_list == 0) {
        return std::unexpected(error{error_code::config_invalid,
                                     "nlist, nprobe and min_points_per_list must be > 0", "index.ivf"});
    }

    std::unique_ptr<IvfIndex> index(new IvfIndex());
    index->impl_->dim_ = dim;
    index->impl_->metric_ = metric;
    index->impl_->params_ = params;
    index->impl_->lists_.resize(1);
    return index;
}

auto IvfIndex::dimension() const noexcept -> std::size_t { return impl_->dim_; }
auto IvfIndex::metric() const noexcept -> DistanceMetric { return impl_->metric_; }

auto IvfIndex::train(std::span<const float> samples, std::size_t n) -> std::expected<void, core::error> {
    using core::error;
    using core::error_code;

    std::unique_lock lock(impl_->mutex_);
    if (!impl_->locations_.empty()) {
        return std::unexpected(error{error_code::precondition_failed, "train requires an empty index", "index.ivf"});
    }
    if (samples.size() != n * impl_->dim_) {
        return std::unexpected(error{error_code::invalid_argument, "sample buffer size mismatch", "index.ivf"});
    }
    if (n < impl_->training_threshold() || n < impl_->params_.nlist) {
        return {};
    }

    std::vector<float> data(samples.begin(), samples.end());
    if (impl_->metric_ == DistanceMetric::Cosine) {
        for (std::size_t i = 0; i < n; ++i) {
            kernels::normalize_inplace(std::span(data.data() + i * impl_->dim_, impl_->dim_));
        }
    }

    KmeansParams kp;
    kp.k = impl_->params_.nlist;
    kp.max_iter = impl_->params_.max_iter;
    kp.seed = impl_->params_.seed;
    auto result = kmeans_cluster(data.data(), n, impl_->dim_, kp);
    if (!result) return std::unexpected(result.error());

    impl_->centroids_ = std::move(result->centroids);
    impl_->lists_.assign(impl_->centroids_.size(), InvertedList{});
    if (core::debug_enabled()) {
        std::cerr << "[quiver][index.ivf] trained nlist=" << impl_->centroids_.size()
                  << " on n=" << n << " inertia=" << result->inertia << "\n";
    }
    return {};
}

auto IvfIndex::insert(std::string_view id, std::span<const float> vec)
    -> std::expected<void, core::error> {
    using core::error;
    using core::error_code;

    if (vec.size() != impl_->dim_) {
        return std::unexpected(error{error_code::validation_failed,
            "vector dimension " + std::to_string(vec.size()) + " != " + std::to_string(impl_->dim_),
            "index.ivf"});
    }
    std::vector<float> data(vec.begin(), vec.end());
    if (impl_->metric_ == DistanceMetric::Cosine && kernels::normalize_inplace(data) == 0.0f) {
        return std::unexpected(error{error_code::validation_failed, "zero-norm vector under cosine metric", "index.ivf"});
    }

    std::unique_lock lock(impl_->mutex_);
    std::string key(id);
    if (auto it = impl_->locations_.find(key); it != impl_->locations_.end()) {
        impl_->erase(it->second);
        impl_->locations_.erase(it);
    }

    const std::uint32_t list_idx = impl_->assign(data.data());
    auto& list = impl_->lists_[list_idx];
    const auto offset = static_cast<std::uint32_t>(list.ids.size());
    list.ids.push_back(key);
    list.vectors.insert(list.vectors.end(), data.begin(), data.end());
    impl_->locations_.emplace(std::move(key), Location{list_idx, offset});
    return {};
}

auto IvfIndex::remove(std::string_view id) -> bool {
    std::unique_lock lock(impl_->mutex_);
    auto it = impl_->locations_.find(std::string(id));
    if (it == impl_->locations_.end()) return false;
    impl_->erase(it->second);
    impl_->locations_.erase(it);
    return true;
}

auto IvfIndex::search(std::span<const float> query, std::size_t k, DistanceMetric metric) const
    -> std::expected<std::vector<Neighbor>, core::error> {
    if (metric != impl_->metric_) {
        return std::unexpected(core::error{core::error_code::invalid_argument,
            "metric " + std::string(to_string(metric)) + " does not match index metric " +
            std::string(to_string(impl_->metric_)), "index.ivf"});
    }
    return search(query, k, impl_->params_.nprobe);
}

auto IvfIndex::search(std::span<const float> query, std::size_t k, std::uint32_t nprobe) const
    -> std::expected<std::vector<Neighbor>, core::error> {
    using core::error;
    using core::error_code;

    if (query.size() != impl_->dim_) {
        return std::unexpected(error{error_code::validation_failed,
            "query dimension " + std::to_string(query.size()) + " != " + std::to_string(impl_->dim_),
            "index.ivf"});
    }
    std::vector<float> q(query.begin(), query.end());
    if (impl_->metric_ == DistanceMetric::Cosine && kernels::normalize_inplace(q) == 0.0f) {
        return std::unexpected(error{error_code::validation_failed, "zero-norm query under cosine metric", "index.ivf"});
    }

    std::shared_lock lock(impl_->mutex_);
    std::vector<Neighbor> results;
    if (k == 0 || impl_->locations_.empty()) return results;

    // Probe order: nearest centroids first, ties by list index
    std::vector<std::uint32_t> probe;
    if (impl_->centroids_.empty()) {
        probe.push_back(0);
    } else {
        std::vector<std::pair<float, std::uint32_t>> order;
        order.reserve(impl_->centroids_.size());
        for (std::uint32_t c = 0; c < impl_->centroids_.size(); ++c) {
            order.emplace_back(kernels::l2_sq(q, impl_->centroids_[c]), c);
        }
        const std::size_t n_probe = std::min<std::size_t>(std::max<std::uint32_t>(nprobe, 1), order.size());
        std::partial_sort(order.begin(), order.begin() + static_cast<std::ptrdiff_t>(n_probe), order.end());
        for (std::size_t i = 0; i < n_probe; ++i) probe.push_back(order[i].second);
    }

    for (std::uint32_t l : probe) {
        const auto& list = impl_->lists_[l];
        for (std::size_t i = 0; i < list.ids.size(); ++i) {
            const float d = impl_->internal_distance(q.data(), list.vectors.data() + i * impl_->dim_);
            results.push_back(Neighbor{list.ids[i], impl_->to_output_distance(d)});
        }
    }

    const std::size_t n_out = std::min(k, results.size());
    std::partial_sort(results.begin(), results.begin() + static_cast<std::ptrdiff_t>(n_out), results.end(),
        [](const Neighbor& a, const Neighbor& b) {
            return a.distance != b.distance ? a.distance < b.distance : a.id < b.id;
        });
    results.resize(n_out);
    return results;
}

auto IvfIndex::contains(std::string_view id) const -> bool {
    std::shared_lock lock(impl_->mutex_);
    return impl_->locations_.contains(std::string(id));
}

auto IvfIndex::size() const -> std::size_t {
    std::shared_lock lock(impl_->mutex_);
    return impl_->locations_.size();
}

auto IvfIndex::ids() const -> std::vector<std::string> {
    std::shared_lock lock(impl_->mutex_);
    std::vector<std::string> out;
    out.reserve(impl_->locations_.size());
    for (const auto& [id, _] : impl_->locations_) out.push_back(id);
    return out;
}

auto IvfIndex::wants_training() const -> bool {
    std::shared_lock lock(impl_->mutex_);
    return impl_->centroids_.empty() && impl_->locations_.size() >= impl_->training_threshold();
}

auto IvfIndex::empty_like() const -> std::expected<std::unique_ptr<VectorIndex>, core::error> {
    auto fresh = create(impl_->dim_, impl_->metric_, impl_->params_);
    if (!fresh) return std::unexpected(fresh.error());
    std::shared_lock lock(impl_->mutex_);
    if (!impl_->centroids_.empty()) {
        (*fresh)->impl_->centroids_ = impl_->centroids_;
        (*fresh)->impl_->lists_.assign(impl_->centroids_.size(), InvertedList{});
    }
    return std::unique_ptr<VectorIndex>(std::move(*fresh));
}

auto IvfIndex::is_trained() const -> bool {
    std::shared_lock lock(impl_->mutex_);
    return !impl_->centroids_.empty();
}

auto IvfIndex::list_count() const -> std::size_t {
    std::shared_lock lock(impl_->mutex_);
    return impl_->lists_.size();
}

// --- Serialization ---
// u32 n_centroids | centroids | u32 n_lists | per list: u32 n | n x (id | dim floats)

auto IvfIndex::save(io::BinaryWriter& out) const -> void {
    std::shared_lock lock(impl_->mutex_);
    out.put(static_cast<std::uint32_t>(impl_->centroids_.size()));
    for (const auto& c : impl_->centroids_) out.put_floats(c);
    out.put(static_cast<std::uint32_t>(impl_->lists_.size()));
    for (const auto& list : impl_->lists_) {
        out.put(static_cast<std::uint32_t>(list.ids.size()));
        for (std::size_t i = 0; i < list.ids.size(); ++i) {
            out.put_string(list.ids[i]);
            out.put_floats(std::span(list.vectors.data() + i * impl_->dim_, impl_->dim_));
        }
    }
}

auto IvfIndex::load(std::size_t dim, DistanceMetric metric, const IvfParams& params,
                    io::BinaryReader& in)
    -> std::expected<std::unique_ptr<IvfIndex>, core::error> {
    using core::error;
    using core::error_code;

    auto created = create(dim, metric, params);
    if (!created) return std::unexpected(created.error());
    auto index = std::move(*created);
    auto& impl = *index->impl_;

    auto n_centroids = in.get<std::uint32_t>();
    if (!n_centroids) return std::unexpected(n_centroids.error());
    for (std::uint32_t c = 0; c < *n_centroids; ++c) {
        auto centroid = in.get_floats(dim);
        if (!centroid) return std::unexpected(centroid.error());
        impl.centroids_.push_back(std::move(*centroid));
    }

    auto n_lists = in.get<std::uint32_t>();
    if (!n_lists) return std::unexpected(n_lists.error());
    const std::uint32_t expected_lists = impl.centroids_.empty() ? 1u : *n_centroids;
    if (*n_lists != expected_lists) {
        return std::unexpected(error{error_code::data_integrity, "list count does not match quantizer", "index.ivf"});
    }
    impl.lists_.assign(*n_lists, InvertedList{});

    for (std::uint32_t l = 0; l < *n_lists; ++l) {
        auto count = in.get<std::uint32_t>();
        if (!count) return std::unexpected(count.error());
        for (std::uint32_t i = 0; i < *count; ++i) {
            auto id = in.get_string();
            if (!id) return std::unexpected(id.error());
            auto vec = in.get_floats(dim);
            if (!vec) return std::unexpected(vec.error());
            auto& list = impl.lists_[l];
            if (!impl.locations_.emplace(*id, Location{l, static_cast<std::uint32_t>(list.ids.size())}).second) {
                return std::unexpected(error{error_code::data_integrity, "duplicate id in inverted lists", "index.ivf"});
            }
            list.ids.push_back(std::move(*id));
            list.vectors.insert(list.vectors.end(), vec->begin(), vec->end());
        }
    }
    return index;
}

} // namespace quiver::index
