#include "quiver/store/record_store.hpp"
#include "quiver/io/binary_file.hpp"

#include <algorithm>
#include <cmath>
#include <map>
#include <mutex>
#include <shared_mutex>
#include <unordered_map>

namespace quiver::store {

namespace {

constexpr io::Magic RECORDS_MAGIC = {'Q', 'V', 'R', 'E', 'C', 'v', '1', '0'};
constexpr std::uint16_t RECORDS_MAJOR = 1;
constexpr std::uint16_t RECORDS_MINOR = 0;

struct Partition {
    std::size_t dimension{0};
    std::uint64_t mutation_seq{0};
    std::unordered_map<std::string, EmbeddingRecord> records;
    mutable std::shared_mutex mutex;
};

auto unknown_tag(std::string_view tag) -> std::unexpected<core::error> {
    return std::unexpected(core::error{core::error_code::not_found,
                                       "unknown model tag '" + std::string(tag) + "'", "store.records"});
}

} // anonymous namespace

class RecordStore::Impl {
public:
    auto find(std::string_view tag) const -> Partition* {
        std::shared_lock lock(mutex_);
        auto it = partitions_.find(tag);
        return it == partitions_.end() ? nullptr : it->second.get();
    }

    // Partitions are never dropped, so raw pointers stay valid for the store's lifetime.
    std::map<std::string, std::unique_ptr<Partition>, std::less<>> partitions_;
    mutable std::shared_mutex mutex_;
};

RecordStore::RecordStore() : impl_(std::make_unique<Impl>()) {}
RecordStore::~RecordStore() = default;

auto RecordStore::register_partition(std::string_view model_tag, std::size_t dimension)
    -> std::expected<void, core::error> {
    using core::error;
    using core::error_code;

    if (model_tag.empty()) {
        return std::unexpected(error{error_code::config_invalid, "empty model tag", "store.records"});
    }
    if (dimension == 0) {
        return std::unexpected(error{error_code::config_invalid, "dimension must be > 0", "store.records"});
    }

    std::unique_lock lock(impl_->mutex_);
    auto it = impl_->partitions_.find(model_tag);
    if (it != impl_->partitions_.end()) {
        if (it->second->dimension != dimension) {
            return std::unexpected(error{error_code::config_invalid,
                "model tag '" + std::string(model_tag) + "' already registered with dimension " +
                std::to_string(it->second->dimension), "store.records"});
        }
        return {};
    }
    auto partition = std::make_unique<Partition>();
    partition->dimension = dimension;
    impl_->partitions_.emplace(std::string(model_tag), std::move(partition));
    return {};
}

auto RecordStore::has_partition(std::string_view model_tag) const -> bool {
    return impl_->find(model_tag) != nullptr;
}

auto RecordStore::dimension(std::string_view model_tag) const -> std::expected<std::size_t, core::error> {
    auto* p = impl_->find(model_tag);
    if (!p) return unknown_tag(model_tag);
    return p->dimension;
}

auto RecordStore::get(std::string_view id, std::string_view model_tag) const
    -> std::expected<EmbeddingRecord, core::error> {
    auto* p = impl_->find(model_tag);
    if (!p) return unknown_tag(model_tag);

    std::shared_lock lock(p->mutex);
    auto it = p->records.find(std::string(id));
    if (it == p->records.end()) {
        return std::unexpected(core::error{core::error_code::not_found,
                                           "no record '" + std::string(id) + "'", "store.records"});
    }
    return it->second;
}

auto RecordStore::put(EmbeddingRecord record) -> std::expected<std::optional<std::uint64_t>, core::error> {
    using core::error;
    using core::error_code;

    auto* p = impl_->find(record.model_tag);
    if (!p) return unknown_tag(record.model_tag);

    if (record.id.empty()) {
        return std::unexpected(error{error_code::validation_failed, "empty record id", "store.records"});
    }
    if (record.vector.size() != p->dimension) {
        return std::unexpected(error{error_code::validation_failed,
            "vector dimension " + std::to_string(record.vector.size()) + " != " +
            std::to_string(p->dimension) + " for model '" + record.model_tag + "'", "store.records"});
    }
    if (!std::all_of(record.vector.begin(), record.vector.end(), [](float v) { return std::isfinite(v); })) {
        return std::unexpected(error{error_code::validation_failed, "non-finite vector component", "store.records"});
    }

    std::unique_lock lock(p->mutex);
    std::optional<std::uint64_t> previous;
    auto it = p->records.find(record.id);
    if (it != p->records.end()) {
        previous = it->second.version;
        record.version = it->second.version + 1;
        it->second = std::move(record);
    } else {
        record.version = 1;
        auto key = record.id;
        p->records.emplace(std::move(key), std::move(record));
    }
    ++p->mutation_seq;
    return previous;
}

auto RecordStore::remove(std::string_view id, std::string_view model_tag) -> std::expected<void, core::error> {
    auto* p = impl_->find(model_tag);
    if (!p) return unknown_tag(model_tag);

    std::unique_lock lock(p->mutex);
    if (p->records.erase(std::string(id)) == 0) {
        return std::unexpected(core::error{core::error_code::not_found,
                                           "no record '" + std::string(id) + "'", "store.records"});
    }
    ++p->mutation_seq;
    return {};
}

auto RecordStore::snapshot(std::string_view model_tag) const
    -> std::expected<std::vector<EmbeddingRecord>, core::error> {
    auto* p = impl_->find(model_tag);
    if (!p) return unknown_tag(model_tag);

    std::vector<EmbeddingRecord> out;
    {
        std::shared_lock lock(p->mutex);
        out.reserve(p->records.size());
        for (const auto& [_, rec] : p->records) out.push_back(rec);
    }
    std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.id < b.id; });
    return out;
}

auto RecordStore::ids(std::string_view model_tag) const -> std::expected<std::vector<std::string>, core::error> {
    auto* p = impl_->find(model_tag);
    if (!p) return unknown_tag(model_tag);

    std::shared_lock lock(p->mutex);
    std::vector<std::string> out;
    out.reserve(p->records.size());
    for (const auto& [id, _] : p->records) out.push_back(id);
    return out;
}

auto RecordStore::size(std::string_view model_tag) const -> std::size_t {
    auto* p = impl_->find(model_tag);
    if (!p) return 0;
    std::shared_lock lock(p->mutex);
    return p->records.size();
}

auto RecordStore::mutation_seq(std::string_view model_tag) const -> std::uint64_t {
    auto* p = impl_->find(model_tag);
    if (!p) return 0;
    std::shared_lock lock(p->mutex);
    return p->mutation_seq;
}

auto RecordStore::tags() const -> std::vector<std::string> {
    std::shared_lock lock(impl_->mutex_);
    std::vector<std::string> out;
    for (const auto& [tag, _] : impl_->partitions_) out.push_back(tag);
    return out;
}

// --- Serialization ---
// tag | u64 dim | u64 seq | u64 n | per record (sorted by id):
//   id | 32B hash | u64 version | dim floats | text | metadata

auto RecordStore::save(std::string_view model_tag, const std::filesystem::path& path) const
    -> std::expected<void, core::error> {
    auto* p = impl_->find(model_tag);
    if (!p) return unknown_tag(model_tag);

    io::BinaryWriter out(RECORDS_MAGIC, RECORDS_MAJOR, RECORDS_MINOR);
    {
        std::shared_lock lock(p->mutex);
        std::vector<const EmbeddingRecord*> sorted;
        sorted.reserve(p->records.size());
        for (const auto& [_, rec] : p->records) sorted.push_back(&rec);
        std::sort(sorted.begin(), sorted.end(), [](const auto* a, const auto* b) { return a->id < b->id; });

        out.put_string(model_tag);
        out.put(static_cast<std::uint64_t>(p->dimension));
        out.put(p->mutation_seq);
        out.put(static_cast<std::uint64_t>(sorted.size()));
        for (const auto* rec : sorted) {
            out.put_string(rec->id);
            out.put_bytes(rec->content_hash.data(), rec->content_hash.size());
            out.put(rec->version);
            out.put_floats(rec->vector);
            out.put_string(rec->text);
            metadata::write_metadata(out, rec->metadata);
        }
    }
    return out.commit(path);
}

auto RecordStore::load(std::string_view model_tag, const std::filesystem::path& path)
    -> std::expected<void, core::error> {
    using core::error;
    using core::error_code;

    auto* p = impl_->find(model_tag);
    if (!p) return unknown_tag(model_tag);

    auto reader = io::BinaryReader::open(path, RECORDS_MAGIC, RECORDS_MAJOR);
    if (!reader) return std::unexpected(reader.error());
    auto& in = *reader;
    auto corrupt = [&](const std::string& what) {
        return std::unexpected(error{error_code::data_integrity, what + ": " + path.string(), "store.records"});
    };

    auto tag = in.get_string();
    auto dim = in.get<std::uint64_t>();
    auto seq = in.get<std::uint64_t>();
    auto n = in.get<std::uint64_t>();
    if (!tag || !dim || !seq || !n) return corrupt("truncated header");
    if (*tag != model_tag) return corrupt("artifact belongs to model '" + *tag + "'");
    if (*dim != p->dimension) return corrupt("dimension " + std::to_string(*dim) + " does not match partition");

    std::unordered_map<std::string, EmbeddingRecord> records;
    for (std::uint64_t i = 0; i < *n; ++i) {
        EmbeddingRecord rec;
        rec.model_tag = std::string(model_tag);
        auto id = in.get_string();
        if (!id) return std::unexpected(id.error());
        rec.id = std::move(*id);
        if (auto r = in.get_bytes(rec.content_hash.data(), rec.content_hash.size()); !r) {
            return std::unexpected(r.error());
        }
        auto version = in.get<std::uint64_t>();
        if (!version) return std::unexpected(version.error());
        rec.version = *version;
        auto vec = in.get_floats(p->dimension);
        if (!vec) return std::unexpected(vec.error());
        rec.vector = std::move(*vec);
        auto text = in.get_string();
        if (!text) return std::unexpected(text.error());
        rec.text = std::move(*text);
        auto meta = metadata::read_metadata(in);
        if (!meta) return std::unexpected(meta.error());
        rec.metadata = std::move(*meta);

        auto key = rec.id;
        if (!records.emplace(std::move(key), std::move(rec)).second) return corrupt("duplicate record id");
    }

    std::unique_lock lock(p->mutex);
    p->records = std::move(records);
    p->mutation_seq = *seq;
    return {};
}

} // namespace quiver::store
