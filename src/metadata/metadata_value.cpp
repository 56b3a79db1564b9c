#include "quiver/metadata/metadata_value.hpp"
#include "quiver/io/binary_file.hpp"

namespace quiver::metadata {

namespace {

enum class Tag : std::uint8_t { String = 0, Double = 1, Int = 2, Bool = 3, Time = 4 };

} // anonymous namespace

auto numeric_view(const MetadataValue& v) noexcept -> std::optional<double> {
    if (const auto* d = std::get_if<double>(&v)) return *d;
    if (const auto* i = std::get_if<std::int64_t>(&v)) return static_cast<double>(*i);
    if (const auto* t = std::get_if<Timestamp>(&v)) {
        return static_cast<double>(t->time_since_epoch().count());
    }
    return std::nullopt;
}

auto write_metadata(io::BinaryWriter& out, const MetadataMap& m) -> void {
    out.put(static_cast<std::uint32_t>(m.size()));
    for (const auto& [key, value] : m) {
        out.put_string(key);
        if (const auto* s = std::get_if<std::string>(&value)) {
            out.put(Tag::String);
            out.put_string(*s);
        } else if (const auto* d = std::get_if<double>(&value)) {
            out.put(Tag::Double);
            out.put(*d);
        } else if (const auto* i = std::get_if<std::int64_t>(&value)) {
            out.put(Tag::Int);
            out.put(*i);
        } else if (const auto* b = std::get_if<bool>(&value)) {
            out.put(Tag::Bool);
            out.put(static_cast<std::uint8_t>(*b ? 1 : 0));
        } else {
            out.put(Tag::Time);
            out.put(static_cast<std::int64_t>(std::get<Timestamp>(value).time_since_epoch().count()));
        }
    }
}

auto read_metadata(io::BinaryReader& in) -> std::expected<MetadataMap, core::error> {
    using core::error; using core::error_code;

    auto count = in.get<std::uint32_t>();
    if (!count) return std::unexpected(count.error());

    MetadataMap m;
    for (std::uint32_t i = 0; i < *count; ++i) {
        auto key = in.get_string();
        if (!key) return std::unexpected(key.error());
        auto tag = in.get<Tag>();
        if (!tag) return std::unexpected(tag.error());

        switch (*tag) {
            case Tag::String: {
                auto s = in.get_string();
                if (!s) return std::unexpected(s.error());
                m.emplace(std::move(*key), std::move(*s));
                break;
            }
            case Tag::Double: {
                auto d = in.get<double>();
                if (!d) return std::unexpected(d.error());
                m.emplace(std::move(*key), *d);
                break;
            }
            case Tag::Int: {
                auto v = in.get<std::int64_t>();
                if (!v) return std::unexpected(v.error());
                m.emplace(std::move(*key), *v);
                break;
            }
            case Tag::Bool: {
                auto b = in.get<std::uint8_t>();
                if (!b) return std::unexpected(b.error());
                m.emplace(std::move(*key), *b != 0);
                break;
            }
            case Tag::Time: {
                auto us = in.get<std::int64_t>();
                if (!us) return std::unexpected(us.error());
                m.emplace(std::move(*key), Timestamp{std::chrono::microseconds{*us}});
                break;
            }
            default:
                return std::unexpected(error{error_code::data_integrity, "unknown metadata tag", "metadata"});
        }
    }
    return m;
}

} // namespace quiver::metadata
