#include "quiver/engine/engine_config.hpp"
#include "quiver/core/platform_utils.hpp"

#include <cerrno>
#include <cmath>
#include <cstdlib>

namespace quiver::engine {

namespace {

auto invalid(std::string message) -> std::unexpected<core::error> {
    return std::unexpected(core::error{core::error_code::config_invalid, std::move(message), "engine.config"});
}

auto parse_double(const char* name, const std::string& text) -> std::expected<double, core::error> {
    if (text.empty()) return invalid(std::string(name) + " is empty");
    errno = 0;
    char* end = nullptr;
    const double v = std::strtod(text.c_str(), &end);
    if (errno != 0 || end != text.c_str() + text.size() || !std::isfinite(v)) {
        return invalid(std::string(name) + "='" + text + "' is not a number");
    }
    return v;
}

auto parse_unsigned(const char* name, const std::string& text) -> std::expected<std::uint64_t, core::error> {
    if (text.empty() || text.front() == '-') return invalid(std::string(name) + "='" + text + "' is not an unsigned integer");
    errno = 0;
    char* end = nullptr;
    const unsigned long long v = std::strtoull(text.c_str(), &end, 10);
    if (errno != 0 || end != text.c_str() + text.size()) {
        return invalid(std::string(name) + "='" + text + "' is not an unsigned integer");
    }
    return static_cast<std::uint64_t>(v);
}

auto parse_bool(const char* name, const std::string& text) -> std::expected<bool, core::error> {
    if (text == "1" || text == "true" || text == "on" || text == "yes") return true;
    if (text == "0" || text == "false" || text == "off" || text == "no") return false;
    return invalid(std::string(name) + "='" + text + "' is not a boolean");
}

} // anonymous namespace

auto ModelSpec::validate() const -> std::expected<void, core::error> {
    if (model_tag.empty()) return invalid("model tag must not be empty");
    // The tag names a directory under data_dir.
    if (model_tag == "." || model_tag == ".." ||
        model_tag.find_first_of("/\\:") != std::string::npos) {
        return invalid("model tag '" + model_tag + "' is not a valid directory name");
    }
    if (dimension == 0) return invalid("model '" + model_tag + "' has dimension 0");
    return {};
}

auto EngineConfig::validate() const -> std::expected<void, core::error> {
    if (auto w = search::fusion::validate(weights); !w) return invalid(w.error().message);
    if (overfetch == 0) return invalid("overfetch must be positive");
    if (filter_overfetch == 0) return invalid("filter_overfetch must be positive");
    if (!(rebuild_tombstone_ratio > 0.0) || rebuild_tombstone_ratio > 1.0) {
        return invalid("rebuild_tombstone_ratio must be in (0, 1]");
    }
    if (rebuild_retry_interval.count() < 0) return invalid("rebuild_retry_interval must not be negative");
    for (const auto& m : models) {
        if (auto r = m.validate(); !r) return r;
    }
    return {};
}

auto EngineConfig::from_env(EngineConfig base) -> std::expected<EngineConfig, core::error> {
    if (auto v = core::safe_getenv("QUIVER_DATA_DIR"); v && !v->empty()) {
        base.data_dir = *v;
    }
    if (auto v = core::safe_getenv("QUIVER_VECTOR_WEIGHT")) {
        auto d = parse_double("QUIVER_VECTOR_WEIGHT", *v);
        if (!d) return std::unexpected(d.error());
        base.weights.vector = static_cast<float>(*d);
    }
    if (auto v = core::safe_getenv("QUIVER_LEXICAL_WEIGHT")) {
        auto d = parse_double("QUIVER_LEXICAL_WEIGHT", *v);
        if (!d) return std::unexpected(d.error());
        base.weights.lexical = static_cast<float>(*d);
    }
    if (auto v = core::safe_getenv("QUIVER_OVERFETCH")) {
        auto n = parse_unsigned("QUIVER_OVERFETCH", *v);
        if (!n) return std::unexpected(n.error());
        base.overfetch = static_cast<std::size_t>(*n);
    }
    if (auto v = core::safe_getenv("QUIVER_REBUILD_TOMBSTONE_RATIO")) {
        auto d = parse_double("QUIVER_REBUILD_TOMBSTONE_RATIO", *v);
        if (!d) return std::unexpected(d.error());
        base.rebuild_tombstone_ratio = *d;
    }
    if (auto v = core::safe_getenv("QUIVER_INDEX_RETRY_ATTEMPTS")) {
        auto n = parse_unsigned("QUIVER_INDEX_RETRY_ATTEMPTS", *v);
        if (!n) return std::unexpected(n.error());
        base.index_retry_attempts = static_cast<std::uint32_t>(*n);
    }
    if (auto v = core::safe_getenv("QUIVER_BLOCKING_RECOVERY")) {
        auto b = parse_bool("QUIVER_BLOCKING_RECOVERY", *v);
        if (!b) return std::unexpected(b.error());
        base.blocking_recovery = *b;
    }
    if (auto r = base.validate(); !r) return std::unexpected(r.error());
    return base;
}

} // namespace quiver::engine
