#pragma once

/** \file metadata_value.hpp
 *  \brief Typed scalar metadata carried alongside each record.
 *
 * Metadata is pass-through for the engine: it is stored, returned with query
 * hits, and consulted only by optional query filters.
 */

#include <chrono>
#include <cstdint>
#include <expected>
#include <map>
#include <optional>
#include <string>
#include <variant>

#include "quiver/error.hpp"

namespace quiver::io {
class BinaryWriter;
class BinaryReader;
}

namespace quiver::metadata {

using Timestamp = std::chrono::sys_time<std::chrono::microseconds>;

/** \brief Metadata value type */
using MetadataValue = std::variant<std::string, double, std::int64_t, bool, Timestamp>;

/** \brief Attribute name to value; ordered so serialization is deterministic. */
using MetadataMap = std::map<std::string, MetadataValue>;

/** \brief Numeric view used by range predicates.
 *
 * double and int64 convert directly; timestamps become microseconds since
 * the Unix epoch. Strings and booleans have no numeric view.
 */
auto numeric_view(const MetadataValue& v) noexcept -> std::optional<double>;

auto write_metadata(io::BinaryWriter& out, const MetadataMap& m) -> void;
auto read_metadata(io::BinaryReader& in) -> std::expected<MetadataMap, core::error>;

} // namespace quiver::metadata
