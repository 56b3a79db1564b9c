#pragma once

/** \file content_hash.hpp
 *  \brief Content normalization and 256-bit digests for change detection.
 *
 * Normalization makes semantically identical text in different byte
 * representations hash identically:
 * - a leading UTF-8 byte order mark is dropped
 * - runs of ASCII whitespace, CR and LF included, collapse to one space
 * - leading and trailing whitespace is trimmed
 * Letter case is preserved.
 */

#include <array>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

#include "quiver/error.hpp"

namespace quiver::core {

using ContentHash = std::array<std::uint8_t, 32>;

/** \brief Canonical form of `text` used for hashing and lexical indexing. */
auto normalize_content(std::string_view text) -> std::string;

/** \brief SHA-256 of `bytes` (no normalization applied). */
auto sha256(std::string_view bytes) -> std::expected<ContentHash, error>;

/** \brief SHA-256 of normalize_content(text). */
auto hash_content(std::string_view text) -> std::expected<ContentHash, error>;

/** \brief Lowercase hex rendering, 64 characters. */
auto to_hex(const ContentHash& h) -> std::string;

} // namespace quiver::core
