#pragma once

/** \file change_detector.hpp
 *  \brief Insert / update / skip decisions from normalized content digests.
 *
 * Only content is inspected, never vectors: identical normalized content
 * means the stored embedding is still valid and nothing downstream
 * (embedding model, indexes) needs to run.
 */

#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>

#include "quiver/core/content_hash.hpp"
#include "quiver/error.hpp"
#include "quiver/store/record_store.hpp"

namespace quiver::store {

enum class ChangeAction : std::uint8_t {
    Insert,   /**< no live record for the key */
    Update,   /**< live record with a different content hash */
    Skip,     /**< live record with the same content hash */
};

struct ChangeDecision {
    ChangeAction action{ChangeAction::Insert};
    core::ContentHash content_hash{};           /**< digest of normalized content */
    std::string normalized_text;                /**< what gets stored and indexed */
    std::optional<std::uint64_t> current_version;  /**< stored version, if any */
};

class ChangeDetector {
public:
    explicit ChangeDetector(const RecordStore& store) : store_(store) {}

    /** \brief Compare `new_content` against the stored record for (id, model_tag).
     *
     * Errors: not_found only for an unknown model tag (an absent id is Insert).
     */
    auto decide(std::string_view id, std::string_view model_tag, std::string_view new_content) const
        -> std::expected<ChangeDecision, core::error>;

private:
    const RecordStore& store_;
};

auto to_string(ChangeAction action) noexcept -> std::string_view;

} // namespace quiver::store
