#include "quiver/store/change_detector.hpp"

namespace quiver::store {

auto ChangeDetector::decide(std::string_view id, std::string_view model_tag,
                            std::string_view new_content) const
    -> std::expected<ChangeDecision, core::error> {
    if (!store_.has_partition(model_tag)) {
        return std::unexpected(core::error{core::error_code::not_found,
                                           "unknown model tag '" + std::string(model_tag) + "'", "store.change"});
    }

    ChangeDecision decision;
    decision.normalized_text = core::normalize_content(new_content);
    auto digest = core::sha256(decision.normalized_text);
    if (!digest) return std::unexpected(digest.error());
    decision.content_hash = *digest;

    auto existing = store_.get(id, model_tag);
    if (!existing) {
        if (existing.error().code != core::error_code::not_found) return std::unexpected(existing.error());
        decision.action = ChangeAction::Insert;
        return decision;
    }

    decision.current_version = existing->version;
    decision.action = existing->content_hash == decision.content_hash ? ChangeAction::Skip : ChangeAction::Update;
    return decision;
}

auto to_string(ChangeAction action) noexcept -> std::string_view {
    switch (action) {
        case ChangeAction::Insert: return "insert";
        case ChangeAction::Update: return "update";
        case ChangeAction::Skip: return "skip";
    }
    return "unknown";
}

} // namespace quiver::store
