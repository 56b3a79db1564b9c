#include "quiver/index/bm25.hpp"
#include "quiver/io/binary_file.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <limits>
#include <shared_mutex>
#include <unordered_map>
#include <unordered_set>

#include "roaring.hh"

namespace quiver::index {

namespace {

// Common English stopwords
const std::unordered_set<std::string> STOPWORDS = {
    "a", "an", "and", "are", "as", "at", "be", "been", "by", "for",
    "from", "has", "he", "in", "is", "it", "its", "of", "on", "that",
    "the", "to", "was", "will", "with", "this", "these", "those",
    "i", "you", "we", "they", "them", "their", "what", "which", "who",
    "when", "where", "why", "how", "all", "would", "there", "could"
};

inline auto is_separator(char c, bool punctuation) -> bool {
    const auto uc = static_cast<unsigned char>(c);
    if (uc >= 0x80) return false;
    return std::isspace(uc) || (punctuation && std::ispunct(uc));
}

/** \brief Per-document term frequencies, sorted by term id. */
struct DocumentStats {
    std::string id;
    std::uint32_t length{0};
    std::vector<std::pair<std::uint32_t, std::uint32_t>> term_freqs;  // (term_id, tf)
};

} // anonymous namespace

// Tokenizer implementation

auto Tokenizer::tokenize(std::string_view text, const Options& options)
    -> std::vector<std::string> {
    std::vector<std::string> tokens;
    std::string current_token;

    auto flush = [&] {
        if (current_token.empty()) return;
        if (current_token.length() >= options.min_length &&
            current_token.length() <= options.max_length) {
            if (options.lowercase) {
                std::transform(current_token.begin(), current_token.end(), current_token.begin(),
                               [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            }
            if (!options.remove_stopwords || !is_stopword(current_token)) {
                tokens.push_back(std::move(current_token));
            }
        }
        current_token.clear();
    };

    for (char c : text) {
        if (is_separator(c, options.remove_punctuation)) {
            flush();
        } else {
            current_token.push_back(c);
        }
    }
    flush();

    return tokens;
}

auto Tokenizer::is_stopword(std::string_view word) -> bool {
    std::string lower_word(word);
    std::transform(lower_word.begin(), lower_word.end(), lower_word.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return STOPWORDS.count(lower_word) > 0;
}

// BM25Index::Impl

class BM25Index::Impl {
public:
    auto init(const BM25Params& params) -> std::expected<void, core::error>;
    auto insert_locked(std::string_view id, std::string_view text) -> void;
    auto remove_locked(std::string_view id) -> bool;
    auto search(std::string_view query, std::size_t k) const -> std::vector<LexicalHit>;
    auto clear_locked() -> void;

    BM25Params params_;
    bool initialized_{false};

    // Term dictionary; a term whose last posting goes away frees its slot
    std::unordered_map<std::string, std::uint32_t> term_to_id_;
    std::vector<std::string> id_to_term_;
    std::vector<std::uint32_t> free_terms_;

    // Inverted index: term_id -> document handles
    std::vector<roaring::Roaring> inverted_index_;
    std::vector<std::uint32_t> doc_freqs_;

    // Documents by handle; handles of removed documents are recycled
    std::unordered_map<std::string, std::uint32_t> id_to_handle_;
    std::unordered_map<std::uint32_t, DocumentStats> doc_stats_;
    std::vector<std::uint32_t> free_handles_;
    std::uint32_t next_handle_{0};

    std::size_t total_tokens_{0};

    mutable std::shared_mutex mutex_;

    auto tokenizer_options() const -> Tokenizer::Options;
    auto get_or_create_term_id(const std::string& term) -> std::uint32_t;
    auto release_term(std::uint32_t term_id) -> void;
    auto compute_idf(std::uint32_t term_id) const -> float;
    auto avg_doc_length() const -> float;
    auto score_document(const std::vector<std::pair<std::uint32_t, std::uint32_t>>& query_terms,
                        const DocumentStats& doc) const -> float;
};

auto BM25Index::Impl::init(const BM25Params& params) -> std::expected<void, core::error> {
    if (params.k1 <= 0.0f) {
        return std::unexpected(core::error{core::error_code::invalid_argument, "k1 must be positive", "index.bm25"});
    }
    if (params.b < 0.0f || params.b > 1.0f) {
        return std::unexpected(core::error{core::error_code::invalid_argument, "b must be between 0 and 1", "index.bm25"});
    }
    if (params.min_term_length > params.max_term_length) {
        return std::unexpected(core::error{core::error_code::invalid_argument,
                                           "min_term_length exceeds max_term_length", "index.bm25"});
    }
    params_ = params;
    initialized_ = true;
    return {};
}

auto BM25Index::Impl::tokenizer_options() const -> Tokenizer::Options {
    Tokenizer::Options opts;
    opts.lowercase = params_.lowercase;
    opts.remove_stopwords = params_.remove_stopwords;
    opts.min_length = params_.min_term_length;
    opts.max_length = params_.max_term_length;
    return opts;
}

auto BM25Index::Impl::get_or_create_term_id(const std::string& term) -> std::uint32_t {
    auto it = term_to_id_.find(term);
    if (it != term_to_id_.end()) {
        return it->second;
    }

    if (!free_terms_.empty()) {
        const auto id = free_terms_.back();
        free_terms_.pop_back();
        term_to_id_.emplace(term, id);
        id_to_term_[id] = term;
        return id;
    }

    const auto id = static_cast<std::uint32_t>(id_to_term_.size());
    term_to_id_.emplace(term, id);
    id_to_term_.push_back(term);
    inverted_index_.emplace_back();
    doc_freqs_.push_back(0);
    return id;
}

auto BM25Index::Impl::release_term(std::uint32_t term_id) -> void {
    term_to_id_.erase(id_to_term_[term_id]);
    id_to_term_[term_id].clear();
    inverted_index_[term_id] = roaring::Roaring();
    free_terms_.push_back(term_id);
}

auto BM25Index::Impl::insert_locked(std::string_view id, std::string_view text) -> void {
    // Update: remove prior contributions then re-index
    remove_locked(id);

    auto tokens = Tokenizer::tokenize(text, tokenizer_options());

    std::unordered_map<std::string, std::uint32_t> term_counts;
    for (const auto& token : tokens) {
        term_counts[token]++;
    }

    std::uint32_t handle;
    if (!free_handles_.empty()) {
        handle = free_handles_.back();
        free_handles_.pop_back();
    } else {
        handle = next_handle_++;
    }

    DocumentStats stats;
    stats.id = std::string(id);
    stats.length = static_cast<std::uint32_t>(tokens.size());
    stats.term_freqs.reserve(term_counts.size());
    for (const auto& [term, count] : term_counts) {
        const std::uint32_t term_id = get_or_create_term_id(term);
        inverted_index_[term_id].add(handle);
        doc_freqs_[term_id]++;
        stats.term_freqs.emplace_back(term_id, count);
    }
    std::sort(stats.term_freqs.begin(), stats.term_freqs.end());

    total_tokens_ += stats.length;
    id_to_handle_.emplace(stats.id, handle);
    doc_stats_.emplace(handle, std::move(stats));
}

auto BM25Index::Impl::remove_locked(std::string_view id) -> bool {
    auto it = id_to_handle_.find(std::string(id));
    if (it == id_to_handle_.end()) return false;

    const std::uint32_t handle = it->second;
    auto doc_it = doc_stats_.find(handle);
    if (doc_it != doc_stats_.end()) {
        for (const auto& [term_id, tf] : doc_it->second.term_freqs) {
            inverted_index_[term_id].remove(handle);
            if (doc_freqs_[term_id] > 0 && --doc_freqs_[term_id] == 0) release_term(term_id);
        }
        total_tokens_ -= std::min<std::size_t>(total_tokens_, doc_it->second.length);
        doc_stats_.erase(doc_it);
    }
    id_to_handle_.erase(it);
    free_handles_.push_back(handle);
    return true;
}

auto BM25Index::Impl::avg_doc_length() const -> float {
    return doc_stats_.empty() ? 0.0f
                              : static_cast<float>(total_tokens_) / static_cast<float>(doc_stats_.size());
}

auto BM25Index::Impl::compute_idf(std::uint32_t term_id) const -> float {
    const std::size_t N = doc_stats_.size();
    const std::size_t df = doc_freqs_[term_id];
    if (df == 0) return 0.0f;
    // IDF = log(1 + (N - df + 0.5) / (df + 0.5)), non-negative
    return std::log(1.0f + (static_cast<float>(N - df) + 0.5f) / (static_cast<float>(df) + 0.5f));
}

auto BM25Index::Impl::score_document(const std::vector<std::pair<std::uint32_t, std::uint32_t>>& query_terms,
                                     const DocumentStats& doc) const -> float {
    const float avg_len = avg_doc_length();
    const float doc_len_norm = 1.0f - params_.b +
        params_.b * (avg_len > 0.0f ? static_cast<float>(doc.length) / avg_len : 1.0f);

    float score = 0.0f;
    std::size_t qi = 0, di = 0;
    while (qi < query_terms.size() && di < doc.term_freqs.size()) {
        if (query_terms[qi].first < doc.term_freqs[di].first) {
            ++qi;
        } else if (query_terms[qi].first > doc.term_freqs[di].first) {
            ++di;
        } else {
            const auto term_id = query_terms[qi].first;
            const auto query_tf = static_cast<float>(query_terms[qi].second);
            const auto doc_tf = static_cast<float>(doc.term_freqs[di].second);

            const float numerator = doc_tf * (params_.k1 + 1.0f);
            const float denominator = doc_tf + params_.k1 * doc_len_norm;
            score += compute_idf(term_id) * query_tf * (numerator / denominator);
            ++qi;
            ++di;
        }
    }
    return score;
}

auto BM25Index::Impl::search(std::string_view query, std::size_t k) const -> std::vector<LexicalHit> {
    std::vector<LexicalHit> results;
    if (k == 0 || doc_stats_.empty()) return results;

    // Query terms unknown to the vocabulary cannot match
    std::unordered_map<std::uint32_t, std::uint32_t> counts;
    for (const auto& token : Tokenizer::tokenize(query, tokenizer_options())) {
        if (auto it = term_to_id_.find(token); it != term_to_id_.end()) {
            counts[it->second]++;
        }
    }
    if (counts.empty()) return results;

    std::vector<std::pair<std::uint32_t, std::uint32_t>> query_terms(counts.begin(), counts.end());
    std::sort(query_terms.begin(), query_terms.end());

    // Candidate documents: union of posting lists
    roaring::Roaring candidates;
    for (const auto& [term_id, _] : query_terms) {
        candidates |= inverted_index_[term_id];
    }

    results.reserve(candidates.cardinality());
    for (std::uint32_t handle : candidates) {
        const auto& doc = doc_stats_.at(handle);
        results.push_back(LexicalHit{doc.id, score_document(query_terms, doc)});
    }

    const std::size_t n_out = std::min(k, results.size());
    std::partial_sort(results.begin(), results.begin() + static_cast<std::ptrdiff_t>(n_out), results.end(),
        [](const LexicalHit& a, const LexicalHit& b) {
            return a.score != b.score ? a.score > b.score : a.id < b.id;
        });
    results.resize(n_out);
    return results;
}

auto BM25Index::Impl::clear_locked() -> void {
    term_to_id_.clear();
    id_to_term_.clear();
    free_terms_.clear();
    inverted_index_.clear();
    doc_freqs_.clear();
    id_to_handle_.clear();
    doc_stats_.clear();
    free_handles_.clear();
    next_handle_ = 0;
    total_tokens_ = 0;
}

// BM25Index public interface

BM25Index::BM25Index() : impl_(std::make_unique<Impl>()) {
    // Default parameters always validate.
    (void)impl_->init(BM25Params{});
}

BM25Index::~BM25Index() = default;
BM25Index::BM25Index(BM25Index&&) noexcept = default;
BM25Index& BM25Index::operator=(BM25Index&&) noexcept = default;

auto BM25Index::init(const BM25Params& params) -> std::expected<void, core::error> {
    std::unique_lock lock(impl_->mutex_);
    if (!impl_->doc_stats_.empty()) {
        return std::unexpected(core::error{core::error_code::precondition_failed,
                                           "parameters cannot change on a populated index", "index.bm25"});
    }
    return impl_->init(params);
}

auto BM25Index::insert(std::string_view id, std::string_view text) -> std::expected<void, core::error> {
    if (id.empty()) {
        return std::unexpected(core::error{core::error_code::validation_failed, "empty document id", "index.bm25"});
    }
    std::unique_lock lock(impl_->mutex_);
    if (!impl_->initialized_) {
        return std::unexpected(core::error{core::error_code::not_initialized, "Index not initialized", "index.bm25"});
    }
    impl_->insert_locked(id, text);
    return {};
}

auto BM25Index::remove(std::string_view id) -> bool {
    std::unique_lock lock(impl_->mutex_);
    return impl_->remove_locked(id);
}

auto BM25Index::search(std::string_view query, std::size_t k) const
    -> std::expected<std::vector<LexicalHit>, core::error> {
    std::shared_lock lock(impl_->mutex_);
    if (!impl_->initialized_) {
        return std::unexpected(core::error{core::error_code::not_initialized, "Index not initialized", "index.bm25"});
    }
    return impl_->search(query, k);
}

auto BM25Index::contains(std::string_view id) const -> bool {
    std::shared_lock lock(impl_->mutex_);
    return impl_->id_to_handle_.contains(std::string(id));
}

auto BM25Index::size() const -> std::size_t {
    std::shared_lock lock(impl_->mutex_);
    return impl_->doc_stats_.size();
}

auto BM25Index::ids() const -> std::vector<std::string> {
    std::shared_lock lock(impl_->mutex_);
    std::vector<std::string> out;
    out.reserve(impl_->id_to_handle_.size());
    for (const auto& [id, _] : impl_->id_to_handle_) out.push_back(id);
    return out;
}

auto BM25Index::get_stats() const -> BM25Stats {
    std::shared_lock lock(impl_->mutex_);
    BM25Stats stats;
    stats.num_documents = impl_->doc_stats_.size();
    stats.vocabulary_size = impl_->term_to_id_.size();
    stats.total_tokens = impl_->total_tokens_;
    stats.avg_doc_length = impl_->doc_stats_.empty()
        ? 0.0f : static_cast<float>(impl_->total_tokens_) / static_cast<float>(impl_->doc_stats_.size());
    return stats;
}

auto BM25Index::is_initialized() const noexcept -> bool {
    return impl_ && impl_->initialized_;
}

auto BM25Index::clear() -> void {
    std::unique_lock lock(impl_->mutex_);
    impl_->clear_locked();
}

// --- Serialization ---
// params | u32 n_terms | terms | u64 n_docs | per doc: id | u32 length | u32 n | n x (u32 term, u32 tf)
// Only live terms are written, renumbered densely. Posting lists are rebuilt
// from document term frequencies on load.

auto BM25Index::save(io::BinaryWriter& out) const -> void {
    std::shared_lock lock(impl_->mutex_);
    const auto& p = impl_->params_;
    out.put(p.k1);
    out.put(p.b);
    out.put(static_cast<std::uint8_t>(p.lowercase ? 1 : 0));
    out.put(static_cast<std::uint8_t>(p.remove_stopwords ? 1 : 0));
    out.put(p.min_term_length);
    out.put(p.max_term_length);

    constexpr auto FREE = std::numeric_limits<std::uint32_t>::max();
    std::vector<std::uint32_t> remap(impl_->id_to_term_.size(), FREE);
    std::uint32_t n_live = 0;
    for (std::uint32_t t = 0; t < impl_->id_to_term_.size(); ++t) {
        if (impl_->doc_freqs_[t] > 0) remap[t] = n_live++;
    }
    out.put(n_live);
    for (std::uint32_t t = 0; t < impl_->id_to_term_.size(); ++t) {
        if (remap[t] != FREE) out.put_string(impl_->id_to_term_[t]);
    }

    // Deterministic order for docs
    std::vector<const DocumentStats*> docs;
    docs.reserve(impl_->doc_stats_.size());
    for (const auto& [_, doc] : impl_->doc_stats_) docs.push_back(&doc);
    std::sort(docs.begin(), docs.end(), [](const auto* a, const auto* b) { return a->id < b->id; });

    out.put(static_cast<std::uint64_t>(docs.size()));
    for (const auto* doc : docs) {
        out.put_string(doc->id);
        out.put(doc->length);
        out.put(static_cast<std::uint32_t>(doc->term_freqs.size()));
        for (const auto& [term_id, tf] : doc->term_freqs) {
            out.put(remap[term_id]);
            out.put(tf);
        }
    }
}

auto BM25Index::load(io::BinaryReader& in) -> std::expected<BM25Index, core::error> {
    using core::error;
    using core::error_code;
    auto corrupt = [](const char* what) {
        return std::unexpected(error{error_code::data_integrity, what, "index.bm25"});
    };

    BM25Params p;
    auto k1 = in.get<float>();
    auto b = in.get<float>();
    auto lowercase = in.get<std::uint8_t>();
    auto stopwords = in.get<std::uint8_t>();
    auto min_len = in.get<std::uint32_t>();
    auto max_len = in.get<std::uint32_t>();
    if (!k1 || !b || !lowercase || !stopwords || !min_len || !max_len) return corrupt("truncated parameters");
    p.k1 = *k1;
    p.b = *b;
    p.lowercase = *lowercase != 0;
    p.remove_stopwords = *stopwords != 0;
    p.min_term_length = *min_len;
    p.max_term_length = *max_len;

    BM25Index index;
    auto& impl = *index.impl_;
    if (auto r = impl.init(p); !r) return corrupt("invalid stored parameters");

    auto n_terms = in.get<std::uint32_t>();
    if (!n_terms) return std::unexpected(n_terms.error());
    for (std::uint32_t t = 0; t < *n_terms; ++t) {
        auto term = in.get_string();
        if (!term) return std::unexpected(term.error());
        if (impl.get_or_create_term_id(*term) != t) return corrupt("duplicate vocabulary term");
    }

    auto n_docs = in.get<std::uint64_t>();
    if (!n_docs) return std::unexpected(n_docs.error());
    for (std::uint64_t d = 0; d < *n_docs; ++d) {
        auto id = in.get_string();
        auto length = in.get<std::uint32_t>();
        auto n_tf = in.get<std::uint32_t>();
        if (!id || !length || !n_tf) return corrupt("truncated document");
        if (impl.id_to_handle_.contains(*id)) return corrupt("duplicate document id");

        const std::uint32_t handle = impl.next_handle_++;
        DocumentStats doc;
        doc.id = std::move(*id);
        doc.length = *length;
        doc.term_freqs.reserve(std::min<std::size_t>(*n_tf, in.remaining() / 8));
        for (std::uint32_t i = 0; i < *n_tf; ++i) {
            auto term_id = in.get<std::uint32_t>();
            auto tf = in.get<std::uint32_t>();
            if (!term_id || !tf) return corrupt("truncated term frequencies");
            if (*term_id >= impl.id_to_term_.size()) return corrupt("term id out of range");
            impl.inverted_index_[*term_id].add(handle);
            impl.doc_freqs_[*term_id]++;
            doc.term_freqs.emplace_back(*term_id, *tf);
        }
        std::sort(doc.term_freqs.begin(), doc.term_freqs.end());
        impl.total_tokens_ += doc.length;
        impl.id_to_handle_.emplace(doc.id, handle);
        impl.doc_stats_.emplace(handle, std::move(doc));
    }
    for (std::uint32_t t = 0; t < impl.doc_freqs_.size(); ++t) {
        if (impl.doc_freqs_[t] == 0) impl.release_term(t);
    }
    return index;
}

} // namespace quiver::index
