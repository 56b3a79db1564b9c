#pragma once

/** \file bm25.hpp
 *  \brief BM25 inverted index for lexical search.
 *
 * - Inverted index with Roaring bitmap posting lists over dense document handles
 * - External string ids mapped to recycled 32-bit handles
 * - Configurable BM25 parameters (k1, b)
 * - The same tokenizer runs at index time and query time
 *
 * Results are ordered by score descending, ties by id ascending.
 *
 * Thread-safety: reads share a reader-writer lock; mutations are exclusive.
 * Memory: O(V + D*L) where V is vocabulary size, D is documents, L is avg doc length.
 */

#include <cstdint>
#include <expected>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "quiver/error.hpp"

namespace quiver::io {
class BinaryWriter;
class BinaryReader;
}

namespace quiver::index {

/** \brief BM25 scoring parameters. */
struct BM25Params {
    float k1{1.2f};              /**< Term frequency saturation parameter (typically 1.2-2.0) */
    float b{0.75f};              /**< Length normalization parameter (0.0-1.0) */
    bool lowercase{true};        /**< Convert terms to lowercase */
    bool remove_stopwords{true}; /**< Remove common stopwords */
    std::uint32_t min_term_length{2}; /**< Minimum term length to index */
    std::uint32_t max_term_length{50}; /**< Maximum term length to index */
};

/** \brief BM25 index statistics. */
struct BM25Stats {
    std::size_t num_documents{0};      /**< Total documents indexed */
    std::size_t vocabulary_size{0};    /**< Terms with at least one posting */
    std::size_t total_tokens{0};       /**< Total tokens over live documents */
    float avg_doc_length{0.0f};        /**< Average document length */
};

/** \brief One lexical match. */
struct LexicalHit {
    std::string id;
    float score{0.0f};
};

/** \brief Tokenizer for text processing.
 *
 * Splits on whitespace and ASCII punctuation; bytes >= 0x80 are kept inside
 * tokens so UTF-8 words survive intact.
 */
class Tokenizer {
public:
    /** \brief Tokenization options. */
    struct Options {
        bool lowercase{true};
        bool remove_stopwords{true};
        bool remove_punctuation{true};
        std::uint32_t min_length{2};
        std::uint32_t max_length{50};
    };

    static auto tokenize(std::string_view text, const Options& options)
        -> std::vector<std::string>;
    static auto tokenize(std::string_view text) -> std::vector<std::string> {
        return tokenize(text, Options{});
    }

    static auto is_stopword(std::string_view word) -> bool;
};

/** \brief BM25 inverted index keyed by external string ids.
 *
 * Example usage:
 * ```cpp
 * BM25Index index;
 * index.init(BM25Params{});
 * index.insert("doc1", "the quick brown fox");
 * index.insert("doc2", "lazy dog sleeps");
 * auto hits = index.search("quick fox", 10);
 * ```
 */
class BM25Index {
public:
    BM25Index();
    ~BM25Index();
    BM25Index(BM25Index&&) noexcept;
    BM25Index& operator=(BM25Index&&) noexcept;
    BM25Index(const BM25Index&) = delete;
    BM25Index& operator=(const BM25Index&) = delete;

    /** \brief Initialize index with parameters.
     *
     * Preconditions: k1 > 0; 0 <= b <= 1; min_term_length <= max_term_length
     */
    auto init(const BM25Params& params) -> std::expected<void, core::error>;

    /** \brief Index `text` under `id`, replacing any previous text for that id. */
    auto insert(std::string_view id, std::string_view text) -> std::expected<void, core::error>;

    /** \brief Drop `id`; absent ids are a no-op. Returns true if removed. */
    auto remove(std::string_view id) -> bool;

    /** \brief Top-k documents for `query`, score descending, ties by id.
     *
     * A query with no indexed terms yields an empty result.
     */
    auto search(std::string_view query, std::size_t k) const
        -> std::expected<std::vector<LexicalHit>, core::error>;

    auto contains(std::string_view id) const -> bool;
    auto size() const -> std::size_t;
    auto ids() const -> std::vector<std::string>;
    auto get_stats() const -> BM25Stats;
    auto is_initialized() const noexcept -> bool;
    auto clear() -> void;

    auto save(io::BinaryWriter& out) const -> void;
    static auto load(io::BinaryReader& in) -> std::expected<BM25Index, core::error>;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace quiver::index
