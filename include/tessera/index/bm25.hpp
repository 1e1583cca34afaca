#pragma once

/** \file bm25.hpp
 *  \brief BM25 inverted index for keyword search over declared text fields.
 *
 * BM25 (Best Matching 25) is a probabilistic relevance ranking function
 * used for information retrieval. This implementation provides:
 * - One inverted index per declared text field, with Roaring bitmap posting lists
 * - Smoothed IDF: ln(1 + (N - df + 0.5) / (df + 0.5)), never negative
 * - Allow-bitmap filtering applied to posting lists before scoring
 * - Documents matching no query term are excluded, never scored as zero
 *
 * Thread-safety: inserts, removes and searches may run concurrently. Posting updates for a term
 * are serialized by a per-term stripe lock; corpus statistics (N, average length) are atomics
 * and may lag a concurrent write by one document. Writes for the same handle must be serialized
 * by the caller.
 * Memory: O(V + D*L) where V is vocabulary size, D is documents, L is avg distinct terms.
 */

#include <cstdint>
#include <expected>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <roaring/roaring.hh>

#include "tessera/error.hpp"
#include "tessera/index/tokenizer.hpp"

namespace tessera::index {

/** \brief BM25 scoring parameters. */
struct BM25Params {
    float k1{1.2f};              /**< Term frequency saturation parameter (typically 1.2-2.0) */
    float b{0.75f};              /**< Length normalization parameter (0.0-1.0) */
};

/** \brief BM25 index statistics. */
struct BM25Stats {
    std::size_t num_documents{0};      /**< Total documents indexed */
    std::size_t vocabulary_size{0};    /**< Terms with at least one live posting */
    std::size_t total_tokens{0};       /**< Total tokens processed */
    float avg_doc_length{0.0f};        /**< Average document length */
};

/** \brief One lexical hit: handle plus BM25 score. */
struct LexicalHit {
    std::uint32_t handle{0};
    float score{0.0f};
};

/** \brief Inverted index for a single text field. */
class Bm25FieldIndex {
public:
    Bm25FieldIndex();
    ~Bm25FieldIndex();
    Bm25FieldIndex(Bm25FieldIndex&&) noexcept;
    Bm25FieldIndex& operator=(Bm25FieldIndex&&) noexcept;
    Bm25FieldIndex(const Bm25FieldIndex&) = delete;
    Bm25FieldIndex& operator=(const Bm25FieldIndex&) = delete;

    /** \brief Initialize index with parameters.
     *
     * Preconditions: k1 > 0; 0 <= b <= 1
     */
    auto init(const BM25Params& params, const TokenizerOptions& tokenizer = {})
        -> std::expected<void, core::error>;

    /** \brief Index (or re-index) a document's text, replacing prior contributions. */
    auto add_document(std::uint32_t handle, std::string_view text)
        -> std::expected<void, core::error>;

    /** \brief Remove a document's postings. Returns false if it was not indexed. */
    auto remove_document(std::uint32_t handle) -> bool;

    /** \brief Accumulate BM25 scores for the given query terms into \p scores.
     *
     * Only documents containing at least one term (and present in \p allow when given) are
     * touched.
     */
    auto accumulate(const std::vector<std::pair<std::string, std::uint32_t>>& query_terms,
                    const roaring::Roaring* allow,
                    std::unordered_map<std::uint32_t, float>& scores) const -> void;

    /** \brief Top-k search for a raw query string. Ties broken by handle. */
    auto search(std::string_view query, std::uint32_t k,
                const roaring::Roaring* allow = nullptr) const
        -> std::expected<std::vector<LexicalHit>, core::error>;

    /** \brief Number of live documents whose text contains the (normalized) term. */
    auto document_frequency(std::string_view term) const -> std::size_t;

    /** \brief Smoothed IDF of a term under current statistics. */
    auto idf(std::string_view term) const -> float;

    auto contains(std::uint32_t handle) const -> bool;
    auto get_stats() const noexcept -> BM25Stats;
    auto is_initialized() const noexcept -> bool;
    auto size() const noexcept -> std::size_t;
    auto clear() -> void;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

/** \brief BM25 over all declared text fields of a collection.
 *
 * Field scores are summed per document. Every inserted handle is tracked even when all its
 * fields tokenize to nothing, so reconciliation can compare membership against the store.
 */
class LexicalIndex {
public:
    LexicalIndex();
    ~LexicalIndex();
    LexicalIndex(LexicalIndex&&) noexcept;
    LexicalIndex& operator=(LexicalIndex&&) noexcept;
    LexicalIndex(const LexicalIndex&) = delete;
    LexicalIndex& operator=(const LexicalIndex&) = delete;

    auto init(std::vector<std::string> fields, const BM25Params& params,
              const TokenizerOptions& tokenizer = {})
        -> std::expected<void, core::error>;

    /** \brief Index a document; declared fields missing from \p texts are indexed as empty. */
    auto insert(std::uint32_t handle, const std::map<std::string, std::string>& texts)
        -> std::expected<void, core::error>;

    /** \brief Remove a document from every field. Returns false if it was not indexed. */
    auto remove(std::uint32_t handle) -> bool;

    /** \brief Top-k BM25 search.
     *
     * \param fields Fields to search; empty means every declared field
     * Errors: invalid_query on k == 0, schema_mismatch on an undeclared field.
     * Empty or all-separator queries return an empty result.
     */
    auto search(std::string_view query, std::uint32_t k,
                const std::vector<std::string>& fields = {},
                const roaring::Roaring* allow = nullptr) const
        -> std::expected<std::vector<LexicalHit>, core::error>;

    auto contains(std::uint32_t handle) const -> bool;
    auto live_handles() const -> roaring::Roaring;
    auto fields() const -> const std::vector<std::string>&;
    auto field_stats(std::string_view field) const -> std::expected<BM25Stats, core::error>;
    auto tokenizer_options() const noexcept -> const TokenizerOptions&;
    auto size() const -> std::size_t;
    auto clear() -> void;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace tessera::index
