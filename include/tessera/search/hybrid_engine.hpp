#pragma once

/** \file hybrid_engine.hpp
 *  \brief Hybrid search combining lexical (BM25) and dense vector search.
 *
 * Both sources run in parallel over an oversampled candidate pool (top_k * candidate_factor)
 * and are merged with Reciprocal Rank Fusion. A query with only one of vector/text skips fusion
 * and returns that source's native scores.
 *
 * Filters are compiled once to a bitmap of store handles and pushed into both indexes. When the
 * vector index returns fewer candidates than the filter admits, the pool is backfilled by an
 * exact scan over the admitted documents. Every hit is re-checked against the store before it is
 * returned, so deletes are visible even while index cleanup is pending.
 *
 * A source that fails degrades the query to the other source and adds a warning; the query fails
 * only when every requested source fails.
 *
 * Thread-safety: all search operations are thread-safe.
 */

#include <cstdint>
#include <expected>
#include <functional>
#include <optional>
#include <span>
#include <stop_token>
#include <string>
#include <vector>

#include "tessera/document.hpp"
#include "tessera/error.hpp"
#include "tessera/filter_expr.hpp"
#include "tessera/index/bm25.hpp"
#include "tessera/index/hnsw.hpp"
#include "tessera/store/document_store.hpp"

namespace tessera::search {

/** \brief Hybrid query combining text and an embedding. */
struct Query {
    std::optional<std::vector<float>> vector;   /**< Query embedding for vector search */
    std::optional<std::string> text;            /**< Text query for lexical search */
    std::int64_t top_k{10};                     /**< Number of results; must be > 0 */
    std::optional<filter_expr> filter;          /**< Payload predicate */
    std::vector<std::string> text_fields;       /**< Fields to search; empty = all declared */
    bool with_payload{true};                    /**< Hydrate payloads */
    bool with_vector{false};                    /**< Hydrate vectors */
    std::stop_token stop{};                     /**< Abandon the query */
};

/** \brief Hybrid search configuration. */
struct HybridConfig {
    float rrf_k{60.0f};                 /**< RRF k parameter */
    std::uint32_t candidate_factor{10}; /**< Oversample factor per source */
    std::uint32_t ef_search{100};       /**< HNSW beam width (raised to the pool size) */
    bool exact_backfill{true};          /**< Top up short vector pools by exact scan */
};

/** \brief One ranked hit. */
struct Hit {
    DocumentId id;
    float score{0.0f};                  /**< fused score, or native score for a single source */
    std::optional<float> vector_score;
    std::optional<float> text_score;
    std::uint32_t vector_rank{0};       /**< 1-based; 0 if absent */
    std::uint32_t text_rank{0};
    Payload payload;
    std::vector<float> vector;
};

struct SearchResponse {
    std::vector<Hit> hits;
    std::vector<std::string> warnings;  /**< degraded sources */
};

/** \brief Score breakdown for one document within a query's candidate pools. */
struct Explanation {
    DocumentId id;
    bool matched_filter{true};
    std::optional<float> vector_score;
    std::optional<float> text_score;
    std::uint32_t vector_rank{0};
    std::uint32_t text_rank{0};
    float fused_score{0.0f};
};

/** \brief Retrieval sources of a hybrid query. */
enum class Source : std::uint8_t { vector, text };

/** \brief Admission check run before a source retrieves; an error fails that source only.
 *
 * Lets a caller shed one source (quota, circuit breaker) while the other still answers.
 */
using SourceGate = std::function<std::expected<void, core::error>(Source)>;

/** \brief The three structures a query runs against. */
struct SearchSources {
    const store::DocumentStore& store;
    const index::HnswIndex& vectors;
    const index::LexicalIndex& lexical;
};

class HybridQueryEngine {
public:
    explicit HybridQueryEngine(HybridConfig config = {}, SourceGate gate = {})
        : config_(config), gate_(std::move(gate)) {}

    /** \brief Search with hybrid query.
     *
     * Errors: invalid_query (no vector and no text, top_k <= 0, malformed filter),
     * schema_mismatch (vector length, undeclared text field), cancelled, or the source error
     * when every requested source fails.
     */
    auto search(const SearchSources& sources, const Query& query) const
        -> std::expected<SearchResponse, core::error>;

    /** \brief Run several queries in order against the same sources.
     *
     * Errors: the first failing query's error, its message prefixed with the query's position.
     */
    auto search_batch(const SearchSources& sources, std::span<const Query> queries) const
        -> std::expected<std::vector<SearchResponse>, core::error>;

    /** \brief Explain how one document scores for a query. Errors: not_found if not live. */
    auto explain(const SearchSources& sources, const Query& query, const DocumentId& id) const
        -> std::expected<Explanation, core::error>;

    auto config() const noexcept -> const HybridConfig& { return config_; }

private:
    HybridConfig config_;
    SourceGate gate_;
};

} // namespace tessera::search
