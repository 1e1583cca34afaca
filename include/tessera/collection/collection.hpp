#pragma once

/** \file collection.hpp
 *  \brief A named collection: document store, vector index and lexical index kept in step.
 *
 * The store is authoritative. Writes land in the store first and are then applied to both
 * indexes, either inline (Sync) or by a background applier (Async). Writes to the same id are
 * serialized through striped locks; index application re-checks the store version so a stale
 * update never overwrites a newer one. Searches re-check the store, which makes deletes visible
 * immediately in either mode.
 *
 * A maintenance thread compacts the vector index once tombstones pass a ratio, rewrites the log
 * once it grows past a size, and reconciles the indexes after an index update failed.
 *
 * Thread-safety: all operations are thread-safe.
 */

#include <atomic>
#include <chrono>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <memory>
#include <optional>
#include <span>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

#include "tessera/collection/schema.hpp"
#include "tessera/document.hpp"
#include "tessera/error.hpp"
#include "tessera/index/bm25.hpp"
#include "tessera/index/hnsw.hpp"
#include "tessera/search/hybrid_engine.hpp"
#include "tessera/store/document_store.hpp"

namespace tessera::collection {

enum class CollectionState : std::uint8_t { Creating, Ready, Dropping, Gone };

auto to_string(CollectionState state) noexcept -> std::string_view;

/** \brief When index updates become visible relative to the write call. */
enum class ApplyMode : std::uint8_t {
    Sync,   /**< applied before the write returns */
    Async   /**< queued; durable in the store on return */
};

auto to_string(ApplyMode mode) noexcept -> std::string_view;

/** \brief Parse "sync" | "async" (case-insensitive). Errors: precondition_failed. */
auto parse_apply_mode(std::string_view text) -> std::expected<ApplyMode, core::error>;

/** \brief Background maintenance thresholds. */
struct MaintenanceConfig {
    bool enabled{true};
    std::chrono::milliseconds interval{1000};
    float tombstone_ratio{0.2f};            /**< compact when tombstones / (live + tombstones) >= ratio */
    std::size_t min_tombstones{64};         /**< ... and at least this many tombstones exist */
    std::uint64_t log_compaction_bytes{64ull << 20}; /**< rewrite the log past this many appended bytes */
};

/** \brief Per-collection runtime options. */
struct CollectionOptions {
    ApplyMode apply_mode{ApplyMode::Sync};
    std::filesystem::path data_dir;         /**< empty keeps the collection in memory */
    bool fsync_on_write{false};
    index::HnswBuildParams hnsw{};
    index::BM25Params bm25{};
    index::TokenizerOptions tokenizer{};
    search::HybridConfig hybrid{};
    MaintenanceConfig maintenance{};
};

/** \brief Per-write overrides. */
struct WriteOptions {
    std::optional<bool> synchronous;        /**< overrides the collection's apply mode */
};

struct UpsertOutcome {
    bool created{false};                    /**< false when an existing document was replaced */
    std::uint64_t version{0};
};

struct CompactionReport {
    index::HnswCompactionStats vectors;
    bool log_compacted{false};
};

/** \brief Differences found (and repaired) between the store and the indexes. */
struct ReconcileReport {
    std::size_t vector_missing{0};
    std::size_t vector_extra{0};
    std::size_t lexical_missing{0};
    std::size_t lexical_extra{0};
    std::size_t repair_failures{0};
};

struct CollectionStats {
    std::string name;
    CollectionState state{CollectionState::Creating};
    std::size_t documents{0};
    std::size_t vector_live{0};
    std::size_t vector_tombstones{0};
    std::size_t lexical_documents{0};
    std::size_t lexical_terms{0};           /**< vocabulary summed over text fields */
    std::size_t pending_updates{0};
    std::size_t apply_failures{0};
    bool needs_reconcile{false};
    std::size_t compactions{0};
    std::size_t reconciliations{0};
    store::StoreStats store{};
};

class Collection {
public:
    /** \brief Construct in the Creating state; open() makes it Ready. */
    Collection(CollectionSchema schema, CollectionOptions options);
    ~Collection();

    Collection(const Collection&) = delete;
    Collection& operator=(const Collection&) = delete;

    /** \brief Open the store (replaying its log), build both indexes, start background work. */
    auto open() -> std::expected<void, core::error>;

    auto name() const noexcept -> const std::string&;
    auto schema() const noexcept -> const CollectionSchema&;
    auto options() const noexcept -> const CollectionOptions&;
    auto state() const noexcept -> CollectionState;

    /** \brief Errors: not_found when not Ready, schema_mismatch, io_failed, internal when a
     *  synchronous index update fails (the document is stored and is reconciled later). */
    auto upsert(Document doc, const WriteOptions& options = {})
        -> std::expected<UpsertOutcome, core::error>;

    /** \brief Returns false when the id was not live. */
    auto remove(const DocumentId& id, const WriteOptions& options = {})
        -> std::expected<bool, core::error>;

    auto get(const DocumentId& id) const -> std::expected<Document, core::error>;

    auto search(const search::Query& query) const -> std::expected<search::SearchResponse, core::error>;

    /** \brief Several queries against one consistent view of the indexes. */
    auto search_batch(std::span<const search::Query> queries) const
        -> std::expected<std::vector<search::SearchResponse>, core::error>;

    auto explain(const search::Query& query, const DocumentId& id) const
        -> std::expected<search::Explanation, core::error>;

    /** \brief Wait for queued index updates and flush the log. */
    auto flush(bool sync = false) -> std::expected<void, core::error>;

    /** \brief Compact the vector index and rewrite the log now. */
    auto compact(std::stop_token stop = {}) -> std::expected<CompactionReport, core::error>;

    /** \brief Diff index membership against the store and repair both indexes. */
    auto reconcile() -> std::expected<ReconcileReport, core::error>;

    /** \brief Rebuild both indexes from the store. */
    auto rebuild_indexes() -> std::expected<void, core::error>;

    auto stats() const -> CollectionStats;

    /** \brief Ready -> Dropping -> Gone. Stops background work and, when remove_files, deletes
     *  the log. Idempotent. */
    auto drop(bool remove_files) -> void;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace tessera::collection
