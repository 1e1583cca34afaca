#pragma once

/** \file document_store.hpp
 *  \brief Authoritative document storage with write-ahead logging and Roaring bitmap filtering.
 *
 * Every live document occupies a slot addressed by a 32-bit handle. Handles are assigned once
 * and never reused: re-upserting a live id keeps its handle, while an id upserted after a delete
 * receives a fresh one. Indexes key their entries by handle, so a stale index entry can never
 * alias a newer document.
 *
 * A deleted slot keeps only its version, but it is not freed while the store is open, so the
 * slot table grows with every distinct id ever written. Filtering and live-handle queries walk
 * the live ids only; scans skip dead slots. compact_log() followed by a reopen renumbers the
 * live documents densely.
 *
 * When a WAL path is configured, each write is appended to the log before it becomes visible;
 * open() replays the log and truncates a torn tail.
 *
 * Thread-safety: all operations are thread-safe. Writes are totally ordered by the log.
 */

#include <cstdint>
#include <expected>
#include <filesystem>
#include <memory>
#include <optional>
#include <vector>

#include <roaring/roaring.hh>

#include "tessera/document.hpp"
#include "tessera/error.hpp"
#include "tessera/filter_expr.hpp"

namespace tessera::store {

using Handle = std::uint32_t;

/** \brief Store configuration. */
struct StoreOptions {
    std::filesystem::path wal_path;     /**< Empty keeps the store in memory only */
    bool fsync_on_write{false};         /**< fsync after every append */
};

/** \brief A document together with its slot. */
struct StoredDocument {
    Handle handle{0};
    std::uint64_t version{0};
    Document document;
};

/** \brief Outcome of an upsert: the slot written and the content it replaced. */
struct UpsertResult {
    Handle handle{0};
    std::optional<Document> previous;
    std::uint64_t version{0};
};

/** \brief Outcome of a delete. */
struct RemoveResult {
    bool removed{false};
    Handle handle{0};                   /**< valid when removed */
    std::uint64_t version{0};
};

/** \brief Store statistics. */
struct StoreStats {
    std::size_t live_documents{0};
    std::size_t slots{0};
    std::uint64_t version{0};
    std::size_t replayed_frames{0};     /**< frames applied by the last open() */
    std::uint64_t truncated_bytes{0};   /**< torn tail dropped by the last open() */
    std::uint64_t wal_bytes{0};         /**< bytes appended since open or last compaction */
};

class DocumentStore {
public:
    class Cursor;

    DocumentStore();
    ~DocumentStore();
    DocumentStore(DocumentStore&&) noexcept;
    DocumentStore& operator=(DocumentStore&&) noexcept;
    DocumentStore(const DocumentStore&) = delete;
    DocumentStore& operator=(const DocumentStore&) = delete;

    /** \brief Open a store, replaying the WAL when one exists at options.wal_path. */
    static auto open(const StoreOptions& options) -> std::expected<DocumentStore, core::error>;

    /** \brief Atomically replace the content stored for doc.id.
     *
     * Errors: schema_mismatch on an invalid id, io_failed when the log append fails.
     */
    auto upsert(Document doc) -> std::expected<UpsertResult, core::error>;

    /** \brief Errors: not_found when the id is not live. */
    auto get(const DocumentId& id) const -> std::expected<Document, core::error>;

    /** \brief Live document at a handle, if any. */
    auto get_by_handle(Handle handle) const -> std::optional<StoredDocument>;

    auto handle_of(const DocumentId& id) const -> std::optional<Handle>;
    auto contains(const DocumentId& id) const -> bool;
    auto is_live(Handle handle) const -> bool;

    /** \brief Delete a document; removed == false when the id was not live. */
    auto remove(const DocumentId& id) -> std::expected<RemoveResult, core::error>;

    /** \brief Lazy, restartable scan of live documents in handle order starting at from. */
    auto scan(Handle from = 0) const -> Cursor;

    auto live_handles() const -> roaring::Roaring;

    /** \brief Handles of live documents whose payload matches expr. Errors: invalid_query. */
    auto filter_handles(const filter_expr& expr) const -> std::expected<roaring::Roaring, core::error>;

    /** \brief Rewrite the log with the latest record per live id. */
    auto compact_log() -> std::expected<void, core::error>;

    /** \brief Flush the log; sync forces an fsync. */
    auto flush(bool sync = false) -> std::expected<void, core::error>;

    auto size() const -> std::size_t;
    auto version() const -> std::uint64_t;
    auto stats() const -> StoreStats;

private:
    class Impl;
    std::shared_ptr<Impl> impl_;
};

/** \brief Forward cursor over live documents.
 *
 * Each step re-enters the store under a shared lock, so concurrent writes are allowed; a
 * document written behind the cursor is not revisited. Holds the store alive.
 */
class DocumentStore::Cursor {
public:
    auto next() -> std::optional<StoredDocument>;
    /** \brief Restart from a handle (default: the beginning). */
    auto reset(Handle from = 0) -> void { position_ = from; }
    auto position() const noexcept -> std::uint64_t { return position_; }

private:
    friend class DocumentStore;
    Cursor(std::shared_ptr<const Impl> impl, Handle from) : impl_(std::move(impl)), position_(from) {}

    std::shared_ptr<const Impl> impl_;
    std::uint64_t position_{0};
};

} // namespace tessera::store
