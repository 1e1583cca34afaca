#include "tessera/collection/collection.hpp"

#include <array>
#include <condition_variable>
#include <mutex>
#include <shared_mutex>
#include <thread>

#include <spdlog/spdlog.h>

#include "tessera/collection/index_applier.hpp"
#include "tessera/core/platform_utils.hpp"

namespace tessera::collection {

namespace {

constexpr std::size_t kIdStripes = 64;

} // namespace

auto to_string(CollectionState state) noexcept -> std::string_view {
    switch (state) {
        case CollectionState::Creating: return "creating";
        case CollectionState::Ready: return "ready";
        case CollectionState::Dropping: return "dropping";
        case CollectionState::Gone: return "gone";
    }
    return "unknown";
}

auto to_string(ApplyMode mode) noexcept -> std::string_view {
    return mode == ApplyMode::Sync ? "sync" : "async";
}

auto parse_apply_mode(std::string_view text) -> std::expected<ApplyMode, core::error> {
    if (core::iequals(text, "sync")) return ApplyMode::Sync;
    if (core::iequals(text, "async")) return ApplyMode::Async;
    return core::fail(core::error_code::precondition_failed,
                      "apply mode must be 'sync' or 'async', got '" + std::string(text) + "'", "config");
}

class Collection::Impl {
public:
    Impl(CollectionSchema schema, CollectionOptions options)
        : schema_(std::move(schema)), options_(std::move(options)), engine_(options_.hybrid) {}

    ~Impl() { shutdown(); }

    auto open() -> std::expected<void, core::error>;
    auto upsert(Document doc, const WriteOptions& wo) -> std::expected<UpsertOutcome, core::error>;
    auto remove(const DocumentId& id, const WriteOptions& wo) -> std::expected<bool, core::error>;
    auto compact(std::stop_token stop) -> std::expected<CompactionReport, core::error>;
    auto reconcile() -> std::expected<ReconcileReport, core::error>;
    auto rebuild_indexes() -> std::expected<void, core::error>;
    auto drop(bool remove_files) -> void;
    auto shutdown() -> void;

    auto ensure_ready() const -> std::expected<void, core::error> {
        if (state_.load(std::memory_order_acquire) == CollectionState::Ready) return {};
        return core::fail(core::error_code::not_found,
                          "collection '" + schema_.name + "' is " +
                              std::string(to_string(state_.load(std::memory_order_acquire))),
                          "collection");
    }

    auto sources() const -> search::SearchSources { return {store_, vectors_, lexical_}; }

    auto stripe(const DocumentId& id) -> std::mutex& {
        return id_locks_[DocumentIdHash{}(id) % kIdStripes];
    }

    auto wal_path() const -> std::filesystem::path {
        if (options_.data_dir.empty()) return {};
        return options_.data_dir / (schema_.name + ".wal");
    }

    // Caller holds the id stripe.
    auto apply_upsert_locked(store::Handle handle, std::uint64_t version, const std::vector<float>& vec,
                             const std::map<std::string, std::string>& texts)
        -> std::expected<void, core::error>;
    auto apply_remove(store::Handle handle) -> std::expected<void, core::error>;
    auto check_replayed(const store::DocumentStore& store) const -> std::expected<void, core::error>;
    auto index_all_locked() -> std::expected<void, core::error>;
    auto maintenance_loop(std::stop_token stop) -> void;
    auto run_maintenance(std::stop_token stop) -> void;

    CollectionSchema schema_;
    CollectionOptions options_;
    std::atomic<CollectionState> state_{CollectionState::Creating};

    store::DocumentStore store_;
    index::HnswIndex vectors_;
    index::LexicalIndex lexical_;
    search::HybridQueryEngine engine_;

    // Shared by searches and index updates; exclusive only while rebuilding.
    mutable std::shared_mutex indexes_mutex_;
    std::array<std::mutex, kIdStripes> id_locks_;
    std::mutex maintenance_mutex_;
    std::mutex lifecycle_mutex_;

    std::unique_ptr<IndexApplier> applier_;
    std::mutex wake_mutex_;
    std::condition_variable_any wake_cv_;
    std::jthread maintenance_;

    std::atomic<std::size_t> compactions_{0};
    std::atomic<std::size_t> reconciliations_{0};
};

auto Collection::Impl::open() -> std::expected<void, core::error> {
    if (state_.load() != CollectionState::Creating) {
        return core::fail(core::error_code::precondition_failed,
                          "collection '" + schema_.name + "' is already open", "collection");
    }
    if (auto v = validate_schema(schema_); !v) return v;

    store::StoreOptions so;
    so.wal_path = wal_path();
    so.fsync_on_write = options_.fsync_on_write;
    auto opened = store::DocumentStore::open(so);
    if (!opened) return std::unexpected(opened.error());
    if (auto r = check_replayed(*opened); !r) return r;

    const index::DistanceMetric metric(schema_.metric);
    if (auto r = vectors_.init(static_cast<std::size_t>(schema_.dimension), metric, options_.hnsw); !r) return r;
    if (auto r = lexical_.init(schema_.text_field_names(), options_.bm25, options_.tokenizer); !r) return r;
    store_ = std::move(*opened);

    applier_ = std::make_unique<IndexApplier>("collection." + schema_.name);
    {
        std::unique_lock lock(indexes_mutex_);
        if (auto r = index_all_locked(); !r) {
            // Documents that could not be indexed stay in the store; maintenance retries them.
            applier_->mark_needs_reconcile();
            spdlog::warn("collection '{}': initial indexing incomplete: {}", schema_.name,
                         core::describe(r.error()));
        }
    }

    if (options_.maintenance.enabled) {
        maintenance_ = std::jthread([this](std::stop_token stop) { maintenance_loop(stop); });
    }

    state_.store(CollectionState::Ready, std::memory_order_release);
    spdlog::info("collection '{}' ready: {} documents, dim={}, metric={}, apply={}",
                 schema_.name, store_.size(), schema_.dimension, index::to_string(schema_.metric),
                 to_string(options_.apply_mode));
    return {};
}

// A log written under another schema is rejected whole; nothing is indexed from it.
auto Collection::Impl::check_replayed(const store::DocumentStore& store) const -> std::expected<void, core::error> {
    auto cursor = store.scan();
    while (auto sd = cursor.next()) {
        if (auto v = validate_document(schema_, sd->document); !v) {
            return core::fail(core::error_code::schema_mismatch,
                              "log " + wal_path().string() + " does not match the schema of '" + schema_.name +
                                  "': document " + tessera::to_string(sd->document.id) + ": " + v.error().message,
                              "collection");
        }
    }
    return {};
}

auto Collection::Impl::apply_upsert_locked(store::Handle handle, std::uint64_t version,
                                           const std::vector<float>& vec,
                                           const std::map<std::string, std::string>& texts)
    -> std::expected<void, core::error> {
    std::shared_lock lock(indexes_mutex_);
    auto current = store_.get_by_handle(handle);
    // Superseded by a newer write to the same id, which carries its own update.
    if (!current || current->version != version) return {};
    if (auto r = vectors_.insert(handle, vec); !r) return r;
    return lexical_.insert(handle, texts);
}

auto Collection::Impl::apply_remove(store::Handle handle) -> std::expected<void, core::error> {
    std::shared_lock lock(indexes_mutex_);
    vectors_.remove(handle);
    lexical_.remove(handle);
    return {};
}

auto Collection::Impl::index_all_locked() -> std::expected<void, core::error> {
    std::optional<core::error> first_error;
    std::size_t failed = 0;
    auto cursor = store_.scan();
    while (auto sd = cursor.next()) {
        auto texts = validate_document(schema_, sd->document);
        std::expected<void, core::error> r = texts ? vectors_.insert(sd->handle, sd->document.vector)
                                                   : std::expected<void, core::error>(std::unexpected(texts.error()));
        if (r) r = lexical_.insert(sd->handle, *texts);
        if (!r) {
            ++failed;
            if (!first_error) first_error = r.error();
        }
    }
    if (first_error) {
        return core::fail(core::error_code::internal,
                          std::to_string(failed) + " documents failed to index; first: " +
                              core::describe(*first_error),
                          "collection");
    }
    return {};
}

auto Collection::Impl::upsert(Document doc, const WriteOptions& wo)
    -> std::expected<UpsertOutcome, core::error> {
    if (auto r = ensure_ready(); !r) return std::unexpected(r.error());
    auto texts = validate_document(schema_, doc);
    if (!texts) return std::unexpected(texts.error());

    const bool synchronous = wo.synchronous.value_or(options_.apply_mode == ApplyMode::Sync);
    const DocumentId id = doc.id;
    std::vector<float> vec = doc.vector;

    std::unique_lock id_lock(stripe(id));
    auto written = store_.upsert(std::move(doc));
    if (!written) return std::unexpected(written.error());

    UpsertOutcome outcome{!written->previous.has_value(), written->version};
    const auto handle = written->handle;
    const auto version = written->version;

    if (synchronous) {
        auto r = applier_->run([&] { return apply_upsert_locked(handle, version, vec, *texts); });
        if (!r) {
            return core::fail(core::error_code::internal,
                              "document " + tessera::to_string(id) + " stored but not indexed: " + r.error().message,
                              "collection");
        }
        return outcome;
    }

    const bool queued = applier_->submit(
        [this, id, handle, version, vec = std::move(vec), texts = std::move(*texts)]() {
            std::lock_guard lock(stripe(id));
            return apply_upsert_locked(handle, version, vec, texts);
        });
    if (!queued) applier_->mark_needs_reconcile();
    return outcome;
}

auto Collection::Impl::remove(const DocumentId& id, const WriteOptions& wo) -> std::expected<bool, core::error> {
    if (auto r = ensure_ready(); !r) return std::unexpected(r.error());
    if (auto v = validate_id(id); !v) return std::unexpected(v.error());

    const bool synchronous = wo.synchronous.value_or(options_.apply_mode == ApplyMode::Sync);
    std::unique_lock id_lock(stripe(id));
    auto removed = store_.remove(id);
    if (!removed) return std::unexpected(removed.error());
    if (!removed->removed) return false;

    const auto handle = removed->handle;
    if (synchronous) {
        if (auto r = applier_->run([&] { return apply_remove(handle); }); !r) {
            return core::fail(core::error_code::internal,
                              "document " + tessera::to_string(id) + " removed but index cleanup failed: " + r.error().message,
                              "collection");
        }
    } else if (!applier_->submit([this, handle] { return apply_remove(handle); })) {
        applier_->mark_needs_reconcile();
    }
    return true;
}

auto Collection::Impl::compact(std::stop_token stop) -> std::expected<CompactionReport, core::error> {
    std::lock_guard guard(maintenance_mutex_);
    CompactionReport report;
    {
        std::shared_lock lock(indexes_mutex_);
        report.vectors = vectors_.compact(stop);
    }
    if (report.vectors.interrupted) {
        return core::fail(core::error_code::cancelled, "compaction interrupted", "collection");
    }
    if (!wal_path().empty()) {
        if (auto r = store_.compact_log(); !r) return std::unexpected(r.error());
        report.log_compacted = true;
    }
    compactions_.fetch_add(1, std::memory_order_relaxed);
    spdlog::info("collection '{}' compacted: {} tombstones, {} lists repaired, {} slots reclaimed",
                 schema_.name, report.vectors.tombstones_seen, report.vectors.repaired_lists,
                 report.vectors.reclaimed);
    return report;
}

auto Collection::Impl::reconcile() -> std::expected<ReconcileReport, core::error> {
    std::lock_guard guard(maintenance_mutex_);
    // Failures that happen while this pass runs re-arm the flag.
    applier_->clear_needs_reconcile();

    ReconcileReport report;
    const auto live = store_.live_handles();
    roaring::Roaring in_vectors;
    roaring::Roaring in_lexical;
    {
        std::shared_lock lock(indexes_mutex_);
        in_vectors = vectors_.live_handles();
        in_lexical = lexical_.live_handles();
    }

    // Handles are never reused, so an indexed handle the store no longer holds is garbage.
    const auto extra_vectors = in_vectors - live;
    const auto extra_lexical = in_lexical - live;
    {
        std::shared_lock lock(indexes_mutex_);
        for (const auto handle : extra_vectors) {
            if (!store_.is_live(handle) && vectors_.remove(handle)) ++report.vector_extra;
        }
        for (const auto handle : extra_lexical) {
            if (!store_.is_live(handle) && lexical_.remove(handle)) ++report.lexical_extra;
        }
    }

    const auto missing = (live - in_vectors) | (live - in_lexical);
    for (const auto handle : missing) {
        auto snapshot = store_.get_by_handle(handle);
        if (!snapshot) continue;
        std::lock_guard id_lock(stripe(snapshot->document.id));
        auto current = store_.get_by_handle(handle);
        if (!current) continue;

        auto texts = validate_document(schema_, current->document);
        if (!texts) {
            ++report.repair_failures;
            spdlog::error("collection '{}': cannot reindex {}: {}", schema_.name,
                          tessera::to_string(current->document.id), core::describe(texts.error()));
            continue;
        }
        std::shared_lock lock(indexes_mutex_);
        if (!vectors_.contains(handle)) {
            if (auto r = vectors_.insert(handle, current->document.vector); r) {
                ++report.vector_missing;
            } else {
                ++report.repair_failures;
                spdlog::error("collection '{}': vector reindex of {} failed: {}", schema_.name,
                              tessera::to_string(current->document.id), core::describe(r.error()));
            }
        }
        if (!lexical_.contains(handle)) {
            if (auto r = lexical_.insert(handle, *texts); r) {
                ++report.lexical_missing;
            } else {
                ++report.repair_failures;
                spdlog::error("collection '{}': lexical reindex of {} failed: {}", schema_.name,
                              tessera::to_string(current->document.id), core::describe(r.error()));
            }
        }
    }

    if (report.repair_failures > 0) applier_->mark_needs_reconcile();
    reconciliations_.fetch_add(1, std::memory_order_relaxed);
    spdlog::info("collection '{}' reconciled: vectors +{} -{}, lexical +{} -{}, {} failures", schema_.name,
                 report.vector_missing, report.vector_extra, report.lexical_missing, report.lexical_extra,
                 report.repair_failures);
    return report;
}

auto Collection::Impl::rebuild_indexes() -> std::expected<void, core::error> {
    std::lock_guard guard(maintenance_mutex_);
    applier_->wait_idle();
    std::unique_lock lock(indexes_mutex_);
    vectors_.clear();
    lexical_.clear();
    applier_->clear_needs_reconcile();
    auto r = index_all_locked();
    if (!r) {
        applier_->mark_needs_reconcile();
        return r;
    }
    spdlog::info("collection '{}': indexes rebuilt from {} documents", schema_.name, store_.size());
    return {};
}

auto Collection::Impl::maintenance_loop(std::stop_token stop) -> void {
    while (!stop.stop_requested()) {
        {
            std::unique_lock lock(wake_mutex_);
            wake_cv_.wait_for(lock, stop, options_.maintenance.interval, [] { return false; });
        }
        if (stop.stop_requested()) break;
        run_maintenance(stop);
    }
}

auto Collection::Impl::run_maintenance(std::stop_token stop) -> void {
    if (state_.load(std::memory_order_acquire) != CollectionState::Ready) return;
    const auto& cfg = options_.maintenance;

    if (applier_->needs_reconcile()) {
        if (auto r = reconcile(); !r) {
            spdlog::error("collection '{}': reconcile failed: {}", schema_.name, core::describe(r.error()));
        }
    }

    const auto tombstones = vectors_.tombstone_count();
    const auto total = tombstones + vectors_.size();
    if (tombstones > 0 && tombstones >= cfg.min_tombstones &&
        static_cast<double>(tombstones) >= static_cast<double>(cfg.tombstone_ratio) * static_cast<double>(total)) {
        std::lock_guard guard(maintenance_mutex_);
        std::shared_lock lock(indexes_mutex_);
        const auto s = vectors_.compact(stop);
        if (s.interrupted) return;
        compactions_.fetch_add(1, std::memory_order_relaxed);
        spdlog::debug("collection '{}': background compaction reclaimed {} of {} tombstones", schema_.name,
                      s.reclaimed, s.tombstones_seen);
    }

    if (!wal_path().empty() && store_.stats().wal_bytes >= cfg.log_compaction_bytes) {
        std::lock_guard guard(maintenance_mutex_);
        if (auto r = store_.compact_log(); !r) {
            spdlog::warn("collection '{}': log compaction failed: {}", schema_.name, core::describe(r.error()));
        }
    }
}

auto Collection::Impl::drop(bool remove_files) -> void {
    std::lock_guard guard(lifecycle_mutex_);
    const auto state = state_.load();
    if (state == CollectionState::Dropping || state == CollectionState::Gone) return;
    state_.store(CollectionState::Dropping, std::memory_order_release);

    if (maintenance_.joinable()) {
        maintenance_.request_stop();
        maintenance_.join();
    }
    if (applier_) applier_->stop(false);

    if (remove_files) {
        if (const auto path = wal_path(); !path.empty()) {
            std::error_code ec;
            std::filesystem::remove(path, ec);
            if (ec) spdlog::warn("collection '{}': cannot remove {}: {}", schema_.name, path.string(), ec.message());
            auto tmp = path;
            tmp += ".compact";
            std::filesystem::remove(tmp, ec);
        }
    }
    state_.store(CollectionState::Gone, std::memory_order_release);
    spdlog::info("collection '{}' dropped", schema_.name);
}

auto Collection::Impl::shutdown() -> void {
    std::lock_guard guard(lifecycle_mutex_);
    if (state_.load() == CollectionState::Gone) return;
    if (maintenance_.joinable()) {
        maintenance_.request_stop();
        maintenance_.join();
    }
    if (applier_) applier_->stop(true);
    if (auto r = store_.flush(true); !r) {
        spdlog::error("collection '{}': final flush failed: {}", schema_.name, core::describe(r.error()));
    }
    state_.store(CollectionState::Gone, std::memory_order_release);
}

Collection::Collection(CollectionSchema schema, CollectionOptions options)
    : impl_(std::make_unique<Impl>(std::move(schema), std::move(options))) {}

Collection::~Collection() = default;

auto Collection::open() -> std::expected<void, core::error> { return impl_->open(); }

auto Collection::name() const noexcept -> const std::string& { return impl_->schema_.name; }
auto Collection::schema() const noexcept -> const CollectionSchema& { return impl_->schema_; }
auto Collection::options() const noexcept -> const CollectionOptions& { return impl_->options_; }
auto Collection::state() const noexcept -> CollectionState {
    return impl_->state_.load(std::memory_order_acquire);
}

auto Collection::upsert(Document doc, const WriteOptions& options) -> std::expected<UpsertOutcome, core::error> {
    return impl_->upsert(std::move(doc), options);
}

auto Collection::remove(const DocumentId& id, const WriteOptions& options) -> std::expected<bool, core::error> {
    return impl_->remove(id, options);
}

auto Collection::get(const DocumentId& id) const -> std::expected<Document, core::error> {
    if (auto r = impl_->ensure_ready(); !r) return std::unexpected(r.error());
    return impl_->store_.get(id);
}

auto Collection::search(const search::Query& query) const -> std::expected<search::SearchResponse, core::error> {
    if (auto r = impl_->ensure_ready(); !r) return std::unexpected(r.error());
    std::shared_lock lock(impl_->indexes_mutex_);
    return impl_->engine_.search(impl_->sources(), query);
}

auto Collection::search_batch(std::span<const search::Query> queries) const
    -> std::expected<std::vector<search::SearchResponse>, core::error> {
    if (auto r = impl_->ensure_ready(); !r) return std::unexpected(r.error());
    std::shared_lock lock(impl_->indexes_mutex_);
    return impl_->engine_.search_batch(impl_->sources(), queries);
}

auto Collection::explain(const search::Query& query, const DocumentId& id) const
    -> std::expected<search::Explanation, core::error> {
    if (auto r = impl_->ensure_ready(); !r) return std::unexpected(r.error());
    std::shared_lock lock(impl_->indexes_mutex_);
    return impl_->engine_.explain(impl_->sources(), query, id);
}

auto Collection::flush(bool sync) -> std::expected<void, core::error> {
    if (auto r = impl_->ensure_ready(); !r) return r;
    impl_->applier_->wait_idle();
    return impl_->store_.flush(sync);
}

auto Collection::compact(std::stop_token stop) -> std::expected<CompactionReport, core::error> {
    if (auto r = impl_->ensure_ready(); !r) return std::unexpected(r.error());
    return impl_->compact(stop);
}

auto Collection::reconcile() -> std::expected<ReconcileReport, core::error> {
    if (auto r = impl_->ensure_ready(); !r) return std::unexpected(r.error());
    return impl_->reconcile();
}

auto Collection::rebuild_indexes() -> std::expected<void, core::error> {
    if (auto r = impl_->ensure_ready(); !r) return r;
    return impl_->rebuild_indexes();
}

auto Collection::stats() const -> CollectionStats {
    CollectionStats s;
    s.name = impl_->schema_.name;
    s.state = state();
    s.store = impl_->store_.stats();
    s.documents = s.store.live_documents;
    {
        std::shared_lock lock(impl_->indexes_mutex_);
        s.vector_live = impl_->vectors_.size();
        s.vector_tombstones = impl_->vectors_.tombstone_count();
        s.lexical_documents = impl_->lexical_.size();
        for (const auto& field : impl_->lexical_.fields()) {
            if (auto fs = impl_->lexical_.field_stats(field)) s.lexical_terms += fs->vocabulary_size;
        }
    }
    if (impl_->applier_) {
        s.pending_updates = impl_->applier_->pending();
        s.apply_failures = impl_->applier_->failures();
        s.needs_reconcile = impl_->applier_->needs_reconcile();
    }
    s.compactions = impl_->compactions_.load(std::memory_order_relaxed);
    s.reconciliations = impl_->reconciliations_.load(std::memory_order_relaxed);
    return s;
}

auto Collection::drop(bool remove_files) -> void { impl_->drop(remove_files); }

} // namespace tessera::collection
