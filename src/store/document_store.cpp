#include "tessera/store/document_store.hpp"

#include <limits>
#include <mutex>
#include <shared_mutex>
#include <unordered_map>

#include <spdlog/spdlog.h>

#include "tessera/filter_eval.hpp"
#include "tessera/store/record_codec.hpp"
#include "tessera/wal/io.hpp"

namespace tessera::store {

namespace {

struct Slot {
    std::optional<Document> doc;    // nullopt once deleted
    std::uint64_t version{0};
};

} // namespace

class DocumentStore::Impl {
public:
    StoreOptions options_;

    // Lock order: wal_mutex_ -> mutex_
    std::mutex wal_mutex_;
    wal::WalWriter writer_;
    std::uint64_t wal_bytes_{0};

    mutable std::shared_mutex mutex_;
    std::vector<Slot> slots_;
    std::unordered_map<DocumentId, Handle, DocumentIdHash> id_to_handle_;
    std::uint64_t version_{0};
    std::size_t replayed_frames_{0};
    std::uint64_t truncated_bytes_{0};

    auto apply_upsert(Document doc) -> std::expected<UpsertResult, core::error>;
    auto apply_remove(const DocumentId& id) -> RemoveResult;
    auto replay() -> std::expected<void, core::error>;
    auto log(wal::FrameType type, const std::vector<std::uint8_t>& record)
        -> std::expected<void, core::error>;
    auto reopen_writer() -> std::expected<void, core::error>;
    auto durable() const noexcept -> bool { return !options_.wal_path.empty(); }
    auto next_from(std::uint64_t& position) const -> std::optional<StoredDocument>;
};

// Caller holds wal_mutex_ (or is replaying); takes mutex_ exclusively
auto DocumentStore::Impl::apply_upsert(Document doc) -> std::expected<UpsertResult, core::error> {
    std::unique_lock lock(mutex_);
    UpsertResult result;
    result.version = ++version_;

    if (auto it = id_to_handle_.find(doc.id); it != id_to_handle_.end()) {
        auto& slot = slots_[it->second];
        result.handle = it->second;
        result.previous = std::move(slot.doc);
        slot.doc = std::move(doc);
        slot.version = result.version;
        return result;
    }

    if (slots_.size() >= std::numeric_limits<Handle>::max()) {
        return core::fail(core::error_code::internal, "document handles exhausted", "store");
    }
    result.handle = static_cast<Handle>(slots_.size());
    id_to_handle_.emplace(doc.id, result.handle);
    slots_.push_back(Slot{std::move(doc), result.version});
    return result;
}

auto DocumentStore::Impl::apply_remove(const DocumentId& id) -> RemoveResult {
    std::unique_lock lock(mutex_);
    RemoveResult result;
    auto it = id_to_handle_.find(id);
    if (it == id_to_handle_.end()) return result;
    result.removed = true;
    result.handle = it->second;
    result.version = ++version_;
    slots_[it->second].doc.reset();
    slots_[it->second].version = result.version;
    id_to_handle_.erase(it);
    return result;
}

auto DocumentStore::Impl::log(wal::FrameType type, const std::vector<std::uint8_t>& record)
    -> std::expected<void, core::error> {
    if (!durable()) return {};
    if (auto r = reopen_writer(); !r) return r;
    // The LSN is the version this write is about to receive
    const std::uint64_t lsn = version_ + 1;
    if (auto r = writer_.append(lsn, static_cast<std::uint16_t>(type), record); !r) return r;
    wal_bytes_ += wal::WAL_HEADER_SIZE + record.size() + 4;
    return writer_.flush(options_.fsync_on_write);
}

// Caller holds wal_mutex_. A durable store never acknowledges a write it could not log.
auto DocumentStore::Impl::reopen_writer() -> std::expected<void, core::error> {
    if (writer_.is_open()) return {};
    auto writer = wal::WalWriter::open(options_.wal_path, false, options_.fsync_on_write);
    if (!writer) {
        return core::fail(core::error_code::io_failed,
                          "wal " + options_.wal_path.string() + " is not writable: " + writer.error().message,
                          "store");
    }
    writer_ = std::move(*writer);
    return {};
}

auto DocumentStore::Impl::replay() -> std::expected<void, core::error> {
    const auto& path = options_.wal_path;
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) return {};

    auto stats = wal::recover_scan(path, [&](const wal::WalFrame& frame) -> std::expected<void, core::error> {
        switch (static_cast<wal::FrameType>(frame.type)) {
            case wal::FrameType::upsert: {
                auto doc = decode_upsert(frame.payload);
                if (!doc) return std::unexpected(doc.error());
                auto r = apply_upsert(std::move(*doc));
                if (!r) return std::unexpected(r.error());
                return {};
            }
            case wal::FrameType::remove: {
                auto id = decode_remove(frame.payload);
                if (!id) return std::unexpected(id.error());
                apply_remove(*id);
                return {};
            }
        }
        return core::fail(core::error_code::data_integrity,
                          "unknown frame type " + std::to_string(frame.type), "store.replay");
    });
    if (!stats) return std::unexpected(stats.error());

    replayed_frames_ = stats->frames;
    if (stats->torn_tail) {
        truncated_bytes_ = stats->file_bytes - stats->valid_bytes;
        spdlog::warn("wal {}: dropping {} bytes of torn tail after {} frames",
                     path.string(), truncated_bytes_, stats->frames);
        std::filesystem::resize_file(path, stats->valid_bytes, ec);
        if (ec) {
            return core::fail(core::error_code::io_failed,
                              "truncate torn tail failed: " + ec.message(), "store.replay");
        }
    }
    spdlog::debug("wal {}: replayed {} frames, {} live documents",
                  path.string(), stats->frames, id_to_handle_.size());
    return {};
}

auto DocumentStore::Impl::next_from(std::uint64_t& position) const -> std::optional<StoredDocument> {
    std::shared_lock lock(mutex_);
    while (position < slots_.size()) {
        const auto handle = static_cast<Handle>(position++);
        const auto& slot = slots_[handle];
        if (slot.doc) return StoredDocument{handle, slot.version, *slot.doc};
    }
    return std::nullopt;
}

// DocumentStore

DocumentStore::DocumentStore() : impl_(std::make_shared<Impl>()) {}
DocumentStore::~DocumentStore() = default;
DocumentStore::DocumentStore(DocumentStore&&) noexcept = default;
DocumentStore& DocumentStore::operator=(DocumentStore&&) noexcept = default;

auto DocumentStore::open(const StoreOptions& options) -> std::expected<DocumentStore, core::error> {
    DocumentStore store;
    store.impl_->options_ = options;
    if (options.wal_path.empty()) return store;

    std::error_code ec;
    if (auto parent = options.wal_path.parent_path(); !parent.empty()) {
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            return core::fail(core::error_code::io_failed,
                              "create " + parent.string() + ": " + ec.message(), "store");
        }
    }
    if (auto r = store.impl_->replay(); !r) return std::unexpected(r.error());

    auto writer = wal::WalWriter::open(options.wal_path, false, options.fsync_on_write);
    if (!writer) return std::unexpected(writer.error());
    store.impl_->writer_ = std::move(*writer);
    return store;
}

auto DocumentStore::upsert(Document doc) -> std::expected<UpsertResult, core::error> {
    if (auto v = validate_id(doc.id); !v) return std::unexpected(v.error());
    std::lock_guard wal_lock(impl_->wal_mutex_);
    if (auto r = impl_->log(wal::FrameType::upsert, encode_upsert(doc)); !r) {
        return std::unexpected(r.error());
    }
    return impl_->apply_upsert(std::move(doc));
}

auto DocumentStore::get(const DocumentId& id) const -> std::expected<Document, core::error> {
    std::shared_lock lock(impl_->mutex_);
    auto it = impl_->id_to_handle_.find(id);
    if (it == impl_->id_to_handle_.end()) {
        return core::fail(core::error_code::not_found, "document '" + to_string(id) + "' not found", "store");
    }
    return *impl_->slots_[it->second].doc;
}

auto DocumentStore::get_by_handle(Handle handle) const -> std::optional<StoredDocument> {
    std::shared_lock lock(impl_->mutex_);
    if (handle >= impl_->slots_.size()) return std::nullopt;
    const auto& slot = impl_->slots_[handle];
    if (!slot.doc) return std::nullopt;
    return StoredDocument{handle, slot.version, *slot.doc};
}

auto DocumentStore::handle_of(const DocumentId& id) const -> std::optional<Handle> {
    std::shared_lock lock(impl_->mutex_);
    auto it = impl_->id_to_handle_.find(id);
    if (it == impl_->id_to_handle_.end()) return std::nullopt;
    return it->second;
}

auto DocumentStore::contains(const DocumentId& id) const -> bool {
    return handle_of(id).has_value();
}

auto DocumentStore::is_live(Handle handle) const -> bool {
    std::shared_lock lock(impl_->mutex_);
    return handle < impl_->slots_.size() && impl_->slots_[handle].doc.has_value();
}

auto DocumentStore::remove(const DocumentId& id) -> std::expected<RemoveResult, core::error> {
    std::lock_guard wal_lock(impl_->wal_mutex_);
    if (!contains(id)) return RemoveResult{};
    if (auto r = impl_->log(wal::FrameType::remove, encode_remove(id)); !r) {
        return std::unexpected(r.error());
    }
    return impl_->apply_remove(id);
}

auto DocumentStore::scan(Handle from) const -> Cursor {
    return Cursor(impl_, from);
}

auto DocumentStore::Cursor::next() -> std::optional<StoredDocument> {
    return impl_->next_from(position_);
}

auto DocumentStore::live_handles() const -> roaring::Roaring {
    roaring::Roaring out;
    std::shared_lock lock(impl_->mutex_);
    for (const auto& [id, handle] : impl_->id_to_handle_) out.add(handle);
    return out;
}

auto DocumentStore::filter_handles(const filter_expr& expr) const
    -> std::expected<roaring::Roaring, core::error> {
    if (auto v = filter_eval::validate(expr); !v) return std::unexpected(v.error());
    roaring::Roaring out;
    std::shared_lock lock(impl_->mutex_);
    for (const auto& [id, handle] : impl_->id_to_handle_) {
        if (filter_eval::matches(expr, impl_->slots_[handle].doc->payload)) out.add(handle);
    }
    return out;
}

auto DocumentStore::compact_log() -> std::expected<void, core::error> {
    std::lock_guard wal_lock(impl_->wal_mutex_);
    if (!impl_->durable()) return {};

    const auto path = impl_->options_.wal_path;
    auto tmp_path = path;
    tmp_path += ".compact";

    std::size_t records = 0;
    {
        auto tmp = wal::WalWriter::open(tmp_path, true);
        if (!tmp) return std::unexpected(tmp.error());
        std::shared_lock lock(impl_->mutex_);
        for (const auto& slot : impl_->slots_) {
            if (!slot.doc) continue;
            const auto record = encode_upsert(*slot.doc);
            if (auto r = tmp->append(slot.version, static_cast<std::uint16_t>(wal::FrameType::upsert), record); !r) {
                return r;
            }
            ++records;
        }
        if (auto r = tmp->close(); !r) return r;
    }

    if (impl_->writer_.is_open()) {
        if (auto r = impl_->writer_.close(); !r) return r;
    }
    std::error_code ec;
    std::filesystem::rename(tmp_path, path, ec);
    if (ec) {
        std::filesystem::remove(tmp_path, ec);
        // Keep appending to the uncompacted log
        if (auto r = impl_->reopen_writer(); !r) {
            spdlog::error("wal {}: {}", path.string(), r.error().message);
        }
        return core::fail(core::error_code::io_failed, "rename compacted wal failed", "store");
    }
    if (auto r = impl_->reopen_writer(); !r) return r;
    impl_->wal_bytes_ = 0;
    if (auto parent = path.parent_path(); !parent.empty()) {
        if (auto r = wal::fsync_path(parent); !r) return r;
    }
    spdlog::info("wal {}: compacted to {} records", path.string(), records);
    return {};
}

auto DocumentStore::flush(bool sync) -> std::expected<void, core::error> {
    std::lock_guard wal_lock(impl_->wal_mutex_);
    if (!impl_->durable()) return {};
    if (auto r = impl_->reopen_writer(); !r) return r;
    return impl_->writer_.flush(sync);
}

auto DocumentStore::size() const -> std::size_t {
    std::shared_lock lock(impl_->mutex_);
    return impl_->id_to_handle_.size();
}

auto DocumentStore::version() const -> std::uint64_t {
    std::shared_lock lock(impl_->mutex_);
    return impl_->version_;
}

auto DocumentStore::stats() const -> StoreStats {
    StoreStats s;
    {
        std::lock_guard wal_lock(impl_->wal_mutex_);
        s.wal_bytes = impl_->wal_bytes_;
    }
    std::shared_lock lock(impl_->mutex_);
    s.live_documents = impl_->id_to_handle_.size();
    s.slots = impl_->slots_.size();
    s.version = impl_->version_;
    s.replayed_frames = impl_->replayed_frames_;
    s.truncated_bytes = impl_->truncated_bytes_;
    return s;
}

} // namespace tessera::store
