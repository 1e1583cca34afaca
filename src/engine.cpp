#include "tessera/engine.hpp"

#include <mutex>

#include <spdlog/spdlog.h>

#include "tessera/collection/collection_manager.hpp"

namespace tessera {

class Engine::Impl {
public:
    explicit Impl(EngineConfig config) : config_(std::move(config)), manager_(config_.collections) {}

    EngineConfig config_;
    collection::CollectionManager manager_;
};

Engine::Engine() : impl_(std::make_unique<Impl>(EngineConfig{})) {}
Engine::~Engine() = default;
Engine::Engine(Engine&&) noexcept = default;
Engine& Engine::operator=(Engine&&) noexcept = default;

auto Engine::open(EngineConfig config) -> std::expected<Engine, core::error> {
    if (auto v = validate(config); !v) return std::unexpected(v.error());
    if (config.configure_logging) {
        if (auto r = logging::configure(config.log); !r) return std::unexpected(r.error());
    }
    Engine engine;
    engine.impl_ = std::make_unique<Impl>(std::move(config));
    const auto& c = engine.impl_->config_.collections;
    spdlog::info("engine ready: apply={}, data_dir='{}', rrf_k={}", collection::to_string(c.apply_mode),
                 c.data_dir.string(), c.hybrid.rrf_k);
    return engine;
}

auto Engine::create_collection(const collection::CollectionSchema& schema) -> std::expected<void, core::error> {
    auto created = impl_->manager_.create(schema);
    if (!created) return std::unexpected(created.error());
    return {};
}

auto Engine::drop_collection(const std::string& name) -> std::expected<void, core::error> {
    return impl_->manager_.drop(name);
}

auto Engine::list_collections() const -> std::vector<std::string> { return impl_->manager_.list(); }

auto Engine::collection(const std::string& name) const
    -> std::expected<std::shared_ptr<collection::Collection>, core::error> {
    return impl_->manager_.get(name);
}

auto Engine::upsert(const std::string& collection, Document doc, const collection::WriteOptions& options)
    -> std::expected<collection::UpsertOutcome, core::error> {
    auto c = impl_->manager_.get(collection);
    if (!c) return std::unexpected(c.error());
    return (*c)->upsert(std::move(doc), options);
}

auto Engine::remove(const std::string& collection, const DocumentId& id, const collection::WriteOptions& options)
    -> std::expected<bool, core::error> {
    auto c = impl_->manager_.get(collection);
    if (!c) return std::unexpected(c.error());
    return (*c)->remove(id, options);
}

auto Engine::get(const std::string& collection, const DocumentId& id) const -> std::expected<Document, core::error> {
    auto c = impl_->manager_.get(collection);
    if (!c) return std::unexpected(c.error());
    return (*c)->get(id);
}

auto Engine::search(const std::string& collection, const search::Query& query) const
    -> std::expected<search::SearchResponse, core::error> {
    auto c = impl_->manager_.get(collection);
    if (!c) return std::unexpected(c.error());
    return (*c)->search(query);
}

auto Engine::search_batch(const std::string& collection, std::span<const search::Query> queries) const
    -> std::expected<std::vector<search::SearchResponse>, core::error> {
    auto c = impl_->manager_.get(collection);
    if (!c) return std::unexpected(c.error());
    return (*c)->search_batch(queries);
}

auto Engine::explain(const std::string& collection, const search::Query& query, const DocumentId& id) const
    -> std::expected<search::Explanation, core::error> {
    auto c = impl_->manager_.get(collection);
    if (!c) return std::unexpected(c.error());
    return (*c)->explain(query, id);
}

auto Engine::flush(const std::string& collection, bool sync) -> std::expected<void, core::error> {
    auto c = impl_->manager_.get(collection);
    if (!c) return std::unexpected(c.error());
    return (*c)->flush(sync);
}

auto Engine::compact(const std::string& collection, std::stop_token stop)
    -> std::expected<collection::CompactionReport, core::error> {
    auto c = impl_->manager_.get(collection);
    if (!c) return std::unexpected(c.error());
    return (*c)->compact(stop);
}

auto Engine::reconcile(const std::string& collection) -> std::expected<collection::ReconcileReport, core::error> {
    auto c = impl_->manager_.get(collection);
    if (!c) return std::unexpected(c.error());
    return (*c)->reconcile();
}

auto Engine::rebuild_indexes(const std::string& collection) -> std::expected<void, core::error> {
    auto c = impl_->manager_.get(collection);
    if (!c) return std::unexpected(c.error());
    return (*c)->rebuild_indexes();
}

auto Engine::stats(const std::string& collection) const -> std::expected<collection::CollectionStats, core::error> {
    auto c = impl_->manager_.get(collection);
    if (!c) return std::unexpected(c.error());
    return (*c)->stats();
}

auto Engine::drop_all() -> void { impl_->manager_.drop_all(); }

auto Engine::config() const -> const EngineConfig& { return impl_->config_; }

namespace {

std::mutex g_engine_mutex;
std::unique_ptr<Engine> g_engine;

} // namespace

auto initialize(EngineConfig config) -> std::expected<void, core::error> {
    std::lock_guard lock(g_engine_mutex);
    if (g_engine) {
        return core::fail(core::error_code::already_exists, "engine already initialized", "engine");
    }
    auto engine = Engine::open(std::move(config));
    if (!engine) return std::unexpected(engine.error());
    g_engine = std::make_unique<Engine>(std::move(*engine));
    return {};
}

auto global() -> std::expected<Engine*, core::error> {
    std::lock_guard lock(g_engine_mutex);
    if (!g_engine) {
        return core::fail(core::error_code::precondition_failed, "engine not initialized", "engine");
    }
    return g_engine.get();
}

auto teardown() -> void {
    std::unique_ptr<Engine> engine;
    {
        std::lock_guard lock(g_engine_mutex);
        engine = std::move(g_engine);
    }
    if (engine) spdlog::info("engine teardown: {} collections", engine->list_collections().size());
}

} // namespace tessera
