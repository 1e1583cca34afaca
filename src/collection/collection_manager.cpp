#include "tessera/collection/collection_manager.hpp"

#include <mutex>

#include <spdlog/spdlog.h>

namespace tessera::collection {

CollectionManager::CollectionManager(CollectionOptions defaults) : defaults_(std::move(defaults)) {}

CollectionManager::~CollectionManager() { close_all(); }

auto CollectionManager::create(const CollectionSchema& schema)
    -> std::expected<std::shared_ptr<Collection>, core::error> {
    return create(schema, defaults_);
}

auto CollectionManager::create(const CollectionSchema& schema, const CollectionOptions& options)
    -> std::expected<std::shared_ptr<Collection>, core::error> {
    if (auto v = validate_schema(schema); !v) return std::unexpected(v.error());

    auto collection = std::make_shared<Collection>(schema, options);
    {
        std::unique_lock lock(mutex_);
        if (collections_.contains(schema.name)) {
            return core::fail(core::error_code::already_exists,
                              "collection '" + schema.name + "' already exists", "collection.manager");
        }
        // Reserves the name while the collection opens outside the lock.
        collections_.emplace(schema.name, collection);
    }

    if (auto r = collection->open(); !r) {
        {
            std::unique_lock lock(mutex_);
            if (auto it = collections_.find(schema.name); it != collections_.end() && it->second == collection) {
                collections_.erase(it);
            }
        }
        collection->drop(false);
        spdlog::error("create collection '{}' failed: {}", schema.name, core::describe(r.error()));
        return std::unexpected(r.error());
    }
    return collection;
}

auto CollectionManager::get(const std::string& name) const
    -> std::expected<std::shared_ptr<Collection>, core::error> {
    std::shared_lock lock(mutex_);
    auto it = collections_.find(name);
    if (it == collections_.end() || !visible(it)) {
        return core::fail(core::error_code::not_found, "collection '" + name + "' not found",
                          "collection.manager");
    }
    return it->second;
}

auto CollectionManager::drop(const std::string& name) -> std::expected<void, core::error> {
    std::shared_ptr<Collection> collection;
    {
        std::unique_lock lock(mutex_);
        auto it = collections_.find(name);
        if (it == collections_.end() || !visible(it)) {
            return core::fail(core::error_code::not_found, "collection '" + name + "' not found",
                              "collection.manager");
        }
        collection = it->second;
        dropping_.insert(name);
    }

    // The name stays registered until the files are gone, so a create of the same name
    // cannot replay or append to the log being removed.
    collection->drop(true);

    std::unique_lock lock(mutex_);
    if (auto it = collections_.find(name); it != collections_.end() && it->second == collection) {
        collections_.erase(it);
    }
    dropping_.erase(name);
    return {};
}

auto CollectionManager::list() const -> std::vector<std::string> {
    std::shared_lock lock(mutex_);
    std::vector<std::string> names;
    names.reserve(collections_.size());
    for (auto it = collections_.begin(); it != collections_.end(); ++it) {
        if (visible(it)) names.push_back(it->first);
    }
    return names;
}

// Caller holds mutex_.
auto CollectionManager::visible(Registry::const_iterator it) const -> bool {
    return it->second->state() == CollectionState::Ready && !dropping_.contains(it->first);
}

auto CollectionManager::take_all() -> std::vector<std::shared_ptr<Collection>> {
    std::unique_lock lock(mutex_);
    std::vector<std::shared_ptr<Collection>> all;
    all.reserve(collections_.size());
    for (auto& [name, collection] : collections_) all.push_back(std::move(collection));
    collections_.clear();
    return all;
}

auto CollectionManager::drop_all() -> void {
    for (auto& collection : take_all()) collection->drop(true);
}

auto CollectionManager::close_all() -> void {
    auto all = take_all();
    if (!all.empty()) spdlog::info("closing {} collections", all.size());
    // Each collection drains its queued index updates and flushes its log on destruction.
    all.clear();
}

} // namespace tessera::collection
