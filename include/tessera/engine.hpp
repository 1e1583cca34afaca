#pragma once

/** \file engine.hpp
 *  \brief Public facade: a registry of collections addressed by name.
 *
 * An Engine owns its collections. A process-wide instance is available through initialize(),
 * global() and teardown(); independent Engine objects may also be created directly.
 *
 * Creating a collection whose log already exists under the data directory replays it, so a
 * collection survives restarts as long as it is recreated with the same schema.
 */

#include <cstdint>
#include <expected>
#include <memory>
#include <span>
#include <stop_token>
#include <string>
#include <vector>

#include "tessera/collection/collection.hpp"
#include "tessera/collection/schema.hpp"
#include "tessera/config.hpp"
#include "tessera/document.hpp"
#include "tessera/error.hpp"
#include "tessera/search/hybrid_engine.hpp"

namespace tessera {

class Engine {
public:
    Engine();
    ~Engine();
    Engine(Engine&&) noexcept;
    Engine& operator=(Engine&&) noexcept;
    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;

    /** \brief Validate the configuration and build an empty engine. */
    static auto open(EngineConfig config) -> std::expected<Engine, core::error>;

    auto create_collection(const collection::CollectionSchema& schema) -> std::expected<void, core::error>;
    auto drop_collection(const std::string& name) -> std::expected<void, core::error>;
    auto list_collections() const -> std::vector<std::string>;

    auto upsert(const std::string& collection, Document doc, const collection::WriteOptions& options = {})
        -> std::expected<collection::UpsertOutcome, core::error>;

    /** \brief Returns false when the document did not exist. */
    auto remove(const std::string& collection, const DocumentId& id, const collection::WriteOptions& options = {})
        -> std::expected<bool, core::error>;

    auto get(const std::string& collection, const DocumentId& id) const -> std::expected<Document, core::error>;

    auto search(const std::string& collection, const search::Query& query) const
        -> std::expected<search::SearchResponse, core::error>;

    auto search_batch(const std::string& collection, std::span<const search::Query> queries) const
        -> std::expected<std::vector<search::SearchResponse>, core::error>;

    auto explain(const std::string& collection, const search::Query& query, const DocumentId& id) const
        -> std::expected<search::Explanation, core::error>;

    auto flush(const std::string& collection, bool sync = false) -> std::expected<void, core::error>;
    auto compact(const std::string& collection, std::stop_token stop = {})
        -> std::expected<collection::CompactionReport, core::error>;
    auto reconcile(const std::string& collection) -> std::expected<collection::ReconcileReport, core::error>;
    auto rebuild_indexes(const std::string& collection) -> std::expected<void, core::error>;
    auto stats(const std::string& collection) const -> std::expected<collection::CollectionStats, core::error>;

    /** \brief Direct handle to a Ready collection. */
    auto collection(const std::string& name) const
        -> std::expected<std::shared_ptr<collection::Collection>, core::error>;

    /** \brief Drop every collection together with its files. */
    auto drop_all() -> void;

    auto config() const -> const EngineConfig&;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

/** \brief Create the process-wide engine. Errors: already_exists when initialized. */
auto initialize(EngineConfig config) -> std::expected<void, core::error>;

/** \brief The process-wide engine. Errors: precondition_failed before initialize(). */
auto global() -> std::expected<Engine*, core::error>;

/** \brief Destroy the process-wide engine, closing its collections and keeping their logs. */
auto teardown() -> void;

} // namespace tessera
