#pragma once

/** \file collection_manager.hpp
 *  \brief Registry of named collections.
 *
 * The registry lock is held exclusively only while membership changes; operations on a
 * collection run on a shared handle outside it. A collection that is being created or dropped
 * is reported as not found.
 */

#include <expected>
#include <map>
#include <memory>
#include <set>
#include <shared_mutex>
#include <string>
#include <vector>

#include "tessera/collection/collection.hpp"
#include "tessera/collection/schema.hpp"
#include "tessera/error.hpp"

namespace tessera::collection {

class CollectionManager {
public:
    explicit CollectionManager(CollectionOptions defaults = {});
    ~CollectionManager();

    CollectionManager(const CollectionManager&) = delete;
    CollectionManager& operator=(const CollectionManager&) = delete;

    /** \brief Create and open a collection.
     *
     * Errors: invalid_schema, already_exists (including while a same-named collection is
     * still being created or dropped), or the error that made opening fail.
     */
    auto create(const CollectionSchema& schema) -> std::expected<std::shared_ptr<Collection>, core::error>;

    /** \brief Same, with options overriding the manager defaults. */
    auto create(const CollectionSchema& schema, const CollectionOptions& options)
        -> std::expected<std::shared_ptr<Collection>, core::error>;

    /** \brief Ready collection by name. Errors: not_found. */
    auto get(const std::string& name) const -> std::expected<std::shared_ptr<Collection>, core::error>;

    /** \brief Remove a collection and its files. Errors: not_found. */
    auto drop(const std::string& name) -> std::expected<void, core::error>;

    /** \brief Names of Ready collections, sorted. */
    auto list() const -> std::vector<std::string>;

    /** \brief Drop every collection including its files. */
    auto drop_all() -> void;

    /** \brief Shut every collection down, keeping its files. */
    auto close_all() -> void;

    auto defaults() const noexcept -> const CollectionOptions& { return defaults_; }

private:
    using Registry = std::map<std::string, std::shared_ptr<Collection>>;

    auto take_all() -> std::vector<std::shared_ptr<Collection>>;
    auto visible(Registry::const_iterator it) const -> bool;

    CollectionOptions defaults_;
    mutable std::shared_mutex mutex_;
    Registry collections_;
    std::set<std::string> dropping_;    /**< registered names whose files are being removed */
};

} // namespace tessera::collection
