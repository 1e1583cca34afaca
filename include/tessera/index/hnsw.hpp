#pragma once

/** \file hnsw.hpp
 *  \brief Hierarchical Navigable Small World (HNSW) index with tombstone deletion.
 *
 * Features:
 * - Multi-layer proximity graph with diversity-pruned neighbour lists
 * - Metric-agnostic through DistanceMetric (Cosine, Dot, Euclidean)
 * - Allow-bitmap filtering pushed into the base-layer beam search
 * - Soft delete: tombstoned nodes keep routing queries but never appear in results
 * - Incremental compaction that repairs neighbour lists and reclaims tombstoned slots
 *
 * Entries are keyed by 32-bit handles assigned by the document store. Nodes live in an arena of
 * stable integer slots; adjacency lists are guarded by striped locks (slot mod kLockStripes).
 *
 * Thread-safety: search, insert, remove and compact may run concurrently. Inserts for the same
 * handle must be serialized by the caller.
 * Memory: O(M * N) edges where M is max connections per node.
 */

#include <atomic>
#include <cstdint>
#include <expected>
#include <memory>
#include <span>
#include <stop_token>
#include <vector>

#include <roaring/roaring.hh>

#include "tessera/error.hpp"
#include "tessera/index/metric.hpp"

namespace tessera::index {

/** \brief HNSW build parameters. */
struct HnswBuildParams {
    std::uint32_t M{16};                    /**< Target connections per node on upper layers */
    std::uint32_t efConstruction{200};      /**< Beam width during construction */
    std::uint32_t seed{42};                 /**< Random seed for level assignment */
    bool keep_pruned_connections{true};     /**< Refill lists from pruned candidates up to the cap */
    std::uint32_t max_M{0};                 /**< Max connections for level > 0 (0 = M) */
    std::uint32_t max_M0{0};                /**< Max connections for level 0 (0 = 2 * M) */
};

/** \brief HNSW search parameters. */
struct HnswSearchParams {
    std::uint32_t efSearch{100};            /**< Beam width at the base layer (raised to k if smaller) */
    std::uint32_t k{10};                    /**< Number of neighbours to return */
    const roaring::Roaring* allow{nullptr}; /**< Optional allow-list of handles */
    std::stop_token stop{};                 /**< Abandons the traversal when requested */
};

/** \brief One search hit: handle plus native metric score. */
struct HnswHit {
    std::uint32_t handle{0};
    float score{0.0f};
};

/** \brief HNSW index statistics. */
struct HnswStats {
    std::size_t n_slots{0};                 /**< Arena slots in use or free */
    std::size_t n_live{0};                  /**< Live entries */
    std::size_t n_tombstoned{0};            /**< Tombstoned, not yet reclaimed */
    std::size_t n_free{0};                  /**< Reclaimed slots available for reuse */
    std::size_t n_edges{0};                 /**< Directed base-layer edges */
    std::size_t n_levels{0};                /**< Number of hierarchy levels */
    float avg_degree{0.0f};                 /**< Average base-layer out-degree */
    std::vector<std::size_t> level_counts;  /**< Nodes per level */
};

/** \brief Outcome of a compaction pass. */
struct HnswCompactionStats {
    std::size_t tombstones_seen{0};         /**< Tombstones present when the pass started */
    std::size_t repaired_lists{0};          /**< Neighbour lists rewritten */
    std::size_t reclaimed{0};               /**< Slots returned to the free list */
    bool interrupted{false};                /**< Stop was requested; nothing reclaimed */
};

/** \brief Hierarchical Navigable Small World index. */
class HnswIndex {
public:
    HnswIndex();
    ~HnswIndex();
    HnswIndex(HnswIndex&&) noexcept;
    HnswIndex& operator=(HnswIndex&&) noexcept;
    HnswIndex(const HnswIndex&) = delete;
    HnswIndex& operator=(const HnswIndex&) = delete;

    /** \brief Initialize index with parameters.
     *
     * Preconditions: dim > 0; M >= 2; efConstruction >= M
     */
    auto init(std::size_t dim, DistanceMetric metric, const HnswBuildParams& params)
        -> std::expected<void, core::error>;

    /** \brief Add or replace the entry for a handle.
     *
     * Re-inserting an identical vector for a live handle is a no-op. A different vector
     * tombstones the previous node and links a new one.
     *
     * Errors: schema_mismatch on wrong length or non-finite values.
     * Complexity: O(M * log(N) * efConstruction)
     */
    auto insert(std::uint32_t handle, std::span<const float> vec)
        -> std::expected<void, core::error>;

    /** \brief Tombstone the live entry for a handle. Returns false if none existed. */
    auto remove(std::uint32_t handle) -> bool;

    /** \brief True if a live entry exists for the handle. */
    auto contains(std::uint32_t handle) const -> bool;

    /** \brief Search for the k best live entries.
     *
     * Returns an empty result on an empty or fully tombstoned index.
     * Errors: schema_mismatch on wrong length, invalid_query on k == 0, cancelled on stop.
     * Thread-safety: safe for concurrent calls.
     */
    auto search(std::span<const float> query, const HnswSearchParams& params) const
        -> std::expected<std::vector<HnswHit>, core::error>;

    /** \brief Repair neighbour lists around tombstones and reclaim their slots.
     *
     * Interruptible between nodes through \p stop; an interrupted pass leaves every
     * tombstone in place so the next pass restarts cleanly.
     */
    auto compact(std::stop_token stop = {}) -> HnswCompactionStats;

    /** \brief Handles of all live entries. */
    auto live_handles() const -> roaring::Roaring;

    /** \brief Live nodes reachable from the entry point on the base layer (BFS). */
    auto reachable_count_base_layer() const -> std::size_t;

    auto get_stats() const -> HnswStats;
    auto is_initialized() const noexcept -> bool;
    auto dimension() const noexcept -> std::size_t;
    auto metric() const noexcept -> DistanceMetric;

    /** \brief Number of live entries. */
    auto size() const noexcept -> std::size_t;

    /** \brief Number of tombstoned entries awaiting compaction. */
    auto tombstone_count() const noexcept -> std::size_t;

    /** \brief Drop every entry, keeping parameters. */
    auto clear() -> void;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace tessera::index
