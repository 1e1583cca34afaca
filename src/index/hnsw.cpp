#include "tessera/index/hnsw.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <limits>
#include <mutex>
#include <queue>
#include <random>
#include <shared_mutex>
#include <unordered_map>
#include <unordered_set>
#include <utility>

#include <spdlog/spdlog.h>

namespace tessera::index {

namespace {

constexpr std::uint32_t kNoNode = std::numeric_limits<std::uint32_t>::max();
constexpr std::size_t kLockStripes = 64;
constexpr std::uint32_t kMaxLevel = 16;
constexpr std::uint32_t kStopCheckInterval = 64;

using Candidate = std::pair<float, std::uint32_t>;  // (key, slot)

} // namespace

/** \brief Node in HNSW graph. */
struct HnswNode {
    std::uint32_t handle{0};
    std::vector<float> data;                            // prepared for the metric
    std::vector<std::vector<std::uint32_t>> neighbors;  // Per level
    std::uint32_t level{0};
    std::atomic<bool> deleted{false};
    bool reclaimed{false};                              // written under exclusive graph lock only
};

/** \brief Internal implementation of HNSW index. */
class HnswIndex::Impl {
public:
    /** \brief Index configuration and state. */
    struct State {
        bool initialized{false};
        std::size_t dim{0};
        DistanceMetric metric;
        HnswBuildParams params;
        float level_multiplier{1.0f / std::log(2.0f)};
        std::uint32_t entry_point{kNoNode};             // guarded by entry_mutex_
        std::uint32_t max_level{0};                     // guarded by entry_mutex_
    } state_;

    std::vector<std::unique_ptr<HnswNode>> nodes_;
    std::vector<std::uint32_t> free_slots_;
    std::unordered_map<std::uint32_t, std::uint32_t> handle_to_idx_;

    // Lock order: graph_mutex_ -> label_mutex_ -> entry_mutex_ -> stripes_
    mutable std::shared_mutex graph_mutex_;  // shared: traversal and linking; unique: arena changes
    mutable std::mutex label_mutex_;
    mutable std::mutex entry_mutex_;
    mutable std::array<std::mutex, kLockStripes> stripes_{};

    std::mutex rng_mutex_;
    std::mt19937 rng_;

    std::atomic<std::size_t> live_count_{0};
    std::atomic<std::size_t> tombstone_count_{0};

    auto init(std::size_t dim, DistanceMetric metric, const HnswBuildParams& params)
        -> std::expected<void, core::error>;
    auto insert(std::uint32_t handle, std::span<const float> vec)
        -> std::expected<void, core::error>;
    auto remove(std::uint32_t handle) -> bool;
    auto search(std::span<const float> query, const HnswSearchParams& params) const
        -> std::expected<std::vector<HnswHit>, core::error>;
    auto compact(std::stop_token stop) -> HnswCompactionStats;
    auto reachable_count_base_layer() const -> std::size_t;
    auto get_stats() const -> HnswStats;
    auto clear() -> void;

private:
    struct StripePair {
        std::unique_lock<std::mutex> first;
        std::unique_lock<std::mutex> second;
    };

    static auto stripe_of(std::uint32_t idx) noexcept -> std::size_t { return idx % kLockStripes; }

    auto lock_node(std::uint32_t idx) const -> std::unique_lock<std::mutex> {
        return std::unique_lock<std::mutex>(stripes_[stripe_of(idx)]);
    }

    /** \brief Lock two slots' stripes without deadlock; locks once when they share a stripe. */
    auto lock_pair(std::uint32_t a, std::uint32_t b) const -> StripePair {
        auto& ma = stripes_[stripe_of(a)];
        auto& mb = stripes_[stripe_of(b)];
        if (&ma == &mb) {
            return StripePair{std::unique_lock<std::mutex>(ma), {}};
        }
        std::unique_lock<std::mutex> la(ma, std::defer_lock);
        std::unique_lock<std::mutex> lb(mb, std::defer_lock);
        std::lock(la, lb);
        return StripePair{std::move(la), std::move(lb)};
    }

    auto traversable(std::uint32_t idx, std::uint32_t layer) const noexcept -> bool {
        if (idx >= nodes_.size()) return false;
        const auto* n = nodes_[idx].get();
        return n != nullptr && !n->reclaimed && n->level >= layer;
    }

    auto key_to(std::span<const float> query, std::uint32_t idx) const noexcept -> float {
        return state_.metric.key(query, nodes_[idx]->data);
    }

    auto key_between(std::uint32_t a, std::uint32_t b) const noexcept -> float {
        return state_.metric.key(nodes_[a]->data, nodes_[b]->data);
    }

    auto max_connections(std::uint32_t layer) const noexcept -> std::uint32_t {
        return layer == 0 ? state_.params.max_M0 : state_.params.max_M;
    }

    /** \brief Copy a neighbour list under its stripe lock. */
    auto neighbors_at(std::uint32_t idx, std::uint32_t layer) const -> std::vector<std::uint32_t> {
        auto guard = lock_node(idx);
        const auto& lists = nodes_[idx]->neighbors;
        if (layer >= lists.size()) return {};
        return lists[layer];
    }

    auto select_level() -> std::uint32_t;

    auto search_layer(std::span<const float> query, std::uint32_t entry_point,
                      std::uint32_t ef, std::uint32_t layer,
                      const roaring::Roaring* allow, bool live_only,
                      const std::stop_token& stop, bool* stopped = nullptr) const
        -> std::vector<Candidate>;

    auto select_neighbors(std::vector<Candidate> candidates, std::uint32_t M) const
        -> std::pair<std::vector<std::uint32_t>, std::vector<std::uint32_t>>;

    auto connect_node(std::uint32_t new_idx, const std::vector<Candidate>& candidates,
                      std::uint32_t layer) -> void;
};

auto HnswIndex::Impl::init(std::size_t dim, DistanceMetric metric, const HnswBuildParams& params)
    -> std::expected<void, core::error> {
    using core::error_code;

    if (dim == 0) {
        return core::fail(error_code::invalid_schema, "Dimension must be > 0", "index.hnsw");
    }
    if (params.M < 2) {
        return core::fail(error_code::invalid_schema, "M must be >= 2", "index.hnsw");
    }
    if (params.efConstruction < params.M) {
        return core::fail(error_code::invalid_schema, "efConstruction must be >= M", "index.hnsw");
    }

    state_.dim = dim;
    state_.metric = metric;
    state_.params = params;
    // Derive connection caps from M unless explicitly overridden
    if (state_.params.max_M == 0) state_.params.max_M = params.M;
    if (state_.params.max_M0 == 0) state_.params.max_M0 = 2u * params.M;
    state_.level_multiplier = 1.0f / std::log(static_cast<float>(params.M));
    rng_.seed(params.seed);
    state_.initialized = true;
    return {};
}

auto HnswIndex::Impl::select_level() -> std::uint32_t {
    std::lock_guard<std::mutex> guard(rng_mutex_);
    std::uniform_real_distribution<float> dist(std::numeric_limits<float>::min(), 1.0f);
    const float f = -std::log(dist(rng_)) * state_.level_multiplier;
    return std::min(static_cast<std::uint32_t>(f), kMaxLevel);
}

auto HnswIndex::Impl::search_layer(std::span<const float> query, std::uint32_t entry_point,
                                   std::uint32_t ef, std::uint32_t layer,
                                   const roaring::Roaring* allow, bool live_only,
                                   const std::stop_token& stop, bool* stopped) const
    -> std::vector<Candidate> {

    const std::size_t N = nodes_.size();
    if (!traversable(entry_point, layer)) return {};

    // Thread-local epoch-based visited marking (avoids hash set overhead)
    struct TLSVisited { std::vector<std::uint32_t> seen; std::uint32_t epoch{0}; };
    thread_local TLSVisited tls;
    if (tls.seen.size() < N) tls.seen.resize(N, 0);
    tls.epoch++;
    if (tls.epoch == 0) { std::fill(tls.seen.begin(), tls.seen.end(), 0u); tls.epoch = 1; }
    auto mark_visited = [&](std::uint32_t id) noexcept { tls.seen[id] = tls.epoch; };
    auto is_visited = [&](std::uint32_t id) noexcept { return tls.seen[id] == tls.epoch; };

    auto accepted = [&](std::uint32_t idx) noexcept {
        const auto* n = nodes_[idx].get();
        if (live_only && n->deleted.load(std::memory_order_acquire)) return false;
        return allow == nullptr || allow->contains(n->handle);
    };

    std::priority_queue<Candidate> candidates;  // (-key, slot): closest first
    std::priority_queue<Candidate> nearest;     // (key, slot): worst accepted on top
    float lower_bound = std::numeric_limits<float>::infinity();

    const float entry_key = key_to(query, entry_point);
    candidates.emplace(-entry_key, entry_point);
    if (accepted(entry_point)) {
        nearest.emplace(entry_key, entry_point);
        lower_bound = entry_key;
    }
    mark_visited(entry_point);

    std::uint32_t expansions = 0;
    while (!candidates.empty()) {
        const auto [neg_key, current] = candidates.top();
        if (-neg_key > lower_bound && nearest.size() >= ef) {
            break;
        }
        candidates.pop();

        if (++expansions % kStopCheckInterval == 0 && stop.stop_requested()) {
            if (stopped) *stopped = true;
            break;
        }

        // Copy under the stripe lock; writers never expose a half-written list
        const auto neighbors_copy = neighbors_at(current, layer);

        for (std::uint32_t neighbor : neighbors_copy) {
            if (neighbor >= N || is_visited(neighbor)) continue;
            mark_visited(neighbor);
            if (!traversable(neighbor, layer)) continue;

            const float k = key_to(query, neighbor);
            if (nearest.size() < ef || k < lower_bound) {
                // Tombstoned and filtered nodes still route the search
                candidates.emplace(-k, neighbor);
                if (accepted(neighbor)) {
                    nearest.emplace(k, neighbor);
                    if (nearest.size() > ef) nearest.pop();
                    lower_bound = nearest.top().first;
                }
            }
        }
    }

    std::vector<Candidate> result;
    result.reserve(nearest.size());
    while (!nearest.empty()) {
        result.push_back(nearest.top());
        nearest.pop();
    }
    // Deterministic ordering on ties (key, then slot)
    std::sort(result.begin(), result.end());
    return result;
}

auto HnswIndex::Impl::select_neighbors(std::vector<Candidate> candidates, std::uint32_t M) const
    -> std::pair<std::vector<std::uint32_t>, std::vector<std::uint32_t>> {
    // Select-Neighbors-Heuristic: keep a candidate only if it is closer to the base node than
    // to every neighbour already kept, which favours edges pointing in new directions.
    std::sort(candidates.begin(), candidates.end());

    std::vector<std::uint32_t> selected;
    std::vector<std::uint32_t> pruned;
    std::unordered_set<std::uint32_t> seen;
    selected.reserve(M);

    for (const auto& [key, c] : candidates) {
        if (!seen.insert(c).second) continue;
        if (selected.size() >= M) {
            pruned.push_back(c);
            continue;
        }
        bool diverse = true;
        for (std::uint32_t s : selected) {
            if (key_between(c, s) < key) {
                diverse = false;
                break;
            }
        }
        if (diverse) {
            selected.push_back(c);
        } else {
            pruned.push_back(c);
        }
    }

    if (state_.params.keep_pruned_connections && selected.size() < M && !pruned.empty()) {
        const std::size_t to_add = std::min<std::size_t>(M - selected.size(), pruned.size());
        selected.insert(selected.end(), pruned.begin(), pruned.begin() + static_cast<std::ptrdiff_t>(to_add));
        pruned.erase(pruned.begin(), pruned.begin() + static_cast<std::ptrdiff_t>(to_add));
    }

    return {std::move(selected), std::move(pruned)};
}

auto HnswIndex::Impl::connect_node(std::uint32_t new_idx, const std::vector<Candidate>& candidates,
                                   std::uint32_t layer) -> void {
    const std::uint32_t max_conn = max_connections(layer);

    std::vector<Candidate> filtered;
    filtered.reserve(candidates.size());
    for (const auto& c : candidates) {
        if (c.second != new_idx) filtered.push_back(c);
    }
    auto selected = select_neighbors(std::move(filtered), max_conn).first;

    {
        auto guard = lock_node(new_idx);
        nodes_[new_idx]->neighbors[layer] = selected;
    }

    bool accepted_any = false;

    // Reverse edges with back-pruning; both stripes held so neither list is observed mid-update
    for (std::uint32_t neighbor : selected) {
        auto locks = lock_pair(new_idx, neighbor);
        auto& lists = nodes_[neighbor]->neighbors;
        if (layer >= lists.size()) continue;
        auto& neighbor_neighbors = lists[layer];

        if (std::find(neighbor_neighbors.begin(), neighbor_neighbors.end(), new_idx) != neighbor_neighbors.end()) {
            accepted_any = true;
            continue;
        }
        if (neighbor_neighbors.size() < max_conn) {
            neighbor_neighbors.push_back(new_idx);
            accepted_any = true;
            continue;
        }

        std::vector<Candidate> neighbor_candidates;
        neighbor_candidates.reserve(neighbor_neighbors.size() + 1);
        for (std::uint32_t nn : neighbor_neighbors) {
            if (traversable(nn, layer)) {
                neighbor_candidates.emplace_back(key_between(neighbor, nn), nn);
            }
        }
        neighbor_candidates.emplace_back(key_between(neighbor, new_idx), new_idx);
        neighbor_neighbors = select_neighbors(std::move(neighbor_candidates), max_conn).first;
        if (std::find(neighbor_neighbors.begin(), neighbor_neighbors.end(), new_idx) != neighbor_neighbors.end()) {
            accepted_any = true;
        }
    }

    // Guarantee reciprocal connectivity at base layer: ensure at least one reverse edge
    if (layer == 0 && !accepted_any && !selected.empty()) {
        const std::uint32_t forced = selected.front();
        auto locks = lock_pair(new_idx, forced);
        auto& nn = nodes_[forced]->neighbors[0];
        if (std::find(nn.begin(), nn.end(), new_idx) == nn.end()) {
            if (nn.size() < max_conn) {
                nn.push_back(new_idx);
            } else if (!nn.empty()) {
                // Replace the farthest
                float worst_key = -std::numeric_limits<float>::infinity();
                std::size_t worst_pos = 0;
                for (std::size_t i = 0; i < nn.size(); ++i) {
                    const float k = traversable(nn[i], 0) ? key_between(forced, nn[i])
                                                          : std::numeric_limits<float>::infinity();
                    if (k > worst_key) { worst_key = k; worst_pos = i; }
                }
                nn[worst_pos] = new_idx;
            }
        }
    }
}

auto HnswIndex::Impl::insert(std::uint32_t handle, std::span<const float> vec)
    -> std::expected<void, core::error> {
    using core::error_code;

    if (!state_.initialized) {
        return core::fail(error_code::precondition_failed, "Index not initialized", "index.hnsw");
    }
    if (vec.size() != state_.dim) {
        return core::fail(error_code::schema_mismatch,
                          "vector length " + std::to_string(vec.size()) + " != dimension " +
                              std::to_string(state_.dim),
                          "index.hnsw");
    }
    for (float x : vec) {
        if (!std::isfinite(x)) {
            return core::fail(error_code::schema_mismatch, "vector contains non-finite values", "index.hnsw");
        }
    }

    std::vector<float> prepared(vec.begin(), vec.end());
    state_.metric.prepare(prepared);

    // Replace semantics: identical live vector is a no-op, otherwise tombstone the old node
    {
        std::shared_lock<std::shared_mutex> graph(graph_mutex_);
        std::lock_guard<std::mutex> label(label_mutex_);
        if (auto it = handle_to_idx_.find(handle); it != handle_to_idx_.end()) {
            auto& old = *nodes_[it->second];
            if (!old.deleted.load() && old.data == prepared) {
                return {};
            }
            if (!old.deleted.exchange(true)) {
                live_count_.fetch_sub(1);
                tombstone_count_.fetch_add(1);
            }
            handle_to_idx_.erase(it);
        }
    }

    const std::uint32_t level = select_level();
    std::uint32_t new_idx = kNoNode;

    // Only lock exclusively for the arena change
    {
        std::unique_lock<std::shared_mutex> graph(graph_mutex_);
        auto node = std::make_unique<HnswNode>();
        node->handle = handle;
        node->data = std::move(prepared);
        node->level = level;
        node->neighbors.resize(level + 1);

        if (!free_slots_.empty()) {
            new_idx = free_slots_.back();
            free_slots_.pop_back();
            nodes_[new_idx] = std::move(node);
        } else {
            if (nodes_.size() >= static_cast<std::size_t>(kNoNode)) {
                return core::fail(error_code::internal, "HNSW arena exhausted", "index.hnsw");
            }
            new_idx = static_cast<std::uint32_t>(nodes_.size());
            nodes_.push_back(std::move(node));
        }
        {
            std::lock_guard<std::mutex> label(label_mutex_);
            handle_to_idx_[handle] = new_idx;
        }
        live_count_.fetch_add(1);

        // First node becomes entry point
        std::lock_guard<std::mutex> entry(entry_mutex_);
        if (state_.entry_point == kNoNode) {
            state_.entry_point = new_idx;
            state_.max_level = level;
            return {};
        }
    }

    std::shared_lock<std::shared_mutex> graph(graph_mutex_);

    // Snapshot entry point and its top level to avoid races during traversal
    std::uint32_t ep_idx_snapshot;
    std::uint32_t ep_top_level_snapshot;
    {
        std::lock_guard<std::mutex> entry(entry_mutex_);
        ep_idx_snapshot = state_.entry_point;
        ep_top_level_snapshot = state_.max_level;
    }
    if (ep_idx_snapshot == new_idx || ep_idx_snapshot == kNoNode) {
        return {};
    }

    const std::span<const float> data = nodes_[new_idx]->data;
    const std::stop_token no_stop;
    std::uint32_t curr_nearest = ep_idx_snapshot;

    // Greedy descent through layers above the new node's level
    for (std::int64_t lc = ep_top_level_snapshot; lc > static_cast<std::int64_t>(level); --lc) {
        auto nearest = search_layer(data, curr_nearest, 1, static_cast<std::uint32_t>(lc),
                                    nullptr, false, no_stop);
        if (!nearest.empty()) curr_nearest = nearest.front().second;
    }

    for (std::int64_t lc = std::min(level, ep_top_level_snapshot); lc >= 0; --lc) {
        const auto layer = static_cast<std::uint32_t>(lc);
        auto nearest = search_layer(data, curr_nearest, state_.params.efConstruction, layer,
                                    nullptr, true, no_stop);
        if (nearest.empty()) {
            // Everything nearby is tombstoned: link through them, compaction repairs later
            nearest = search_layer(data, curr_nearest, state_.params.efConstruction, layer,
                                   nullptr, false, no_stop);
        }
        connect_node(new_idx, nearest, layer);
        if (!nearest.empty()) curr_nearest = nearest.front().second;
    }

    // Update entry point if new node has higher level
    if (level > ep_top_level_snapshot) {
        std::lock_guard<std::mutex> entry(entry_mutex_);
        if (level > state_.max_level) {
            state_.entry_point = new_idx;
            state_.max_level = level;
        }
    }

    return {};
}

auto HnswIndex::Impl::remove(std::uint32_t handle) -> bool {
    std::shared_lock<std::shared_mutex> graph(graph_mutex_);
    std::lock_guard<std::mutex> label(label_mutex_);
    auto it = handle_to_idx_.find(handle);
    if (it == handle_to_idx_.end()) return false;
    if (!nodes_[it->second]->deleted.exchange(true, std::memory_order_acq_rel)) {
        live_count_.fetch_sub(1);
        tombstone_count_.fetch_add(1);
    }
    handle_to_idx_.erase(it);
    return true;
}

auto HnswIndex::Impl::search(std::span<const float> query, const HnswSearchParams& params) const
    -> std::expected<std::vector<HnswHit>, core::error> {
    using core::error_code;

    if (!state_.initialized) {
        return core::fail(error_code::precondition_failed, "Index not initialized", "index.hnsw");
    }
    if (query.size() != state_.dim) {
        return core::fail(error_code::schema_mismatch,
                          "query length " + std::to_string(query.size()) + " != dimension " +
                              std::to_string(state_.dim),
                          "index.hnsw");
    }
    if (params.k == 0) {
        return core::fail(error_code::invalid_query, "k must be > 0", "index.hnsw");
    }

    std::vector<float> prepared(query.begin(), query.end());
    state_.metric.prepare(prepared);

    std::shared_lock<std::shared_mutex> graph(graph_mutex_);
    if (live_count_.load() == 0) {
        return std::vector<HnswHit>{};
    }

    std::uint32_t ep_idx_snapshot;
    std::uint32_t ep_top_level_snapshot;
    {
        std::lock_guard<std::mutex> entry(entry_mutex_);
        ep_idx_snapshot = state_.entry_point;
        ep_top_level_snapshot = state_.max_level;
    }
    if (ep_idx_snapshot == kNoNode) {
        return std::vector<HnswHit>{};
    }

    bool stopped = false;
    std::uint32_t curr_nearest = ep_idx_snapshot;
    for (std::int64_t lc = ep_top_level_snapshot; lc > 0 && !stopped; --lc) {
        auto nearest = search_layer(prepared, curr_nearest, 1, static_cast<std::uint32_t>(lc),
                                    nullptr, false, params.stop, &stopped);
        if (!nearest.empty()) curr_nearest = nearest.front().second;
    }

    const std::uint32_t ef = std::max(params.efSearch, params.k);
    auto candidates = stopped ? std::vector<Candidate>{}
                              : search_layer(prepared, curr_nearest, ef, 0, params.allow, true,
                                             params.stop, &stopped);
    if (stopped || params.stop.stop_requested()) {
        return core::fail(error_code::cancelled, "search abandoned", "index.hnsw");
    }

    // Ties broken by handle for determinism
    std::vector<std::pair<float, std::uint32_t>> keyed;
    keyed.reserve(candidates.size());
    for (const auto& [key, idx] : candidates) {
        if (!std::isfinite(key)) continue;
        keyed.emplace_back(key, nodes_[idx]->handle);
    }
    std::sort(keyed.begin(), keyed.end());

    std::vector<HnswHit> results;
    results.reserve(std::min<std::size_t>(params.k, keyed.size()));
    for (const auto& [key, handle] : keyed) {
        if (results.size() >= params.k) break;
        results.push_back(HnswHit{handle, state_.metric.score_from_key(key)});
    }
    return results;
}

auto HnswIndex::Impl::compact(std::stop_token stop) -> HnswCompactionStats {
    HnswCompactionStats out;
    roaring::Roaring dead;

    // Phase 1: rewrite neighbour lists that point at tombstones. Readers keep running.
    {
        std::shared_lock<std::shared_mutex> graph(graph_mutex_);
        for (std::uint32_t idx = 0; idx < nodes_.size(); ++idx) {
            const auto* n = nodes_[idx].get();
            if (n && !n->reclaimed && n->deleted.load()) dead.add(idx);
        }
        out.tombstones_seen = dead.cardinality();
        if (dead.isEmpty()) return out;

        for (std::uint32_t idx = 0; idx < nodes_.size(); ++idx) {
            if (stop.stop_requested()) {
                out.interrupted = true;
                break;
            }
            auto* node = nodes_[idx].get();
            if (node == nullptr || node->reclaimed || dead.contains(idx)) continue;

            for (std::uint32_t layer = 0; layer <= node->level; ++layer) {
                const auto current = neighbors_at(idx, layer);
                const bool touches_dead = std::any_of(current.begin(), current.end(),
                    [&](std::uint32_t nb) { return dead.contains(nb); });
                if (!touches_dead) continue;

                // Replacement candidates come from the tombstones' own neighbourhoods
                std::vector<std::uint32_t> pool;
                for (std::uint32_t nb : current) {
                    if (!dead.contains(nb) || !traversable(nb, layer)) continue;
                    for (std::uint32_t x : neighbors_at(nb, layer)) {
                        if (x != idx && !dead.contains(x) && traversable(x, layer)) pool.push_back(x);
                    }
                }

                auto guard = lock_node(idx);
                auto& list = node->neighbors[layer];
                std::vector<Candidate> candidates;
                candidates.reserve(list.size() + pool.size());
                for (std::uint32_t nb : list) {
                    if (nb != idx && !dead.contains(nb) && traversable(nb, layer)) {
                        candidates.emplace_back(key_between(idx, nb), nb);
                    }
                }
                for (std::uint32_t x : pool) {
                    candidates.emplace_back(key_between(idx, x), x);
                }
                list = select_neighbors(std::move(candidates), max_connections(layer)).first;
                ++out.repaired_lists;
            }
        }
    }

    if (out.interrupted) {
        spdlog::debug("hnsw compaction interrupted after {} lists; {} tombstones kept",
                      out.repaired_lists, out.tombstones_seen);
        return out;
    }

    // Phase 2: brief exclusive section to strip stale edges and recycle slots
    std::unique_lock<std::shared_mutex> graph(graph_mutex_);
    for (auto& node : nodes_) {
        if (!node || node->reclaimed) continue;
        for (auto& list : node->neighbors) {
            std::erase_if(list, [&](std::uint32_t nb) { return dead.contains(nb); });
        }
    }
    for (std::uint32_t idx : dead) {
        auto& node = *nodes_[idx];
        node.data.clear();
        node.data.shrink_to_fit();
        node.neighbors.clear();
        node.neighbors.shrink_to_fit();
        node.reclaimed = true;
        free_slots_.push_back(idx);
        tombstone_count_.fetch_sub(1);
        ++out.reclaimed;
    }

    std::lock_guard<std::mutex> entry(entry_mutex_);
    if (state_.entry_point == kNoNode || dead.contains(state_.entry_point)) {
        // Prefer the highest live node; fall back to a tombstone that is still routable
        std::uint32_t best = kNoNode;
        bool best_live = false;
        for (std::uint32_t idx = 0; idx < nodes_.size(); ++idx) {
            const auto* n = nodes_[idx].get();
            if (n == nullptr || n->reclaimed) continue;
            const bool live = !n->deleted.load();
            if (best == kNoNode || (live && !best_live) ||
                (live == best_live && n->level > nodes_[best]->level)) {
                best = idx;
                best_live = live;
            }
        }
        state_.entry_point = best;
        state_.max_level = best == kNoNode ? 0 : nodes_[best]->level;
    }

    return out;
}

auto HnswIndex::Impl::reachable_count_base_layer() const -> std::size_t {
    std::shared_lock<std::shared_mutex> graph(graph_mutex_);
    std::uint32_t ep_idx_snapshot;
    {
        std::lock_guard<std::mutex> entry(entry_mutex_);
        ep_idx_snapshot = state_.entry_point;
    }
    if (ep_idx_snapshot == kNoNode || !traversable(ep_idx_snapshot, 0)) return 0;

    std::vector<char> visited(nodes_.size(), 0);
    std::queue<std::uint32_t> q;
    visited[ep_idx_snapshot] = 1;
    q.push(ep_idx_snapshot);

    std::size_t count = 0;
    while (!q.empty()) {
        const auto current = q.front();
        q.pop();
        if (!nodes_[current]->deleted.load()) ++count;

        for (std::uint32_t nb : neighbors_at(current, 0)) {
            if (nb >= nodes_.size() || visited[nb] || !traversable(nb, 0)) continue;
            visited[nb] = 1;
            q.push(nb);
        }
    }
    return count;
}

auto HnswIndex::Impl::get_stats() const -> HnswStats {
    std::shared_lock<std::shared_mutex> graph(graph_mutex_);
    HnswStats stats;
    stats.n_slots = nodes_.size();
    stats.n_free = free_slots_.size();
    stats.n_live = live_count_.load();
    stats.n_tombstoned = tombstone_count_.load();

    std::size_t max_level = 0;
    for (std::uint32_t idx = 0; idx < nodes_.size(); ++idx) {
        const auto* node = nodes_[idx].get();
        if (node == nullptr || node->reclaimed) continue;
        max_level = std::max<std::size_t>(max_level, node->level);
        if (stats.level_counts.size() <= node->level) {
            stats.level_counts.resize(node->level + 1, 0);
        }
        stats.level_counts[node->level]++;
        auto guard = lock_node(idx);
        if (!node->neighbors.empty()) stats.n_edges += node->neighbors[0].size();
    }
    stats.n_levels = stats.level_counts.empty() ? 0 : max_level + 1;
    const std::size_t present = stats.n_live + stats.n_tombstoned;
    stats.avg_degree = present > 0 ? static_cast<float>(stats.n_edges) / static_cast<float>(present) : 0.0f;
    return stats;
}

auto HnswIndex::Impl::clear() -> void {
    std::unique_lock<std::shared_mutex> graph(graph_mutex_);
    std::lock_guard<std::mutex> label(label_mutex_);
    std::lock_guard<std::mutex> entry(entry_mutex_);
    nodes_.clear();
    free_slots_.clear();
    handle_to_idx_.clear();
    state_.entry_point = kNoNode;
    state_.max_level = 0;
    live_count_.store(0);
    tombstone_count_.store(0);
}

// HnswIndex public API

HnswIndex::HnswIndex() : impl_(std::make_unique<Impl>()) {}
HnswIndex::~HnswIndex() = default;
HnswIndex::HnswIndex(HnswIndex&&) noexcept = default;
HnswIndex& HnswIndex::operator=(HnswIndex&&) noexcept = default;

auto HnswIndex::init(std::size_t dim, DistanceMetric metric, const HnswBuildParams& params)
    -> std::expected<void, core::error> {
    return impl_->init(dim, metric, params);
}

auto HnswIndex::insert(std::uint32_t handle, std::span<const float> vec)
    -> std::expected<void, core::error> {
    return impl_->insert(handle, vec);
}

auto HnswIndex::remove(std::uint32_t handle) -> bool {
    return impl_->remove(handle);
}

auto HnswIndex::contains(std::uint32_t handle) const -> bool {
    std::lock_guard<std::mutex> label(impl_->label_mutex_);
    return impl_->handle_to_idx_.contains(handle);
}

auto HnswIndex::search(std::span<const float> query, const HnswSearchParams& params) const
    -> std::expected<std::vector<HnswHit>, core::error> {
    return impl_->search(query, params);
}

auto HnswIndex::compact(std::stop_token stop) -> HnswCompactionStats {
    return impl_->compact(std::move(stop));
}

auto HnswIndex::live_handles() const -> roaring::Roaring {
    roaring::Roaring out;
    std::lock_guard<std::mutex> label(impl_->label_mutex_);
    for (const auto& [handle, idx] : impl_->handle_to_idx_) {
        out.add(handle);
    }
    return out;
}

auto HnswIndex::reachable_count_base_layer() const -> std::size_t {
    return impl_->reachable_count_base_layer();
}

auto HnswIndex::get_stats() const -> HnswStats {
    return impl_->get_stats();
}

auto HnswIndex::is_initialized() const noexcept -> bool {
    return impl_->state_.initialized;
}

auto HnswIndex::dimension() const noexcept -> std::size_t {
    return impl_->state_.dim;
}

auto HnswIndex::metric() const noexcept -> DistanceMetric {
    return impl_->state_.metric;
}

auto HnswIndex::size() const noexcept -> std::size_t {
    return impl_->live_count_.load();
}

auto HnswIndex::tombstone_count() const noexcept -> std::size_t {
    return impl_->tombstone_count_.load();
}

auto HnswIndex::clear() -> void {
    impl_->clear();
}

} // namespace tessera::index
