#include "tessera/search/hybrid_engine.hpp"

#include <algorithm>
#include <cmath>
#include <exception>
#include <future>
#include <limits>
#include <unordered_map>

#include <spdlog/spdlog.h>

#include "tessera/search/fusion.hpp"

namespace tessera::search {

namespace {

struct Candidate {
    DocumentId id;
    store::Handle handle{0};
    float score{0.0f};
};

using Pool = std::expected<std::vector<Candidate>, core::error>;

/** \brief Requested sources; a disengaged optional means the source was not asked for. */
struct Pools {
    std::optional<Pool> vector;
    std::optional<Pool> text;
};

auto validate_query(const SearchSources& sources, const Query& query) -> std::expected<void, core::error> {
    using core::error_code;
    if (!query.vector && !query.text) {
        return core::fail(error_code::invalid_query, "query needs a vector or text", "search.hybrid");
    }
    if (query.top_k <= 0) {
        return core::fail(error_code::invalid_query, "top_k must be > 0", "search.hybrid");
    }
    if (query.vector) {
        if (query.vector->size() != sources.vectors.dimension()) {
            return core::fail(error_code::schema_mismatch,
                              "query vector length " + std::to_string(query.vector->size()) +
                                  " != dimension " + std::to_string(sources.vectors.dimension()),
                              "search.hybrid");
        }
        if (!std::all_of(query.vector->begin(), query.vector->end(), [](float x) { return std::isfinite(x); })) {
            return core::fail(error_code::schema_mismatch, "query vector contains non-finite values", "search.hybrid");
        }
    }
    if (query.text) {
        const auto& declared = sources.lexical.fields();
        if (declared.empty()) {
            return core::fail(error_code::schema_mismatch, "collection has no indexed text fields", "search.hybrid");
        }
        for (const auto& field : query.text_fields) {
            if (std::find(declared.begin(), declared.end(), field) == declared.end()) {
                return core::fail(error_code::schema_mismatch,
                                  "field '" + field + "' is not an indexed text field", "search.hybrid");
            }
        }
    }
    return {};
}

auto pool_size(const Query& query, const HybridConfig& config) -> std::uint32_t {
    const auto top_k = std::min<std::uint64_t>(static_cast<std::uint64_t>(query.top_k),
                                               std::numeric_limits<std::uint32_t>::max());
    const auto wanted = top_k * std::max<std::uint32_t>(config.candidate_factor, 1);
    return static_cast<std::uint32_t>(std::min<std::uint64_t>(wanted, std::numeric_limits<std::uint32_t>::max()));
}

auto vector_pool(const SearchSources& sources, const std::vector<float>& vec, std::uint32_t pool,
                 const roaring::Roaring* allow, const HybridConfig& config, const std::stop_token& stop) -> Pool {
    index::HnswSearchParams params;
    params.efSearch = std::max(config.ef_search, pool);
    params.k = pool;
    params.allow = allow;
    params.stop = stop;

    auto hits = sources.vectors.search(vec, params);
    if (!hits) return std::unexpected(hits.error());

    const auto metric = sources.vectors.metric();
    std::vector<Candidate> out;
    out.reserve(hits->size());
    roaring::Roaring seen;
    for (const auto& hit : *hits) {
        auto doc = sources.store.get_by_handle(hit.handle);
        if (!doc) continue;  // deleted, index cleanup pending
        out.push_back(Candidate{std::move(doc->document.id), hit.handle, hit.score});
        seen.add(hit.handle);
    }

    if (config.exact_backfill && out.size() < pool) {
        const std::uint64_t admitted = allow ? allow->cardinality() : sources.store.size();
        if (out.size() < std::min<std::uint64_t>(pool, admitted)) {
            std::size_t added = 0;
            auto consider = [&](const store::StoredDocument& sd) {
                if (seen.contains(sd.handle)) return;
                const float score = metric.score_raw(vec, sd.document.vector);
                if (std::isnan(score)) return;
                out.push_back(Candidate{sd.document.id, sd.handle, score});
                ++added;
            };
            if (allow != nullptr) {
                for (std::uint32_t handle : *allow) {
                    if (auto sd = sources.store.get_by_handle(handle)) consider(*sd);
                }
            } else {
                auto cursor = sources.store.scan();
                while (auto sd = cursor.next()) consider(*sd);
            }
            spdlog::debug("vector pool short ({} of {}); backfilled {} by exact scan",
                          out.size() - added, pool, added);
        }
    }

    std::sort(out.begin(), out.end(), [&](const Candidate& a, const Candidate& b) {
        const auto pref = metric.compare(a.score, b.score);
        if (pref != index::Preference::equal) return pref == index::Preference::better;
        return a.id < b.id;
    });
    if (out.size() > pool) out.resize(pool);
    return out;
}

auto text_pool(const SearchSources& sources, const std::string& text, const std::vector<std::string>& fields,
               std::uint32_t pool, const roaring::Roaring* allow) -> Pool {
    auto hits = sources.lexical.search(text, pool, fields, allow);
    if (!hits) return std::unexpected(hits.error());

    std::vector<Candidate> out;
    out.reserve(hits->size());
    for (const auto& hit : *hits) {
        auto doc = sources.store.get_by_handle(hit.handle);
        if (!doc) continue;
        out.push_back(Candidate{std::move(doc->document.id), hit.handle, hit.score});
    }
    std::sort(out.begin(), out.end(), [](const Candidate& a, const Candidate& b) {
        if (a.score != b.score) return a.score > b.score;
        return a.id < b.id;
    });
    return out;
}

// Futures are always joined; an escaping exception becomes an internal error for that source
auto join(std::future<Pool>& f, const char* source) -> Pool {
    try {
        return f.get();
    } catch (const std::exception& e) {
        return core::fail(core::error_code::internal, std::string(source) + " search threw: " + e.what(),
                          "search.hybrid");
    }
}

auto gather(const SearchSources& sources, const Query& query, const roaring::Roaring* allow,
            const HybridConfig& config, const SourceGate& gate) -> Pools {
    const std::uint32_t pool = pool_size(query, config);
    auto run_vector = [&]() -> Pool {
        if (gate) {
            if (auto g = gate(Source::vector); !g) return std::unexpected(g.error());
        }
        return vector_pool(sources, *query.vector, pool, allow, config, query.stop);
    };
    auto run_text = [&]() -> Pool {
        if (gate) {
            if (auto g = gate(Source::text); !g) return std::unexpected(g.error());
        }
        return text_pool(sources, *query.text, query.text_fields, pool, allow);
    };

    Pools pools;
    if (query.vector && query.text) {
        // Launch both searches in parallel
        auto vector_future = std::async(std::launch::async, run_vector);
        auto text_future = std::async(std::launch::async, run_text);
        pools.vector = join(vector_future, "vector");
        pools.text = join(text_future, "text");
    } else if (query.vector) {
        pools.vector = run_vector();
    } else {
        pools.text = run_text();
    }
    return pools;
}

auto to_fusion_input(const std::vector<Candidate>& pool) -> std::vector<fusion::SearchResult> {
    std::vector<fusion::SearchResult> out;
    out.reserve(pool.size());
    for (const auto& c : pool) out.push_back(fusion::SearchResult{c.id, c.score});
    return out;
}

auto compile_filter(const SearchSources& sources, const Query& query)
    -> std::expected<std::optional<roaring::Roaring>, core::error> {
    if (!query.filter) return std::optional<roaring::Roaring>{};
    auto allow = sources.store.filter_handles(*query.filter);
    if (!allow) return std::unexpected(allow.error());
    return std::optional<roaring::Roaring>{std::move(*allow)};
}

} // namespace

auto HybridQueryEngine::search(const SearchSources& sources, const Query& query) const
    -> std::expected<SearchResponse, core::error> {
    if (auto v = validate_query(sources, query); !v) return std::unexpected(v.error());

    auto allow = compile_filter(sources, query);
    if (!allow) return std::unexpected(allow.error());
    const roaring::Roaring* allow_ptr = allow->has_value() ? &**allow : nullptr;

    SearchResponse response;
    if (allow_ptr != nullptr && allow_ptr->isEmpty()) {
        return response;
    }

    Pools pools = gather(sources, query, allow_ptr, config_, gate_);
    if (query.stop.stop_requested()) {
        return core::fail(core::error_code::cancelled, "query abandoned", "search.hybrid");
    }

    // Degrade to a single source when one of two fails
    if (pools.vector && pools.text && (!*pools.vector || !*pools.text)) {
        if (!*pools.vector && !*pools.text) {
            spdlog::warn("hybrid query failed in both sources: {}; {}",
                         core::describe(pools.vector->error()), core::describe(pools.text->error()));
            return std::unexpected(pools.vector->error());
        }
        auto& failed = *pools.vector ? pools.text : pools.vector;
        const char* name = *pools.vector ? "text" : "vector";
        response.warnings.push_back(std::string(name) + " search failed: " + core::describe(failed->error()));
        spdlog::warn("hybrid query degraded to a single source: {}", response.warnings.back());
        failed.reset();
    }

    struct Ranked {
        DocumentId id;
        float score{0.0f};
        std::optional<float> vector_score;
        std::optional<float> text_score;
        std::uint32_t vector_rank{0};
        std::uint32_t text_rank{0};
    };
    std::vector<Ranked> ranked;
    std::unordered_map<DocumentId, store::Handle, DocumentIdHash> handles;

    if (pools.vector && pools.text) {
        const auto& vp = **pools.vector;
        const auto& tp = **pools.text;
        for (const auto& c : vp) handles.emplace(c.id, c.handle);
        for (const auto& c : tp) handles.emplace(c.id, c.handle);
        fusion::ReciprocalRankFusion rrf(config_.rrf_k);
        for (auto& f : rrf.fuse(to_fusion_input(vp), to_fusion_input(tp), std::numeric_limits<std::size_t>::max())) {
            ranked.push_back(Ranked{std::move(f.id), f.fused_score, f.vector_score, f.text_score,
                                    f.vector_rank, f.text_rank});
        }
    } else {
        const bool is_vector = pools.vector.has_value();
        auto& single = is_vector ? *pools.vector : *pools.text;
        if (!single) return std::unexpected(single.error());
        std::uint32_t rank = 0;
        for (auto& c : *single) {
            ++rank;
            handles.emplace(c.id, c.handle);
            Ranked r{c.id, c.score, std::nullopt, std::nullopt, 0, 0};
            if (is_vector) { r.vector_score = c.score; r.vector_rank = rank; }
            else { r.text_score = c.score; r.text_rank = rank; }
            ranked.push_back(std::move(r));
        }
    }

    // Hydrate in rank order, dropping anything deleted since retrieval
    const auto top_k = static_cast<std::size_t>(query.top_k);
    for (auto& r : ranked) {
        if (response.hits.size() >= top_k) break;
        auto sd = sources.store.get_by_handle(handles.at(r.id));
        if (!sd || sd->document.id != r.id) continue;
        Hit hit;
        hit.id = std::move(r.id);
        hit.score = r.score;
        hit.vector_score = r.vector_score;
        hit.text_score = r.text_score;
        hit.vector_rank = r.vector_rank;
        hit.text_rank = r.text_rank;
        if (query.with_payload) hit.payload = std::move(sd->document.payload);
        if (query.with_vector) hit.vector = std::move(sd->document.vector);
        response.hits.push_back(std::move(hit));
    }
    return response;
}

auto HybridQueryEngine::search_batch(const SearchSources& sources, std::span<const Query> queries) const
    -> std::expected<std::vector<SearchResponse>, core::error> {
    std::vector<SearchResponse> out;
    out.reserve(queries.size());
    for (std::size_t i = 0; i < queries.size(); ++i) {
        auto r = search(sources, queries[i]);
        if (!r) {
            auto e = std::move(r.error());
            e.message = "query " + std::to_string(i) + ": " + e.message;
            return std::unexpected(std::move(e));
        }
        out.push_back(std::move(*r));
    }
    return out;
}

auto HybridQueryEngine::explain(const SearchSources& sources, const Query& query, const DocumentId& id) const
    -> std::expected<Explanation, core::error> {
    if (auto v = validate_query(sources, query); !v) return std::unexpected(v.error());

    const auto handle = sources.store.handle_of(id);
    if (!handle) {
        return core::fail(core::error_code::not_found, "document '" + to_string(id) + "' not found", "search.hybrid");
    }

    auto allow = compile_filter(sources, query);
    if (!allow) return std::unexpected(allow.error());
    const roaring::Roaring* allow_ptr = allow->has_value() ? &**allow : nullptr;

    Explanation out;
    out.id = id;
    out.matched_filter = allow_ptr == nullptr || allow_ptr->contains(*handle);
    if (!out.matched_filter) return out;

    Pools pools = gather(sources, query, allow_ptr, config_, gate_);
    std::vector<fusion::SearchResult> vector_input;
    std::vector<fusion::SearchResult> text_input;
    if (pools.vector) {
        if (!*pools.vector) return std::unexpected(pools.vector->error());
        vector_input = to_fusion_input(**pools.vector);
    }
    if (pools.text) {
        if (!*pools.text) return std::unexpected(pools.text->error());
        text_input = to_fusion_input(**pools.text);
    }

    fusion::ReciprocalRankFusion rrf(config_.rrf_k);
    for (const auto& f : rrf.fuse(vector_input, text_input, std::numeric_limits<std::size_t>::max())) {
        if (f.id != id) continue;
        out.vector_score = f.vector_score;
        out.text_score = f.text_score;
        out.vector_rank = f.vector_rank;
        out.text_rank = f.text_rank;
        out.fused_score = f.fused_score;
        break;
    }
    return out;
}

} // namespace tessera::search
