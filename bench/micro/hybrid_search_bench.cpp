/** \file hybrid_search_bench.cpp
 *  \brief Micro benchmarks for lexical scoring, fusion and collection-level hybrid queries.
 */

#include <benchmark/benchmark.h>

#include <cmath>
#include <memory>
#include <random>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "tessera/collection/collection.hpp"
#include "tessera/index/bm25.hpp"
#include "tessera/search/fusion.hpp"

using namespace tessera;
using namespace tessera::index;
using namespace tessera::search;

namespace {

std::vector<std::string> generate_documents(std::size_t n_docs, std::size_t avg_length, std::size_t vocab_size) {
    std::vector<std::string> docs;
    std::mt19937 gen(42);
    std::uniform_int_distribution<std::size_t> word_dist(0, vocab_size - 1);
    std::normal_distribution<> len_dist(static_cast<double>(avg_length), static_cast<double>(avg_length) / 4.0);

    for (std::size_t i = 0; i < n_docs; ++i) {
        std::string doc;
        const int doc_len = std::max(1, static_cast<int>(len_dist(gen)));
        for (int j = 0; j < doc_len; ++j) {
            if (j > 0) doc += " ";
            doc += "word" + std::to_string(word_dist(gen));
        }
        docs.push_back(std::move(doc));
    }
    return docs;
}

std::vector<std::vector<float>> generate_embeddings(std::size_t n_vecs, std::size_t dim) {
    std::vector<std::vector<float>> embeddings;
    std::mt19937 gen(42);
    std::normal_distribution<float> dist(0.0f, 1.0f);
    for (std::size_t i = 0; i < n_vecs; ++i) {
        std::vector<float> vec(dim);
        for (auto& val : vec) val = dist(gen);
        embeddings.push_back(std::move(vec));
    }
    return embeddings;
}

std::vector<fusion::SearchResult> ranked_list(std::size_t n, std::uint64_t offset) {
    std::vector<fusion::SearchResult> out;
    out.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
        out.push_back(fusion::SearchResult{DocumentId{offset + i + 1}, 1.0f / static_cast<float>(i + 1)});
    }
    return out;
}

auto populated_collection(std::size_t n_docs, std::size_t dim) -> std::unique_ptr<collection::Collection> {
    spdlog::set_level(spdlog::level::warn);
    collection::CollectionSchema schema;
    schema.name = "bench";
    schema.dimension = static_cast<std::int64_t>(dim);
    schema.metric = MetricKind::Cosine;
    schema.text_fields = {collection::TextFieldDef{"text", false}};
    collection::CollectionOptions options;
    options.maintenance.enabled = false;

    auto c = std::make_unique<collection::Collection>(schema, options);
    if (!c->open()) return nullptr;
    const auto docs = generate_documents(n_docs, 50, 5000);
    const auto vecs = generate_embeddings(n_docs, dim);
    for (std::size_t i = 0; i < n_docs; ++i) {
        if (!c->upsert(Document{DocumentId{std::uint64_t{i + 1}}, vecs[i], Payload{{"text", docs[i]}}})) {
            return nullptr;
        }
    }
    return c;
}

} // namespace

static void BM_BM25_AddDocument(benchmark::State& state) {
    const auto n_docs = static_cast<std::size_t>(state.range(0));
    const auto docs = generate_documents(n_docs, 100, 10000);

    for (auto _ : state) {
        Bm25FieldIndex index;
        if (!index.init(BM25Params{})) {
            state.SkipWithError("init failed");
            break;
        }
        for (std::size_t i = 0; i < n_docs; ++i) {
            benchmark::DoNotOptimize(index.add_document(static_cast<std::uint32_t>(i), docs[i]));
        }
    }
    state.SetItemsProcessed(state.iterations() * static_cast<std::int64_t>(n_docs));
}
BENCHMARK(BM_BM25_AddDocument)->Range(100, 10000);

static void BM_BM25_Search(benchmark::State& state) {
    const auto n_docs = static_cast<std::size_t>(state.range(0));
    const auto docs = generate_documents(n_docs, 100, 10000);
    LexicalIndex index;
    if (!index.init({"text"}, BM25Params{})) {
        state.SkipWithError("init failed");
        return;
    }
    for (std::size_t i = 0; i < n_docs; ++i) {
        if (!index.insert(static_cast<std::uint32_t>(i), {{"text", docs[i]}})) {
            state.SkipWithError("insert failed");
            return;
        }
    }

    for (auto _ : state) {
        auto hits = index.search("word1 word42 word777", 100);
        benchmark::DoNotOptimize(hits);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_BM25_Search)->Range(1000, 100000);

static void BM_RRF_Fusion(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    // Half of each list overlaps the other
    const auto vector_results = ranked_list(n, 0);
    const auto text_results = ranked_list(n, n / 2);
    fusion::ReciprocalRankFusion rrf(60.0f);

    for (auto _ : state) {
        auto fused = rrf.fuse(vector_results, text_results, 100);
        benchmark::DoNotOptimize(fused);
    }
    state.SetItemsProcessed(state.iterations() * static_cast<std::int64_t>(n) * 2);
}
BENCHMARK(BM_RRF_Fusion)->Range(10, 1000);

static void BM_Collection_Upsert(benchmark::State& state) {
    const bool async = state.range(0) != 0;
    collection::CollectionSchema schema;
    schema.name = "upserts";
    schema.dimension = 64;
    schema.text_fields = {collection::TextFieldDef{"text", false}};
    collection::CollectionOptions options;
    options.apply_mode = async ? collection::ApplyMode::Async : collection::ApplyMode::Sync;
    options.maintenance.enabled = false;
    spdlog::set_level(spdlog::level::warn);

    collection::Collection c(schema, options);
    if (!c.open()) {
        state.SkipWithError("open failed");
        return;
    }
    const auto vecs = generate_embeddings(1024, 64);
    const auto docs = generate_documents(1024, 30, 2000);
    std::uint64_t id = 0;
    for (auto _ : state) {
        const auto slot = id % vecs.size();
        ++id;
        benchmark::DoNotOptimize(c.upsert(Document{DocumentId{id}, vecs[slot], Payload{{"text", docs[slot]}}}));
    }
    state.PauseTiming();
    benchmark::DoNotOptimize(c.flush());
    state.ResumeTiming();
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_Collection_Upsert)->Arg(0)->Arg(1);

static void BM_HybridQuery(benchmark::State& state) {
    const auto n_docs = static_cast<std::size_t>(state.range(0));
    const std::size_t dim = 64;
    auto c = populated_collection(n_docs, dim);
    if (!c) {
        state.SkipWithError("setup failed");
        return;
    }
    const auto queries = generate_embeddings(16, dim);

    std::size_t qi = 0;
    for (auto _ : state) {
        Query q;
        q.vector = queries[qi++ % queries.size()];
        q.text = "word12 word300";
        q.top_k = 10;
        auto r = c->search(q);
        benchmark::DoNotOptimize(r);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_HybridQuery)->Range(1000, 20000)->Unit(benchmark::kMicrosecond);

static void BM_VectorOnlyQuery(benchmark::State& state) {
    const auto n_docs = static_cast<std::size_t>(state.range(0));
    const std::size_t dim = 64;
    auto c = populated_collection(n_docs, dim);
    if (!c) {
        state.SkipWithError("setup failed");
        return;
    }
    const auto queries = generate_embeddings(16, dim);

    std::size_t qi = 0;
    for (auto _ : state) {
        Query q;
        q.vector = queries[qi++ % queries.size()];
        q.top_k = 10;
        q.with_payload = false;
        auto r = c->search(q);
        benchmark::DoNotOptimize(r);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_VectorOnlyQuery)->Range(1000, 20000)->Unit(benchmark::kMicrosecond);
